// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "nccl_comm.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <thread>

#include <cuda_runtime.h>
#include <nccl.h>
#include <fmt/core.h>

#include "cuda_utils.h"
#include "errors.h"

/**
 * @brief Throws a std::runtime_error if an NCCL call returned an error.
 *
 * @param status NCCL status code returned by an NCCL API call.
 * @param file Source file where the failing call was made.
 * @param line Source line where the failing call was made.
 *
 * @throws std::runtime_error Always thrown when @p status != ncclSuccess.
 */
void nccl_check(ncclResult_t status, const char* file, int line) {
    if (status != ncclSuccess) {
        throw std::runtime_error(fmt::format("NCCL error at {}:{}: {}", file, line, ncclGetErrorString(status)));
    }
}
#define ncclCheck(err) (nccl_check(err, __FILE__, __LINE__))

std::byte* NCCLCommunicator::DeviceBuffer::reserve(std::size_t bytes) {
    if (bytes > Size) {
        release();
        void* ptr = nullptr;
        CUDA_CHECK(cudaMalloc(&ptr, bytes));
        Ptr = static_cast<std::byte*>(ptr);
        Size = bytes;
    }
    return Ptr;
}

void NCCLCommunicator::DeviceBuffer::release() noexcept {
    if (Ptr) {
        const cudaError_t st = cudaFree(Ptr);
        if (st != cudaSuccess) {
            fprintf(stderr, "WARNING: cudaFree(staging buffer) failed: %s\n", cudaGetErrorString(st));
            (void)cudaGetLastError();
        }
    }
    Ptr = nullptr;
    Size = 0;
}

/**
 * @brief Construct an NCCLCommunicator for a given rank and world size.
 *
 * Sets the CUDA device, initializes the NCCL communicator using @p nccl_id, and
 * creates a dedicated comms stream on that device.
 *
 * @param rank Rank in the NCCL communicator (0 to world-1).
 * @param world Total number of ranks in the communicator.
 * @param nccl_id Pointer to an ncclUniqueId shared across all ranks.
 * @param local_device CUDA device index to use (defaults to rank).
 *
 * @throws std::runtime_error If NCCL initialization fails.
 */
NCCLCommunicator::NCCLCommunicator(int rank, int world, const void* nccl_id, int local_device) :
    Communicator(rank, world), mLocalDevice(local_device >= 0 ? local_device : rank)
{
    CUDA_CHECK(cudaSetDevice(mLocalDevice));
    ncclCheck(ncclCommInitRank(&mNcclComm, world, *reinterpret_cast<const ncclUniqueId*>(nccl_id), rank));
    // must be created _after_ we set the device
    CUDA_CHECK(cudaStreamCreateWithFlags(&mStream, cudaStreamNonBlocking));
}

NCCLCommunicator::NCCLCommunicator(int rank, int world, ncclComm_t comm, int local_device) :
    Communicator(rank, world), mNcclComm(comm), mLocalDevice(local_device)
{
    CUDA_CHECK(cudaSetDevice(mLocalDevice));
    CUDA_CHECK(cudaStreamCreateWithFlags(&mStream, cudaStreamNonBlocking));
}

/**
 * @brief Destructor; tears down NCCL and releases device resources.
 *
 * Destructor must not throw, especially during stack unwinding. CUDA errors are
 * reported and cleanup continues.
 */
NCCLCommunicator::~NCCLCommunicator() {
    terminate_nccl();
    mSendStage.release();
    mRecvStage.release();
    if (mStream) {
        const cudaError_t st = cudaStreamDestroy(mStream);
        if (st != cudaSuccess) {
            fprintf(stderr, "WARNING: cudaStreamDestroy(nccl_stream) failed: %s\n", cudaGetErrorString(st));
            fflush(stderr);
            (void)cudaGetLastError();
        }
        mStream = nullptr;
    }
}

/**
 * @brief Performs NCCL teardown: finalize/destroy in a good state, abort otherwise.
 */
void NCCLCommunicator::terminate_nccl() noexcept {
    if (!mNcclComm) return;
    ncclResult_t async_error = ncclSuccess;
    const ncclResult_t query = ncclCommGetAsyncError(mNcclComm, &async_error);
    if (std::uncaught_exceptions() == 0 && query == ncclSuccess && async_error == ncclSuccess) {
        if (cudaStreamSynchronize(mStream) != cudaSuccess || ncclCommFinalize(mNcclComm) != ncclSuccess) {
            fprintf(stderr, "WARNING: NCCL finalize failed on rank %d, aborting communicator\n", rank());
            ncclCommAbort(mNcclComm);
        } else {
            ncclCommDestroy(mNcclComm);
        }
    } else {
        ncclCommAbort(mNcclComm);
    }
    mNcclComm = nullptr;
}

void NCCLCommunicator::barrier() {
    std::byte* flag = mSendStage.reserve(1);
    ncclCheck(ncclAllReduce(flag, flag, 1, ncclChar, ncclSum, mNcclComm, mStream));
    CUDA_CHECK(cudaStreamSynchronize(mStream));
}

/**
 * @brief Variable-split all-to-all using grouped ncclSend/ncclRecv.
 *
 * NCCL has no native variable-split all-to-all. This implements it via:
 * ncclGroupStart(); for each peer: ncclSend + ncclRecv; ncclGroupEnd();
 * Split agreement is exchanged up front so mismatches are reported on all
 * ranks before any data moves.
 */
void NCCLCommunicator::all_to_all_single(const std::byte* send, std::byte* recv,
                                         const int* send_splits, const int* recv_splits,
                                         int elem_size) {
    const int world = world_size();
    std::vector<int> mine(2 * world);
    std::copy(send_splits, send_splits + world, mine.begin());
    std::copy(recv_splits, recv_splits + world, mine.begin() + world);
    const std::vector<int> all = host_all_gather(mine);
    for (int i = 0; i < world; ++i) {
        for (int j = 0; j < world; ++j) {
            const int sent = all[i * 2 * world + j];
            const int expected = all[j * 2 * world + world + i];
            if (sent != expected) {
                throw dispatch_protocol_error(fmt::format(
                    "all_to_all_single: rank {} sends {} elements to rank {}, which expects {}",
                    i, sent, j, expected));
            }
        }
    }

    std::size_t send_total = 0;
    std::size_t recv_total = 0;
    for (int peer = 0; peer < world; ++peer) {
        send_total += static_cast<std::size_t>(send_splits[peer]) * elem_size;
        recv_total += static_cast<std::size_t>(recv_splits[peer]) * elem_size;
    }
    std::byte* d_send = mSendStage.reserve(std::max<std::size_t>(send_total, 1));
    std::byte* d_recv = mRecvStage.reserve(std::max<std::size_t>(recv_total, 1));
    if (send_total > 0) {
        CUDA_CHECK(cudaMemcpyAsync(d_send, send, send_total, cudaMemcpyHostToDevice, mStream));
    }

    ncclCheck(ncclGroupStart());
    std::size_t send_offset = 0;
    std::size_t recv_offset = 0;
    for (int peer = 0; peer < world; ++peer) {
        std::size_t send_bytes = static_cast<std::size_t>(send_splits[peer]) * elem_size;
        std::size_t recv_bytes = static_cast<std::size_t>(recv_splits[peer]) * elem_size;
        if (send_bytes > 0) {
            ncclCheck(ncclSend(d_send + send_offset, send_bytes, ncclInt8, peer, mNcclComm, mStream));
        }
        if (recv_bytes > 0) {
            ncclCheck(ncclRecv(d_recv + recv_offset, recv_bytes, ncclInt8, peer, mNcclComm, mStream));
        }
        send_offset += send_bytes;
        recv_offset += recv_bytes;
    }
    ncclCheck(ncclGroupEnd());

    if (recv_total > 0) {
        CUDA_CHECK(cudaMemcpyAsync(recv, d_recv, recv_total, cudaMemcpyDeviceToHost, mStream));
    }
    CUDA_CHECK(cudaStreamSynchronize(mStream));
}

void NCCLCommunicator::all_gather_bytes(std::byte* recv, const std::byte* object, std::size_t size) {
    if (size == 0) return;
    std::byte* d_send = mSendStage.reserve(size);
    std::byte* d_recv = mRecvStage.reserve(size * world_size());
    CUDA_CHECK(cudaMemcpyAsync(d_send, object, size, cudaMemcpyHostToDevice, mStream));
    ncclCheck(ncclAllGather(d_send, d_recv, size, ncclChar, mNcclComm, mStream));
    CUDA_CHECK(cudaMemcpyAsync(recv, d_recv, size * world_size(), cudaMemcpyDeviceToHost, mStream));
    CUDA_CHECK(cudaStreamSynchronize(mStream));
}

void NCCLCommunicator::transfer_group_start() {
    if (mInTransfer) {
        throw std::logic_error("transfer_group_start: transfer group already open");
    }
    mInTransfer = true;
    mSends.clear();
    mRecvs.clear();
}

void NCCLCommunicator::send(const std::byte* src, std::size_t bytes, int peer) {
    if (!mInTransfer) throw std::logic_error("send: must be called between transfer_group_start/end");
    mSends.push_back({src, nullptr, bytes, peer});
}

void NCCLCommunicator::recv(std::byte* dst, std::size_t bytes, int peer) {
    if (!mInTransfer) throw std::logic_error("recv: must be called between transfer_group_start/end");
    mRecvs.push_back({nullptr, dst, bytes, peer});
}

/**
 * @brief Stage the queued host buffers and run them as one NCCL group.
 */
void NCCLCommunicator::transfer_group_end() {
    if (!mInTransfer) throw std::logic_error("transfer_group_end: no transfer group open");
    mInTransfer = false;

    std::size_t send_total = 0;
    std::size_t recv_total = 0;
    for (const auto& s : mSends) send_total += s.Bytes;
    for (const auto& r : mRecvs) recv_total += r.Bytes;

    std::byte* d_send = mSendStage.reserve(std::max<std::size_t>(send_total, 1));
    std::byte* d_recv = mRecvStage.reserve(std::max<std::size_t>(recv_total, 1));

    std::size_t offset = 0;
    for (const auto& s : mSends) {
        if (s.Bytes > 0) {
            CUDA_CHECK(cudaMemcpyAsync(d_send + offset, s.Src, s.Bytes, cudaMemcpyHostToDevice, mStream));
        }
        offset += s.Bytes;
    }

    ncclCheck(ncclGroupStart());
    offset = 0;
    for (const auto& s : mSends) {
        if (s.Bytes > 0) {
            ncclCheck(ncclSend(d_send + offset, s.Bytes, ncclInt8, s.Peer, mNcclComm, mStream));
        }
        offset += s.Bytes;
    }
    offset = 0;
    for (const auto& r : mRecvs) {
        if (r.Bytes > 0) {
            ncclCheck(ncclRecv(d_recv + offset, r.Bytes, ncclInt8, r.Peer, mNcclComm, mStream));
        }
        offset += r.Bytes;
    }
    ncclCheck(ncclGroupEnd());

    offset = 0;
    for (const auto& r : mRecvs) {
        if (r.Bytes > 0) {
            CUDA_CHECK(cudaMemcpyAsync(r.Dst, d_recv + offset, r.Bytes, cudaMemcpyDeviceToHost, mStream));
        }
        offset += r.Bytes;
    }
    CUDA_CHECK(cudaStreamSynchronize(mStream));
    mSends.clear();
    mRecvs.clear();
}

std::unique_ptr<Communicator> NCCLCommunicator::split_ep_group(int ep_size) {
    check_ep_size(ep_size, world_size());
    const int dp_rank = rank() / ep_size;
    const int ep_rank = rank() % ep_size;

    ncclComm_t ep_comm = nullptr;
    ncclCheck(ncclCommSplit(mNcclComm, dp_rank, ep_rank, &ep_comm, nullptr));
    if (rank() == 0) {
        fprintf(stderr, "[EP] Initialized EP groups: ep_size=%d, dp_size=%d, world_size=%d\n",
                ep_size, world_size() / ep_size, world_size());
    }
    return std::unique_ptr<Communicator>(new NCCLCommunicator(ep_rank, ep_size, ep_comm, mLocalDevice));
}

void NCCLCommunicator::run_communicators(int ngpus, std::function<void(Communicator& comm)> work) {
    int gpus_available = 0;
    CUDA_CHECK(cudaGetDeviceCount(&gpus_available));
    if (ngpus == 0) {
        ngpus = gpus_available;
    }
    if (ngpus <= 0 || ngpus > gpus_available) {
        throw std::runtime_error(fmt::format("Requested {} GPUs, but only {} available", ngpus, gpus_available));
    }

    ncclUniqueId nccl_id;
    ncclCheck(ncclGetUniqueId(&nccl_id));

    std::mutex mutex;
    std::vector<std::exception_ptr> exceptions(ngpus);
    {
        std::vector<std::jthread> threads;
        threads.reserve(ngpus);
        for (int rank = 0; rank < ngpus; ++rank) {
            threads.emplace_back([&, rank]() {
                try {
                    NCCLCommunicator comm(rank, ngpus, &nccl_id, rank);
                    work(comm);
                    comm.barrier();
                } catch (...) {
                    std::lock_guard<std::mutex> lock(mutex);
                    exceptions[rank] = std::current_exception();
                }
            });
        }
    }

    for (std::size_t t = 0; t < exceptions.size(); ++t) {
        if (exceptions[t]) {
            fprintf(stderr, "Thread %zu exited with uncaught exception\n", t);
            fflush(stderr);
            std::rethrow_exception(exceptions[t]);
        }
    }
}
