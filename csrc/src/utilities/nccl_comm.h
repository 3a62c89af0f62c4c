// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOESHARD_SRC_UTILITIES_NCCL_COMM_H
#define MOESHARD_SRC_UTILITIES_NCCL_COMM_H

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

#include "comm.h"

typedef struct ncclComm* ncclComm_t;
typedef struct CUstream_st* cudaStream_t;

/**
 * @brief Communicator backed by NCCL, one CUDA device per rank.
 *
 * The Communicator interface takes host buffers; this implementation stages
 * them through device memory and runs the collectives on a dedicated stream.
 * Each call synchronizes the stream before returning.
 */
class NCCLCommunicator : public Communicator {
public:
    NCCLCommunicator(int rank, int world, const void* nccl_id, int local_device = -1);
    ~NCCLCommunicator() override;

    void barrier() override;

    /// Variable-split all-to-all using grouped ncclSend/ncclRecv.
    void all_to_all_single(const std::byte* send, std::byte* recv,
                           const int* send_splits, const int* recv_splits,
                           int elem_size) override;

    void all_gather_bytes(std::byte* recv, const std::byte* object, std::size_t size) override;

    void transfer_group_start() override;
    void send(const std::byte* src, std::size_t bytes, int peer) override;
    void recv(std::byte* dst, std::size_t bytes, int peer) override;
    void transfer_group_end() override;

    /// Splits via ncclCommSplit (color = dp_rank, key = ep_rank).
    std::unique_ptr<Communicator> split_ep_group(int ep_size) override;

    [[nodiscard]] int local_device() const { return mLocalDevice; }
    [[nodiscard]] ncclComm_t comm() const { return mNcclComm; }
    [[nodiscard]] cudaStream_t stream() const { return mStream; }

    /**
     * @brief Run one worker thread per local GPU (blocking).
     *
     * @param ngpus Number of local GPUs to use (0 = auto-detect all available).
     * @param work Callable invoked once per GPU with that GPU's communicator.
     */
    static void run_communicators(int ngpus, std::function<void(Communicator& comm)> work);

private:
    NCCLCommunicator(int rank, int world, ncclComm_t comm, int local_device);

    void terminate_nccl() noexcept;

    // grow-only device staging buffer
    struct DeviceBuffer {
        std::byte* Ptr = nullptr;
        std::size_t Size = 0;
        std::byte* reserve(std::size_t bytes);
        void release() noexcept;
    };

    ncclComm_t mNcclComm = nullptr;
    int mLocalDevice;
    cudaStream_t mStream = nullptr;

    DeviceBuffer mSendStage;
    DeviceBuffer mRecvStage;

    bool mInTransfer = false;
    struct PendingTransfer {
        const std::byte* Src;   // sends only
        std::byte* Dst;         // receives only
        std::size_t Bytes;
        int Peer;
    };
    std::vector<PendingTransfer> mSends;
    std::vector<PendingTransfer> mRecvs;
};

#endif //MOESHARD_SRC_UTILITIES_NCCL_COMM_H
