// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "comm.h"

#include <barrier>
#include <cstdio>
#include <cstring>
#include <exception>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

#include <fmt/core.h>

#include "errors.h"

Communicator::Communicator(int rank, int world) : mRank(rank), mWorld(world) {
    if (world <= 0 || rank < 0 || rank >= world) {
        throw std::logic_error(fmt::format("Communicator: invalid rank {} for world size {}", rank, world));
    }
}

Communicator::~Communicator() = default;

void Communicator::check_ep_size(int ep_size, int world) {
    if (ep_size <= 0 || world % ep_size != 0) {
        throw configuration_error(fmt::format(
            "split_ep_group: ep_size ({}) must divide world_size ({})", ep_size, world));
    }
}

/**
 * @brief Equal-split all-to-all of integer counts.
 *
 * Used to exchange the per-(peer, local expert) token counts ahead of the
 * variable-split token exchange.
 *
 * @param send_counts world_size() * n ints; block p goes to rank p.
 * @param recv_counts world_size() * n ints; block p arrives from rank p.
 * @param n Number of ints per peer.
 */
void Communicator::all_to_all_counts(const int* send_counts, int* recv_counts, int n) {
    std::vector<int> splits(world_size(), n);
    all_to_all_single(reinterpret_cast<const std::byte*>(send_counts), reinterpret_cast<std::byte*>(recv_counts),
                      splits.data(), splits.data(), sizeof(int));
}

/**
 * @brief Communicator for in-process workers, one thread per rank.
 *
 * Uses std::barrier for synchronization and shared memory for data exchange:
 * every collective publishes this rank's pointers into a shared slot, waits for
 * all peers, then pulls the data it needs directly from the peers' buffers.
 */
class HostCommunicator : public Communicator {
public:
    struct SharedState {
        struct PendingSend {
            const std::byte* Src;
            std::size_t Bytes;
            int Peer;
        };

        struct Slot {
            const std::byte* Send = nullptr;
            const int* SendSplits = nullptr;
            const int* RecvSplits = nullptr;
            int ElemSize = 0;
            const std::vector<PendingSend>* Sends = nullptr;
        };

        struct Gather {
            const std::byte* Object = nullptr;
            std::size_t Size = 0;
            bool Entered = false;
        };

        std::unique_ptr<std::barrier<>> Barrier;
        std::vector<Gather> Gathers;        // one entry per thread
        std::vector<Slot> Slots;            // one slot per thread
        std::vector<std::exception_ptr> Exceptions;
        std::mutex Mutex;

        // sub-groups created by split_ep_group, keyed by (split generation, dp_rank)
        std::map<std::pair<int, int>, std::shared_ptr<SharedState>> Groups;

        explicit SharedState(int n) :
            Barrier(std::make_unique<std::barrier<>>(n)), Gathers(n), Slots(n), Exceptions(n) {}
    };

    HostCommunicator(int rank, int world, std::shared_ptr<SharedState> state) :
        Communicator(rank, world), mShare(std::move(state)) {}

    /**
     * @brief Drops out of the shared barrier on destruction, so peers blocked in a
     * collective are released if this rank exits early.
     */
    ~HostCommunicator() override {
        if (mShare && mShare->Barrier) {
            mShare->Barrier->arrive_and_drop();
        }
    }

    void barrier() override {
        local_barrier();
    }

    void all_to_all_single(const std::byte* send, std::byte* recv,
                           const int* send_splits, const int* recv_splits,
                           int elem_size) override;

    void all_gather_bytes(std::byte* recv, const std::byte* object, std::size_t size) override;

    void transfer_group_start() override;
    void send(const std::byte* src, std::size_t bytes, int peer) override;
    void recv(std::byte* dst, std::size_t bytes, int peer) override;
    void transfer_group_end() override;

    std::unique_ptr<Communicator> split_ep_group(int ep_size) override;

private:
    void local_barrier() {
        mShare->Barrier->arrive_and_wait();
    }

    void check_peer(int peer, const char* op) const {
        if (peer < 0 || peer >= world_size()) {
            throw std::logic_error(fmt::format("{}: invalid peer {} (world size {})", op, peer, world_size()));
        }
    }

    std::shared_ptr<SharedState> mShare;
    int mSplitGeneration = 0;

    bool mInTransfer = false;
    std::vector<SharedState::PendingSend> mSends;

    struct PendingRecv {
        std::byte* Dst;
        std::size_t Bytes;
        int Peer;
    };
    std::vector<PendingRecv> mRecvs;
};

/**
 * @brief Variable-split all-to-all over shared memory.
 *
 * Every rank validates the complete send/receive split matrix, so a mismatch is
 * detected identically on all ranks and the whole group fails together instead
 * of some ranks blocking in the next collective.
 */
void HostCommunicator::all_to_all_single(const std::byte* send, std::byte* recv,
                                         const int* send_splits, const int* recv_splits,
                                         int elem_size) {
    const int world = world_size();
    auto& slots = mShare->Slots;

    local_barrier();
    slots[rank()] = SharedState::Slot{send, send_splits, recv_splits, elem_size, nullptr};
    local_barrier();

    for (int i = 0; i < world; ++i) {
        if (slots[i].SendSplits == nullptr) {
            throw std::runtime_error(fmt::format("all_to_all_single: rank {} did not enter the collective", i));
        }
        if (slots[i].ElemSize != elem_size) {
            throw dispatch_protocol_error(fmt::format(
                "all_to_all_single: element size mismatch (rank {} uses {}, rank {} uses {})",
                i, slots[i].ElemSize, rank(), elem_size));
        }
    }
    for (int i = 0; i < world; ++i) {
        for (int j = 0; j < world; ++j) {
            if (slots[i].SendSplits[j] != slots[j].RecvSplits[i]) {
                throw dispatch_protocol_error(fmt::format(
                    "all_to_all_single: rank {} sends {} elements to rank {}, which expects {}",
                    i, slots[i].SendSplits[j], j, slots[j].RecvSplits[i]));
            }
        }
    }

    std::size_t recv_offset = 0;
    for (int peer = 0; peer < world; ++peer) {
        std::size_t src_offset = 0;
        for (int q = 0; q < rank(); ++q) {
            src_offset += static_cast<std::size_t>(slots[peer].SendSplits[q]) * elem_size;
        }
        std::size_t bytes = static_cast<std::size_t>(recv_splits[peer]) * elem_size;
        if (bytes > 0) {
            std::memcpy(recv + recv_offset, slots[peer].Send + src_offset, bytes);
        }
        recv_offset += bytes;
    }
    local_barrier();
    slots[rank()] = SharedState::Slot{};
}

void HostCommunicator::all_gather_bytes(std::byte* recv, const std::byte* object, std::size_t size) {
    local_barrier();
    mShare->Gathers[rank()] = SharedState::Gather{object, size, true};
    local_barrier();
    // all ranks check every entry, so a mismatch fails the whole group
    std::exception_ptr error;
    for (int i = 0; i < world_size() && !error; ++i) {
        const auto& g = mShare->Gathers[i];
        if (!g.Entered) {
            error = std::make_exception_ptr(std::runtime_error(
                fmt::format("all_gather_bytes: rank {} did not enter the collective", i)));
        } else if (g.Size != size) {
            error = std::make_exception_ptr(dispatch_protocol_error(
                fmt::format("all_gather_bytes: rank {} contributes {} bytes, rank {} expects {}", i, g.Size, rank(), size)));
        }
    }
    if (!error && size > 0) {
        for (int i = 0; i < world_size(); ++i) {
            std::memcpy(recv + i * size, mShare->Gathers[i].Object, size);
        }
    }
    local_barrier();
    mShare->Gathers[rank()] = SharedState::Gather{};
    if (error) {
        std::rethrow_exception(error);
    }
}

void HostCommunicator::transfer_group_start() {
    if (mInTransfer) {
        throw std::logic_error("transfer_group_start: transfer group already open");
    }
    mInTransfer = true;
    mSends.clear();
    mRecvs.clear();
}

void HostCommunicator::send(const std::byte* src, std::size_t bytes, int peer) {
    if (!mInTransfer) throw std::logic_error("send: must be called between transfer_group_start/end");
    check_peer(peer, "send");
    mSends.push_back({src, bytes, peer});
}

void HostCommunicator::recv(std::byte* dst, std::size_t bytes, int peer) {
    if (!mInTransfer) throw std::logic_error("recv: must be called between transfer_group_start/end");
    check_peer(peer, "recv");
    mRecvs.push_back({dst, bytes, peer});
}

/**
 * @brief Execute the queued point-to-point transfers (collective).
 *
 * Each rank matches its receives against the sends its peers queued for it, in
 * posting order, and copies directly from the sender's buffer.
 *
 * @throws std::runtime_error If the number or size of sends and receives between a pair of ranks disagree.
 */
void HostCommunicator::transfer_group_end() {
    if (!mInTransfer) throw std::logic_error("transfer_group_end: no transfer group open");
    mInTransfer = false;

    auto& slots = mShare->Slots;
    local_barrier();
    slots[rank()].Sends = &mSends;
    local_barrier();

    std::vector<std::vector<const SharedState::PendingSend*>> incoming(world_size());
    for (int peer = 0; peer < world_size(); ++peer) {
        if (slots[peer].Sends == nullptr) {
            throw std::runtime_error(fmt::format("transfer_group_end: rank {} did not enter the collective", peer));
        }
        for (const auto& s : *slots[peer].Sends) {
            if (s.Peer == rank()) incoming[peer].push_back(&s);
        }
    }

    std::vector<std::size_t> matched(world_size(), 0);
    for (const auto& r : mRecvs) {
        auto& queue = incoming[r.Peer];
        if (matched[r.Peer] >= queue.size()) {
            throw std::runtime_error(fmt::format(
                "transfer_group_end: rank {} posted a receive from rank {} without a matching send", rank(), r.Peer));
        }
        const auto* s = queue[matched[r.Peer]++];
        if (s->Bytes != r.Bytes) {
            throw std::runtime_error(fmt::format(
                "transfer_group_end: size mismatch between rank {} (sends {} bytes) and rank {} (expects {} bytes)",
                r.Peer, s->Bytes, rank(), r.Bytes));
        }
        if (r.Bytes > 0) {
            std::memcpy(r.Dst, s->Src, r.Bytes);
        }
    }
    for (int peer = 0; peer < world_size(); ++peer) {
        if (matched[peer] != incoming[peer].size()) {
            throw std::runtime_error(fmt::format(
                "transfer_group_end: rank {} sent {} buffers to rank {}, which received {}",
                peer, incoming[peer].size(), rank(), matched[peer]));
        }
    }

    local_barrier();
    slots[rank()].Sends = nullptr;
    mSends.clear();
    mRecvs.clear();
}

std::unique_ptr<Communicator> HostCommunicator::split_ep_group(int ep_size) {
    check_ep_size(ep_size, world_size());
    const int dp_rank = rank() / ep_size;
    const int ep_rank = rank() % ep_size;
    const int generation = mSplitGeneration++;

    local_barrier();
    std::shared_ptr<SharedState> group;
    {
        std::lock_guard<std::mutex> lock(mShare->Mutex);
        auto& entry = mShare->Groups[{generation, dp_rank}];
        if (!entry) {
            entry = std::make_shared<SharedState>(ep_size);
        }
        group = entry;
    }
    local_barrier();
    if (ep_rank == 0) {
        std::lock_guard<std::mutex> lock(mShare->Mutex);
        mShare->Groups.erase({generation, dp_rank});
    }
    return std::make_unique<HostCommunicator>(ep_rank, ep_size, std::move(group));
}

// ============================================================================
// Thread Pack for managing worker threads
// ============================================================================

class CommunicatorThreadsPackImpl : public CommunicatorThreadsPack {
public:
    CommunicatorThreadsPackImpl(std::vector<std::jthread> threads,
                                std::shared_ptr<HostCommunicator::SharedState> state)
        : mThreads(std::move(threads)), mState(std::move(state)) {}

    ~CommunicatorThreadsPackImpl() override {
        for (auto& t : mThreads) {
            if (t.joinable()) {
                t.join();
            }
        }
        if (has_exception()) {
            fprintf(stderr, "WARNING: worker threads exited with uncaught exceptions that were never joined\n");
            fflush(stderr);
        }
    }

    void join() override {
        for (auto& t : mThreads) {
            if (t.joinable()) {
                t.join();
            }
        }
        check_exceptions();
    }

    bool has_exception() const override {
        std::lock_guard<std::mutex> lock(mState->Mutex);
        for (const auto& e : mState->Exceptions) {
            if (e) return true;
        }
        return false;
    }

private:
    void check_exceptions() {
        std::lock_guard<std::mutex> lock(mState->Mutex);
        for (size_t t = 0; t < mThreads.size(); ++t) {
            if (auto error = mState->Exceptions[t]; error) {
                fprintf(stderr, "Thread %zu exited with uncaught exception\n", t);
                fflush(stderr);
                mState->Exceptions[t] = nullptr;
                std::rethrow_exception(error);
            }
        }
    }

    std::vector<std::jthread> mThreads;
    std::shared_ptr<HostCommunicator::SharedState> mState;
};

// ============================================================================
// Main Entry Points
// ============================================================================

std::unique_ptr<CommunicatorThreadsPack> Communicator::launch_communicators(
    int nranks, std::function<void(Communicator& comm)> work) {
    if (nranks <= 0) {
        throw std::logic_error(fmt::format("launch_communicators: need at least one rank, got {}", nranks));
    }

    auto shared_state = std::make_shared<HostCommunicator::SharedState>(nranks);
    auto shared_work = std::make_shared<std::function<void(Communicator&)>>(std::move(work));

    std::vector<std::jthread> threads;
    threads.reserve(nranks);
    for (int rank = 0; rank < nranks; ++rank) {
        threads.emplace_back([=]() {
            try {
                HostCommunicator comm(rank, nranks, shared_state);
                (*shared_work)(comm);
                shared_state->Barrier->arrive_and_wait();
            } catch (...) {
                std::lock_guard<std::mutex> lock(shared_state->Mutex);
                shared_state->Exceptions[rank] = std::current_exception();
            }
        });
    }

    return std::make_unique<CommunicatorThreadsPackImpl>(std::move(threads), shared_state);
}

void Communicator::run_communicators(int nranks, std::function<void(Communicator& comm)> work) {
    auto pack = launch_communicators(nranks, std::move(work));
    pack->join();
}
