// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOESHARD_SRC_UTILITIES_COMM_H
#define MOESHARD_SRC_UTILITIES_COMM_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <type_traits>
#include <vector>

class CommunicatorThreadsPack {
public:
    virtual ~CommunicatorThreadsPack() = default;
    virtual void join() = 0;
    virtual bool has_exception() const = 0;
};

/**
 * @brief Collective communication substrate for one expert-parallel worker.
 *
 * All buffers passed to a Communicator are host buffers. Implementations that
 * talk to devices stage through device memory internally. Every collective must
 * be entered by all members of the communicator, in the same order.
 */
class Communicator {
public:
    Communicator(int rank, int world);
    virtual ~Communicator();

    Communicator(const Communicator&) = delete;
    Communicator& operator=(const Communicator&) = delete;

    // Cpu-side barrier across all members
    virtual void barrier() = 0;

    [[nodiscard]] int rank() const { return mRank; }
    [[nodiscard]] int world_size() const { return mWorld; }

    // ========================================================================
    // Variable-split all-to-all (for EP token routing)
    // ========================================================================

    /// Variable-split all-to-all.
    /// send_splits[i] = number of elements to send to rank i
    /// recv_splits[i] = number of elements to receive from rank i
    /// @param send Source buffer (contiguous, split according to send_splits)
    /// @param recv Destination buffer (contiguous, split according to recv_splits)
    /// @param send_splits Array of world_size() ints: per-peer send counts (in elements)
    /// @param recv_splits Array of world_size() ints: per-peer recv counts (in elements)
    /// @param elem_size Size of each element in bytes
    /// @throws dispatch_protocol_error if send and receive splits disagree between any pair of ranks
    virtual void all_to_all_single(const std::byte* send, std::byte* recv,
                                   const int* send_splits, const int* recv_splits,
                                   int elem_size) = 0;

    /// Equal-split all-to-all of int counts: sends send_counts[p*n .. p*n+n) to rank p,
    /// receives rank p's block into recv_counts[p*n .. p*n+n).
    void all_to_all_counts(const int* send_counts, int* recv_counts, int n);

    //! All-gather of a fixed-size host blob; recv must hold world_size() * size bytes.
    virtual void all_gather_bytes(std::byte* recv, const std::byte* object, std::size_t size) = 0;

    template<typename T>
    std::vector<T> host_all_gather(const T& object) {
        static_assert(std::is_trivially_copyable_v<T>, "Cannot communicate type with non-trivial copy operator");
        std::vector<T> result(world_size());
        all_gather_bytes(reinterpret_cast<std::byte*>(result.data()), reinterpret_cast<const std::byte*>(&object), sizeof(T));
        return result;
    }

    //! All-gather of equally sized vectors; the result is the concatenation in rank order.
    template<typename T>
    std::vector<T> host_all_gather(const std::vector<T>& values) {
        static_assert(std::is_trivially_copyable_v<T>, "Cannot communicate type with non-trivial copy operator");
        std::vector<T> result(values.size() * world_size());
        all_gather_bytes(reinterpret_cast<std::byte*>(result.data()), reinterpret_cast<const std::byte*>(values.data()),
                         values.size() * sizeof(T));
        return result;
    }

    // ========================================================================
    // Batched point-to-point transfers (expert migration)
    // ========================================================================
    // Every member calls transfer_group_start() / transfer_group_end(), even if it
    // has nothing to send or receive. The n-th recv from a peer matches the n-th
    // send from that peer to this rank.

    virtual void transfer_group_start() = 0;
    virtual void send(const std::byte* src, std::size_t bytes, int peer) = 0;
    virtual void recv(std::byte* dst, std::size_t bytes, int peer) = 0;
    virtual void transfer_group_end() = 0;

    /// Split into expert-parallel groups. Collective over this communicator.
    /// Rank mapping: ep_rank = rank % ep_size, dp_rank = rank / ep_size; the returned
    /// communicator spans the ep_size ranks sharing this rank's dp_rank.
    /// @throws configuration_error if ep_size doesn't divide world_size.
    virtual std::unique_ptr<Communicator> split_ep_group(int ep_size) = 0;

    /**
     * @brief Run @p nranks in-process workers, one thread each, over shared host memory (blocking).
     *
     * The first exception thrown by any worker is rethrown after all threads have finished.
     *
     * @param nranks Number of workers.
     * @param work Callable invoked once per worker with that worker's communicator.
     */
    static void run_communicators(int nranks, std::function<void(Communicator& comm)> work);

    /**
     * @brief Launch in-process workers and return a joinable pack (non-blocking).
     */
    static std::unique_ptr<CommunicatorThreadsPack> launch_communicators(int nranks, std::function<void(Communicator& comm)> work);

protected:
    static void check_ep_size(int ep_size, int world);

private:
    int mRank;
    int mWorld;
};

#endif //MOESHARD_SRC_UTILITIES_COMM_H
