// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOESHARD_SRC_MODULES_MOE_TOKEN_DISPATCHER_H
#define MOESHARD_SRC_MODULES_MOE_TOKEN_DISPATCHER_H

#include <cstdint>
#include <vector>

#include "utilities/tensor.h"

class Communicator;

namespace modules {

class ExpertOwnershipTable;

/**
 * @brief Bookkeeping that lets unpermute invert a permute exactly.
 *
 * Send side: the flat (token * top_k + slot) id of each row in the send buffer,
 * grouped by destination rank and destination local expert. Receive side: where
 * each received row lands in the expert-grouped buffer, and which origin
 * (rank, token, slot) every grouped row belongs to.
 */
struct RoutingMap {
    struct Entry {
        int origin_rank;    ///< EP rank that owns the token
        int origin_token;   ///< Row in the origin rank's batch
        int slot;           ///< Which of the token's top_k choices
    };

    std::uint64_t table_version = 0;    ///< Ownership table the map was built against
    int num_tokens = 0;
    int top_k = 0;
    int num_local_experts = 0;

    std::vector<int> send_slots;        ///< (num_tokens * top_k) send row -> flat slot id
    std::vector<int> send_splits;       ///< (ep_size) rows sent to each rank
    std::vector<int> recv_splits;       ///< (ep_size) rows received from each rank
    std::vector<int> recv_counts;       ///< (ep_size, num_local_experts) rows from rank p for local expert l
    std::vector<int> recv_to_grouped;   ///< receive row -> grouped row
    std::vector<Entry> entries;         ///< grouped row -> origin

    [[nodiscard]] int num_dispatched() const { return static_cast<int>(entries.size()); }
};

struct DispatchOutput {
    HostTensor dispatched_tokens;               ///< (M, hidden) rows grouped by local expert
    std::vector<int> tokens_per_local_expert;   ///< (num_local_experts), sums to M
    Tensor scores;                              ///< (N, top_k) routing scores, passed through
    Tensor expert_indices;                      ///< (N, top_k) routing ids, passed through
    RoutingMap routing_map;
};

struct CombineOutput {
    HostTensor output;  ///< (N, hidden) in input order
    HostTensor bias;    ///< (N, hidden) combined expert bias; null tensor when experts have none
};

/**
 * @brief Dropless token dispatcher over an expert-parallel group.
 *
 * permute() sends every (token, slot) pair to the rank hosting its expert, with
 * buffers sized exactly from the exchanged counts; unpermute() reverses the
 * exchange and combines the k expert outputs of each token weighted by its
 * routing scores. Both are collective over the EP communicator.
 */
class DroplessTokenDispatcher {
public:
    DroplessTokenDispatcher(Communicator& ep_comm, int num_experts, int top_k, int hidden_size);

    /// @throws dispatch_protocol_error for expert ids outside [0, num_experts) or mismatched exchanges.
    [[nodiscard]] DispatchOutput permute(const Tensor& tokens, const Tensor& scores, const Tensor& expert_indices,
                                         const ExpertOwnershipTable& table) const;

    /// @param expert_outputs (M, hidden) rows in the grouped order produced by permute.
    /// @param expert_bias Optional (M, hidden) per-row bias; pass a null Tensor if none.
    /// @param current_version Version of the ownership table currently in force.
    /// @throws dispatch_protocol_error on a stale map, a row-count mismatch, or slot ids that
    ///         do not come back in the order they were sent.
    [[nodiscard]] CombineOutput unpermute(const Tensor& expert_outputs, const Tensor& expert_bias,
                                          const Tensor& scores, const Tensor& expert_indices,
                                          const RoutingMap& routing_map, std::uint64_t current_version) const;

    [[nodiscard]] int num_experts() const { return mNumExperts; }
    [[nodiscard]] int top_k() const { return mTopK; }

private:
    HostTensor return_rows(const Tensor& grouped, const RoutingMap& map) const;

    Communicator* mComm;
    int mNumExperts;
    int mTopK;
    int mHiddenSize;
};

} // namespace modules

#endif //MOESHARD_SRC_MODULES_MOE_TOKEN_DISPATCHER_H
