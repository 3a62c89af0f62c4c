// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// LPT (Longest Processing Time) planner for expert placement.
// Computes a new expert -> rank assignment from observed per-expert loads,
// with the same number of experts on every rank.

#ifndef MOESHARD_SRC_RUNTIME_EP_LPT_PLANNER_H
#define MOESHARD_SRC_RUNTIME_EP_LPT_PLANNER_H

#include <vector>

namespace ep {

/// Describes an expert moving between two EP ranks.
struct WeightTransferEntry {
    int expert_id;      ///< Global expert ID
    int src_rank;       ///< Rank that currently owns the expert
    int dst_rank;       ///< Rank that will own it after the move
};

/// Complete placement plan for a single layer.
struct PlacementPlan {
    /// New owner of every expert: expert_to_rank[expert_id] = EP rank
    std::vector<int> expert_to_rank;

    /// Per-rank load (token count) under the new placement
    std::vector<long> rank_loads;

    /// max / mean rank load before and after
    float ratio_before = 1.0f;
    float ratio_after = 1.0f;

    /// Experts whose owner changes
    std::vector<WeightTransferEntry> transfers;
};

/// Per-rank load of a placement.
std::vector<long> compute_rank_loads(
    const std::vector<long>& expert_loads,   ///< [num_experts] token counts per expert
    const std::vector<int>& expert_to_rank,  ///< [num_experts] owner per expert
    int ep_size);

/// Compute the rank load imbalance ratio of a placement.
/// Returns max_load / mean_load (1.0 = perfectly balanced, also for no load at all).
float compute_imbalance_ratio(
    const std::vector<long>& expert_loads,
    const std::vector<int>& expert_to_rank,
    int ep_size);

/// Compute an LPT placement with num_local_experts slots per rank.
///
/// Sorts experts by load (largest first, lower id first on ties) and assigns
/// each to the least-loaded rank that still has a free slot. An expert stays
/// on its current owner whenever that owner is one of the least-loaded ranks
/// with a free slot, so an already balanced placement produces no transfers.
///
/// @param expert_loads       [num_experts] global token counts
/// @param current_owners     [num_experts] current expert -> rank mapping
/// @param ep_size            Number of ranks in the EP group
/// @param num_local_experts  Slots per rank (num_experts / ep_size)
PlacementPlan compute_lpt_placement(
    const std::vector<long>& expert_loads,
    const std::vector<int>& current_owners,
    int ep_size,
    int num_local_experts);

}  // namespace ep

#endif  // MOESHARD_SRC_RUNTIME_EP_LPT_PLANNER_H
