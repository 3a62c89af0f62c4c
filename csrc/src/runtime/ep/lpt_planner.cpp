// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "runtime/ep/lpt_planner.h"

#include <algorithm>
#include <numeric>
#include <stdexcept>

#include <fmt/core.h>

namespace ep {

std::vector<long> compute_rank_loads(
    const std::vector<long>& expert_loads,
    const std::vector<int>& expert_to_rank,
    int ep_size) {

    if (expert_loads.size() != expert_to_rank.size()) {
        throw std::logic_error(fmt::format("compute_rank_loads: {} loads for {} experts",
                                           expert_loads.size(), expert_to_rank.size()));
    }
    std::vector<long> rank_loads(ep_size, 0);
    for (std::size_t e = 0; e < expert_loads.size(); ++e) {
        const int rank = expert_to_rank[e];
        if (rank < 0 || rank >= ep_size) {
            throw std::logic_error(fmt::format("compute_rank_loads: expert {} owned by invalid rank {}", e, rank));
        }
        rank_loads[rank] += expert_loads[e];
    }
    return rank_loads;
}

float compute_imbalance_ratio(
    const std::vector<long>& expert_loads,
    const std::vector<int>& expert_to_rank,
    int ep_size) {

    const std::vector<long> rank_loads = compute_rank_loads(expert_loads, expert_to_rank, ep_size);
    const long max_load = *std::max_element(rank_loads.begin(), rank_loads.end());
    const long total = std::accumulate(rank_loads.begin(), rank_loads.end(), 0L);
    const float mean_load = static_cast<float>(total) / ep_size;

    if (mean_load <= 0.0f) return 1.0f;
    return static_cast<float>(max_load) / mean_load;
}

PlacementPlan compute_lpt_placement(
    const std::vector<long>& expert_loads,
    const std::vector<int>& current_owners,
    int ep_size,
    int num_local_experts) {

    const int num_experts = static_cast<int>(expert_loads.size());
    if (ep_size <= 0 || num_local_experts * ep_size != num_experts) {
        throw std::logic_error(fmt::format("compute_lpt_placement: {} experts do not fill {} ranks x {} slots",
                                           num_experts, ep_size, num_local_experts));
    }

    PlacementPlan plan;
    plan.ratio_before = compute_imbalance_ratio(expert_loads, current_owners, ep_size);
    plan.expert_to_rank.assign(num_experts, -1);
    plan.rank_loads.assign(ep_size, 0);
    std::vector<int> free_slots(ep_size, num_local_experts);

    // LPT ordering: heaviest expert first, lower id first on ties
    std::vector<int> order(num_experts);
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](int a, int b) {
        if (expert_loads[a] != expert_loads[b]) return expert_loads[a] > expert_loads[b];
        return a < b;
    });

    for (int expert_id : order) {
        // Least-loaded rank with a free slot; lowest rank on ties
        int best_rank = -1;
        for (int r = 0; r < ep_size; ++r) {
            if (free_slots[r] == 0) continue;
            if (best_rank < 0 || plan.rank_loads[r] < plan.rank_loads[best_rank]) {
                best_rank = r;
            }
        }

        // Keep the expert where it is if its owner is just as good
        const int owner = current_owners[expert_id];
        if (free_slots[owner] > 0 && plan.rank_loads[owner] == plan.rank_loads[best_rank]) {
            best_rank = owner;
        }

        plan.expert_to_rank[expert_id] = best_rank;
        plan.rank_loads[best_rank] += expert_loads[expert_id];
        --free_slots[best_rank];

        if (best_rank != owner) {
            plan.transfers.push_back({expert_id, owner, best_rank});
        }
    }

    // Transfers in expert id order so every rank iterates them identically
    std::sort(plan.transfers.begin(), plan.transfers.end(),
              [](const auto& a, const auto& b) { return a.expert_id < b.expert_id; });

    plan.ratio_after = compute_imbalance_ratio(expert_loads, plan.expert_to_rank, ep_size);
    return plan;
}

}  // namespace ep
