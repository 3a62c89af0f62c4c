// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "runtime/ep/balance_policy.h"

#include <numeric>
#include <stdexcept>

#include <fmt/core.h>

#include "modules/moe/expert_partition.h"
#include "utilities/errors.h"

namespace ep {

ExpertPlacementPolicy::ExpertPlacementPolicy(float improvement_threshold) : mThreshold(improvement_threshold) {
    if (improvement_threshold < 0.f) {
        throw configuration_error(fmt::format("improvement threshold must be non-negative, got {}", improvement_threshold));
    }
}

BalancePlan ExpertPlacementPolicy::plan(const std::vector<long>& expert_loads,
                                        const modules::ExpertOwnershipTable& table) const {
    PlacementPlan lpt = compute_lpt_placement(expert_loads, table.owners(), table.ep_size(), table.num_local_experts());

    BalancePlan result;
    result.ratio_before = lpt.ratio_before;
    result.ratio_after = lpt.ratio_before;
    const float improvement = lpt.ratio_before - lpt.ratio_after;
    if (lpt.transfers.empty() || improvement <= 0.f || improvement < mThreshold) {
        return result;
    }
    result.ratio_after = lpt.ratio_after;
    result.new_owners = std::move(lpt.expert_to_rank);
    result.transfers = std::move(lpt.transfers);
    return result;
}

RouterBiasPolicy::RouterBiasPolicy(float update_rate) : mRate(update_rate) {
    if (update_rate < 0.f) {
        throw configuration_error(fmt::format("bias update rate must be non-negative, got {}", update_rate));
    }
}

/// bias[e] += rate * sign(mean - load[e])
BalancePlan RouterBiasPolicy::plan(const std::vector<long>& expert_loads,
                                   const modules::ExpertOwnershipTable& table) const {
    BalancePlan result;
    result.ratio_before = compute_imbalance_ratio(expert_loads, table.owners(), table.ep_size());
    result.ratio_after = result.ratio_before;

    const long total = std::accumulate(expert_loads.begin(), expert_loads.end(), 0L);
    if (total == 0) {
        return result;
    }
    const double mean = static_cast<double>(total) / static_cast<double>(expert_loads.size());
    result.bias_delta.resize(expert_loads.size());
    for (std::size_t e = 0; e < expert_loads.size(); ++e) {
        const double diff = mean - static_cast<double>(expert_loads[e]);
        result.bias_delta[e] = diff > 0 ? mRate : (diff < 0 ? -mRate : 0.f);
    }
    return result;
}

std::unique_ptr<IBalancePolicy> make_balance_policy(const MoELayerConfig& config) {
    switch (config.balance_policy) {
        case EBalancePolicy::ExpertPlacement:
            return std::make_unique<ExpertPlacementPolicy>(config.improvement_threshold);
        case EBalancePolicy::RouterBias:
            return std::make_unique<RouterBiasPolicy>(config.bias_update_rate);
    }
    throw std::logic_error("make_balance_policy: unhandled policy");
}

}  // namespace ep
