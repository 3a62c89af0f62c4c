// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Rebalancing policies used by the load balancer.

#ifndef MOESHARD_SRC_RUNTIME_EP_BALANCE_POLICY_H
#define MOESHARD_SRC_RUNTIME_EP_BALANCE_POLICY_H

#include <memory>
#include <vector>

#include "config/moe_config.h"
#include "runtime/ep/lpt_planner.h"

namespace modules {
class ExpertOwnershipTable;
}

namespace ep {

/// What a policy wants changed. Empty vectors mean "leave as is".
struct BalancePlan {
    std::vector<int> new_owners;                ///< [num_experts] new placement, or empty
    std::vector<WeightTransferEntry> transfers; ///< moves needed to reach new_owners
    std::vector<float> bias_delta;              ///< [num_experts] router selection bias change, or empty
    float ratio_before = 1.0f;                  ///< max/mean rank load under the current placement
    float ratio_after = 1.0f;                   ///< same under the proposed placement

    [[nodiscard]] bool moves_experts() const { return !new_owners.empty(); }
    [[nodiscard]] bool changes_router() const { return !bias_delta.empty(); }
};

/**
 * @brief Decides how to react to an observed per-expert load.
 *
 * plan() must be a pure function of its arguments: every rank of the EP group
 * calls it with the same gathered loads and must arrive at the same plan.
 * Any returned placement keeps every expert owned by exactly one rank.
 */
class IBalancePolicy {
public:
    virtual ~IBalancePolicy() = default;

    [[nodiscard]] virtual const char* name() const = 0;
    [[nodiscard]] virtual BalancePlan plan(const std::vector<long>& expert_loads,
                                           const modules::ExpertOwnershipTable& table) const = 0;
};

/// LPT placement; adopted only if it lowers the rank load ratio by at least the threshold.
class ExpertPlacementPolicy final : public IBalancePolicy {
public:
    explicit ExpertPlacementPolicy(float improvement_threshold);

    [[nodiscard]] const char* name() const override { return "placement"; }
    [[nodiscard]] BalancePlan plan(const std::vector<long>& expert_loads,
                                   const modules::ExpertOwnershipTable& table) const override;

private:
    float mThreshold;
};

/// Moves the router's selection bias toward under-loaded experts; never migrates.
class RouterBiasPolicy final : public IBalancePolicy {
public:
    explicit RouterBiasPolicy(float update_rate);

    [[nodiscard]] const char* name() const override { return "router_bias"; }
    [[nodiscard]] BalancePlan plan(const std::vector<long>& expert_loads,
                                   const modules::ExpertOwnershipTable& table) const override;

private:
    float mRate;
};

std::unique_ptr<IBalancePolicy> make_balance_policy(const MoELayerConfig& config);

}  // namespace ep

#endif  // MOESHARD_SRC_RUNTIME_EP_BALANCE_POLICY_H
