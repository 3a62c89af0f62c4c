// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "runtime/ep/load_balancer.h"

#include <algorithm>
#include <stdexcept>

#include <fmt/core.h>

#include "modules/moe/expert_bank.h"
#include "modules/moe/expert_partition.h"
#include "modules/moe/router.h"
#include "runtime/optimizers/expert_optimizer_state.h"
#include "training/logging.h"
#include "utilities/comm.h"
#include "utilities/errors.h"

namespace ep {

namespace {

/// Puts the balancer back into Observing when balance_load leaves, normally or not.
class RebalancingScope {
public:
    explicit RebalancingScope(EBalancerState& state) : mState(state) { mState = EBalancerState::Rebalancing; }
    ~RebalancingScope() { mState = EBalancerState::Observing; }
private:
    EBalancerState& mState;
};

}  // namespace

LoadBalancer::LoadBalancer(Communicator& ep_comm,
                           modules::ExpertOwnershipRegistry& registry,
                           modules::ExpertBank& bank,
                           modules::TopKRouter& router,
                           std::unique_ptr<IBalancePolicy> policy,
                           int window,
                           MoERunLogger* logger,
                           std::string name) :
    mComm(&ep_comm), mRegistry(&registry), mBank(&bank), mRouter(&router), mPolicy(std::move(policy)),
    mLogger(logger), mName(std::move(name)), mWindow(window), mNumLocal(bank.num_local_experts())
{
    if (!mPolicy) {
        throw configuration_error("LoadBalancer: no balancing policy given");
    }
    if (window <= 0) {
        throw configuration_error(fmt::format("LoadBalancer: window must be positive, got {}", window));
    }
    mRing.assign(static_cast<std::size_t>(mWindow) * mNumLocal, 0);
    mSums.assign(mNumLocal, 0);
}

void LoadBalancer::update_load(const std::vector<int>& tokens_per_local_expert) {
    if (mState != EBalancerState::Observing) {
        throw std::logic_error(fmt::format("LoadBalancer[{}]: update_load called while rebalancing", mName));
    }
    if (static_cast<int>(tokens_per_local_expert.size()) != mNumLocal) {
        throw std::logic_error(fmt::format("LoadBalancer[{}]: got {} counts for {} local experts",
                                           mName, tokens_per_local_expert.size(), mNumLocal));
    }

    // overwrite the oldest row once the window is full
    int* row = mRing.data() + static_cast<std::size_t>(mHead) * mNumLocal;
    for (int l = 0; l < mNumLocal; ++l) {
        mSums[l] += tokens_per_local_expert[l] - row[l];
        row[l] = tokens_per_local_expert[l];
    }
    mHead = (mHead + 1) % mWindow;
    mFilled = std::min(mFilled + 1, mWindow);
}

void LoadBalancer::reset_window() {
    std::fill(mRing.begin(), mRing.end(), 0);
    std::fill(mSums.begin(), mSums.end(), 0L);
    mHead = 0;
    mFilled = 0;
}

TokenDistribution LoadBalancer::gather_distribution() {
    auto table = mRegistry->snapshot();
    const std::vector<long> all_sums = mComm->host_all_gather(mSums);

    TokenDistribution dist;
    dist.expert_loads.assign(table->num_experts(), 0);
    for (int p = 0; p < table->ep_size(); ++p) {
        const std::vector<int>& hosted = table->local_experts(p);
        for (int l = 0; l < mNumLocal; ++l) {
            dist.expert_loads[hosted[l]] = all_sums[static_cast<std::size_t>(p) * mNumLocal + l];
        }
    }
    dist.rank_loads = compute_rank_loads(dist.expert_loads, table->owners(), table->ep_size());
    dist.imbalance = compute_imbalance_ratio(dist.expert_loads, table->owners(), table->ep_size());
    return dist;
}

/**
 * @brief Rebalance expert load across the EP group (collective).
 *
 * Steps:
 *  1. all-gather the window sums into a global per-expert load vector;
 *  2. ask the policy for a plan (identical on every rank);
 *  3. migrate experts and optimizer moments, then publish the new ownership table;
 *  4. apply router bias changes;
 *  5. start a new observation window.
 */
BalanceReport LoadBalancer::balance_load(optimizers::ExpertOptimizerState* optimizer, int step) {
    if (mState != EBalancerState::Observing) {
        throw std::logic_error(fmt::format("LoadBalancer[{}]: balance_load is not re-entrant", mName));
    }
    RebalancingScope scope(mState);

    auto table = mRegistry->snapshot();
    const TokenDistribution dist = gather_distribution();
    const BalancePlan plan = mPolicy->plan(dist.expert_loads, *table);

    BalanceReport report;
    report.policy = mPolicy->name();
    report.ratio_before = plan.ratio_before;
    report.ratio_after = plan.ratio_after;
    report.table_version = table->version();

    if (plan.moves_experts()) {
        report.migration = migrate_experts(plan.transfers, *mComm, *mBank, optimizer);
        auto next = std::make_shared<const modules::ExpertOwnershipTable>(
            modules::ExpertOwnershipTable::from_owners(plan.new_owners, table->ep_size(), table->version() + 1));
        mBank->adopt_ownership(*next, mComm->rank());
        mRegistry->publish(next);
        report.migrated_experts = static_cast<int>(plan.transfers.size());
        report.table_version = next->version();
        report.applied = true;
    }
    if (plan.changes_router()) {
        mRouter->adjust_selection_bias(plan.bias_delta);
        report.applied = true;
    }

    reset_window();

    if (mLogger) {
        mLogger->log_rebalance(step, mName, report.policy, report.applied, report.ratio_before, report.ratio_after,
                               report.migrated_experts, report.table_version);
    }
    return report;
}

TokenDistribution LoadBalancer::print_token_dist(int step) {
    TokenDistribution dist = gather_distribution();
    if (mLogger) {
        mLogger->log_token_dist(step, mName, dist.expert_loads, dist.rank_loads, dist.imbalance);
    }
    return dist;
}

}  // namespace ep
