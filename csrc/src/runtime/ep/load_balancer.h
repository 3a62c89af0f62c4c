// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Per-layer expert load tracking and rebalancing.

#ifndef MOESHARD_SRC_RUNTIME_EP_LOAD_BALANCER_H
#define MOESHARD_SRC_RUNTIME_EP_LOAD_BALANCER_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "runtime/ep/balance_policy.h"
#include "runtime/ep/expert_transfer.h"

class Communicator;
class MoERunLogger;

namespace modules {
class ExpertBank;
class ExpertOwnershipRegistry;
class TopKRouter;
}

namespace optimizers {
class ExpertOptimizerState;
}

namespace ep {

enum class EBalancerState {
    Observing,      ///< accepting update_load calls
    Rebalancing     ///< inside balance_load
};

/// Outcome of one balance_load call; identical on every rank except the migration stats.
struct BalanceReport {
    const char* policy = "";
    bool applied = false;               ///< placement or router bias changed
    float ratio_before = 1.0f;
    float ratio_after = 1.0f;
    int migrated_experts = 0;           ///< experts that changed owner, group-wide
    std::uint64_t table_version = 0;    ///< ownership table in force afterwards
    MigrationStats migration;           ///< this rank's share of the traffic
};

/// Load observed over the current window, in global expert order.
struct TokenDistribution {
    std::vector<long> expert_loads;     ///< [num_experts]
    std::vector<long> rank_loads;       ///< [ep_size] under the current placement
    float imbalance = 1.0f;             ///< max / mean of rank_loads
};

/**
 * @brief Tracks per-expert load of one MoE layer and rebalances on request.
 *
 * update_load() is called once per forward pass with the token counts of the
 * locally hosted experts and keeps a sliding window of the last @p window
 * passes in a ring buffer allocated at construction. balance_load() is
 * collective over the EP group: it gathers the window sums of all ranks,
 * lets the policy decide, applies the decision and starts a fresh window.
 */
class LoadBalancer {
public:
    LoadBalancer(Communicator& ep_comm,
                 modules::ExpertOwnershipRegistry& registry,
                 modules::ExpertBank& bank,
                 modules::TopKRouter& router,
                 std::unique_ptr<IBalancePolicy> policy,
                 int window,
                 MoERunLogger* logger = nullptr,
                 std::string name = "moe");

    /// O(num_local_experts), no allocation.
    /// @throws std::logic_error while rebalancing or for a count vector of the wrong length.
    void update_load(const std::vector<int>& tokens_per_local_expert);

    /// Collective over the EP group; must be called between forward passes.
    /// @param optimizer Optimizer state that migrates with the experts, or nullptr.
    BalanceReport balance_load(optimizers::ExpertOptimizerState* optimizer, int step = 0);

    /// Collective: gather and log the current window's distribution. Does not change any state.
    TokenDistribution print_token_dist(int step);

    /// Collective: gather the current window's distribution.
    [[nodiscard]] TokenDistribution gather_distribution();

    [[nodiscard]] EBalancerState state() const { return mState; }
    [[nodiscard]] int window() const { return mWindow; }
    [[nodiscard]] int recorded_passes() const { return mFilled; }
    [[nodiscard]] const std::vector<long>& local_window_sums() const { return mSums; }
    [[nodiscard]] const IBalancePolicy& policy() const { return *mPolicy; }

private:
    void reset_window();

    Communicator* mComm;
    modules::ExpertOwnershipRegistry* mRegistry;
    modules::ExpertBank* mBank;
    modules::TopKRouter* mRouter;
    std::unique_ptr<IBalancePolicy> mPolicy;
    MoERunLogger* mLogger;
    std::string mName;

    int mWindow;
    int mNumLocal;
    std::vector<int> mRing;     ///< [window, num_local] counts of the last passes
    std::vector<long> mSums;    ///< [num_local] running sum over the ring
    int mHead = 0;
    int mFilled = 0;

    EBalancerState mState = EBalancerState::Observing;
};

}  // namespace ep

#endif  // MOESHARD_SRC_RUNTIME_EP_LOAD_BALANCER_H
