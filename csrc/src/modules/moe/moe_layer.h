// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOESHARD_SRC_MODULES_MOE_MOE_LAYER_H
#define MOESHARD_SRC_MODULES_MOE_MOE_LAYER_H

#include <memory>
#include <string>
#include <variant>

#include "config/moe_config.h"
#include "modules/moe/expert_bank.h"
#include "modules/moe/expert_partition.h"
#include "modules/moe/router.h"
#include "modules/moe/token_dispatcher.h"
#include "runtime/ep/load_balancer.h"
#include "runtime/optimizers/expert_optimizer_state.h"
#include "utilities/tensor.h"

class Communicator;
class MoERunLogger;

namespace modules {

/// Dispatch strategies a layer can run. Only the dropless all-to-all dispatcher exists today.
using TokenDispatcher = std::variant<DroplessTokenDispatcher>;

struct MoELayerOutput {
    HostTensor output;  ///< (N, hidden) in input order
    HostTensor bias;    ///< (N, hidden) combined expert bias, or null
};

/// Router health of the last forward pass on this rank.
struct MoEForwardStats {
    float aux_loss = 0.f;
    float z_loss = 0.f;
    float expert_utilization = 0.f;     ///< fraction of experts that received at least one slot
    float load_imbalance = 1.f;         ///< max / mean slots per expert
    int dispatched_rows = 0;            ///< rows processed by the local experts
};

/**
 * @brief Dropless Mixture-of-Experts layer over an expert-parallel group.
 *
 * forward: route -> permute -> (record load) -> expert compute -> unpermute.
 * The ownership table is snapshotted at the start of each forward pass, so a
 * rebalance can only take effect between passes. balance_load() and
 * print_token_dist() are collective over the EP group and are only available
 * when a load balance interval is configured.
 */
class MoELayer {
public:
    /// @throws configuration_error if @p config is invalid or its ep_size differs from the communicator.
    MoELayer(const MoELayerConfig& config, Communicator& ep_comm, MoERunLogger* logger = nullptr,
             std::string name = "moe");

    MoELayer(const MoELayer&) = delete;
    MoELayer& operator=(const MoELayer&) = delete;

    /// Collective over the EP group.
    [[nodiscard]] MoELayerOutput forward(const Tensor& tokens);

    /// @throws std::logic_error if load balancing is disabled.
    ep::BalanceReport balance_load(optimizers::ExpertOptimizerState* optimizer, int step = 0);
    /// @throws std::logic_error if load balancing is disabled.
    ep::TokenDistribution print_token_dist(int step);

    //! Log the statistics of the last forward pass.
    void log_stats(int step) const;

    /// Optimizer state with zeroed moments for every expert hosted here.
    [[nodiscard]] optimizers::ExpertOptimizerState make_optimizer_state() const;

    [[nodiscard]] const MoELayerConfig& config() const { return mConfig; }
    [[nodiscard]] const std::string& name() const { return mName; }
    [[nodiscard]] bool load_balancing_enabled() const { return mBalancer != nullptr; }

    [[nodiscard]] TopKRouter& router() { return mRouter; }
    [[nodiscard]] const TopKRouter& router() const { return mRouter; }
    [[nodiscard]] ExpertBank& bank() { return mBank; }
    [[nodiscard]] const ExpertBank& bank() const { return mBank; }
    [[nodiscard]] std::shared_ptr<const ExpertOwnershipTable> ownership() const { return mOwnership.snapshot(); }
    [[nodiscard]] ep::LoadBalancer* load_balancer() { return mBalancer.get(); }
    [[nodiscard]] const MoEForwardStats& last_stats() const { return mLastStats; }

private:
    MoELayerConfig mConfig;
    Communicator* mComm;
    MoERunLogger* mLogger;
    std::string mName;

    ExpertOwnershipRegistry mOwnership;
    TopKRouter mRouter;
    TokenDispatcher mDispatcher;
    ExpertBank mBank;
    std::unique_ptr<ep::LoadBalancer> mBalancer;

    MoEForwardStats mLastStats;
};

} // namespace modules

#endif //MOESHARD_SRC_MODULES_MOE_MOE_LAYER_H
