// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "modules/moe/moe_layer.h"

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "kernels/kernels.h"
#include "training/logging.h"
#include "utilities/comm.h"
#include "utilities/errors.h"

namespace modules {

namespace {

const MoELayerConfig& validated(const MoELayerConfig& config, const Communicator& comm) {
    config.validate();
    if (config.ep_size != comm.world_size()) {
        throw configuration_error(fmt::format("MoELayer: configured ep_size {} but the EP communicator has {} ranks",
                                              config.ep_size, comm.world_size()));
    }
    return config;
}

TopKRouter::Config router_config(const MoELayerConfig& config) {
    TopKRouter::Config rc;
    rc.hidden_size = config.hidden_size;
    rc.num_experts = config.num_experts;
    rc.top_k = config.top_k;
    rc.aux_loss_coef = config.aux_loss_coef;
    rc.z_loss_coef = config.z_loss_coef;
    return rc;
}

ExpertBank::Config bank_config(const MoELayerConfig& config) {
    ExpertBank::Config bc;
    bc.hidden_size = config.hidden_size;
    bc.ffn_hidden_size = config.ffn_hidden_size;
    bc.activation = config.activation;
    bc.add_bias = config.add_bias;
    bc.grouped_gemm = config.grouped_gemm;
    bc.seed = config.seed + 1;
    return bc;
}

} // namespace

MoELayer::MoELayer(const MoELayerConfig& config, Communicator& ep_comm, MoERunLogger* logger, std::string name) :
    mConfig(validated(config, ep_comm)),
    mComm(&ep_comm),
    mLogger(logger),
    mName(std::move(name)),
    mOwnership(ExpertOwnershipTable::contiguous(config.num_experts, config.ep_size)),
    mRouter(TopKRouter::create(router_config(config), config.seed)),
    mDispatcher(std::in_place_type<DroplessTokenDispatcher>, ep_comm, config.num_experts, config.top_k, config.hidden_size),
    mBank(bank_config(config), partition_experts(config.num_experts, ep_comm.world_size(), ep_comm.rank()).local_expert_indices)
{
    if (mConfig.load_balancing_enabled()) {
        mBalancer = std::make_unique<ep::LoadBalancer>(ep_comm, mOwnership, mBank, mRouter,
                                                       ep::make_balance_policy(mConfig), mConfig.balance_window,
                                                       mLogger, mName);
    }
}

MoELayerOutput MoELayer::forward(const Tensor& tokens) {
    auto table = mOwnership.snapshot();

    TopKRouter::RouterOutput routed = mRouter.route(tokens);

    DispatchOutput dispatched = std::visit([&](const auto& dispatcher) {
        return dispatcher.permute(tokens, routed.scores, routed.expert_indices, *table);
    }, mDispatcher);

    if (mBalancer) {
        mBalancer->update_load(dispatched.tokens_per_local_expert);
    }

    ExpertBank::ExpertOutput expert_out = mBank.compute(dispatched.dispatched_tokens, dispatched.tokens_per_local_expert);

    CombineOutput combined = std::visit([&](const auto& dispatcher) {
        return dispatcher.unpermute(expert_out.output, expert_out.bias, routed.scores, routed.expert_indices,
                                    dispatched.routing_map, mOwnership.snapshot()->version());
    }, mDispatcher);

    // router statistics of this pass
    const int N = narrow<int>(tokens.Sizes[0]);
    std::vector<int> counts(mConfig.num_experts);
    moe_compute_expert_counts(counts.data(), routed.expert_indices.get<int>(), N, mConfig.top_k, mConfig.num_experts);
    const int used = static_cast<int>(std::count_if(counts.begin(), counts.end(), [](int c) { return c > 0; }));
    const int max_count = *std::max_element(counts.begin(), counts.end());
    const float mean_count = static_cast<float>(N * mConfig.top_k) / static_cast<float>(mConfig.num_experts);

    mLastStats.aux_loss = routed.aux_loss;
    mLastStats.z_loss = routed.z_loss;
    mLastStats.expert_utilization = static_cast<float>(used) / static_cast<float>(mConfig.num_experts);
    mLastStats.load_imbalance = mean_count > 0.f ? static_cast<float>(max_count) / mean_count : 1.f;
    mLastStats.dispatched_rows = dispatched.routing_map.num_dispatched();

    return MoELayerOutput{std::move(combined.output), std::move(combined.bias)};
}

ep::BalanceReport MoELayer::balance_load(optimizers::ExpertOptimizerState* optimizer, int step) {
    if (!mBalancer) {
        throw std::logic_error(fmt::format("MoELayer[{}]: balance_load called but load balancing is disabled", mName));
    }
    return mBalancer->balance_load(optimizer, step);
}

ep::TokenDistribution MoELayer::print_token_dist(int step) {
    if (!mBalancer) {
        throw std::logic_error(fmt::format("MoELayer[{}]: print_token_dist called but load balancing is disabled", mName));
    }
    return mBalancer->print_token_dist(step);
}

void MoELayer::log_stats(int step) const {
    if (!mLogger) return;
    mLogger->log_moe_stats(step, mName, mLastStats.aux_loss, mLastStats.z_loss,
                           mLastStats.expert_utilization, mLastStats.load_imbalance);
}

optimizers::ExpertOptimizerState MoELayer::make_optimizer_state() const {
    optimizers::ExpertOptimizerState state(mBank.expert_numel());
    for (int id : mBank.hosted_experts()) {
        state.register_expert(id);
    }
    return state;
}

} // namespace modules
