// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "modules/moe/router.h"

#include <random>
#include <utility>

#include <fmt/core.h>

#include "kernels/kernels.h"
#include "utilities/errors.h"

namespace modules {

TopKRouter::TopKRouter(const Config& config, HostTensor gate) :
    mConfig(config), mGate(std::move(gate)), mSelectionBias(config.num_experts, 0.f)
{
    if (mConfig.num_experts <= 0 || mConfig.hidden_size <= 0) {
        throw configuration_error(fmt::format("TopKRouter: invalid shape (experts={}, hidden={})",
                                              mConfig.num_experts, mConfig.hidden_size));
    }
    if (mConfig.top_k <= 0 || mConfig.top_k > mConfig.num_experts) {
        throw configuration_error(fmt::format("TopKRouter: top_k ({}) must be in [1, {}]",
                                              mConfig.top_k, mConfig.num_experts));
    }
    if (mGate.DType != ETensorDType::FP32 || mGate.Rank != 2 ||
        mGate.Sizes[0] != mConfig.num_experts || mGate.Sizes[1] != mConfig.hidden_size) {
        throw configuration_error(fmt::format("TopKRouter: gate must be fp32 ({}, {})",
                                              mConfig.num_experts, mConfig.hidden_size));
    }
}

TopKRouter TopKRouter::create(const Config& config, std::uint64_t seed, float init_std) {
    HostTensor gate(ETensorDType::FP32, {config.num_experts, config.hidden_size});
    std::mt19937_64 gen(seed);
    std::normal_distribution<float> dist(0.f, init_std);
    float* g = gate.get<float>();
    for (std::size_t i = 0; i < gate.nelem(); ++i) {
        g[i] = dist(gen);
    }
    return TopKRouter(config, std::move(gate));
}

TopKRouter::RouterOutput TopKRouter::route(const Tensor& tokens) const {
    if (tokens.Rank != 2 || tokens.Sizes[1] != mConfig.hidden_size) {
        throw std::logic_error(fmt::format("TopKRouter::route: expected (N, {}) tokens", mConfig.hidden_size));
    }
    const int N = narrow<int>(tokens.Sizes[0]);
    const int E = mConfig.num_experts;
    const int K = mConfig.top_k;

    HostTensor logits(ETensorDType::FP32, {N, E});
    matmul(logits.get<float>(), tokens.get<float>(), mGate.get<float>(), nullptr, N, E, mConfig.hidden_size);

    RouterOutput out;
    out.probs = HostTensor(ETensorDType::FP32, {N, E});
    moe_softmax_forward(out.probs.get<float>(), logits.get<float>(), N, E);

    out.scores = HostTensor(ETensorDType::FP32, {N, K});
    out.expert_indices = HostTensor(ETensorDType::INT32, {N, K});
    moe_topk_forward(out.expert_indices.get<int>(), out.scores.get<float>(), out.probs.get<float>(),
                     mSelectionBias.data(), N, E, K, mConfig.normalize_routing);

    out.aux_loss = moe_compute_aux_loss(out.probs.get<float>(), out.expert_indices.get<int>(), N, E, K, mConfig.aux_loss_coef);
    out.z_loss = moe_router_z_loss_forward(logits.get<float>(), N, E, mConfig.z_loss_coef);
    return out;
}

void TopKRouter::adjust_selection_bias(const std::vector<float>& delta) {
    if (delta.size() != mSelectionBias.size()) {
        throw std::logic_error(fmt::format("adjust_selection_bias: expected {} entries, got {}",
                                           mSelectionBias.size(), delta.size()));
    }
    for (std::size_t e = 0; e < delta.size(); ++e) {
        mSelectionBias[e] += delta[e];
    }
}

} // namespace modules
