// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOESHARD_SRC_MODULES_MOE_ROUTER_H
#define MOESHARD_SRC_MODULES_MOE_ROUTER_H

#include <cstdint>
#include <vector>

#include "utilities/tensor.h"

namespace modules {

/**
 * @brief Top-k softmax router for Mixture of Experts
 *
 * Computes routing probabilities for each token to each expert using a linear
 * projection followed by softmax over all experts, then selects the top-k
 * experts per token. The returned scores are the softmax probabilities of the
 * selected experts renormalized to sum to 1 per token, which equals a softmax
 * over the selected logits.
 *
 * The router also reports auxiliary losses for monitoring:
 * - Load balancing loss: encourages uniform expert utilization
 * - Router z-loss: regularizes logits to prevent routing collapse
 *
 * Input: (N, hidden_size) token representations
 * Output: RouterOutput containing scores and expert indices
 */
class TopKRouter {
public:
    struct Config {
        int hidden_size;              ///< Input hidden dimension
        int num_experts;              ///< Total number of experts
        int top_k = 2;                ///< Number of experts to route each token to
        float aux_loss_coef = 0.01f;  ///< Coefficient for load balancing auxiliary loss
        float z_loss_coef = 0.001f;   ///< Coefficient for router z-loss
        bool normalize_routing = true;  ///< Normalize routing weights to sum to 1
    };

    struct RouterOutput {
        HostTensor scores;            ///< (N, top_k) selected probabilities, summing to 1 per token
        HostTensor expert_indices;    ///< (N, top_k) selected expert ids (int32), highest first
        HostTensor probs;             ///< (N, num_experts) full softmax probabilities
        float aux_loss = 0.f;         ///< Load balancing auxiliary loss
        float z_loss = 0.f;           ///< Router z-loss
    };

    /// @param gate (num_experts, hidden_size) routing projection.
    TopKRouter(const Config& config, HostTensor gate);

    /// Router with a gate drawn from N(0, init_std^2) using @p seed.
    static TopKRouter create(const Config& config, std::uint64_t seed, float init_std = 0.02f);

    /// Deterministic for fixed tokens, gate and selection bias.
    [[nodiscard]] RouterOutput route(const Tensor& tokens) const;

    [[nodiscard]] const Config& config() const { return mConfig; }
    [[nodiscard]] const HostTensor& gate() const { return mGate; }
    [[nodiscard]] HostTensor& gate() { return mGate; }

    //! Per-expert bias added to the probabilities for selection only. Zero unless a
    //! balancing policy adjusts it.
    [[nodiscard]] const std::vector<float>& selection_bias() const { return mSelectionBias; }
    void adjust_selection_bias(const std::vector<float>& delta);

private:
    Config mConfig;
    HostTensor mGate;
    std::vector<float> mSelectionBias;
};

} // namespace modules

#endif //MOESHARD_SRC_MODULES_MOE_ROUTER_H
