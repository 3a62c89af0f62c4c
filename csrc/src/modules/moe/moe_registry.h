// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOESHARD_SRC_MODULES_MOE_MOE_REGISTRY_H
#define MOESHARD_SRC_MODULES_MOE_MOE_REGISTRY_H

#include <cstddef>
#include <vector>

#include "runtime/ep/load_balancer.h"

namespace optimizers {
class ExpertOptimizerState;
}

namespace modules {

class MoELayer;

/**
 * @brief Flat list of the MoE layers of a model, filled at model construction.
 *
 * Training-loop hooks iterate this list instead of walking the model. The
 * registry does not own the layers.
 */
class MoELayerRegistry {
public:
    void add(MoELayer& layer);

    [[nodiscard]] std::size_t size() const { return mLayers.size(); }
    [[nodiscard]] bool empty() const { return mLayers.empty(); }
    [[nodiscard]] MoELayer& operator[](std::size_t i) const { return *mLayers.at(i); }

    [[nodiscard]] auto begin() const { return mLayers.begin(); }
    [[nodiscard]] auto end() const { return mLayers.end(); }

private:
    std::vector<MoELayer*> mLayers;
};

/**
 * @brief Rebalance every layer that has load balancing enabled (collective).
 *
 * @param optimizers Per-layer optimizer state, index-aligned with the registry,
 *                   or empty to migrate parameters only.
 * @return One report per balanced layer, in registry order.
 */
std::vector<ep::BalanceReport> apply_load_balance(const MoELayerRegistry& registry,
                                                  const std::vector<optimizers::ExpertOptimizerState*>& optimizers,
                                                  int step);

/// Log the token distribution of every layer that has load balancing enabled (collective).
void print_token_dist(const MoELayerRegistry& registry, int step);

/// Log the router statistics of the last forward pass of every layer.
void log_moe_stats(const MoELayerRegistry& registry, int step);

} // namespace modules

#endif //MOESHARD_SRC_MODULES_MOE_MOE_REGISTRY_H
