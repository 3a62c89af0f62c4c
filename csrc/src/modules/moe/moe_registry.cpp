// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "modules/moe/moe_registry.h"

#include <stdexcept>

#include <fmt/core.h>

#include "modules/moe/moe_layer.h"

namespace modules {

void MoELayerRegistry::add(MoELayer& layer) {
    mLayers.push_back(&layer);
}

std::vector<ep::BalanceReport> apply_load_balance(const MoELayerRegistry& registry,
                                                  const std::vector<optimizers::ExpertOptimizerState*>& optimizers,
                                                  int step) {
    if (!optimizers.empty() && optimizers.size() != registry.size()) {
        throw std::logic_error(fmt::format("apply_load_balance: {} optimizer states for {} layers",
                                           optimizers.size(), registry.size()));
    }
    std::vector<ep::BalanceReport> reports;
    for (std::size_t i = 0; i < registry.size(); ++i) {
        MoELayer& layer = registry[i];
        if (!layer.load_balancing_enabled()) continue;
        reports.push_back(layer.balance_load(optimizers.empty() ? nullptr : optimizers[i], step));
    }
    return reports;
}

void print_token_dist(const MoELayerRegistry& registry, int step) {
    for (MoELayer* layer : registry) {
        if (layer->load_balancing_enabled()) {
            layer->print_token_dist(step);
        }
    }
}

void log_moe_stats(const MoELayerRegistry& registry, int step) {
    for (const MoELayer* layer : registry) {
        layer->log_stats(step);
    }
}

} // namespace modules
