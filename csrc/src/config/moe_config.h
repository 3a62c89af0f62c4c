// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOESHARD_SRC_CONFIG_MOE_CONFIG_H
#define MOESHARD_SRC_CONFIG_MOE_CONFIG_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "modules/moe/expert_bank.h"

/**
 * @brief How balance_load evens out expert load.
 */
enum class EBalancePolicy {
    ExpertPlacement,    ///< migrate experts between ranks (LPT placement)
    RouterBias          ///< nudge the router's selection bias, no migration
};

EBalancePolicy balance_policy_from_str(std::string_view name);
const char* balance_policy_to_str(EBalancePolicy policy);

/**
 * @brief Configuration of one MoE layer.
 *
 * Everything the layer needs is passed explicitly here; the EP world size and
 * rank come from the communicator handed to the layer.
 */
struct MoELayerConfig {
    int num_experts = 8;
    int top_k = 2;
    int hidden_size = 0;
    int ffn_hidden_size = 0;
    modules::EActivation activation = modules::EActivation::SwiGLU;
    bool add_bias = false;
    bool grouped_gemm = true;

    // Load balancing; balancing is disabled without an interval
    std::optional<int> load_balance_interval;
    int balance_window = 16;                ///< forward passes kept in the load window
    EBalancePolicy balance_policy = EBalancePolicy::ExpertPlacement;
    float improvement_threshold = 0.05f;    ///< minimum drop of the max/mean rank load ratio
    float bias_update_rate = 1e-3f;

    // Router statistics
    float aux_loss_coef = 0.01f;
    float z_loss_coef = 0.001f;

    std::uint64_t seed = 42;
    int ep_size = 1;

    [[nodiscard]] bool load_balancing_enabled() const { return load_balance_interval.has_value(); }

    /// @throws configuration_error on the first inconsistent value.
    void validate() const;
};

/// Parse a layer configuration. Numbers may also be given as strings.
/// Unknown keys are ignored; missing keys keep their defaults.
/// @throws configuration_error for unparseable or invalid values.
MoELayerConfig moe_config_from_json(const nlohmann::json& json);

/// Load and validate a layer configuration from a JSON file.
MoELayerConfig load_moe_config(const std::string& file_name);

nlohmann::json moe_config_to_json(const MoELayerConfig& config);

#endif //MOESHARD_SRC_CONFIG_MOE_CONFIG_H
