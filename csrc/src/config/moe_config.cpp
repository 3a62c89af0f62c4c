// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "config/moe_config.h"

#include <cstdint>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "utilities/errors.h"
#include "utilities/utils.h"

namespace {

std::optional<long long> as_int(const nlohmann::json& value) {
    if (value.is_number_integer()) return value.get<long long>();
    if (value.is_number_unsigned()) return static_cast<long long>(value.get<std::uint64_t>());
    if (value.is_number_float()) return static_cast<long long>(value.get<double>());
    if (value.is_string()) {
        try {
            return std::stoll(value.get<std::string>());
        } catch (const std::logic_error&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<float> as_float(const nlohmann::json& value) {
    if (value.is_number_float() || value.is_number_integer() || value.is_number_unsigned()) {
        return static_cast<float>(value.get<double>());
    }
    if (value.is_string()) {
        try {
            return std::stof(value.get<std::string>());
        } catch (const std::logic_error&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<bool> as_bool(const nlohmann::json& value) {
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number_integer()) return value.get<int>() != 0;
    if (value.is_string()) {
        const std::string v = value.get<std::string>();
        if (iequals(v, "true") || v == "1") return true;
        if (iequals(v, "false") || v == "0") return false;
    }
    return std::nullopt;
}

/// Value of @p key, or nullopt if absent (or null). A present value of the wrong type is an error.
template<typename T>
std::optional<T> get_opt(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return std::nullopt;
    std::optional<T> result;
    if constexpr (std::is_same_v<T, int>) {
        if (auto v = as_int(*it)) result = narrow<int>(*v);
    } else if constexpr (std::is_same_v<T, std::uint64_t>) {
        if (auto v = as_int(*it); v && *v >= 0) result = static_cast<std::uint64_t>(*v);
    } else if constexpr (std::is_same_v<T, float>) {
        result = as_float(*it);
    } else if constexpr (std::is_same_v<T, bool>) {
        result = as_bool(*it);
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (it->is_string()) result = it->get<std::string>();
    }
    if (!result) {
        throw configuration_error(fmt::format("invalid value for '{}': {}", key, it->dump()));
    }
    return result;
}

}  // namespace

EBalancePolicy balance_policy_from_str(std::string_view name) {
    if (iequals(name, "placement") || iequals(name, "expert_placement") || iequals(name, "migrate")) {
        return EBalancePolicy::ExpertPlacement;
    }
    if (iequals(name, "router_bias") || iequals(name, "bias")) {
        return EBalancePolicy::RouterBias;
    }
    throw configuration_error(fmt::format("unknown balance policy '{}'", name));
}

const char* balance_policy_to_str(EBalancePolicy policy) {
    switch (policy) {
        case EBalancePolicy::ExpertPlacement: return "placement";
        case EBalancePolicy::RouterBias: return "router_bias";
    }
    return "<unknown>";
}

void MoELayerConfig::validate() const {
    if (num_experts <= 0) {
        throw configuration_error(fmt::format("num_experts must be positive, got {}", num_experts));
    }
    if (top_k <= 0 || top_k > num_experts) {
        throw configuration_error(fmt::format("top_k must be in [1, {}], got {}", num_experts, top_k));
    }
    if (hidden_size <= 0 || ffn_hidden_size <= 0) {
        throw configuration_error(fmt::format("hidden_size ({}) and ffn_hidden_size ({}) must be positive",
                                              hidden_size, ffn_hidden_size));
    }
    if (ep_size <= 0 || num_experts % ep_size != 0) {
        throw configuration_error(fmt::format("num_experts ({}) must be divisible by ep_size ({})",
                                              num_experts, ep_size));
    }
    if (activation == modules::EActivation::Identity && ffn_hidden_size != hidden_size) {
        throw configuration_error(fmt::format("identity experts need ffn_hidden_size == hidden_size, got {} vs {}",
                                              ffn_hidden_size, hidden_size));
    }
    if (load_balance_interval && *load_balance_interval <= 0) {
        throw configuration_error(fmt::format("load_balance_interval must be positive, got {}", *load_balance_interval));
    }
    if (balance_window <= 0) {
        throw configuration_error(fmt::format("balance_window must be positive, got {}", balance_window));
    }
    if (improvement_threshold < 0.f) {
        throw configuration_error(fmt::format("improvement_threshold must be non-negative, got {}", improvement_threshold));
    }
    if (bias_update_rate < 0.f) {
        throw configuration_error(fmt::format("bias_update_rate must be non-negative, got {}", bias_update_rate));
    }
    if (aux_loss_coef < 0.f || z_loss_coef < 0.f) {
        throw configuration_error("router loss coefficients must be non-negative");
    }
}

MoELayerConfig moe_config_from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw configuration_error("MoE config must be a JSON object");
    }
    MoELayerConfig cfg;
    if (auto v = get_opt<int>(json, "num_experts")) cfg.num_experts = *v;
    if (auto v = get_opt<int>(json, "num_local_experts")) cfg.num_experts = *v;
    if (auto v = get_opt<int>(json, "top_k")) cfg.top_k = *v;
    if (auto v = get_opt<int>(json, "num_experts_per_tok")) cfg.top_k = *v;
    if (auto v = get_opt<int>(json, "hidden_size")) cfg.hidden_size = *v;
    if (auto v = get_opt<int>(json, "ffn_hidden_size")) cfg.ffn_hidden_size = *v;
    if (auto v = get_opt<int>(json, "moe_intermediate_size")) cfg.ffn_hidden_size = *v;
    if (auto v = get_opt<std::string>(json, "activation")) cfg.activation = modules::activation_from_str(*v);
    if (auto v = get_opt<bool>(json, "add_bias")) cfg.add_bias = *v;
    if (auto v = get_opt<bool>(json, "grouped_gemm")) cfg.grouped_gemm = *v;
    if (auto v = get_opt<int>(json, "load_balance_interval")) cfg.load_balance_interval = *v;
    if (auto v = get_opt<int>(json, "balance_window")) cfg.balance_window = *v;
    if (auto v = get_opt<std::string>(json, "balance_policy")) cfg.balance_policy = balance_policy_from_str(*v);
    if (auto v = get_opt<float>(json, "improvement_threshold")) cfg.improvement_threshold = *v;
    if (auto v = get_opt<float>(json, "bias_update_rate")) cfg.bias_update_rate = *v;
    if (auto v = get_opt<float>(json, "aux_loss_coef")) cfg.aux_loss_coef = *v;
    if (auto v = get_opt<float>(json, "router_aux_loss_coef")) cfg.aux_loss_coef = *v;
    if (auto v = get_opt<float>(json, "z_loss_coef")) cfg.z_loss_coef = *v;
    if (auto v = get_opt<float>(json, "router_z_loss_coef")) cfg.z_loss_coef = *v;
    if (auto v = get_opt<std::uint64_t>(json, "seed")) cfg.seed = *v;
    if (auto v = get_opt<int>(json, "ep_size")) cfg.ep_size = *v;
    cfg.validate();
    return cfg;
}

MoELayerConfig load_moe_config(const std::string& file_name) {
    std::ifstream file(file_name);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("could not open config file {}", file_name));
    }
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw configuration_error(fmt::format("could not parse config file {}: {}", file_name, e.what()));
    }
    return moe_config_from_json(json);
}

nlohmann::json moe_config_to_json(const MoELayerConfig& config) {
    nlohmann::json json;
    json["num_experts"] = config.num_experts;
    json["top_k"] = config.top_k;
    json["hidden_size"] = config.hidden_size;
    json["ffn_hidden_size"] = config.ffn_hidden_size;
    json["activation"] = modules::activation_to_str(config.activation);
    json["add_bias"] = config.add_bias;
    json["grouped_gemm"] = config.grouped_gemm;
    if (config.load_balance_interval) {
        json["load_balance_interval"] = *config.load_balance_interval;
    } else {
        json["load_balance_interval"] = nullptr;
    }
    json["balance_window"] = config.balance_window;
    json["balance_policy"] = balance_policy_to_str(config.balance_policy);
    json["improvement_threshold"] = config.improvement_threshold;
    json["bias_update_rate"] = config.bias_update_rate;
    json["aux_loss_coef"] = config.aux_loss_coef;
    json["z_loss_coef"] = config.z_loss_coef;
    json["seed"] = config.seed;
    json["ep_size"] = config.ep_size;
    return json;
}
