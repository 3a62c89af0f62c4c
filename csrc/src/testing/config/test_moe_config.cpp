// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "config/moe_config.h"
#include "utilities/errors.h"

using nlohmann::json;

TEST_CASE("MoE config from json", "[config]") {
    SECTION("defaults are filled in") {
        auto cfg = moe_config_from_json(json{{"hidden_size", 16}, {"ffn_hidden_size", 32}});
        REQUIRE(cfg.num_experts == 8);
        REQUIRE(cfg.top_k == 2);
        REQUIRE(cfg.grouped_gemm);
        REQUIRE_FALSE(cfg.load_balancing_enabled());
        REQUIRE(cfg.balance_policy == EBalancePolicy::ExpertPlacement);
    }

    SECTION("all fields") {
        auto cfg = moe_config_from_json(json{
            {"num_experts", 16}, {"top_k", 4}, {"hidden_size", 32}, {"ffn_hidden_size", 64},
            {"activation", "gelu"}, {"add_bias", true}, {"grouped_gemm", false},
            {"load_balance_interval", 10}, {"balance_window", 5}, {"balance_policy", "router_bias"},
            {"improvement_threshold", 0.1}, {"bias_update_rate", 0.01}, {"aux_loss_coef", 0.02},
            {"z_loss_coef", 0.0}, {"seed", 7}, {"ep_size", 4}});
        REQUIRE(cfg.num_experts == 16);
        REQUIRE(cfg.top_k == 4);
        REQUIRE(cfg.activation == modules::EActivation::GeLU);
        REQUIRE(cfg.add_bias);
        REQUIRE_FALSE(cfg.grouped_gemm);
        REQUIRE(cfg.load_balancing_enabled());
        REQUIRE(*cfg.load_balance_interval == 10);
        REQUIRE(cfg.balance_window == 5);
        REQUIRE(cfg.balance_policy == EBalancePolicy::RouterBias);
        REQUIRE(cfg.seed == 7);
        REQUIRE(cfg.ep_size == 4);
    }

    SECTION("HuggingFace-style aliases") {
        auto cfg = moe_config_from_json(json{
            {"num_local_experts", 4}, {"num_experts_per_tok", 1}, {"hidden_size", 8},
            {"moe_intermediate_size", 24}, {"router_aux_loss_coef", 0.5}});
        REQUIRE(cfg.num_experts == 4);
        REQUIRE(cfg.top_k == 1);
        REQUIRE(cfg.ffn_hidden_size == 24);
        REQUIRE(cfg.aux_loss_coef == 0.5f);
    }

    SECTION("numbers and flags given as strings") {
        auto cfg = moe_config_from_json(json{
            {"hidden_size", "16"}, {"ffn_hidden_size", 16}, {"grouped_gemm", "false"},
            {"load_balance_interval", "100"}});
        REQUIRE(cfg.hidden_size == 16);
        REQUIRE_FALSE(cfg.grouped_gemm);
        REQUIRE(*cfg.load_balance_interval == 100);
    }

    SECTION("null means absent") {
        auto cfg = moe_config_from_json(json{{"hidden_size", 8}, {"ffn_hidden_size", 8}, {"load_balance_interval", nullptr}});
        REQUIRE_FALSE(cfg.load_balancing_enabled());
    }
}

TEST_CASE("invalid MoE configs fail fast", "[config][error]") {
    const json base = {{"hidden_size", 8}, {"ffn_hidden_size", 8}};
    auto with = [&](const char* key, const json& value, const char* key2 = nullptr, const json& value2 = {}) {
        json j = base;
        j[key] = value;
        if (key2) j[key2] = value2;
        return j;
    };

    REQUIRE_THROWS_AS(moe_config_from_json(json{{"ffn_hidden_size", 8}}), configuration_error);
    REQUIRE_THROWS_AS(moe_config_from_json(with("num_experts", 6, "ep_size", 4)), configuration_error);
    REQUIRE_THROWS_AS(moe_config_from_json(with("top_k", 9)), configuration_error);
    REQUIRE_THROWS_AS(moe_config_from_json(with("load_balance_interval", 0)), configuration_error);
    REQUIRE_THROWS_AS(moe_config_from_json(with("balance_window", -1)), configuration_error);
    REQUIRE_THROWS_AS(moe_config_from_json(with("balance_policy", "capacity")), configuration_error);
    REQUIRE_THROWS_AS(moe_config_from_json(with("activation", "tanh")), configuration_error);
    REQUIRE_THROWS_AS(moe_config_from_json(with("hidden_size", "sixteen")), configuration_error);
    REQUIRE_THROWS_AS(moe_config_from_json(with("grouped_gemm", "maybe")), configuration_error);
    REQUIRE_THROWS_AS(moe_config_from_json(json::array({1, 2})), configuration_error);

    SECTION("identity experts need ffn == hidden") {
        REQUIRE_THROWS_AS(moe_config_from_json(with("activation", "identity", "ffn_hidden_size", 16)),
                          configuration_error);
        REQUIRE_NOTHROW(moe_config_from_json(with("activation", "identity")));
    }
}

TEST_CASE("MoE config round-trips through a file", "[config]") {
    MoELayerConfig cfg;
    cfg.num_experts = 4;
    cfg.top_k = 1;
    cfg.hidden_size = 12;
    cfg.ffn_hidden_size = 20;
    cfg.activation = modules::EActivation::ReLU;
    cfg.load_balance_interval = 3;
    cfg.balance_policy = EBalancePolicy::RouterBias;
    cfg.ep_size = 2;

    const auto dir = std::filesystem::temp_directory_path() / "moeshard-tests";
    std::filesystem::create_directories(dir);
    const auto path = dir / "moe_config.json";
    {
        std::ofstream out(path);
        out << moe_config_to_json(cfg).dump(2);
    }

    auto loaded = load_moe_config(path.string());
    REQUIRE(loaded.num_experts == 4);
    REQUIRE(loaded.top_k == 1);
    REQUIRE(loaded.activation == modules::EActivation::ReLU);
    REQUIRE(loaded.load_balance_interval == cfg.load_balance_interval);
    REQUIRE(loaded.balance_policy == EBalancePolicy::RouterBias);
    REQUIRE(loaded.ep_size == 2);

    SECTION("missing and malformed files") {
        REQUIRE_THROWS_AS(load_moe_config((dir / "does-not-exist.json").string()), std::runtime_error);
        const auto broken = dir / "broken.json";
        {
            std::ofstream out(broken);
            out << "{ \"num_experts\": ";
        }
        REQUIRE_THROWS_AS(load_moe_config(broken.string()), configuration_error);
    }
}

TEST_CASE("balance policy names", "[config]") {
    REQUIRE(balance_policy_from_str("placement") == EBalancePolicy::ExpertPlacement);
    REQUIRE(balance_policy_from_str("Migrate") == EBalancePolicy::ExpertPlacement);
    REQUIRE(balance_policy_from_str("bias") == EBalancePolicy::RouterBias);
    REQUIRE(std::string(balance_policy_to_str(EBalancePolicy::RouterBias)) == "router_bias");
}
