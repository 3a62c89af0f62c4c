// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <stdexcept>
#include <vector>

#include "config/moe_config.h"
#include "modules/moe/moe_layer.h"
#include "modules/moe/moe_registry.h"
#include "runtime/optimizers/expert_optimizer_state.h"
#include "utilities/comm.h"
#include "utilities/errors.h"
#include "../utilities/test_config.h"
#include "../utilities/test_utils.h"

using namespace modules;

namespace {

MoELayerConfig layer_config(const testing_config::TestSizeConfig& tc) {
    MoELayerConfig cfg;
    cfg.num_experts = tc.E;
    cfg.top_k = tc.K;
    cfg.hidden_size = tc.H;
    cfg.ffn_hidden_size = tc.F;
    cfg.ep_size = tc.W;
    cfg.seed = 1234;
    return cfg;
}

void make_identity_experts(ExpertBank& bank, int hidden) {
    for (int e : bank.hosted_experts()) {
        auto& p = bank.params(e);
        fill_zero(p.gate_up);
        fill_zero(p.down);
        for (int h = 0; h < hidden; ++h) {
            p.gate_up.get<float>()[h * hidden + h] = 1.f;
            p.down.get<float>()[h * hidden + h] = 1.f;
        }
    }
    bank.repack();
}

} // namespace

TEST_CASE("MoE layer forward keeps the token layout", "[moe][layer]") {
    const auto& tc = testing_config::get_test_config();
    const auto cfg = layer_config(tc);

    std::vector<std::vector<long>> shapes(tc.W);
    std::vector<bool> bias_null(tc.W);
    std::vector<int> dispatched(tc.W);
    std::vector<MoEForwardStats> stats(tc.W);
    Communicator::run_communicators(tc.W, [&](Communicator& comm) {
        MoELayer layer(cfg, comm);
        HostTensor tokens = testing_utils::uniform_tensor(tc.N, tc.H, -1.f, 1.f, 100 + comm.rank());
        MoELayerOutput out = layer.forward(tokens);
        shapes[comm.rank()] = {out.output.Sizes[0], out.output.Sizes[1]};
        bias_null[comm.rank()] = out.bias.is_null();
        stats[comm.rank()] = layer.last_stats();
        dispatched[comm.rank()] = layer.last_stats().dispatched_rows;
    });

    for (int r = 0; r < tc.W; ++r) {
        REQUIRE(shapes[r] == std::vector<long>{tc.N, tc.H});
        REQUIRE(bias_null[r]);
        REQUIRE(stats[r].aux_loss > 0.f);
        REQUIRE(stats[r].expert_utilization > 0.f);
        REQUIRE(stats[r].expert_utilization <= 1.f);
        REQUIRE(stats[r].load_imbalance >= 1.f);
    }
    // dropless: every (token, slot) pair of every rank is processed exactly once
    REQUIRE(std::accumulate(dispatched.begin(), dispatched.end(), 0) == tc.N * tc.K * tc.W);
}

TEST_CASE("MoE layer with identity experts reproduces its input", "[moe][layer][roundtrip]") {
    const auto& tc = testing_config::get_test_config();
    const int top_k = GENERATE(1, 2);
    auto cfg = layer_config(tc);
    cfg.top_k = top_k;
    cfg.activation = EActivation::Identity;
    cfg.ffn_hidden_size = tc.H;

    std::vector<float> err(tc.W, 1.f);
    std::vector<float> weight_err(tc.W, 1.f);
    Communicator::run_communicators(tc.W, [&](Communicator& comm) {
        MoELayer layer(cfg, comm);
        make_identity_experts(layer.bank(), tc.H);

        HostTensor tokens = testing_utils::uniform_tensor(tc.N, tc.H, -1.f, 1.f, 7 + comm.rank());
        MoELayerOutput out = layer.forward(tokens);
        err[comm.rank()] = testing_utils::max_abs_diff(out.output, tokens);

        // the k combination weights of every token sum to one
        auto routed = layer.router().route(tokens);
        const float* s = routed.scores.get<float>();
        float worst = 0.f;
        for (int t = 0; t < tc.N; ++t) {
            float weight = 0.f;
            for (int k = 0; k < top_k; ++k) weight += s[t * top_k + k];
            worst = std::max(worst, std::abs(weight - 1.f));
        }
        weight_err[comm.rank()] = worst;
    });

    for (int r = 0; r < tc.W; ++r) {
        REQUIRE(err[r] < 1e-5f);
        REQUIRE(weight_err[r] < 1e-6f);
    }
}

TEST_CASE("grouped and sequential layers agree", "[moe][layer]") {
    const auto& tc = testing_config::get_test_config();
    auto grouped_cfg = layer_config(tc);
    grouped_cfg.add_bias = true;
    auto sequential_cfg = grouped_cfg;
    sequential_cfg.grouped_gemm = false;

    std::vector<float> err(tc.W, 1.f);
    std::vector<float> bias_err(tc.W, 1.f);
    std::vector<float> bias_norm(tc.W, 0.f);
    Communicator::run_communicators(tc.W, [&](Communicator& comm) {
        MoELayer grouped(grouped_cfg, comm);
        MoELayer sequential(sequential_cfg, comm);
        // non-zero biases, identical in both layers
        for (int e : grouped.bank().hosted_experts()) {
            const auto b = testing_utils::uniform_host(tc.H, -1.f, 1.f, 200 + e);
            std::copy(b.begin(), b.end(), grouped.bank().params(e).bias.get<float>());
            std::copy(b.begin(), b.end(), sequential.bank().params(e).bias.get<float>());
        }
        grouped.bank().repack();
        sequential.bank().repack();
        HostTensor tokens = testing_utils::uniform_tensor(tc.N, tc.H, -2.f, 2.f, 55 + comm.rank());
        MoELayerOutput a = grouped.forward(tokens);
        MoELayerOutput b = sequential.forward(tokens);
        err[comm.rank()] = testing_utils::max_abs_diff(a.output, b.output);
        bias_err[comm.rank()] = testing_utils::max_abs_diff(a.bias, b.bias);
        const auto bias = a.bias.to_vector<float>();
        bias_norm[comm.rank()] = testing_utils::max_abs_diff(bias, std::vector<float>(bias.size(), 0.f));
    });

    for (int r = 0; r < tc.W; ++r) {
        REQUIRE(err[r] < 1e-5f);
        REQUIRE(bias_err[r] < 1e-6f);
        REQUIRE(bias_norm[r] > 0.f);
    }
}

TEST_CASE("MoE layer construction errors", "[moe][layer][error]") {
    const auto& tc = testing_config::get_test_config();

    SECTION("ep_size must match the communicator") {
        auto cfg = layer_config(tc);
        cfg.ep_size = 1;
        REQUIRE_THROWS_AS(Communicator::run_communicators(2, [&](Communicator& comm) {
            MoELayer layer(cfg, comm);
        }), configuration_error);
    }

    SECTION("invalid configuration") {
        auto cfg = layer_config(tc);
        cfg.top_k = tc.E + 1;
        REQUIRE_THROWS_AS(Communicator::run_communicators(tc.W, [&](Communicator& comm) {
            MoELayer layer(cfg, comm);
        }), configuration_error);
    }
}

TEST_CASE("balancing entry points need an interval", "[moe][layer][error]") {
    const auto& tc = testing_config::get_test_config();
    const auto cfg = layer_config(tc);

    REQUIRE_THROWS_AS(Communicator::run_communicators(tc.W, [&](Communicator& comm) {
        MoELayer layer(cfg, comm);
        (void)layer.balance_load(nullptr);
    }), std::logic_error);
    REQUIRE_THROWS_AS(Communicator::run_communicators(tc.W, [&](Communicator& comm) {
        MoELayer layer(cfg, comm);
        (void)layer.print_token_dist(0);
    }), std::logic_error);
}

TEST_CASE("optimizer state covers the hosted experts", "[moe][layer]") {
    const auto& tc = testing_config::get_test_config();
    const auto cfg = layer_config(tc);

    std::vector<std::size_t> counts(tc.W);
    std::vector<bool> covered(tc.W);
    std::vector<bool> numel_match(tc.W);
    Communicator::run_communicators(tc.W, [&](Communicator& comm) {
        MoELayer layer(cfg, comm);
        auto state = layer.make_optimizer_state();
        counts[comm.rank()] = state.num_experts();
        numel_match[comm.rank()] = state.expert_numel() == layer.bank().expert_numel();
        bool all = true;
        for (int e : layer.bank().hosted_experts()) all = all && state.has(e);
        covered[comm.rank()] = all;
    });

    for (int r = 0; r < tc.W; ++r) {
        REQUIRE(counts[r] == static_cast<std::size_t>(tc.E / tc.W));
        REQUIRE(covered[r]);
        REQUIRE(numel_match[r]);
    }
}

TEST_CASE("a rebalanced layer computes the same function", "[moe][layer][balance]") {
    constexpr int E = 8, W = 2, K = 2, N = 12, H = 4, F = 6;
    const std::vector<long> skewed = {100, 90, 10, 5, 1, 1, 1, 1};

    MoELayerConfig cfg;
    cfg.num_experts = E;
    cfg.top_k = K;
    cfg.hidden_size = H;
    cfg.ffn_hidden_size = F;
    cfg.activation = EActivation::GeLU;
    cfg.add_bias = true;
    cfg.ep_size = W;
    cfg.load_balance_interval = 1;
    cfg.balance_window = 4;
    cfg.improvement_threshold = 0.f;

    std::vector<bool> applied(W);
    std::vector<std::uint64_t> versions(W);
    std::vector<float> err(W, 1.f);
    std::vector<float> bias_err(W, 1.f);
    Communicator::run_communicators(W, [&](Communicator& comm) {
        MoELayer layer(cfg, comm);
        MoELayer reference(cfg, comm);
        auto state = layer.make_optimizer_state();

        // inject a skewed window directly
        std::vector<int> local;
        for (int e : layer.ownership()->local_experts(comm.rank())) local.push_back(static_cast<int>(skewed[e]));
        layer.load_balancer()->update_load(local);

        ep::BalanceReport report = layer.balance_load(&state, 1);
        applied[comm.rank()] = report.applied;
        versions[comm.rank()] = layer.ownership()->version();

        HostTensor tokens = testing_utils::uniform_tensor(N, H, -1.f, 1.f, 90 + comm.rank());
        MoELayerOutput moved = layer.forward(tokens);
        MoELayerOutput fixed = reference.forward(tokens);
        err[comm.rank()] = testing_utils::max_abs_diff(moved.output, fixed.output);
        bias_err[comm.rank()] = testing_utils::max_abs_diff(moved.bias, fixed.bias);
    });

    for (int r = 0; r < W; ++r) {
        REQUIRE(applied[r]);
        REQUIRE(versions[r] == 1);
        REQUIRE(err[r] < 1e-5f);
        REQUIRE(bias_err[r] < 1e-6f);
    }
}

TEST_CASE("registry hooks visit balancing layers only", "[moe][registry]") {
    const auto& tc = testing_config::get_test_config();
    auto balanced_cfg = layer_config(tc);
    balanced_cfg.load_balance_interval = 10;
    const auto plain_cfg = layer_config(tc);

    std::vector<std::size_t> num_reports(tc.W);
    Communicator::run_communicators(tc.W, [&](Communicator& comm) {
        MoELayer first(balanced_cfg, comm, nullptr, "layer0");
        MoELayer second(plain_cfg, comm, nullptr, "layer1");
        MoELayerRegistry registry;
        registry.add(first);
        registry.add(second);

        HostTensor tokens = testing_utils::uniform_tensor(tc.N, tc.H, -1.f, 1.f, 3 + comm.rank());
        (void)first.forward(tokens);
        (void)second.forward(tokens);

        print_token_dist(registry, 1);
        log_moe_stats(registry, 1);
        num_reports[comm.rank()] = apply_load_balance(registry, {}, 1).size();
    });
    for (int r = 0; r < tc.W; ++r) {
        REQUIRE(num_reports[r] == 1);
    }

    SECTION("optimizer states must line up with the layers") {
        REQUIRE_THROWS_AS(Communicator::run_communicators(tc.W, [&](Communicator& comm) {
            MoELayer first(balanced_cfg, comm);
            MoELayerRegistry registry;
            registry.add(first);
            auto state = first.make_optimizer_state();
            (void)apply_load_balance(registry, {&state, &state}, 1);
        }), std::logic_error);
    }
}
