// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>
#include <stdexcept>
#include <vector>

#include "kernels/kernels.h"
#include "modules/moe/router.h"
#include "utilities/errors.h"
#include "../utilities/test_config.h"
#include "../utilities/test_utils.h"

using namespace modules;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

TopKRouter::Config make_config(int H, int E, int K) {
    TopKRouter::Config cfg{};
    cfg.hidden_size = H;
    cfg.num_experts = E;
    cfg.top_k = K;
    return cfg;
}

HostTensor zero_gate(int E, int H) {
    return HostTensor::from_vector(std::vector<float>(static_cast<std::size_t>(E) * H, 0.f), {E, H});
}

// gate row e = scale * unit vector e, so token unit vector j prefers expert j
HostTensor diagonal_gate(int E, int H, float scale) {
    std::vector<float> g(static_cast<std::size_t>(E) * H, 0.f);
    for (int e = 0; e < E && e < H; ++e) g[e * H + e] = scale;
    return HostTensor::from_vector(g, {E, H});
}

} // namespace

TEST_CASE("router output shapes and probabilities", "[moe][router]") {
    const auto& tc = testing_config::get_test_config();
    TopKRouter router = TopKRouter::create(make_config(tc.H, tc.E, tc.K), 7);
    HostTensor tokens = testing_utils::uniform_tensor(tc.N, tc.H, -1.f, 1.f);

    auto out = router.route(tokens);
    REQUIRE(out.scores.Sizes[0] == tc.N);
    REQUIRE(out.scores.Sizes[1] == tc.K);
    REQUIRE(out.expert_indices.DType == ETensorDType::INT32);
    REQUIRE(out.probs.Sizes[1] == tc.E);

    const float* probs = out.probs.get<float>();
    const float* scores = out.scores.get<float>();
    const int* ids = out.expert_indices.get<int>();
    for (int t = 0; t < tc.N; ++t) {
        float sum = 0.f;
        for (int e = 0; e < tc.E; ++e) sum += probs[t * tc.E + e];
        REQUIRE_THAT(sum, WithinAbs(1.0, 1e-5));

        float selected = 0.f;
        for (int j = 0; j < tc.K; ++j) selected += probs[t * tc.E + ids[t * tc.K + j]];

        float score_sum = 0.f;
        for (int j = 0; j < tc.K; ++j) {
            const int e = ids[t * tc.K + j];
            REQUIRE(e >= 0);
            REQUIRE(e < tc.E);
            // selected probabilities renormalized over the top-k, highest first
            REQUIRE_THAT(scores[t * tc.K + j], WithinRel(probs[t * tc.E + e] / selected, 1e-5f));
            if (j > 0) REQUIRE(scores[t * tc.K + j] <= scores[t * tc.K + j - 1]);
            for (int i = 0; i < j; ++i) REQUIRE(ids[t * tc.K + i] != e);
            score_sum += scores[t * tc.K + j];
        }
        REQUIRE_THAT(score_sum, WithinAbs(1.0, 1e-5));
    }
}

TEST_CASE("routing is deterministic", "[moe][router]") {
    const auto& tc = testing_config::get_test_config();
    TopKRouter a = TopKRouter::create(make_config(tc.H, tc.E, tc.K), 123);
    TopKRouter b = TopKRouter::create(make_config(tc.H, tc.E, tc.K), 123);
    HostTensor tokens = testing_utils::uniform_tensor(tc.N, tc.H, -1.f, 1.f, 99);

    auto first = a.route(tokens);
    auto second = a.route(tokens);
    auto other = b.route(tokens);

    REQUIRE(first.expert_indices.to_vector<int>() == second.expert_indices.to_vector<int>());
    REQUIRE(first.scores.to_vector<float>() == second.scores.to_vector<float>());
    REQUIRE(first.expert_indices.to_vector<int>() == other.expert_indices.to_vector<int>());
    REQUIRE(first.scores.to_vector<float>() == other.scores.to_vector<float>());
}

TEST_CASE("router picks the expert aligned with the token", "[moe][router]") {
    const int E = 4, H = 4;
    TopKRouter router(make_config(H, E, 1), diagonal_gate(E, H, 5.f));
    std::vector<float> x(static_cast<std::size_t>(E) * H, 0.f);
    for (int t = 0; t < E; ++t) x[t * H + (E - 1 - t)] = 1.f;
    HostTensor tokens = HostTensor::from_vector(x, {E, H});

    auto out = router.route(tokens);
    REQUIRE(out.expert_indices.to_vector<int>() == std::vector<int>{3, 2, 1, 0});
}

TEST_CASE("ties resolve towards lower expert ids", "[moe][router]") {
    const int E = 8, H = 4, K = 3;
    TopKRouter router(make_config(H, E, K), zero_gate(E, H));
    HostTensor tokens = testing_utils::uniform_tensor(5, H, -1.f, 1.f);

    auto out = router.route(tokens);
    auto ids = out.expert_indices.to_vector<int>();
    auto scores = out.scores.to_vector<float>();
    for (int t = 0; t < 5; ++t) {
        for (int j = 0; j < K; ++j) {
            REQUIRE(ids[t * K + j] == j);
            REQUIRE_THAT(scores[t * K + j], WithinRel(1.f / K, 1e-5f));
        }
    }
}

TEST_CASE("router losses", "[moe][router][loss]") {
    const int E = 4, H = 3, N = 6;
    TopKRouter::Config cfg = make_config(H, E, 1);
    cfg.aux_loss_coef = 0.5f;
    cfg.z_loss_coef = 0.25f;
    TopKRouter router(cfg, zero_gate(E, H));
    HostTensor tokens = testing_utils::uniform_tensor(N, H, -1.f, 1.f);

    auto out = router.route(tokens);

    SECTION("all slots on one expert with uniform probabilities gives aux = coef") {
        // coef * E * (1 * 1/E)
        REQUIRE(out.expert_indices.to_vector<int>() == std::vector<int>(N, 0));
        REQUIRE_THAT(out.aux_loss, WithinRel(0.5f, 1e-5f));
    }

    SECTION("z-loss of zero logits is coef * log(E)^2") {
        const float lse = std::log(static_cast<float>(E));
        REQUIRE_THAT(out.z_loss, WithinRel(0.25f * lse * lse, 1e-5f));
    }

    SECTION("confident concentrated routing raises the aux loss") {
        TopKRouter::Config sq = cfg;
        sq.hidden_size = E;
        TopKRouter diag(sq, diagonal_gate(E, E, 4.f));

        // one token per expert: f_e = 1/E and mean P_e = 1/E, so aux = coef
        std::vector<float> spread(static_cast<std::size_t>(E) * E, 0.f);
        for (int t = 0; t < E; ++t) spread[t * E + t] = 1.f;
        auto balanced = diag.route(HostTensor::from_vector(spread, {E, E}));
        REQUIRE_THAT(balanced.aux_loss, WithinRel(0.5f, 1e-4f));

        // every token on expert 0 with high probability
        std::vector<float> same(static_cast<std::size_t>(E) * E, 0.f);
        for (int t = 0; t < E; ++t) same[t * E] = 1.f;
        auto skewed = diag.route(HostTensor::from_vector(same, {E, E}));
        const float p0 = std::exp(4.f) / (std::exp(4.f) + 3.f);
        REQUIRE_THAT(skewed.aux_loss, WithinRel(0.5f * E * p0, 1e-4f));
        REQUIRE(skewed.aux_loss > balanced.aux_loss);
    }
}

TEST_CASE("selection bias changes selection but not scores", "[moe][router][bias]") {
    const int E = 4, H = 2, K = 2;
    TopKRouter router(make_config(H, E, K), zero_gate(E, H));
    router.adjust_selection_bias({0.f, 0.f, 0.1f, 0.2f});
    REQUIRE(router.selection_bias() == std::vector<float>{0.f, 0.f, 0.1f, 0.2f});

    auto out = router.route(testing_utils::uniform_tensor(3, H, -1.f, 1.f));
    auto ids = out.expert_indices.to_vector<int>();
    auto scores = out.scores.to_vector<float>();
    for (int t = 0; t < 3; ++t) {
        REQUIRE(ids[t * K] == 3);
        REQUIRE(ids[t * K + 1] == 2);
        // the bias only steers selection; weights come from the equal probabilities
        REQUIRE_THAT(scores[t * K], WithinRel(0.5f, 1e-5f));
        REQUIRE_THAT(scores[t * K + 1], WithinRel(0.5f, 1e-5f));
    }

    REQUIRE_THROWS_AS(router.adjust_selection_bias({1.f}), std::logic_error);
}

TEST_CASE("single-expert routing gives unit weights", "[moe][router]") {
    const int E = 8, H = 6, N = 9;
    TopKRouter router = TopKRouter::create(make_config(H, E, 1), 31, 0.5f);
    auto out = router.route(testing_utils::uniform_tensor(N, H, -1.f, 1.f, 4));
    for (float s : out.scores.to_vector<float>()) {
        REQUIRE_THAT(s, WithinRel(1.f, 1e-6f));
    }
}

TEST_CASE("top-k kernel weight normalization", "[moe][router][kernel]") {
    // one token, probabilities 0.4 / 0.3 / 0.2 / 0.1
    const std::vector<float> probs = {0.1f, 0.4f, 0.2f, 0.3f};
    std::vector<int> ids(2);
    std::vector<float> weights(2);

    moe_topk_forward(ids.data(), weights.data(), probs.data(), nullptr, 1, 4, 2, false);
    REQUIRE(ids == std::vector<int>{1, 3});
    REQUIRE(weights == std::vector<float>{0.4f, 0.3f});

    moe_topk_forward(ids.data(), weights.data(), probs.data(), nullptr, 1, 4, 2, true);
    REQUIRE(ids == std::vector<int>{1, 3});
    REQUIRE_THAT(weights[0], WithinRel(0.4f / 0.7f, 1e-6f));
    REQUIRE_THAT(weights[1], WithinRel(0.3f / 0.7f, 1e-6f));
}

TEST_CASE("router configuration errors", "[moe][router][error]") {
    REQUIRE_THROWS_AS(TopKRouter(make_config(4, 4, 5), zero_gate(4, 4)), configuration_error);
    REQUIRE_THROWS_AS(TopKRouter(make_config(4, 4, 0), zero_gate(4, 4)), configuration_error);
    REQUIRE_THROWS_AS(TopKRouter(make_config(4, 4, 2), zero_gate(3, 4)), configuration_error);

    TopKRouter router(make_config(4, 4, 2), zero_gate(4, 4));
    REQUIRE_THROWS_AS(router.route(testing_utils::uniform_tensor(2, 3, 0.f, 1.f)), std::logic_error);
}
