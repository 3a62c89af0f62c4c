// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <algorithm>
#include <random>
#include <string>
#include <vector>

#include "config/moe_config.h"
#include "modules/moe/expert_partition.h"
#include "runtime/ep/balance_policy.h"
#include "utilities/errors.h"

using namespace ep;
using modules::ExpertOwnershipTable;
using Catch::Matchers::WithinRel;

TEST_CASE("placement policy adopts LPT when it helps enough", "[ep][policy][placement]") {
    const auto table = ExpertOwnershipTable::contiguous(8, 2);
    const std::vector<long> skewed = {100, 90, 10, 5, 1, 1, 1, 1};

    SECTION("large improvement is applied") {
        ExpertPlacementPolicy policy(0.05f);
        BalancePlan plan = policy.plan(skewed, table);
        REQUIRE(plan.moves_experts());
        REQUIRE_FALSE(plan.changes_router());
        REQUIRE(plan.new_owners == std::vector<int>{0, 1, 1, 0, 1, 1, 0, 0});
        REQUIRE(plan.transfers.size() == 4);
        REQUIRE(plan.ratio_after < plan.ratio_before);
    }

    SECTION("improvement below the threshold is skipped") {
        ExpertPlacementPolicy policy(5.0f);
        BalancePlan plan = policy.plan(skewed, table);
        REQUIRE_FALSE(plan.moves_experts());
        REQUIRE(plan.transfers.empty());
        REQUIRE(plan.ratio_after == plan.ratio_before);
    }

    SECTION("balanced load moves nothing, even with a zero threshold") {
        ExpertPlacementPolicy policy(0.0f);
        BalancePlan plan = policy.plan(std::vector<long>(8, 10), table);
        REQUIRE_FALSE(plan.moves_experts());
        REQUIRE_THAT(plan.ratio_before, WithinRel(1.f, 1e-6f));
    }

    SECTION("no load moves nothing") {
        ExpertPlacementPolicy policy(0.0f);
        BalancePlan plan = policy.plan(std::vector<long>(8, 0), table);
        REQUIRE_FALSE(plan.moves_experts());
    }
}

TEST_CASE("placement policy never increases the imbalance", "[ep][policy][placement]") {
    std::mt19937 gen(7);
    ExpertPlacementPolicy policy(0.0f);
    for (int trial = 0; trial < 100; ++trial) {
        const int ep_size = 2 + trial % 3;
        const int E = ep_size * (1 + trial % 4);
        std::vector<int> owners(E);
        for (int e = 0; e < E; ++e) owners[e] = e % ep_size;
        std::shuffle(owners.begin(), owners.end(), gen);
        const auto table = ExpertOwnershipTable::from_owners(owners, ep_size, 0);

        // heavy-tailed loads with at least one expert above and one below the mean
        std::exponential_distribution<double> dist(0.01);
        std::vector<long> loads(E);
        for (auto& l : loads) l = static_cast<long>(dist(gen));
        loads[0] += 1000;
        loads[E - 1] = 0;

        BalancePlan plan = policy.plan(loads, table);
        REQUIRE(plan.ratio_after <= plan.ratio_before);
        if (plan.moves_experts()) {
            // the adopted placement is a valid table with the promised ratio
            const auto next = ExpertOwnershipTable::from_owners(plan.new_owners, ep_size, 1);
            REQUIRE_THAT(compute_imbalance_ratio(loads, next.owners(), ep_size), WithinRel(plan.ratio_after, 1e-5f));
        }
    }
}

TEST_CASE("router bias policy nudges towards the mean", "[ep][policy][router_bias]") {
    const auto table = ExpertOwnershipTable::contiguous(4, 2);
    RouterBiasPolicy policy(0.1f);

    BalancePlan plan = policy.plan({30, 10, 10, 10}, table);
    REQUIRE(plan.changes_router());
    REQUIRE_FALSE(plan.moves_experts());
    REQUIRE(plan.bias_delta == std::vector<float>{-0.1f, 0.1f, 0.1f, 0.1f});
    // rank loads 40 and 20
    REQUIRE_THAT(plan.ratio_before, WithinRel(40.f / 30.f, 1e-6f));

    SECTION("experts at the mean are left alone") {
        BalancePlan even = policy.plan({10, 20, 15, 15}, table);
        REQUIRE(even.bias_delta == std::vector<float>{0.1f, -0.1f, 0.f, 0.f});
    }

    SECTION("no load gives no change") {
        REQUIRE_FALSE(policy.plan({0, 0, 0, 0}, table).changes_router());
    }
}

TEST_CASE("policies are built from the layer configuration", "[ep][policy]") {
    MoELayerConfig cfg;
    cfg.hidden_size = 8;
    cfg.ffn_hidden_size = 8;
    REQUIRE(std::string(make_balance_policy(cfg)->name()) == "placement");
    cfg.balance_policy = EBalancePolicy::RouterBias;
    REQUIRE(std::string(make_balance_policy(cfg)->name()) == "router_bias");

    REQUIRE_THROWS_AS(ExpertPlacementPolicy(-0.1f), configuration_error);
    REQUIRE_THROWS_AS(RouterBiasPolicy(-1.f), configuration_error);
}
