// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <algorithm>
#include <numeric>
#include <random>
#include <stdexcept>
#include <vector>

#include "runtime/ep/lpt_planner.h"

using namespace ep;
using Catch::Matchers::WithinRel;

namespace {

std::vector<int> contiguous_owners(int num_experts, int ep_size) {
    std::vector<int> owners(num_experts);
    for (int e = 0; e < num_experts; ++e) owners[e] = e / (num_experts / ep_size);
    return owners;
}

} // namespace

TEST_CASE("rank loads and imbalance ratio", "[ep][lpt]") {
    const std::vector<long> loads = {4, 2, 1, 1};
    const std::vector<int> owners = {0, 0, 1, 1};
    REQUIRE(compute_rank_loads(loads, owners, 2) == std::vector<long>{6, 2});
    // max 6 over mean 4
    REQUIRE_THAT(compute_imbalance_ratio(loads, owners, 2), WithinRel(1.5f, 1e-6f));

    SECTION("no load counts as balanced") {
        REQUIRE(compute_imbalance_ratio({0, 0, 0, 0}, owners, 2) == 1.0f);
    }

    SECTION("inconsistent inputs") {
        REQUIRE_THROWS_AS(compute_rank_loads({1, 2, 3}, owners, 2), std::logic_error);
        REQUIRE_THROWS_AS(compute_rank_loads(loads, {0, 0, 2, 1}, 2), std::logic_error);
    }
}

TEST_CASE("LPT spreads two hot experts over both ranks", "[ep][lpt]") {
    const std::vector<long> loads = {100, 90, 10, 5, 1, 1, 1, 1};
    const auto owners = contiguous_owners(8, 2);

    PlacementPlan plan = compute_lpt_placement(loads, owners, 2, 4);

    REQUIRE(plan.expert_to_rank == std::vector<int>{0, 1, 1, 0, 1, 1, 0, 0});
    REQUIRE(plan.rank_loads == std::vector<long>{107, 102});
    REQUIRE_THAT(plan.ratio_before, WithinRel(205.f / 104.5f, 1e-5f));
    REQUIRE_THAT(plan.ratio_after, WithinRel(107.f / 104.5f, 1e-5f));

    REQUIRE(plan.transfers.size() == 4);
    const std::vector<int> moved = {plan.transfers[0].expert_id, plan.transfers[1].expert_id,
                                    plan.transfers[2].expert_id, plan.transfers[3].expert_id};
    REQUIRE(moved == std::vector<int>{1, 2, 6, 7});
    REQUIRE(plan.transfers[0].src_rank == 0);
    REQUIRE(plan.transfers[0].dst_rank == 1);
    REQUIRE(plan.transfers[3].src_rank == 1);
    REQUIRE(plan.transfers[3].dst_rank == 0);
}

TEST_CASE("LPT plans are valid partitions", "[ep][lpt]") {
    std::mt19937 gen(2024);
    for (int trial = 0; trial < 50; ++trial) {
        const int ep_size = 1 + trial % 4;
        const int num_local = 1 + (trial / 4) % 4;
        const int E = ep_size * num_local;
        std::uniform_int_distribution<long> dist(0, 1000);
        std::vector<long> loads(E);
        for (auto& l : loads) l = dist(gen);
        std::vector<int> owners = contiguous_owners(E, ep_size);
        std::shuffle(owners.begin(), owners.end(), gen);

        PlacementPlan plan = compute_lpt_placement(loads, owners, ep_size, num_local);

        // every rank ends up with exactly num_local experts
        std::vector<int> per_rank(ep_size, 0);
        for (int r : plan.expert_to_rank) {
            REQUIRE(r >= 0);
            REQUIRE(r < ep_size);
            ++per_rank[r];
        }
        REQUIRE(per_rank == std::vector<int>(ep_size, num_local));
        REQUIRE(plan.rank_loads == compute_rank_loads(loads, plan.expert_to_rank, ep_size));

        // transfers are exactly the owner changes, in expert id order
        int expected_moves = 0;
        for (int e = 0; e < E; ++e) expected_moves += plan.expert_to_rank[e] != owners[e];
        REQUIRE(static_cast<int>(plan.transfers.size()) == expected_moves);
        for (std::size_t i = 0; i < plan.transfers.size(); ++i) {
            const auto& t = plan.transfers[i];
            REQUIRE(t.src_rank == owners[t.expert_id]);
            REQUIRE(t.dst_rank == plan.expert_to_rank[t.expert_id]);
            if (i > 0) REQUIRE(plan.transfers[i - 1].expert_id < t.expert_id);
        }

        // total load is unchanged
        REQUIRE(std::accumulate(plan.rank_loads.begin(), plan.rank_loads.end(), 0L) ==
                std::accumulate(loads.begin(), loads.end(), 0L));
    }
}

TEST_CASE("LPT keeps experts in place on ties", "[ep][lpt]") {
    // a single expert per rank cannot move anywhere useful
    PlacementPlan plan = compute_lpt_placement({5, 5}, {1, 0}, 2, 1);
    REQUIRE(plan.transfers.empty());
    REQUIRE(plan.expert_to_rank == std::vector<int>{1, 0});
}

TEST_CASE("LPT rejects inconsistent shapes", "[ep][lpt][error]") {
    REQUIRE_THROWS_AS(compute_lpt_placement({1, 2, 3}, {0, 0, 1}, 2, 2), std::logic_error);
    REQUIRE_THROWS_AS(compute_lpt_placement({1, 2}, {0, 1}, 0, 1), std::logic_error);
}
