// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdio>
#include <cstdlib>

namespace testing_config {

struct TestSizeConfig {
    int N = 24;     ///< tokens per rank
    int H = 16;     ///< hidden size
    int F = 32;     ///< expert ffn size
    int E = 8;      ///< experts
    int K = 2;      ///< top-k
    int W = 2;      ///< simulated expert-parallel ranks
};

inline TestSizeConfig& mutable_cfg() {
    static TestSizeConfig cfg{};
    return cfg;
}

inline void set_test_config(const TestSizeConfig& cfg) {
    if(cfg.W <= 0 || cfg.E % cfg.W != 0) {
        fprintf(stderr, "ERROR: number of experts must be divisible by the number of ranks\n");
        exit(EXIT_FAILURE);
    }
    if(cfg.K <= 0 || cfg.K > cfg.E) {
        fprintf(stderr, "ERROR: top-k must be in [1, experts]\n");
        exit(EXIT_FAILURE);
    }
    mutable_cfg() = cfg;
}

inline const TestSizeConfig& get_test_config() {
    return mutable_cfg();
}

} // namespace testing_config
