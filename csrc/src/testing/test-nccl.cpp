// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// NCCL-backed communicator tests; skipped on machines without CUDA devices.

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

#include <cuda_runtime.h>

#include "config/moe_config.h"
#include "modules/moe/moe_layer.h"
#include "utilities/comm.h"
#include "utilities/nccl_comm.h"
#include "utilities/test_utils.h"

namespace {

int cuda_device_count() {
    int device_count = 0;
    if (cudaGetDeviceCount(&device_count) != cudaSuccess) {
        (void)cudaGetLastError();
        return 0;
    }
    return device_count;
}

} // anonymous namespace

TEST_CASE("NCCL all-gather orders by rank", "[nccl]") {
    const int ngpus = cuda_device_count();
    if (ngpus < 1) {
        SKIP("No CUDA devices available");
    }

    std::vector<std::vector<int>> gathered(ngpus);
    NCCLCommunicator::run_communicators(ngpus, [&](Communicator& comm) {
        gathered[comm.rank()] = comm.host_all_gather(10 * comm.rank() + 1);
    });

    std::vector<int> expected;
    for (int r = 0; r < ngpus; ++r) expected.push_back(10 * r + 1);
    for (int r = 0; r < ngpus; ++r) {
        REQUIRE(gathered[r] == expected);
    }
}

TEST_CASE("NCCL variable all-to-all", "[nccl]") {
    const int ngpus = cuda_device_count();
    if (ngpus < 2) {
        SKIP("Need at least 2 CUDA devices");
    }

    // rank r sends (r + p + 1) floats with value 100 * r + p to peer p
    std::vector<std::vector<float>> received(ngpus);
    NCCLCommunicator::run_communicators(ngpus, [&](Communicator& comm) {
        const int r = comm.rank();
        std::vector<int> send_splits(ngpus), recv_splits(ngpus);
        std::vector<float> send;
        for (int p = 0; p < ngpus; ++p) {
            send_splits[p] = r + p + 1;
            recv_splits[p] = p + r + 1;
            send.insert(send.end(), send_splits[p], static_cast<float>(100 * r + p));
        }
        int total = 0;
        for (int c : recv_splits) total += c;
        std::vector<float> recv(total);
        comm.all_to_all_single(reinterpret_cast<const std::byte*>(send.data()), reinterpret_cast<std::byte*>(recv.data()),
                               send_splits.data(), recv_splits.data(), sizeof(float));
        received[r] = recv;
    });

    for (int r = 0; r < ngpus; ++r) {
        std::vector<float> expected;
        for (int p = 0; p < ngpus; ++p) expected.insert(expected.end(), p + r + 1, static_cast<float>(100 * p + r));
        REQUIRE(received[r] == expected);
    }
}

TEST_CASE("NCCL point-to-point ring", "[nccl]") {
    const int ngpus = cuda_device_count();
    if (ngpus < 2) {
        SKIP("Need at least 2 CUDA devices");
    }

    std::vector<std::vector<std::int32_t>> received(ngpus);
    NCCLCommunicator::run_communicators(ngpus, [&](Communicator& comm) {
        const int r = comm.rank();
        const int next = (r + 1) % ngpus;
        const int prev = (r + ngpus - 1) % ngpus;
        std::vector<std::int32_t> payload(16, r);
        std::vector<std::int32_t> incoming(16, -1);
        comm.transfer_group_start();
        comm.send(reinterpret_cast<const std::byte*>(payload.data()), payload.size() * sizeof(std::int32_t), next);
        comm.recv(reinterpret_cast<std::byte*>(incoming.data()), incoming.size() * sizeof(std::int32_t), prev);
        comm.transfer_group_end();
        received[r] = incoming;
    });

    for (int r = 0; r < ngpus; ++r) {
        REQUIRE(received[r] == std::vector<std::int32_t>(16, (r + ngpus - 1) % ngpus));
    }
}

TEST_CASE("MoE layer gives the same result over NCCL and host threads", "[nccl][moe]") {
    const int ngpus = cuda_device_count();
    if (ngpus < 2) {
        SKIP("Need at least 2 CUDA devices");
    }

    MoELayerConfig cfg;
    cfg.num_experts = 2 * ngpus;
    cfg.top_k = 2;
    cfg.hidden_size = 8;
    cfg.ffn_hidden_size = 16;
    cfg.ep_size = ngpus;

    auto run = [&](auto launcher) {
        std::vector<std::vector<float>> outputs(ngpus);
        launcher(ngpus, [&](Communicator& comm) {
            modules::MoELayer layer(cfg, comm);
            HostTensor tokens = testing_utils::uniform_tensor(10, cfg.hidden_size, -1.f, 1.f, 17 + comm.rank());
            outputs[comm.rank()] = layer.forward(tokens).output.to_vector<float>();
        });
        return outputs;
    };

    const auto nccl = run([](int n, auto work) { NCCLCommunicator::run_communicators(n, work); });
    const auto host = run([](int n, auto work) { Communicator::run_communicators(n, work); });
    for (int r = 0; r < ngpus; ++r) {
        REQUIRE(testing_utils::max_abs_diff(nccl[r], host[r]) < 1e-6f);
    }
}
