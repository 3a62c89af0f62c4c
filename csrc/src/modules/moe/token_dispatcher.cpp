// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "modules/moe/token_dispatcher.h"

#include <numeric>
#include <stdexcept>

#include <fmt/core.h>

#include "kernels/kernels.h"
#include "modules/moe/expert_partition.h"
#include "utilities/comm.h"
#include "utilities/errors.h"

namespace modules {

namespace {

void check_routing_shape(const Tensor& t, ETensorDType dtype, long num_tokens, int top_k, const char* what) {
    if (t.DType != dtype || t.Rank != 2 || t.Sizes[0] != num_tokens || t.Sizes[1] != top_k) {
        throw std::logic_error(fmt::format("DroplessTokenDispatcher: {} must be {} ({}, {})",
                                           what, dtype_to_str(dtype), num_tokens, top_k));
    }
}

} // namespace

DroplessTokenDispatcher::DroplessTokenDispatcher(Communicator& ep_comm, int num_experts, int top_k, int hidden_size) :
    mComm(&ep_comm), mNumExperts(num_experts), mTopK(top_k), mHiddenSize(hidden_size)
{
    if (num_experts % ep_comm.world_size() != 0) {
        throw configuration_error(fmt::format(
            "DroplessTokenDispatcher: num_experts ({}) must be divisible by the expert-parallel size ({})",
            num_experts, ep_comm.world_size()));
    }
    if (top_k <= 0 || top_k > num_experts || hidden_size <= 0) {
        throw configuration_error(fmt::format(
            "DroplessTokenDispatcher: invalid top_k ({}) or hidden size ({})", top_k, hidden_size));
    }
}

/**
 * @brief Move every (token, slot) pair to the rank hosting its expert.
 *
 * Steps:
 *  1. map each slot's expert through the ownership table to (dest rank, dest local expert)
 *     and order the send buffer by that key, keeping slot order within a key;
 *  2. exchange the (ep_size, num_local_experts) count matrix;
 *  3. exchange token rows and their flat slot ids with variable-split all-to-alls;
 *  4. regroup the received rows by local expert (source-rank order within an expert).
 */
DispatchOutput DroplessTokenDispatcher::permute(const Tensor& tokens, const Tensor& scores,
                                                const Tensor& expert_indices,
                                                const ExpertOwnershipTable& table) const {
    if (tokens.DType != ETensorDType::FP32 || tokens.Rank != 2 || tokens.Sizes[1] != mHiddenSize) {
        throw std::logic_error(fmt::format("DroplessTokenDispatcher::permute: tokens must be fp32 (N, {})", mHiddenSize));
    }
    const int N = narrow<int>(tokens.Sizes[0]);
    const int K = mTopK;
    const int H = mHiddenSize;
    check_routing_shape(scores, ETensorDType::FP32, N, K, "scores");
    check_routing_shape(expert_indices, ETensorDType::INT32, N, K, "expert indices");

    const int ep_size = mComm->world_size();
    if (table.ep_size() != ep_size || table.num_experts() != mNumExperts) {
        throw std::logic_error(fmt::format(
            "DroplessTokenDispatcher::permute: ownership table ({} experts over {} ranks) does not match ({} over {})",
            table.num_experts(), table.ep_size(), mNumExperts, ep_size));
    }
    const int L = table.num_local_experts();
    const int total = N * K;
    const int* ids = expert_indices.get<int>();

    // destination key per slot: dest_rank * L + dest_local_expert
    std::vector<int> keys(total);
    std::vector<int> send_counts(ep_size * L, 0);
    for (int s = 0; s < total; ++s) {
        const int e = ids[s];
        if (e < 0 || e >= mNumExperts) {
            throw dispatch_protocol_error(fmt::format(
                "permute: token {} slot {} routed to expert {}, outside [0, {})", s / K, s % K, e, mNumExperts));
        }
        keys[s] = table.owner_of(e) * L + table.local_index_of(e);
        ++send_counts[keys[s]];
    }

    DispatchOutput out;
    RoutingMap& map = out.routing_map;
    map.table_version = table.version();
    map.num_tokens = N;
    map.top_k = K;
    map.num_local_experts = L;

    // counting sort keeps slot order within each key
    std::vector<int> key_offsets(ep_size * L + 1);
    moe_compute_expert_offsets(key_offsets.data(), send_counts.data(), ep_size * L);
    map.send_slots.resize(total);
    for (int s = 0; s < total; ++s) {
        map.send_slots[key_offsets[keys[s]]++] = s;
    }

    map.send_splits.assign(ep_size, 0);
    for (int p = 0; p < ep_size; ++p) {
        for (int l = 0; l < L; ++l) {
            map.send_splits[p] += send_counts[p * L + l];
        }
    }

    map.recv_counts.assign(ep_size * L, 0);
    mComm->all_to_all_counts(send_counts.data(), map.recv_counts.data(), L);

    map.recv_splits.assign(ep_size, 0);
    for (int p = 0; p < ep_size; ++p) {
        for (int l = 0; l < L; ++l) {
            const int c = map.recv_counts[p * L + l];
            if (c < 0) {
                throw dispatch_protocol_error(fmt::format("permute: rank {} announced a negative count {}", p, c));
            }
            map.recv_splits[p] += c;
        }
    }
    const int R = std::accumulate(map.recv_splits.begin(), map.recv_splits.end(), 0);

    HostTensor send_rows(ETensorDType::FP32, {total, H});
    moe_permute_tokens(send_rows.get<float>(), tokens.get<float>(), map.send_slots.data(), total, N, H, K);

    HostTensor recv_rows(ETensorDType::FP32, {R, H});
    mComm->all_to_all_single(send_rows.Data, recv_rows.Data, map.send_splits.data(), map.recv_splits.data(),
                             H * static_cast<int>(sizeof(float)));

    std::vector<int> recv_slots(R);
    mComm->all_to_all_single(reinterpret_cast<const std::byte*>(map.send_slots.data()),
                             reinterpret_cast<std::byte*>(recv_slots.data()),
                             map.send_splits.data(), map.recv_splits.data(), sizeof(int));

    out.tokens_per_local_expert.assign(L, 0);
    for (int p = 0; p < ep_size; ++p) {
        for (int l = 0; l < L; ++l) {
            out.tokens_per_local_expert[l] += map.recv_counts[p * L + l];
        }
    }
    std::vector<int> cursor(L + 1);
    moe_compute_expert_offsets(cursor.data(), out.tokens_per_local_expert.data(), L);

    map.recv_to_grouped.resize(R);
    map.entries.resize(R);
    int r = 0;
    for (int p = 0; p < ep_size; ++p) {
        for (int l = 0; l < L; ++l) {
            for (int i = 0; i < map.recv_counts[p * L + l]; ++i, ++r) {
                const int g = cursor[l]++;
                const int slot = recv_slots[r];
                if (slot < 0) {
                    throw dispatch_protocol_error(fmt::format("permute: rank {} sent invalid slot id {}", p, slot));
                }
                map.recv_to_grouped[r] = g;
                map.entries[g] = RoutingMap::Entry{p, slot / K, slot % K};
            }
        }
    }

    out.dispatched_tokens = HostTensor(ETensorDType::FP32, {R, H});
    moe_scatter_rows(out.dispatched_tokens.get<float>(), recv_rows.get<float>(), map.recv_to_grouped.data(), R, H);
    out.scores = scores;
    out.expert_indices = expert_indices;
    return out;
}

/// Send grouped rows back to their origin ranks; result is in the origin's send order.
HostTensor DroplessTokenDispatcher::return_rows(const Tensor& grouped, const RoutingMap& map) const {
    const int H = mHiddenSize;
    const int R = map.num_dispatched();
    HostTensor back(ETensorDType::FP32, {R, H});
    moe_gather_rows(back.get<float>(), grouped.get<float>(), map.recv_to_grouped.data(), R, H);

    HostTensor returned(ETensorDType::FP32, {static_cast<long>(map.send_slots.size()), H});
    mComm->all_to_all_single(back.Data, returned.Data, map.recv_splits.data(), map.send_splits.data(),
                             H * static_cast<int>(sizeof(float)));
    return returned;
}

/**
 * @brief Reverse the exchange of permute() and combine the k outputs per token.
 *
 * output[t] = sum_j scores[t, j] * y(t, j), where y(t, j) is the output of the
 * expert chosen in slot j. The flat slot ids travel back alongside the rows and
 * must match what was sent, so a corrupted map cannot silently mix tokens.
 */
CombineOutput DroplessTokenDispatcher::unpermute(const Tensor& expert_outputs, const Tensor& expert_bias,
                                                 const Tensor& scores, const Tensor& expert_indices,
                                                 const RoutingMap& map, std::uint64_t current_version) const {
    if (map.table_version != current_version) {
        throw dispatch_protocol_error(fmt::format(
            "unpermute: routing map was built against ownership table version {}, current version is {}",
            map.table_version, current_version));
    }
    const int N = map.num_tokens;
    const int K = map.top_k;
    const int H = mHiddenSize;
    check_routing_shape(scores, ETensorDType::FP32, N, K, "scores");
    check_routing_shape(expert_indices, ETensorDType::INT32, N, K, "expert indices");

    const int M = map.num_dispatched();
    if (expert_outputs.DType != ETensorDType::FP32 || expert_outputs.Rank != 2 ||
        expert_outputs.Sizes[0] != M || expert_outputs.Sizes[1] != H) {
        throw dispatch_protocol_error(fmt::format(
            "unpermute: expert outputs have {} rows of width {}, routing map expects {} rows of width {}",
            expert_outputs.rows(), expert_outputs.Rank == 2 ? expert_outputs.Sizes[1] : 0, M, H));
    }
    if (static_cast<int>(map.send_slots.size()) != N * K) {
        throw dispatch_protocol_error("unpermute: routing map send side is inconsistent with its token count");
    }
    const bool has_bias = expert_bias.has_value();
    if (has_bias && (expert_bias.Rank != 2 || expert_bias.Sizes[0] != M || expert_bias.Sizes[1] != H)) {
        throw dispatch_protocol_error(fmt::format("unpermute: expert bias must have shape ({}, {})", M, H));
    }

    std::vector<int> back_slots(M);
    for (int r = 0; r < M; ++r) {
        const auto& e = map.entries[map.recv_to_grouped[r]];
        back_slots[r] = e.origin_token * K + e.slot;
    }
    std::vector<int> returned_slots(N * K);
    mComm->all_to_all_single(reinterpret_cast<const std::byte*>(back_slots.data()),
                             reinterpret_cast<std::byte*>(returned_slots.data()),
                             map.recv_splits.data(), map.send_splits.data(), sizeof(int));
    for (int i = 0; i < N * K; ++i) {
        if (returned_slots[i] != map.send_slots[i]) {
            throw dispatch_protocol_error(fmt::format(
                "unpermute: row {} came back as slot {}, expected slot {}", i, returned_slots[i], map.send_slots[i]));
        }
    }

    std::vector<int> scatter_indices(N * K);
    for (int i = 0; i < N * K; ++i) {
        scatter_indices[map.send_slots[i]] = i;
    }

    CombineOutput out;
    HostTensor returned = return_rows(expert_outputs, map);
    out.output = HostTensor(ETensorDType::FP32, {N, H});
    moe_unpermute_and_combine(out.output.get<float>(), returned.get<float>(), scores.get<float>(),
                              scatter_indices.data(), N, N * K, H, K);

    if (has_bias) {
        HostTensor returned_bias = return_rows(expert_bias, map);
        out.bias = HostTensor(ETensorDType::FP32, {N, H});
        moe_unpermute_and_combine(out.bias.get<float>(), returned_bias.get<float>(), scores.get<float>(),
                                  scatter_indices.data(), N, N * K, H, K);
    }
    return out;
}

} // namespace modules
