// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "modules/moe/expert_bank.h"

#include <algorithm>
#include <cstring>
#include <random>
#include <stdexcept>

#include <fmt/core.h>

#include "kernels/kernels.h"
#include "modules/moe/expert_partition.h"
#include "utilities/errors.h"
#include "utilities/utils.h"

namespace modules {

EActivation activation_from_str(std::string_view name) {
    if (iequals(name, "swiglu")) return EActivation::SwiGLU;
    if (iequals(name, "gelu")) return EActivation::GeLU;
    if (iequals(name, "relu")) return EActivation::ReLU;
    if (iequals(name, "identity") || iequals(name, "none")) return EActivation::Identity;
    throw configuration_error(fmt::format("unknown expert activation '{}'", name));
}

const char* activation_to_str(EActivation act) {
    switch (act) {
        case EActivation::SwiGLU: return "swiglu";
        case EActivation::GeLU: return "gelu";
        case EActivation::ReLU: return "relu";
        case EActivation::Identity: return "identity";
    }
    return "<unknown>";
}

ExpertBank::ExpertBank(const Config& config, const std::vector<int>& hosted_experts) :
    mConfig(config), mHosted(hosted_experts)
{
    if (mConfig.hidden_size <= 0 || mConfig.ffn_hidden_size <= 0) {
        throw configuration_error(fmt::format("ExpertBank: invalid expert shape (hidden={}, ffn={})",
                                              mConfig.hidden_size, mConfig.ffn_hidden_size));
    }
    for (int id : mHosted) {
        if (mParams.count(id)) {
            throw configuration_error(fmt::format("ExpertBank: expert {} listed twice", id));
        }
        mParams.emplace(id, init_expert(id));
    }
    repack();
}

int ExpertBank::gate_up_rows() const {
    return mConfig.activation == EActivation::SwiGLU ? 2 * mConfig.ffn_hidden_size : mConfig.ffn_hidden_size;
}

std::size_t ExpertBank::expert_numel() const {
    const std::size_t H = mConfig.hidden_size;
    const std::size_t F = mConfig.ffn_hidden_size;
    return static_cast<std::size_t>(gate_up_rows()) * H + H * F + (mConfig.add_bias ? H : 0);
}

/// Parameters depend only on (seed, expert id), so every rank would build the same expert.
ExpertBank::ExpertParams ExpertBank::init_expert(int expert_id) const {
    const int H = mConfig.hidden_size;
    const int F = mConfig.ffn_hidden_size;
    std::mt19937_64 gen(mConfig.seed ^ (0x9E3779B97F4A7C15ULL * static_cast<std::uint64_t>(expert_id + 1)));
    std::normal_distribution<float> dist(0.f, mConfig.init_std);

    ExpertParams p;
    p.gate_up = HostTensor(ETensorDType::FP32, {gate_up_rows(), H});
    p.down = HostTensor(ETensorDType::FP32, {H, F});
    for (std::size_t i = 0; i < p.gate_up.nelem(); ++i) p.gate_up.get<float>()[i] = dist(gen);
    for (std::size_t i = 0; i < p.down.nelem(); ++i) p.down.get<float>()[i] = dist(gen);
    if (mConfig.add_bias) {
        p.bias = HostTensor(ETensorDType::FP32, {H});
    }
    return p;
}

ExpertBank::ExpertParams& ExpertBank::params(int expert_id) {
    auto it = mParams.find(expert_id);
    if (it == mParams.end()) {
        throw std::out_of_range(fmt::format("ExpertBank: expert {} is not hosted here", expert_id));
    }
    return it->second;
}

const ExpertBank::ExpertParams& ExpertBank::params(int expert_id) const {
    auto it = mParams.find(expert_id);
    if (it == mParams.end()) {
        throw std::out_of_range(fmt::format("ExpertBank: expert {} is not hosted here", expert_id));
    }
    return it->second;
}

/**
 * @brief Validate expert shapes and rebuild the packed arenas used by grouped execution.
 *
 * @throws configuration_error if an expert's parameters do not fit the configured activation.
 */
void ExpertBank::repack() {
    const int H = mConfig.hidden_size;
    const int F = mConfig.ffn_hidden_size;
    const int U = gate_up_rows();
    for (const auto& [id, p] : mParams) {
        if (p.gate_up.Rank != 2 || p.gate_up.Sizes[0] != U || p.gate_up.Sizes[1] != H) {
            throw configuration_error(fmt::format(
                "ExpertBank: expert {} gate_up is ({}, {}), {} activation needs ({}, {})",
                id, p.gate_up.Sizes[0], p.gate_up.Sizes[1], activation_to_str(mConfig.activation), U, H));
        }
        if (p.down.Rank != 2 || p.down.Sizes[0] != H || p.down.Sizes[1] != F) {
            throw configuration_error(fmt::format("ExpertBank: expert {} down projection must be ({}, {})", id, H, F));
        }
        if (mConfig.add_bias != p.bias.has_value() || (p.bias.has_value() && p.bias.nelem() != static_cast<std::size_t>(H))) {
            throw configuration_error(fmt::format("ExpertBank: expert {} bias does not match add_bias={}", id, mConfig.add_bias));
        }
    }

    if (!mConfig.grouped_gemm) {
        mGateUpArena = HostTensor();
        mDownArena = HostTensor();
        mBiasArena = HostTensor();
        return;
    }

    const long L = num_local_experts();
    mGateUpArena = HostTensor(ETensorDType::FP32, {L, U, H});
    mDownArena = HostTensor(ETensorDType::FP32, {L, H, F});
    mBiasArena = HostTensor(ETensorDType::FP32, {L, H});
    for (long l = 0; l < L; ++l) {
        const ExpertParams& p = params(mHosted[l]);
        std::memcpy(mGateUpArena.Data + l * p.gate_up.bytes(), p.gate_up.Data, p.gate_up.bytes());
        std::memcpy(mDownArena.Data + l * p.down.bytes(), p.down.Data, p.down.bytes());
        if (p.bias.has_value()) {
            std::memcpy(mBiasArena.Data + l * p.bias.bytes(), p.bias.Data, p.bias.bytes());
        }
    }
}

void ExpertBank::apply_activation(float* act_out, const float* gate_up_out, int rows) const {
    const int F = mConfig.ffn_hidden_size;
    switch (mConfig.activation) {
        case EActivation::SwiGLU:
            swiglu_forward(act_out, gate_up_out, rows, F);
            break;
        case EActivation::GeLU:
            gelu_forward(act_out, gate_up_out, rows * F);
            break;
        case EActivation::ReLU:
            relu_forward(act_out, gate_up_out, rows * F);
            break;
        case EActivation::Identity:
            std::copy(gate_up_out, gate_up_out + static_cast<std::size_t>(rows) * F, act_out);
            break;
    }
}

ExpertBank::ExpertOutput ExpertBank::compute(const Tensor& dispatched_tokens,
                                             const std::vector<int>& tokens_per_local_expert) const {
    const int H = mConfig.hidden_size;
    if (dispatched_tokens.DType != ETensorDType::FP32 || dispatched_tokens.Rank != 2 ||
        dispatched_tokens.Sizes[1] != H) {
        throw std::logic_error(fmt::format("ExpertBank::compute: tokens must be fp32 (M, {})", H));
    }
    const int L = num_local_experts();
    if (static_cast<int>(tokens_per_local_expert.size()) != L) {
        throw dispatch_protocol_error(fmt::format("ExpertBank::compute: got {} expert counts for {} local experts",
                                                  tokens_per_local_expert.size(), L));
    }
    for (int c : tokens_per_local_expert) {
        if (c < 0) throw dispatch_protocol_error(fmt::format("ExpertBank::compute: negative token count {}", c));
    }
    std::vector<int> offsets(L + 1);
    moe_compute_expert_offsets(offsets.data(), tokens_per_local_expert.data(), L);
    if (offsets[L] != dispatched_tokens.Sizes[0]) {
        throw dispatch_protocol_error(fmt::format("ExpertBank::compute: counts cover {} rows, {} were dispatched",
                                                  offsets[L], dispatched_tokens.Sizes[0]));
    }
    return mConfig.grouped_gemm ? compute_grouped(dispatched_tokens, offsets)
                                : compute_sequential(dispatched_tokens, offsets);
}

ExpertBank::ExpertOutput ExpertBank::compute_grouped(const Tensor& tokens, const std::vector<int>& offsets) const {
    const int H = mConfig.hidden_size;
    const int F = mConfig.ffn_hidden_size;
    const int U = gate_up_rows();
    const int L = num_local_experts();
    const int M = offsets[L];

    HostTensor h(ETensorDType::FP32, {M, U});
    moe_grouped_gemm(h.get<float>(), tokens.get<float>(), mGateUpArena.get<float>(), offsets.data(), L, U, H);
    HostTensor act(ETensorDType::FP32, {M, F});
    apply_activation(act.get<float>(), h.get<float>(), M);

    ExpertOutput out;
    out.output = HostTensor(ETensorDType::FP32, {M, H});
    moe_grouped_gemm(out.output.get<float>(), act.get<float>(), mDownArena.get<float>(), offsets.data(), L, H, F);
    if (mConfig.add_bias) {
        out.bias = HostTensor(ETensorDType::FP32, {M, H});
        moe_expert_bias_add_forward(out.bias.get<float>(), out.bias.get<float>(), mBiasArena.get<float>(),
                                    offsets.data(), L, H);
    }
    return out;
}

ExpertBank::ExpertOutput ExpertBank::compute_sequential(const Tensor& tokens, const std::vector<int>& offsets) const {
    const int H = mConfig.hidden_size;
    const int F = mConfig.ffn_hidden_size;
    const int U = gate_up_rows();
    const int L = num_local_experts();
    const int M = offsets[L];

    ExpertOutput out;
    out.output = HostTensor(ETensorDType::FP32, {M, H});
    if (mConfig.add_bias) {
        out.bias = HostTensor(ETensorDType::FP32, {M, H});
    }
    for (int l = 0; l < L; ++l) {
        const int rows = offsets[l + 1] - offsets[l];
        if (rows == 0) continue;
        const ExpertParams& p = params(mHosted[l]);
        Tensor x = slice(tokens, 0, offsets[l], offsets[l + 1]);
        Tensor y = slice(out.output, 0, offsets[l], offsets[l + 1]);

        HostTensor h(ETensorDType::FP32, {rows, U});
        matmul(h.get<float>(), x.get<float>(), p.gate_up.get<float>(), nullptr, rows, U, H);
        HostTensor act(ETensorDType::FP32, {rows, F});
        apply_activation(act.get<float>(), h.get<float>(), rows);
        matmul(y.get<float>(), act.get<float>(), p.down.get<float>(), nullptr, rows, H, F);

        if (mConfig.add_bias) {
            Tensor b = slice(out.bias, 0, offsets[l], offsets[l + 1]);
            for (int r = 0; r < rows; ++r) {
                std::copy(p.bias.get<float>(), p.bias.get<float>() + H, b.get<float>() + static_cast<std::size_t>(r) * H);
            }
        }
    }
    return out;
}

std::vector<std::byte> ExpertBank::export_expert(int expert_id) const {
    const ExpertParams& p = params(expert_id);
    std::vector<std::byte> blob(expert_bytes());
    std::byte* dst = blob.data();
    std::memcpy(dst, p.gate_up.Data, p.gate_up.bytes());
    dst += p.gate_up.bytes();
    std::memcpy(dst, p.down.Data, p.down.bytes());
    dst += p.down.bytes();
    if (p.bias.has_value()) {
        std::memcpy(dst, p.bias.Data, p.bias.bytes());
    }
    return blob;
}

void ExpertBank::import_expert(int expert_id, const std::vector<std::byte>& blob) {
    if (blob.size() != expert_bytes()) {
        throw std::runtime_error(fmt::format("ExpertBank::import_expert: expert {} blob has {} bytes, expected {}",
                                             expert_id, blob.size(), expert_bytes()));
    }
    if (mParams.count(expert_id)) {
        throw std::logic_error(fmt::format("ExpertBank::import_expert: expert {} is already hosted", expert_id));
    }
    const int H = mConfig.hidden_size;
    ExpertParams p;
    p.gate_up = HostTensor(ETensorDType::FP32, {gate_up_rows(), H});
    p.down = HostTensor(ETensorDType::FP32, {H, mConfig.ffn_hidden_size});
    const std::byte* src = blob.data();
    std::memcpy(p.gate_up.Data, src, p.gate_up.bytes());
    src += p.gate_up.bytes();
    std::memcpy(p.down.Data, src, p.down.bytes());
    src += p.down.bytes();
    if (mConfig.add_bias) {
        p.bias = HostTensor(ETensorDType::FP32, {H});
        std::memcpy(p.bias.Data, src, p.bias.bytes());
    }
    mParams.emplace(expert_id, std::move(p));
}

void ExpertBank::release_expert(int expert_id) {
    if (mParams.erase(expert_id) == 0) {
        throw std::logic_error(fmt::format("ExpertBank::release_expert: expert {} is not hosted here", expert_id));
    }
}

void ExpertBank::adopt_ownership(const ExpertOwnershipTable& table, int rank) {
    const std::vector<int>& hosted = table.local_experts(rank);
    for (int id : hosted) {
        if (!has_expert(id)) {
            throw std::logic_error(fmt::format(
                "ExpertBank::adopt_ownership: rank {} should host expert {} but has no parameters for it", rank, id));
        }
    }
    if (mParams.size() != hosted.size()) {
        throw std::logic_error(fmt::format(
            "ExpertBank::adopt_ownership: rank {} holds {} experts, table assigns {}", rank, mParams.size(), hosted.size()));
    }
    mHosted = hosted;
    repack();
}

} // namespace modules
