// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "kernels.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <vector>

#include <fmt/core.h>

void matmul(float* out, const float* inp, const float* weight, const float* bias, int M, int N, int K) {
    for (int m = 0; m < M; ++m) {
        const float* x = inp + static_cast<std::size_t>(m) * K;
        float* y = out + static_cast<std::size_t>(m) * N;
        for (int n = 0; n < N; ++n) {
            const float* w = weight + static_cast<std::size_t>(n) * K;
            float acc = bias ? bias[n] : 0.f;
            for (int k = 0; k < K; ++k) {
                acc += x[k] * w[k];
            }
            y[n] = acc;
        }
    }
}

void swiglu_forward(float* out, const float* inp, int N, int D) {
    for (int i = 0; i < N; ++i) {
        const float* up = inp + static_cast<std::size_t>(i) * 2 * D;
        const float* gate = up + D;
        float* o = out + static_cast<std::size_t>(i) * D;
        for (int d = 0; d < D; ++d) {
            const float g = gate[d];
            o[d] = up[d] * (g / (1.f + std::exp(-g)));
        }
    }
}

void gelu_forward(float* out, const float* inp, int num_elements) {
    constexpr float kSqrt2OverPi = 0.7978845608028654f;
    for (int i = 0; i < num_elements; ++i) {
        const float x = inp[i];
        const float cube = 0.044715f * x * x * x;
        out[i] = 0.5f * x * (1.f + std::tanh(kSqrt2OverPi * (x + cube)));
    }
}

void relu_forward(float* out, const float* inp, int num_elements) {
    for (int i = 0; i < num_elements; ++i) {
        out[i] = std::max(inp[i], 0.f);
    }
}

void moe_softmax_forward(float* out, const float* inp, int num_tokens, int num_experts) {
    for (int t = 0; t < num_tokens; ++t) {
        const float* x = inp + static_cast<std::size_t>(t) * num_experts;
        float* y = out + static_cast<std::size_t>(t) * num_experts;
        const float max_val = *std::max_element(x, x + num_experts);
        float sum = 0.f;
        for (int e = 0; e < num_experts; ++e) {
            y[e] = std::exp(x[e] - max_val);
            sum += y[e];
        }
        const float inv = 1.f / sum;
        for (int e = 0; e < num_experts; ++e) {
            y[e] *= inv;
        }
    }
}

void moe_topk_forward(int* expert_indices, float* routing_weights, const float* scores,
                      const float* correction_bias,
                      int num_tokens, int num_experts, int top_k, bool normalize_weights) {
    std::vector<int> order(num_experts);
    std::vector<float> key(num_experts);
    for (int t = 0; t < num_tokens; ++t) {
        const float* s = scores + static_cast<std::size_t>(t) * num_experts;
        for (int e = 0; e < num_experts; ++e) {
            key[e] = s[e] + (correction_bias ? correction_bias[e] : 0.f);
        }
        std::iota(order.begin(), order.end(), 0);
        // ties resolved towards the lower expert id
        std::partial_sort(order.begin(), order.begin() + top_k, order.end(), [&](int a, int b) {
            if (key[a] != key[b]) return key[a] > key[b];
            return a < b;
        });
        float sum = 0.f;
        for (int j = 0; j < top_k; ++j) {
            expert_indices[t * top_k + j] = order[j];
            routing_weights[t * top_k + j] = s[order[j]];
            sum += s[order[j]];
        }
        if (normalize_weights && sum > 0.f) {
            const float inv = 1.f / sum;
            for (int j = 0; j < top_k; ++j) {
                routing_weights[t * top_k + j] *= inv;
            }
        }
    }
}

void moe_compute_expert_counts(int* expert_counts, const int* expert_indices,
                               int num_tokens, int top_k, int num_experts) {
    std::fill(expert_counts, expert_counts + num_experts, 0);
    for (int i = 0; i < num_tokens * top_k; ++i) {
        const int e = expert_indices[i];
        if (e >= 0 && e < num_experts) {
            ++expert_counts[e];
        }
    }
}

void moe_compute_expert_offsets(int* expert_offsets, const int* expert_counts, int num_experts) {
    expert_offsets[0] = 0;
    for (int e = 0; e < num_experts; ++e) {
        expert_offsets[e + 1] = expert_offsets[e] + expert_counts[e];
    }
}

float moe_compute_aux_loss(const float* routing_probs, const int* expert_indices,
                           int num_tokens, int num_experts, int top_k, float aux_loss_coef) {
    if (num_tokens == 0) return 0.f;
    std::vector<int> counts(num_experts);
    moe_compute_expert_counts(counts.data(), expert_indices, num_tokens, top_k, num_experts);

    float loss = 0.f;
    const float total_slots = static_cast<float>(num_tokens) * top_k;
    for (int e = 0; e < num_experts; ++e) {
        float mean_prob = 0.f;
        for (int t = 0; t < num_tokens; ++t) {
            mean_prob += routing_probs[static_cast<std::size_t>(t) * num_experts + e];
        }
        mean_prob /= static_cast<float>(num_tokens);
        loss += (static_cast<float>(counts[e]) / total_slots) * mean_prob;
    }
    return aux_loss_coef * static_cast<float>(num_experts) * loss;
}

float moe_router_z_loss_forward(const float* router_logits, int num_tokens, int num_experts, float z_loss_coef) {
    if (num_tokens == 0) return 0.f;
    double acc = 0.0;
    for (int t = 0; t < num_tokens; ++t) {
        const float* x = router_logits + static_cast<std::size_t>(t) * num_experts;
        const float max_val = *std::max_element(x, x + num_experts);
        double sum = 0.0;
        for (int e = 0; e < num_experts; ++e) {
            sum += std::exp(static_cast<double>(x[e] - max_val));
        }
        const double lse = max_val + std::log(sum);
        acc += lse * lse;
    }
    return z_loss_coef * static_cast<float>(acc / num_tokens);
}

void moe_permute_tokens(float* out, const float* inp, const int* gather_indices,
                        int total_tokens, int num_tokens, int hidden_size, int top_k) {
    for (int i = 0; i < total_tokens; ++i) {
        const int token = gather_indices[i] / top_k;
        if (gather_indices[i] < 0 || token >= num_tokens) {
            throw std::out_of_range(fmt::format("moe_permute_tokens: slot {} outside {} tokens", gather_indices[i], num_tokens));
        }
        std::memcpy(out + static_cast<std::size_t>(i) * hidden_size,
                    inp + static_cast<std::size_t>(token) * hidden_size,
                    sizeof(float) * hidden_size);
    }
}

void moe_gather_rows(float* out, const float* inp, const int* indices, int rows, int hidden_size) {
    for (int i = 0; i < rows; ++i) {
        std::memcpy(out + static_cast<std::size_t>(i) * hidden_size,
                    inp + static_cast<std::size_t>(indices[i]) * hidden_size,
                    sizeof(float) * hidden_size);
    }
}

void moe_scatter_rows(float* out, const float* inp, const int* indices, int rows, int hidden_size) {
    for (int i = 0; i < rows; ++i) {
        std::memcpy(out + static_cast<std::size_t>(indices[i]) * hidden_size,
                    inp + static_cast<std::size_t>(i) * hidden_size,
                    sizeof(float) * hidden_size);
    }
}

void moe_unpermute_and_combine(float* out, const float* expert_out, const float* routing_weights,
                               const int* scatter_indices, int num_tokens, int total_tokens,
                               int hidden_size, int top_k) {
    for (int t = 0; t < num_tokens; ++t) {
        float* y = out + static_cast<std::size_t>(t) * hidden_size;
        std::fill(y, y + hidden_size, 0.f);
        for (int j = 0; j < top_k; ++j) {
            const int row = scatter_indices[t * top_k + j];
            if (row < 0 || row >= total_tokens) {
                throw std::out_of_range(fmt::format("moe_unpermute_and_combine: row {} outside {} rows", row, total_tokens));
            }
            const float w = routing_weights[t * top_k + j];
            const float* x = expert_out + static_cast<std::size_t>(row) * hidden_size;
            for (int h = 0; h < hidden_size; ++h) {
                y[h] += w * x[h];
            }
        }
    }
}

void moe_grouped_gemm(float* out, const float* inp, const float* weights, const int* expert_offsets,
                      int num_experts, int N, int K) {
    for (int e = 0; e < num_experts; ++e) {
        const int begin = expert_offsets[e];
        const int rows = expert_offsets[e + 1] - begin;
        if (rows == 0) continue;
        matmul(out + static_cast<std::size_t>(begin) * N,
               inp + static_cast<std::size_t>(begin) * K,
               weights + static_cast<std::size_t>(e) * N * K,
               nullptr, rows, N, K);
    }
}

void moe_expert_bias_add_forward(float* out, const float* inp, const float* bias, const int* expert_offsets,
                                 int num_experts, int hidden_size) {
    for (int e = 0; e < num_experts; ++e) {
        const float* b = bias + static_cast<std::size_t>(e) * hidden_size;
        for (int r = expert_offsets[e]; r < expert_offsets[e + 1]; ++r) {
            const float* x = inp + static_cast<std::size_t>(r) * hidden_size;
            float* y = out + static_cast<std::size_t>(r) * hidden_size;
            for (int h = 0; h < hidden_size; ++h) {
                y[h] = x[h] + b[h];
            }
        }
    }
}
