// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOESHARD_SRC_KERNELS_KERNELS_H
#define MOESHARD_SRC_KERNELS_KERNELS_H

#include <cstddef>
#include <cstdint>

// Host reference kernels used by the MoE layer. All matrices are row-major FP32.

/// @brief Linear projection: out = inp @ weight^T (+ bias).
/// @param out Output (M, N).
/// @param inp Input (M, K).
/// @param weight Weight (N, K), one output feature per row.
/// @param bias Optional bias (N), or nullptr.
/// @param M Number of rows.
/// @param N Number of output features.
/// @param K Number of input features.
void matmul(float* out, const float* inp, const float* weight, const float* bias, int M, int N, int K);

// swiglu assumes that input is the concatenation of up and gate projection.
/// out[i, d] = up[i, d] * silu(gate[i, d]); inp is (N, 2D), out is (N, D).
void swiglu_forward(float* out, const float* inp, int N, int D);

/// tanh-approximated GeLU, out and inp may alias.
void gelu_forward(float* out, const float* inp, int num_elements);
void relu_forward(float* out, const float* inp, int num_elements);

// ============================================================================
// Mixture of Experts (MoE) Kernels
// ============================================================================
// Routing, expert selection, and token dispatch operations for MoE layers.

/// @brief Row-wise softmax for MoE routing logits.
/// @param out Output routing probabilities (num_tokens, num_experts).
/// @param inp Input routing logits (num_tokens, num_experts).
void moe_softmax_forward(float* out, const float* inp, int num_tokens, int num_experts);

/// @brief Top-K expert selection per token.
/// Selection ranks experts by (score + correction_bias); ties go to the lowest expert id.
/// Selected experts are emitted in descending key order; routing weights are taken
/// from the unbiased scores of the selected experts.
/// @param expert_indices Output expert indices (num_tokens, top_k).
/// @param routing_weights Output routing weights (num_tokens, top_k).
/// @param scores Input routing scores (num_tokens, num_experts).
/// @param correction_bias Optional per-expert selection bias (num_experts), or nullptr.
/// @param normalize_weights Whether to normalize weights to sum to 1 over the selected experts.
void moe_topk_forward(int* expert_indices, float* routing_weights, const float* scores,
                      const float* correction_bias,
                      int num_tokens, int num_experts, int top_k, bool normalize_weights);

/// @brief Compute histogram of tokens assigned to each expert.
/// @param expert_counts Output counts per expert (num_experts).
/// @param expert_indices Input expert indices (num_tokens, top_k).
void moe_compute_expert_counts(int* expert_counts, const int* expert_indices,
                               int num_tokens, int top_k, int num_experts);

/// @brief Compute expert offsets from counts (exclusive prefix sum).
/// expert_offsets[i] = sum(expert_counts[0:i]), expert_offsets[num_experts] = total.
void moe_compute_expert_offsets(int* expert_offsets, const int* expert_counts, int num_experts);

/// @brief Auxiliary load-balancing loss.
/// aux_loss = coef * num_experts * sum_e(fraction_e * prob_e)
/// @param routing_probs Routing probabilities post-softmax (num_tokens, num_experts).
/// @param expert_indices Expert indices (num_tokens, top_k).
float moe_compute_aux_loss(const float* routing_probs, const int* expert_indices,
                           int num_tokens, int num_experts, int top_k, float aux_loss_coef);

/// @brief Router z-loss: coef * mean_t(logsumexp(logits[t])^2).
float moe_router_z_loss_forward(const float* router_logits, int num_tokens, int num_experts, float z_loss_coef);

/// @brief Permute tokens from natural order to expert-grouped order.
/// out[i] = inp[gather_indices[i] / top_k]; gather_indices hold flat (token, slot) ids.
/// @param out Output permuted rows (total_tokens, hidden_size).
/// @param inp Input rows (num_tokens, hidden_size).
/// Throws std::out_of_range when a gather index names a token outside [0, num_tokens).
void moe_permute_tokens(float* out, const float* inp, const int* gather_indices,
                        int total_tokens, int num_tokens, int hidden_size, int top_k);

/// @brief Row gather: out[i] = inp[indices[i]].
void moe_gather_rows(float* out, const float* inp, const int* indices, int rows, int hidden_size);

/// @brief Row scatter: out[indices[i]] = inp[i].
void moe_scatter_rows(float* out, const float* inp, const int* indices, int rows, int hidden_size);

/// @brief Unpermute and weight-combine expert outputs back to token order.
/// out[t] = sum_j routing_weights[t, j] * expert_out[scatter_indices[t * top_k + j]]
/// @param out Output combined rows (num_tokens, hidden_size).
/// @param expert_out Expert outputs in permuted order (total_tokens, hidden_size).
/// @param routing_weights Routing weights (num_tokens, top_k).
/// @param scatter_indices Row of each flat (token, slot) id in expert_out (num_tokens * top_k).
/// Throws std::out_of_range when a scatter index falls outside [0, total_tokens).
void moe_unpermute_and_combine(float* out, const float* expert_out, const float* routing_weights,
                               const int* scatter_indices, int num_tokens, int total_tokens,
                               int hidden_size, int top_k);

/// @brief Grouped GEMM over contiguous per-expert row blocks.
/// For expert e, rows [expert_offsets[e], expert_offsets[e+1]) of inp are multiplied
/// with weights[e]^T, where weights is packed (num_experts, N, K).
void moe_grouped_gemm(float* out, const float* inp, const float* weights, const int* expert_offsets,
                      int num_experts, int N, int K);

/// @brief Add per-expert bias to permuted rows. bias is (num_experts, hidden_size).
void moe_expert_bias_add_forward(float* out, const float* inp, const float* bias, const int* expert_offsets,
                                 int num_experts, int hidden_size);

#endif //MOESHARD_SRC_KERNELS_KERNELS_H
