// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOESHARD_SRC_MODULES_MOE_EXPERT_BANK_H
#define MOESHARD_SRC_MODULES_MOE_EXPERT_BANK_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string_view>
#include <vector>

#include "utilities/tensor.h"

namespace modules {

class ExpertOwnershipTable;

enum class EActivation {
    SwiGLU,     ///< gated: gate_up holds [up; gate], 2 * ffn rows
    GeLU,
    ReLU,
    Identity
};

EActivation activation_from_str(std::string_view name);
const char* activation_to_str(EActivation act);

/**
 * @brief Holds the experts hosted on this rank and runs them on dispatched tokens.
 *
 * Each expert is a two-layer MLP: y = down @ act(gate_up @ x) (+ bias).
 * Parameters are keyed by global expert id. With grouped execution, the
 * parameters of all local experts are additionally packed into contiguous
 * (num_local, rows, cols) arenas and run as one grouped GEMM; otherwise each
 * expert slice is processed in its own loop iteration. Both paths produce the
 * same numbers.
 */
class ExpertBank {
public:
    struct Config {
        int hidden_size;                ///< Model hidden dimension (H)
        int ffn_hidden_size;            ///< Expert intermediate dimension (F)
        EActivation activation = EActivation::SwiGLU;
        bool add_bias = false;          ///< Experts add a learned output bias, returned separately
        bool grouped_gemm = true;       ///< Grouped (packed) vs sequential execution
        std::uint64_t seed = 42;        ///< Parameter init seed, combined with the expert id
        float init_std = 0.02f;
    };

    /**
     * @brief Per-expert weight tensors
     */
    struct ExpertParams {
        HostTensor gate_up;   ///< (U, H), U = 2F for SwiGLU else F
        HostTensor down;      ///< (H, F)
        HostTensor bias;      ///< (H) or null
    };

    struct ExpertOutput {
        HostTensor output;    ///< (M, H) in dispatch order
        HostTensor bias;      ///< (M, H) bias of the expert that processed each row, or null
    };

    /// @throws configuration_error for inconsistent shapes.
    ExpertBank(const Config& config, const std::vector<int>& hosted_experts);

    /// @throws dispatch_protocol_error if the counts do not cover the dispatched rows exactly.
    [[nodiscard]] ExpertOutput compute(const Tensor& dispatched_tokens,
                                       const std::vector<int>& tokens_per_local_expert) const;

    [[nodiscard]] const Config& config() const { return mConfig; }
    [[nodiscard]] const std::vector<int>& hosted_experts() const { return mHosted; }
    [[nodiscard]] int num_local_experts() const { return static_cast<int>(mHosted.size()); }
    [[nodiscard]] bool has_expert(int expert_id) const { return mParams.count(expert_id) != 0; }

    [[nodiscard]] ExpertParams& params(int expert_id);
    [[nodiscard]] const ExpertParams& params(int expert_id) const;

    //! Number of float parameters of one expert.
    [[nodiscard]] std::size_t expert_numel() const;
    [[nodiscard]] std::size_t expert_bytes() const { return expert_numel() * sizeof(float); }

    // ========================================================================
    // Migration support
    // ========================================================================

    /// Serialize one expert's parameters (gate_up, down, bias) into a flat byte blob.
    [[nodiscard]] std::vector<std::byte> export_expert(int expert_id) const;
    /// Install parameters received from another rank; does not change the hosted list.
    void import_expert(int expert_id, const std::vector<std::byte>& blob);
    void release_expert(int expert_id);

    /// Switch the hosted list to @p table's list for @p rank and repack the arenas.
    /// @throws std::logic_error if a hosted expert has no parameters or extra parameters remain.
    void adopt_ownership(const ExpertOwnershipTable& table, int rank);

    //! Call after modifying parameters through params() so grouped execution sees the change.
    void repack();

private:
    [[nodiscard]] int gate_up_rows() const;
    ExpertParams init_expert(int expert_id) const;
    void apply_activation(float* act_out, const float* gate_up_out, int rows) const;

    ExpertOutput compute_grouped(const Tensor& tokens, const std::vector<int>& offsets) const;
    ExpertOutput compute_sequential(const Tensor& tokens, const std::vector<int>& offsets) const;

    Config mConfig;
    std::vector<int> mHosted;
    std::map<int, ExpertParams> mParams;

    // packed (num_local, ...) copies for grouped execution
    HostTensor mGateUpArena;
    HostTensor mDownArena;
    HostTensor mBiasArena;
};

} // namespace modules

#endif //MOESHARD_SRC_MODULES_MOE_EXPERT_BANK_H
