// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOESHARD_SRC_RUNTIME_OPTIMIZERS_EXPERT_OPTIMIZER_STATE_H
#define MOESHARD_SRC_RUNTIME_OPTIMIZERS_EXPERT_OPTIMIZER_STATE_H

#include <cstddef>
#include <map>
#include <vector>

namespace optimizers {

/**
 * @brief AdamW moments of the experts hosted on one rank.
 *
 * Each hosted expert has a first and second moment shaped like its flattened
 * parameters. When an expert migrates, its moments travel with it, so the
 * optimizer trajectory is unaffected by placement. The update rule itself
 * lives with the training loop; this class only owns and moves the state.
 */
class ExpertOptimizerState {
public:
    struct Moments {
        std::vector<float> m;   ///< first moment
        std::vector<float> v;   ///< second moment
    };

    /// @param expert_numel Number of parameters of a single expert.
    explicit ExpertOptimizerState(std::size_t expert_numel);

    /// Start tracking @p expert_id with zeroed moments.
    void register_expert(int expert_id);
    [[nodiscard]] bool has(int expert_id) const { return mState.count(expert_id) != 0; }

    [[nodiscard]] Moments& moments(int expert_id);
    [[nodiscard]] const Moments& moments(int expert_id) const;

    //! Serialize the moments of one expert as m | v.
    [[nodiscard]] std::vector<std::byte> export_state(int expert_id) const;
    void import_state(int expert_id, const std::vector<std::byte>& blob);
    void release(int expert_id);

    [[nodiscard]] std::size_t state_bytes() const { return 2 * mExpertNumel * sizeof(float); }
    [[nodiscard]] std::size_t expert_numel() const { return mExpertNumel; }
    [[nodiscard]] std::size_t num_experts() const { return mState.size(); }

    [[nodiscard]] int step() const { return mStep; }
    void set_step(int step) { mStep = step; }

private:
    std::size_t mExpertNumel;
    int mStep = 0;
    std::map<int, Moments> mState;
};

} // namespace optimizers

#endif // MOESHARD_SRC_RUNTIME_OPTIMIZERS_EXPERT_OPTIMIZER_STATE_H
