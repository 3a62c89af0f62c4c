// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "runtime/optimizers/expert_optimizer_state.h"

#include <cstring>
#include <stdexcept>

#include <fmt/core.h>

namespace optimizers {

ExpertOptimizerState::ExpertOptimizerState(std::size_t expert_numel) : mExpertNumel(expert_numel) {
}

void ExpertOptimizerState::register_expert(int expert_id) {
    if (has(expert_id)) {
        throw std::logic_error(fmt::format("ExpertOptimizerState: expert {} already registered", expert_id));
    }
    Moments& s = mState[expert_id];
    s.m.assign(mExpertNumel, 0.f);
    s.v.assign(mExpertNumel, 0.f);
}

ExpertOptimizerState::Moments& ExpertOptimizerState::moments(int expert_id) {
    auto it = mState.find(expert_id);
    if (it == mState.end()) {
        throw std::out_of_range(fmt::format("ExpertOptimizerState: no state for expert {}", expert_id));
    }
    return it->second;
}

const ExpertOptimizerState::Moments& ExpertOptimizerState::moments(int expert_id) const {
    auto it = mState.find(expert_id);
    if (it == mState.end()) {
        throw std::out_of_range(fmt::format("ExpertOptimizerState: no state for expert {}", expert_id));
    }
    return it->second;
}

std::vector<std::byte> ExpertOptimizerState::export_state(int expert_id) const {
    const Moments& s = moments(expert_id);
    std::vector<std::byte> blob(state_bytes());
    std::memcpy(blob.data(), s.m.data(), mExpertNumel * sizeof(float));
    std::memcpy(blob.data() + mExpertNumel * sizeof(float), s.v.data(), mExpertNumel * sizeof(float));
    return blob;
}

void ExpertOptimizerState::import_state(int expert_id, const std::vector<std::byte>& blob) {
    if (blob.size() != state_bytes()) {
        throw std::runtime_error(fmt::format("ExpertOptimizerState: state blob for expert {} has {} bytes, expected {}",
                                             expert_id, blob.size(), state_bytes()));
    }
    register_expert(expert_id);
    Moments& s = mState[expert_id];
    std::memcpy(s.m.data(), blob.data(), mExpertNumel * sizeof(float));
    std::memcpy(s.v.data(), blob.data() + mExpertNumel * sizeof(float), mExpertNumel * sizeof(float));
}

void ExpertOptimizerState::release(int expert_id) {
    if (mState.erase(expert_id) == 0) {
        throw std::logic_error(fmt::format("ExpertOptimizerState: cannot release unknown expert {}", expert_id));
    }
}

} // namespace optimizers
