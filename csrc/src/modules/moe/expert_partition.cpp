// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "modules/moe/expert_partition.h"

#include <stdexcept>
#include <utility>

#include <fmt/core.h>

#include "utilities/errors.h"

namespace modules {

ExpertPartition partition_experts(int num_experts, int world, int rank) {
    if (world <= 0) {
        throw configuration_error(fmt::format("partition_experts: world size must be positive, got {}", world));
    }
    if (num_experts <= 0 || num_experts % world != 0) {
        throw configuration_error(fmt::format(
            "partition_experts: num_experts ({}) must be a positive multiple of the expert-parallel size ({})",
            num_experts, world));
    }
    if (rank < 0 || rank >= world) {
        throw configuration_error(fmt::format("partition_experts: rank {} outside [0, {})", rank, world));
    }

    ExpertPartition p;
    p.num_local_experts = num_experts / world;
    p.local_expert_indices.reserve(p.num_local_experts);
    const int offset = rank * p.num_local_experts;
    for (int i = 0; i < p.num_local_experts; ++i) {
        p.local_expert_indices.push_back(offset + i);
    }
    return p;
}

ExpertOwnershipTable ExpertOwnershipTable::contiguous(int num_experts, int ep_size) {
    // validates divisibility
    const int num_local = partition_experts(num_experts, ep_size, 0).num_local_experts;
    std::vector<int> owners(num_experts);
    for (int e = 0; e < num_experts; ++e) {
        owners[e] = e / num_local;
    }
    return from_owners(std::move(owners), ep_size, 0);
}

ExpertOwnershipTable ExpertOwnershipTable::from_owners(std::vector<int> owners, int ep_size, std::uint64_t version) {
    ExpertOwnershipTable table;
    table.mOwners = std::move(owners);
    table.mEPSize = ep_size;
    table.mVersion = version;
    table.validate();
    table.build_index();
    return table;
}

void ExpertOwnershipTable::build_index() {
    mNumLocal = num_experts() / mEPSize;
    mLocalExperts.assign(mEPSize, {});
    mLocalIndex.assign(num_experts(), -1);
    for (int e = 0; e < num_experts(); ++e) {
        auto& hosted = mLocalExperts[mOwners[e]];
        mLocalIndex[e] = static_cast<int>(hosted.size());
        hosted.push_back(e);
    }
}

void ExpertOwnershipTable::validate() const {
    if (mEPSize <= 0) {
        throw configuration_error(fmt::format("ExpertOwnershipTable: invalid ep_size {}", mEPSize));
    }
    const int num_experts = static_cast<int>(mOwners.size());
    if (num_experts == 0 || num_experts % mEPSize != 0) {
        throw configuration_error(fmt::format(
            "ExpertOwnershipTable: {} experts cannot be spread evenly over {} ranks", num_experts, mEPSize));
    }
    std::vector<int> per_rank(mEPSize, 0);
    for (int e = 0; e < num_experts; ++e) {
        const int owner = mOwners[e];
        if (owner < 0 || owner >= mEPSize) {
            throw configuration_error(fmt::format(
                "ExpertOwnershipTable: expert {} has invalid owner {}", e, owner));
        }
        ++per_rank[owner];
    }
    for (int r = 0; r < mEPSize; ++r) {
        if (per_rank[r] != num_experts / mEPSize) {
            throw configuration_error(fmt::format(
                "ExpertOwnershipTable: rank {} hosts {} experts, expected {}", r, per_rank[r], num_experts / mEPSize));
        }
    }
}

int ExpertOwnershipTable::owner_of(int expert_id) const {
    if (expert_id < 0 || expert_id >= num_experts()) {
        throw std::out_of_range(fmt::format("owner_of: expert id {} outside [0, {})", expert_id, num_experts()));
    }
    return mOwners[expert_id];
}

int ExpertOwnershipTable::local_index_of(int expert_id) const {
    if (expert_id < 0 || expert_id >= num_experts()) {
        throw std::out_of_range(fmt::format("local_index_of: expert id {} outside [0, {})", expert_id, num_experts()));
    }
    return mLocalIndex[expert_id];
}

const std::vector<int>& ExpertOwnershipTable::local_experts(int rank) const {
    if (rank < 0 || rank >= mEPSize) {
        throw std::out_of_range(fmt::format("local_experts: rank {} outside [0, {})", rank, mEPSize));
    }
    return mLocalExperts[rank];
}

ExpertOwnershipRegistry::ExpertOwnershipRegistry(ExpertOwnershipTable initial) :
    mCurrent(std::make_shared<const ExpertOwnershipTable>(std::move(initial)))
{
}

std::shared_ptr<const ExpertOwnershipTable> ExpertOwnershipRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mCurrent;
}

void ExpertOwnershipRegistry::publish(std::shared_ptr<const ExpertOwnershipTable> table) {
    if (!table) {
        throw std::logic_error("ExpertOwnershipRegistry::publish: null table");
    }
    std::lock_guard<std::mutex> lock(mMutex);
    if (table->version() <= mCurrent->version()) {
        throw std::logic_error(fmt::format(
            "ExpertOwnershipRegistry::publish: version {} does not supersede {}", table->version(), mCurrent->version()));
    }
    if (table->num_experts() != mCurrent->num_experts() || table->ep_size() != mCurrent->ep_size()) {
        throw std::logic_error("ExpertOwnershipRegistry::publish: table shape changed");
    }
    mCurrent = std::move(table);
}

} // namespace modules
