// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOESHARD_SRC_MODULES_MOE_EXPERT_PARTITION_H
#define MOESHARD_SRC_MODULES_MOE_EXPERT_PARTITION_H

#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace modules {

/// Contiguous slice of experts hosted by one expert-parallel rank.
struct ExpertPartition {
    std::vector<int> local_expert_indices;  ///< Global expert ids, ascending
    int num_local_experts = 0;
};

/// Rank @p rank of @p world owns experts [rank*E/world, (rank+1)*E/world).
/// @throws configuration_error if E is not divisible by world or rank is out of range.
ExpertPartition partition_experts(int num_experts, int world, int rank);

/**
 * @brief Immutable expert id -> owning rank mapping, with a version counter.
 *
 * Starts out as the contiguous partition. Rebalancing never edits a table in
 * place; it builds a new one with a higher version and publishes it through
 * ExpertOwnershipRegistry. Every rank hosts exactly num_experts / ep_size experts.
 */
class ExpertOwnershipTable {
public:
    static ExpertOwnershipTable contiguous(int num_experts, int ep_size);

    /// Build a table from an explicit owner vector; validates it.
    static ExpertOwnershipTable from_owners(std::vector<int> owners, int ep_size, std::uint64_t version);

    [[nodiscard]] int owner_of(int expert_id) const;
    [[nodiscard]] int local_index_of(int expert_id) const;

    //! Global ids hosted by @p rank, ascending. The position in this list is the local index.
    [[nodiscard]] const std::vector<int>& local_experts(int rank) const;

    [[nodiscard]] int num_experts() const { return static_cast<int>(mOwners.size()); }
    [[nodiscard]] int ep_size() const { return mEPSize; }
    [[nodiscard]] int num_local_experts() const { return mNumLocal; }
    [[nodiscard]] std::uint64_t version() const { return mVersion; }
    [[nodiscard]] const std::vector<int>& owners() const { return mOwners; }

    /// Every expert owned by exactly one rank, every rank hosting num_local_experts.
    /// @throws configuration_error otherwise.
    void validate() const;

private:
    ExpertOwnershipTable() = default;
    void build_index();

    std::vector<int> mOwners;
    std::vector<int> mLocalIndex;
    std::vector<std::vector<int>> mLocalExperts;
    int mEPSize = 0;
    int mNumLocal = 0;
    std::uint64_t mVersion = 0;
};

/**
 * @brief Holds the current ownership table of one MoE layer.
 *
 * Readers take a snapshot at the start of a forward pass and keep using it;
 * the load balancer publishes a complete replacement between passes.
 */
class ExpertOwnershipRegistry {
public:
    explicit ExpertOwnershipRegistry(ExpertOwnershipTable initial);

    [[nodiscard]] std::shared_ptr<const ExpertOwnershipTable> snapshot() const;

    /// @throws std::logic_error if @p table does not have a higher version or a different shape.
    void publish(std::shared_ptr<const ExpertOwnershipTable> table);

private:
    mutable std::mutex mMutex;
    std::shared_ptr<const ExpertOwnershipTable> mCurrent;
};

} // namespace modules

#endif //MOESHARD_SRC_MODULES_MOE_EXPERT_PARTITION_H
