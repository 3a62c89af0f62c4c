// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Expert migration for load balancing.
// Moves expert parameters (and optionally their optimizer moments) between
// EP ranks with one batched point-to-point transfer group.

#ifndef MOESHARD_SRC_RUNTIME_EP_EXPERT_TRANSFER_H
#define MOESHARD_SRC_RUNTIME_EP_EXPERT_TRANSFER_H

#include <cstddef>
#include <vector>

#include "runtime/ep/lpt_planner.h"

class Communicator;

namespace modules {
class ExpertBank;
}

namespace optimizers {
class ExpertOptimizerState;
}

namespace ep {

struct MigrationStats {
    int experts_sent = 0;
    int experts_received = 0;
    std::size_t bytes_sent = 0;
    std::size_t bytes_received = 0;
};

/// Execute @p transfers on this rank (collective over @p comm).
///
/// Every rank passes the same transfer list in the same order; each rank sends
/// the experts it is the source of and receives the ones it is the destination
/// of. Received experts are imported into @p bank, sent ones are released.
/// The hosted list of the bank is left unchanged; call ExpertBank::adopt_ownership
/// with the new table afterwards.
///
/// @param optimizer  Optimizer state to migrate alongside, or nullptr. Either all
///                   ranks pass one or none does.
MigrationStats migrate_experts(
    const std::vector<WeightTransferEntry>& transfers,
    Communicator& comm,
    modules::ExpertBank& bank,
    optimizers::ExpertOptimizerState* optimizer);

}  // namespace ep

#endif  // MOESHARD_SRC_RUNTIME_EP_EXPERT_TRANSFER_H
