// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Expert migration implementation.
// Uses batched P2P via transfer_group_start/end on the EP communicator.

#include "runtime/ep/expert_transfer.h"

#include <stdexcept>

#include <fmt/core.h>

#include "modules/moe/expert_bank.h"
#include "runtime/optimizers/expert_optimizer_state.h"
#include "utilities/comm.h"

namespace ep {

namespace {

/// Buffers of one migrating expert. Kept alive until the transfer group completes.
struct ExpertPayload {
    int expert_id;
    int peer;
    std::vector<std::byte> params;
    std::vector<std::byte> moments;
};

}  // namespace

MigrationStats migrate_experts(
    const std::vector<WeightTransferEntry>& transfers,
    Communicator& comm,
    modules::ExpertBank& bank,
    optimizers::ExpertOptimizerState* optimizer) {

    const int me = comm.rank();
    MigrationStats stats;
    std::vector<ExpertPayload> outgoing;
    std::vector<ExpertPayload> incoming;

    for (const auto& t : transfers) {
        if (t.src_rank == t.dst_rank) {
            throw std::logic_error(fmt::format("migrate_experts: expert {} moves from rank {} to itself",
                                               t.expert_id, t.src_rank));
        }
        if (t.src_rank == me) {
            ExpertPayload p{t.expert_id, t.dst_rank, bank.export_expert(t.expert_id), {}};
            if (optimizer) {
                p.moments = optimizer->export_state(t.expert_id);
            }
            outgoing.push_back(std::move(p));
        } else if (t.dst_rank == me) {
            ExpertPayload p{t.expert_id, t.src_rank, std::vector<std::byte>(bank.expert_bytes()), {}};
            if (optimizer) {
                p.moments.resize(optimizer->state_bytes());
            }
            incoming.push_back(std::move(p));
        }
    }

    // Sends and receives are posted in transfer-list order, which is the same on every rank
    comm.transfer_group_start();
    for (const auto& p : outgoing) {
        comm.send(p.params.data(), p.params.size(), p.peer);
        if (optimizer) comm.send(p.moments.data(), p.moments.size(), p.peer);
        stats.bytes_sent += p.params.size() + p.moments.size();
    }
    for (auto& p : incoming) {
        comm.recv(p.params.data(), p.params.size(), p.peer);
        if (optimizer) comm.recv(p.moments.data(), p.moments.size(), p.peer);
        stats.bytes_received += p.params.size() + p.moments.size();
    }
    comm.transfer_group_end();

    for (const auto& p : incoming) {
        bank.import_expert(p.expert_id, p.params);
        if (optimizer) optimizer->import_state(p.expert_id, p.moments);
    }
    for (const auto& p : outgoing) {
        bank.release_expert(p.expert_id);
        if (optimizer) optimizer->release(p.expert_id);
    }
    stats.experts_sent = static_cast<int>(outgoing.size());
    stats.experts_received = static_cast<int>(incoming.size());
    return stats;
}

}  // namespace ep
