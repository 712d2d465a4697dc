#pragma once

#include "replication/enumerator.hpp"
#include "replication/transfer_plan.hpp"
#include "zfs/snapshot.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace zsend::replication {

// The destination tip is the target chain's last snapshot: nothing to do.
struct Converged {
    bool operator==(const Converged&) const = default;
};

using StepDecision = std::variant<TransferPlan, Converged>;

// ── plan_next_step ────────────────────────────────────────────────────────────
//
// Decide the single next transfer (pure):
//   no tip                 → full transfer of target[0]
//   tip == target[last]    → Converged
//   tip == target[i]       → incremental target[i] → target[i+1]
//   tip not in target      → throws DivergedError
// Matching is by exact name only.  Never plans more than one step ahead.
//
// `target` must not be empty.  `dataset` only names the destination in errors.

[[nodiscard]] StepDecision plan_next_step(const std::string& dataset,
                                          const zfs::SnapshotChain& target,
                                          const std::optional<std::string>& destination_tip);

// ── verify_ancestry ───────────────────────────────────────────────────────────
//
// Strict divergence check over the whole destination chain.  Destination
// snapshots older than the first one that appears in `target` are ignored
// (they predate the selected range).  From there to the tip the destination
// must be a contiguous run of `target`: same names, same order, no gaps.
// Throws DivergedError.

void verify_ancestry(const std::string& dataset,
                     const zfs::SnapshotChain& target,
                     const zfs::SnapshotChain& destination);

// ── ChainReconciler ───────────────────────────────────────────────────────────
//
// Compares the target chain against the destination's actual state.  The
// destination is re-queried on every call; nothing is cached between steps.

struct ReconcileResult {
    std::optional<std::string> destination_tip;  // as observed by this call
    StepDecision               decision;
};

class ChainReconciler {
public:
    ChainReconciler(SnapshotEnumerator& destination,
                    std::string destination_dataset,
                    bool strict,
                    std::shared_ptr<spdlog::logger> logger);

    [[nodiscard]] ReconcileResult next_step(const zfs::SnapshotChain& target);

private:
    SnapshotEnumerator&             destination_;
    std::string                     dataset_;
    bool                            strict_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace zsend::replication
