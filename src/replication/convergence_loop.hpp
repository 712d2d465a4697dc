#pragma once

#include "replication/reconciler.hpp"
#include "replication/transfer_engine.hpp"
#include "replication/transfer_plan.hpp"
#include "zfs/snapshot.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace zsend::replication {

// ── LoopState ─────────────────────────────────────────────────────────────────

enum class LoopState : uint8_t {
    Planning     = 0,
    Transferring = 1,
    Converged    = 2,   // terminal: destination tip == target tip
    Failed       = 3,   // terminal: an error ended the run
};

[[nodiscard]] const char* to_string(LoopState s) noexcept;

struct CompletedTransfer {
    TransferPlan plan;          // with its estimate filled in
    uint64_t     bytes = 0;     // bytes that went through the pipeline
};

struct RunReport {
    LoopState                      state = LoopState::Planning;
    std::vector<CompletedTransfer> transfers;
    std::optional<std::string>     final_tip;
};

// ── ConvergenceLoop ───────────────────────────────────────────────────────────
//
// Plan → transfer → plan … until the destination tip equals the target
// chain's tip.  Iterative, one transfer at a time: step i+1 depends on step i
// having landed.
//
// Every Planning step re-reads the destination, so re-running after an
// interruption simply picks up where the destination is.  After a successful
// transfer the next Planning step must observe the planned snapshot as the
// new tip; anything else fails the run with TransferError.
//
// run() rethrows the error that moved the loop to Failed, after logging the
// failing phase.

class ConvergenceLoop {
public:
    ConvergenceLoop(ChainReconciler& reconciler,
                    TransferEngine& engine,
                    std::shared_ptr<spdlog::logger> logger);

    RunReport run(const zfs::SnapshotChain& target);

    [[nodiscard]] LoopState state() const noexcept { return report_.state; }
    [[nodiscard]] const RunReport& report() const noexcept { return report_; }

private:
    void set_state(LoopState s);

    ChainReconciler&                reconciler_;
    TransferEngine&                 engine_;
    std::shared_ptr<spdlog::logger> logger_;
    RunReport                       report_;
};

} // namespace zsend::replication
