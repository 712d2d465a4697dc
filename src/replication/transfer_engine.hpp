#pragma once

#include "exec/executor.hpp"
#include "exec/pipeline.hpp"
#include "replication/clock.hpp"
#include "replication/transfer_plan.hpp"
#include "zfs/zfs_commands.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace zsend::replication {

struct TransferOptions {
    zfs::ReceiveOptions       receive;
    std::chrono::milliseconds query_timeout{180'000};   // bound on the dry run
    std::chrono::milliseconds report_interval{2000};    // progress log throttle
};

// ── TransferEngine ────────────────────────────────────────────────────────────
//
// Executes one TransferPlan in two phases:
//
//   1. estimate – `zfs send -nvP` on the source side.  Must succeed before
//                 any data moves; it doubles as a last existence and
//                 permission check on the source snapshot.
//   2. execute  – send | measure | receive, with the send stage wrapped by
//                 the source executor and the receive stage by the
//                 destination executor.  Which of them is remote follows
//                 from the topology; the wiring here is the same for all.
//
// Neither phase is retried.  A failed receive leaves no usable snapshot on
// the destination; the next run re-derives its position from there.

class TransferEngine {
public:
    TransferEngine(exec::Executor& source,
                   exec::Executor& destination,
                   exec::StreamRunner& streams,
                   std::string source_dataset,
                   std::string destination_dataset,
                   TransferOptions options,
                   std::shared_ptr<spdlog::logger> logger,
                   const Clock& clock);

    // Phase 1.  Returns the estimated stream size.  Throws EstimationError
    // (ConnectionError if the remote session cannot be opened).
    [[nodiscard]] uint64_t estimate(const TransferPlan& plan);

    // Phase 2.  Returns the bytes that went through the pipeline.
    // Throws TransferError (ConnectionError if the session cannot be opened).
    [[nodiscard]] uint64_t execute(const TransferPlan& plan);

    // Both phases; stores the estimate in `plan`.  Returns bytes transferred.
    uint64_t transfer(TransferPlan& plan);

private:
    exec::Executor&                 source_;
    exec::Executor&                 destination_;
    exec::StreamRunner&             streams_;
    std::string                     source_dataset_;
    std::string                     destination_dataset_;
    TransferOptions                 options_;
    std::shared_ptr<spdlog::logger> logger_;
    const Clock&                    clock_;
};

} // namespace zsend::replication
