#pragma once

#include "exec/command.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace zsend::exec {

// Function that runs one command to completion (run_captured in production).
using RunFunction = std::function<CommandResult(const Command&, std::chrono::milliseconds)>;

// ── Executor ──────────────────────────────────────────────────────────────────
//
// Runs commands on one side of a transfer: this host, or the single remote
// host of the run.  Executors know nothing about snapshots.
//
// run() returns the captured result whatever the exit status; callers must
// inspect it (CommandResult::check()).  A remote executor throws
// ConnectionError when its session cannot be established.

class Executor {
public:
    virtual ~Executor() = default;

    // Run `cmd` on this executor's side, bounded by `timeout` (0 = unbounded).
    [[nodiscard]] virtual CommandResult run(const Command& cmd,
                                            std::chrono::milliseconds timeout) = 0;

    // The argv that runs `cmd` on this executor's side when spawned locally.
    // Used to build pipeline stages; the identity for a local executor.
    [[nodiscard]] virtual Command wrap(const Command& cmd) = 0;

    [[nodiscard]] virtual bool is_remote() const noexcept = 0;

    // Human-readable location for log lines ("localhost", "root@nas").
    [[nodiscard]] virtual std::string describe() const = 0;
};

} // namespace zsend::exec
