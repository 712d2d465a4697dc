#pragma once

#include "exec/executor.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace zsend::exec {

// ── SshTarget ─────────────────────────────────────────────────────────────────

struct SshTarget {
    std::string host;
    std::string user;           // empty → ssh picks the login name
    uint16_t    port = 22;
    std::string control_path;   // ssh ControlPath (tokens like %h are expanded by ssh)
};

// ── SessionState ──────────────────────────────────────────────────────────────

enum class SessionState : uint8_t {
    Closed = 0,     // nothing checked or opened yet
    Reused = 1,     // a master for this ControlPath was already running
    Owned  = 2,     // we opened the master and will close it
};

// ── SshExecutor ───────────────────────────────────────────────────────────────
//
// Runs commands on one fixed remote host through a single OpenSSH control
// master.  The master is looked up (ssh -O check) or opened (ssh -N -f with
// ControlMaster=yes) lazily on the first run() or wrap(), bounded by the
// connect timeout, and every later command multiplexes over it instead of
// authenticating again.
//
// A master opened by this executor is closed (ssh -O exit) on destruction;
// a pre-existing one is left running.
//
// Not thread-safe; the run is single-threaded.

class SshExecutor final : public Executor {
public:
    SshExecutor(SshTarget target,
                std::chrono::milliseconds connect_timeout,
                std::shared_ptr<spdlog::logger> logger,
                RunFunction run_fn = {});

    ~SshExecutor() override;

    SshExecutor(const SshExecutor&)            = delete;
    SshExecutor& operator=(const SshExecutor&) = delete;
    SshExecutor(SshExecutor&&)                 = delete;
    SshExecutor& operator=(SshExecutor&&)      = delete;

    [[nodiscard]] CommandResult run(const Command& cmd,
                                    std::chrono::milliseconds timeout) override;

    [[nodiscard]] Command wrap(const Command& cmd) override;

    [[nodiscard]] bool is_remote() const noexcept override { return true; }

    [[nodiscard]] std::string describe() const override;

    // Check for, or open, the control master.  Throws ConnectionError.
    void ensure_session();

    // Close the master if this executor opened it.  Never throws.
    void close() noexcept;

    [[nodiscard]] SessionState session_state() const noexcept { return state_; }

    // ── Command builders (exposed for tests) ─────────────────────────────────

    [[nodiscard]] Command check_master_command() const;
    [[nodiscard]] Command open_master_command() const;
    [[nodiscard]] Command exit_master_command() const;

    // ssh invocation that runs `cmd` on the remote host over the master.
    [[nodiscard]] Command remote_command(const Command& cmd) const;

private:
    // Options common to every ssh invocation (-p, -l, ControlPath).
    [[nodiscard]] std::vector<std::string> common_args() const;

    SshTarget                       target_;
    std::chrono::milliseconds       connect_timeout_;
    std::shared_ptr<spdlog::logger> logger_;
    RunFunction                     run_fn_;
    SessionState                    state_ = SessionState::Closed;
};

} // namespace zsend::exec
