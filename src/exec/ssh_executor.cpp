#include "exec/ssh_executor.hpp"

#include "common/errors.hpp"
#include "exec/runner.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <exception>
#include <string>
#include <system_error>
#include <utility>

namespace zsend::exec {

namespace {
    // Bound on "ssh -O check" / "ssh -O exit", which only talk to the local socket.
    constexpr std::chrono::milliseconds kControlTimeout{5000};
} // anonymous namespace

// ── Constructor / destructor ──────────────────────────────────────────────────

SshExecutor::SshExecutor(SshTarget target,
                         std::chrono::milliseconds connect_timeout,
                         std::shared_ptr<spdlog::logger> logger,
                         RunFunction run_fn)
    : target_(std::move(target)),
      connect_timeout_(connect_timeout),
      logger_(std::move(logger)),
      run_fn_(run_fn ? std::move(run_fn) : RunFunction{&run_captured}) {}

SshExecutor::~SshExecutor() {
    close();
}

std::string SshExecutor::describe() const {
    return target_.user.empty() ? target_.host : target_.user + "@" + target_.host;
}

// ── Command builders ──────────────────────────────────────────────────────────

std::vector<std::string> SshExecutor::common_args() const {
    std::vector<std::string> args{
        "ssh",
        "-p", std::to_string(target_.port),
        "-o", "ControlPath=" + target_.control_path,
    };
    if (!target_.user.empty()) {
        args.insert(args.end(), {"-l", target_.user});
    }
    return args;
}

Command SshExecutor::check_master_command() const {
    Command cmd(common_args());
    cmd.arg("-O").arg("check").arg(target_.host);
    return cmd;
}

Command SshExecutor::open_master_command() const {
    const auto connect_secs = std::chrono::duration_cast<std::chrono::seconds>(connect_timeout_);

    Command cmd(common_args());
    cmd.arg("-N")           // no remote command
       .arg("-f")           // background once authenticated
       .arg("-q")
       .arg("-o").arg("ControlMaster=yes")
       .arg("-o").arg("ControlPersist=yes")
       .arg("-o").arg("StrictHostKeyChecking=accept-new")
       .arg("-o").arg(fmt::format("ConnectTimeout={}", std::max<long long>(1, connect_secs.count())))
       .arg(target_.host);
    return cmd;
}

Command SshExecutor::exit_master_command() const {
    Command cmd(common_args());
    cmd.arg("-O").arg("exit").arg(target_.host);
    return cmd;
}

Command SshExecutor::remote_command(const Command& cmd) const {
    Command ssh(common_args());
    // BatchMode: if the master went away, fail instead of prompting mid-run.
    ssh.arg("-o").arg("ControlMaster=no")
       .arg("-o").arg("BatchMode=yes")
       .arg(target_.host)
       .arg("--")
       .arg(to_shell_string(cmd));
    return ssh;
}

// ── Session ───────────────────────────────────────────────────────────────────

void SshExecutor::ensure_session() {
    if (state_ != SessionState::Closed) {
        return;
    }

    try {
        const auto check = run_fn_(check_master_command(), kControlTimeout);
        if (check.ok()) {
            logger_->info("Reusing SSH session to {}", describe());
            state_ = SessionState::Reused;
            return;
        }

        logger_->info("Opening SSH session to {}..", describe());
        const auto open = run_fn_(open_master_command(), connect_timeout_);
        if (open.timed_out) {
            throw ConnectionError(describe(), fmt::format(
                "unable to establish SSH connection within {}s",
                std::chrono::duration_cast<std::chrono::seconds>(connect_timeout_).count()));
        }
        if (!open.ok()) {
            const auto detail = trim_right(open.err);
            throw ConnectionError(describe(), detail.empty()
                ? fmt::format("unable to establish SSH connection (ssh exit status {})",
                              open.exit_status)
                : fmt::format("unable to establish SSH connection: {}", detail));
        }
    } catch (const std::system_error& e) {
        throw ConnectionError(describe(), e.what());
    }

    state_ = SessionState::Owned;
    logger_->info("SSH session to {} established", describe());
}

void SshExecutor::close() noexcept {
    if (state_ != SessionState::Owned) {
        state_ = SessionState::Closed;
        return;
    }
    state_ = SessionState::Closed;

    try {
        const auto result = run_fn_(exit_master_command(), kControlTimeout);
        if (result.ok()) {
            logger_->debug("Closed SSH session to {}", describe());
        } else {
            logger_->warn("Closing SSH session to {} failed: {}", describe(), trim_right(result.err));
        }
    } catch (const std::exception& e) {
        logger_->warn("Closing SSH session to {} failed: {}", describe(), e.what());
    }
}

// ── Executor ──────────────────────────────────────────────────────────────────

CommandResult SshExecutor::run(const Command& cmd, std::chrono::milliseconds timeout) {
    ensure_session();

    logger_->debug("{}: {}", describe(), to_shell_string(cmd));
    auto result = run_fn_(remote_command(cmd), timeout);
    logger_->debug("{}: exit status {}{}", describe(), result.exit_status,
                   result.timed_out ? " (timed out)" : "");
    return result;
}

Command SshExecutor::wrap(const Command& cmd) {
    ensure_session();
    return remote_command(cmd);
}

} // namespace zsend::exec
