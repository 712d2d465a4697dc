#pragma once

#include "exec/command.hpp"
#include "exec/process.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace zsend::exec {

// Timeout value meaning "no limit".
inline constexpr std::chrono::milliseconds kNoTimeout{0};

// ── run_captured ──────────────────────────────────────────────────────────────
//
// Run `cmd` to completion with stdin on /dev/null, capturing stdout and
// stderr in full.  Both pipes are drained concurrently on a private
// io_context so a chatty stderr can never stall the child.
//
// When `timeout` is non-zero and elapses first, the child is killed with
// SIGKILL and the result has timed_out set.
//
// A non-zero exit status is returned, not thrown; call CommandResult::check().
// Throws std::system_error only if the process cannot be set up at all
// (pipe or fork failure).

[[nodiscard]] CommandResult run_captured(const Command& cmd,
                                         std::chrono::milliseconds timeout = kNoTimeout);

// ── Coroutine building blocks (shared with the stream pipeline) ───────────────

// How often child processes are polled for exit.
inline constexpr std::chrono::milliseconds kReapInterval{10};

// How long stderr/stdout pipes are still drained after every child exited.
// A grandchild that inherited a pipe (ssh -f) may hold it open indefinitely.
inline constexpr std::chrono::milliseconds kDrainGrace{250};

// Append everything readable from `sd` to `sink` until EOF, error or close.
boost::asio::awaitable<void> drain(boost::asio::posix::stream_descriptor& sd,
                                   std::string& sink);

// Resume once every process in `children` has been reaped.
// `timer` is used for polling and must not be shared with other waiters.
boost::asio::awaitable<void> wait_for_exit(boost::asio::steady_timer& timer,
                                           std::vector<ChildProcess*> children);

} // namespace zsend::exec
