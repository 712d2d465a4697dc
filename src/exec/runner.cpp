#include "exec/runner.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <array>
#include <csignal>
#include <utility>
#include <vector>

namespace zsend::exec {

namespace asio = boost::asio;

namespace {

// Everything the capture coroutines share.  Lives on run_captured()'s stack
// for the whole ioc.run().
struct CaptureState {
    CaptureState(asio::io_context& ioc, int out_fd, int err_fd)
        : out(ioc, out_fd),
          err(ioc, err_fd),
          reap_timer(ioc),
          deadline(ioc),
          grace(ioc) {}

    asio::posix::stream_descriptor out;
    asio::posix::stream_descriptor err;
    asio::steady_timer             reap_timer;
    asio::steady_timer             deadline;
    asio::steady_timer             grace;
    int                            open_streams = 2;
};

asio::awaitable<void> drain_stream(CaptureState& s,
                                   asio::posix::stream_descriptor& sd,
                                   std::string& sink)
{
    co_await drain(sd, sink);
    if (--s.open_streams == 0) {
        s.grace.cancel();
    }
}

asio::awaitable<void> watch_deadline(CaptureState& s,
                                     ChildProcess& child,
                                     std::chrono::milliseconds timeout,
                                     CommandResult& result)
{
    boost::system::error_code ec;
    s.deadline.expires_after(timeout);
    co_await s.deadline.async_wait(asio::redirect_error(asio::use_awaitable, ec));

    // operation_aborted means the child exited first.
    if (!ec && child.running()) {
        result.timed_out = true;
        child.kill(SIGKILL);
    }
}

asio::awaitable<void> supervise(CaptureState& s, ChildProcess& child) {
    std::vector<ChildProcess*> children{&child};
    co_await wait_for_exit(s.reap_timer, std::move(children));
    s.deadline.cancel();

    if (s.open_streams > 0) {
        boost::system::error_code ec;
        s.grace.expires_after(kDrainGrace);
        co_await s.grace.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (s.open_streams > 0) {
            s.out.close(ec);
            s.err.close(ec);
        }
    }
}

} // anonymous namespace

// ── Building blocks ───────────────────────────────────────────────────────────

asio::awaitable<void> drain(asio::posix::stream_descriptor& sd, std::string& sink) {
    std::array<char, 16 * 1024> buf{};
    for (;;) {
        boost::system::error_code ec;
        const std::size_t n = co_await sd.async_read_some(
            asio::buffer(buf), asio::redirect_error(asio::use_awaitable, ec));
        sink.append(buf.data(), n);
        if (ec) {
            // eof, or operation_aborted after close(): either way we're done.
            break;
        }
    }
}

asio::awaitable<void> wait_for_exit(asio::steady_timer& timer,
                                    std::vector<ChildProcess*> children)
{
    for (;;) {
        bool all_exited = true;
        for (auto* child : children) {
            if (!child->try_wait()) {
                all_exited = false;
            }
        }
        if (all_exited) {
            co_return;
        }

        boost::system::error_code ec;
        timer.expires_after(kReapInterval);
        co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }
}

// ── run_captured ──────────────────────────────────────────────────────────────

CommandResult run_captured(const Command& cmd, std::chrono::milliseconds timeout) {
    auto out_pipe = Pipe::create();
    auto err_pipe = Pipe::create();

    StdioFds stdio;
    stdio.out = out_pipe.write.get();
    stdio.err = err_pipe.write.get();
    auto child = ChildProcess::spawn(cmd, stdio);

    // Our copies of the write ends must go, or the reads never see EOF.
    out_pipe.write.reset();
    err_pipe.write.reset();

    asio::io_context ioc{1};
    CaptureState state{ioc, out_pipe.read.release(), err_pipe.read.release()};
    CommandResult result;

    asio::co_spawn(ioc, drain_stream(state, state.out, result.out), asio::detached);
    asio::co_spawn(ioc, drain_stream(state, state.err, result.err), asio::detached);
    if (timeout > kNoTimeout) {
        asio::co_spawn(ioc, watch_deadline(state, child, timeout, result), asio::detached);
    }
    asio::co_spawn(ioc, supervise(state, child), asio::detached);

    ioc.run();

    result.exit_status = child.wait();
    return result;
}

} // namespace zsend::exec
