#include "exec/pipeline.hpp"

#include "exec/process.hpp"
#include "exec/runner.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

#include <csignal>
#include <utility>
#include <vector>

namespace zsend::exec {

namespace asio = boost::asio;

namespace {

struct PipelineState {
    PipelineState(asio::io_context& ioc,
                  int from_producer_fd, int to_consumer_fd,
                  int producer_err_fd, int consumer_err_fd)
        : from_producer(ioc, from_producer_fd),
          to_consumer(ioc, to_consumer_fd),
          producer_err(ioc, producer_err_fd),
          consumer_err(ioc, consumer_err_fd),
          reap_timer(ioc),
          grace(ioc) {}

    asio::posix::stream_descriptor from_producer;
    asio::posix::stream_descriptor to_consumer;
    asio::posix::stream_descriptor producer_err;
    asio::posix::stream_descriptor consumer_err;
    asio::steady_timer             reap_timer;
    asio::steady_timer             grace;
    int                            open_err_streams = 2;
};

// The measure stage.
asio::awaitable<void> pump(PipelineState& s, StreamResult& result, const ByteCallback& on_bytes) {
    std::vector<char> buf(ProcessPipeline::kChunkSize);
    boost::system::error_code ec;

    for (;;) {
        const std::size_t n = co_await s.from_producer.async_read_some(
            asio::buffer(buf), asio::redirect_error(asio::use_awaitable, ec));

        if (n > 0) {
            boost::system::error_code wec;
            co_await asio::async_write(
                s.to_consumer, asio::buffer(buf.data(), n),
                asio::redirect_error(asio::use_awaitable, wec));
            if (wec) {
                result.io_error = "write to receiver: " + wec.message();
                break;
            }
            result.bytes += n;
            if (on_bytes) {
                on_bytes(n);
            }
        }

        if (ec) {
            if (ec != asio::error::eof) {
                result.io_error = "read from sender: " + ec.message();
            }
            break;
        }
    }

    // EOF for the consumer; EPIPE for a producer that is still writing.
    s.to_consumer.close(ec);
    s.from_producer.close(ec);
}

asio::awaitable<void> drain_err(PipelineState& s,
                                asio::posix::stream_descriptor& sd,
                                std::string& sink)
{
    co_await drain(sd, sink);
    if (--s.open_err_streams == 0) {
        s.grace.cancel();
    }
}

asio::awaitable<void> supervise(PipelineState& s, ChildProcess& producer, ChildProcess& consumer) {
    std::vector<ChildProcess*> children{&producer, &consumer};
    co_await wait_for_exit(s.reap_timer, std::move(children));

    boost::system::error_code ec;
    if (s.open_err_streams > 0) {
        s.grace.expires_after(kDrainGrace);
        co_await s.grace.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }
    if (s.open_err_streams > 0) {
        s.producer_err.close(ec);
        s.consumer_err.close(ec);
    }
    // Both stages are gone; unblock the pump if something else holds the pipes.
    s.from_producer.close(ec);
    s.to_consumer.close(ec);
}

} // anonymous namespace

StreamResult ProcessPipeline::run(const Command& producer_cmd,
                                  const Command& consumer_cmd,
                                  const ByteCallback& on_bytes)
{
    ::signal(SIGPIPE, SIG_IGN);

    auto stream_out  = Pipe::create();  // producer stdout → measure
    auto stream_in   = Pipe::create();  // measure → consumer stdin
    auto producer_err = Pipe::create();
    auto consumer_err = Pipe::create();

    StdioFds producer_io;
    producer_io.out = stream_out.write.get();
    producer_io.err = producer_err.write.get();
    auto producer = ChildProcess::spawn(producer_cmd, producer_io);

    StdioFds consumer_io;
    consumer_io.in  = stream_in.read.get();
    consumer_io.err = consumer_err.write.get();
    auto consumer = ChildProcess::spawn(consumer_cmd, consumer_io);

    // Keep only our ends.
    stream_out.write.reset();
    stream_in.read.reset();
    producer_err.write.reset();
    consumer_err.write.reset();

    asio::io_context ioc{1};
    PipelineState state{ioc,
                        stream_out.read.release(), stream_in.write.release(),
                        producer_err.read.release(), consumer_err.read.release()};
    StreamResult result;

    asio::co_spawn(ioc, pump(state, result, on_bytes), asio::detached);
    asio::co_spawn(ioc, drain_err(state, state.producer_err, result.producer.err), asio::detached);
    asio::co_spawn(ioc, drain_err(state, state.consumer_err, result.consumer.err), asio::detached);
    asio::co_spawn(ioc, supervise(state, producer, consumer), asio::detached);

    ioc.run();

    result.producer.exit_status = producer.wait();
    result.consumer.exit_status = consumer.wait();
    return result;
}

} // namespace zsend::exec
