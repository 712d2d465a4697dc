#pragma once

#include "exec/command.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace zsend::exec {

// Called from the measure stage with the size of every chunk that passed.
using ByteCallback = std::function<void(std::size_t)>;

// ── StreamResult ──────────────────────────────────────────────────────────────
// producer/consumer carry exit status and stderr; stdout is the stream itself.

struct StreamResult {
    uint64_t      bytes = 0;    // bytes that went through the measure stage
    CommandResult producer;
    CommandResult consumer;
    std::string   io_error;     // measure-stage failure, empty when none

    [[nodiscard]] bool ok() const noexcept {
        return producer.ok() && consumer.ok() && io_error.empty();
    }
};

// ── StreamRunner ──────────────────────────────────────────────────────────────
//
// Runs producer | measure | consumer as one logical operation.  The producer's
// stdout is copied through the measure stage into the consumer's stdin; the
// whole thing succeeds only if every stage does.

class StreamRunner {
public:
    virtual ~StreamRunner() = default;

    [[nodiscard]] virtual StreamResult run(const Command& producer,
                                           const Command& consumer,
                                           const ByteCallback& on_bytes) = 0;
};

// ── ProcessPipeline ───────────────────────────────────────────────────────────
//
// Production StreamRunner.  Producer and consumer are child processes; the
// measure stage is a coroutine on a private io_context that moves bytes
// between the two pipes in kChunkSize pieces, so nothing larger than one
// chunk is ever buffered and a slow consumer stalls the producer.
//
// SIGPIPE is ignored process-wide while a pipeline runs, so a consumer that
// dies mid-stream shows up as a write error instead of killing us.
//
// Not time-bounded.

class ProcessPipeline final : public StreamRunner {
public:
    static constexpr std::size_t kChunkSize = 64 * 1024;

    [[nodiscard]] StreamResult run(const Command& producer,
                                   const Command& consumer,
                                   const ByteCallback& on_bytes) override;
};

} // namespace zsend::exec
