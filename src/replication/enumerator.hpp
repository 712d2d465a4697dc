#pragma once

#include "exec/executor.hpp"
#include "zfs/snapshot.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <memory>
#include <string>

namespace zsend::replication {

// ── slice_chain ───────────────────────────────────────────────────────────────
// Apply `bounds` to the full chain of `dataset` (pure).
//
// Throws EmptyChainError when the start or end snapshot is not in the chain,
// the end precedes the start, or the result is empty.

[[nodiscard]] zfs::SnapshotChain slice_chain(const zfs::SnapshotChain& all,
                                             const zfs::ChainBounds& bounds,
                                             const std::string& dataset);

// ── SnapshotEnumerator ────────────────────────────────────────────────────────
//
// Lists snapshot chains through one executor (the side that holds the
// dataset).  Every query is bounded by the query timeout, since zfs can hang
// on a pool whose devices are unavailable.

class SnapshotEnumerator {
public:
    SnapshotEnumerator(exec::Executor& executor,
                       std::chrono::milliseconds query_timeout,
                       std::shared_ptr<spdlog::logger> logger);

    // Throws DatasetNotFoundError unless `dataset` exists and its pool is imported.
    void verify_dataset(const std::string& dataset);

    // Every snapshot of `dataset` itself, oldest first.  Throws CommandError.
    [[nodiscard]] zfs::SnapshotChain list_snapshots(const std::string& dataset);

    // Like list_snapshots(), but a dataset that does not exist yet has an
    // empty chain.  Other failures throw CommandError.
    [[nodiscard]] zfs::SnapshotChain destination_chain(const std::string& dataset);

    // The bounded chain to replicate: verify, list, slice.  Defaults for a
    // missing start or end are logged.  Throws DatasetNotFoundError,
    // CommandError or EmptyChainError.
    [[nodiscard]] zfs::SnapshotChain list_chain(const std::string& dataset,
                                                const zfs::ChainBounds& bounds);

    // `name,creation` table of the dataset's snapshots, for the final report.
    [[nodiscard]] std::string describe_snapshots(const std::string& dataset);

    [[nodiscard]] exec::Executor& executor() noexcept { return executor_; }

private:
    exec::Executor&                 executor_;
    std::chrono::milliseconds       query_timeout_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace zsend::replication
