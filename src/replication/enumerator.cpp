#include "replication/enumerator.hpp"

#include "common/errors.hpp"
#include "zfs/output_parser.hpp"
#include "zfs/zfs_commands.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace zsend::replication {

namespace {

[[nodiscard]] bool reports_missing_dataset(const exec::CommandResult& r) {
    return r.exit_status != 0 && !r.timed_out &&
           r.err.find("dataset does not exist") != std::string::npos;
}

} // anonymous namespace

// ── slice_chain ───────────────────────────────────────────────────────────────

zfs::SnapshotChain slice_chain(const zfs::SnapshotChain& all,
                               const zfs::ChainBounds& bounds,
                               const std::string& dataset)
{
    if (all.empty()) {
        throw EmptyChainError(dataset, "dataset has no snapshots");
    }

    auto first = all.begin();
    if (bounds.start) {
        first = std::find(all.begin(), all.end(), *bounds.start);
        if (first == all.end()) {
            throw EmptyChainError(dataset,
                fmt::format("start snapshot '{}' does not exist", *bounds.start));
        }
    }

    auto last = all.end();  // one past the final element of the slice
    if (bounds.end) {
        auto it = std::find(all.begin(), all.end(), *bounds.end);
        if (it == all.end()) {
            throw EmptyChainError(dataset,
                fmt::format("end snapshot '{}' does not exist", *bounds.end));
        }
        if (it < first) {
            throw EmptyChainError(dataset,
                fmt::format("end snapshot '{}' precedes start snapshot '{}'", *bounds.end, *first));
        }
        last = std::next(it);
    } else if (bounds.count) {
        const auto available = std::distance(first, all.end());
        const auto wanted = static_cast<decltype(available)>(*bounds.count) + 1;
        last = std::next(first, std::min(available, wanted));
    }

    zfs::SnapshotChain chain(first, last);
    if (chain.empty()) {
        throw EmptyChainError(dataset, "unable to generate a list of snapshots");
    }
    return chain;
}

// ── SnapshotEnumerator ────────────────────────────────────────────────────────

SnapshotEnumerator::SnapshotEnumerator(exec::Executor& executor,
                                       std::chrono::milliseconds query_timeout,
                                       std::shared_ptr<spdlog::logger> logger)
    : executor_(executor),
      query_timeout_(query_timeout),
      logger_(std::move(logger)) {}

void SnapshotEnumerator::verify_dataset(const std::string& dataset) {
    const auto result = executor_.run(zfs::list_dataset(dataset), query_timeout_);
    if (!result.ok()) {
        throw DatasetNotFoundError(dataset, executor_.describe(),
            result.timed_out ? std::string("query timed out") : result.err);
    }
    logger_->debug("Dataset {} exists on {}", dataset, executor_.describe());
}

zfs::SnapshotChain SnapshotEnumerator::list_snapshots(const std::string& dataset) {
    const auto result = executor_.run(zfs::list_snapshots(dataset), query_timeout_);
    result.check(fmt::format("listing snapshots of {} on {}", dataset, executor_.describe()));
    return zfs::parse_snapshot_names(result.out, dataset);
}

zfs::SnapshotChain SnapshotEnumerator::destination_chain(const std::string& dataset) {
    const auto result = executor_.run(zfs::list_snapshots(dataset), query_timeout_);
    if (reports_missing_dataset(result)) {
        logger_->debug("Dataset {} does not exist on {} yet", dataset, executor_.describe());
        return {};
    }
    result.check(fmt::format("listing snapshots of {} on {}", dataset, executor_.describe()));
    return zfs::parse_snapshot_names(result.out, dataset);
}

zfs::SnapshotChain SnapshotEnumerator::list_chain(const std::string& dataset,
                                                  const zfs::ChainBounds& bounds)
{
    verify_dataset(dataset);

    const auto all = list_snapshots(dataset);

    if (!bounds.start && !all.empty()) {
        logger_->warn("Initial snapshot was not specified. Using first available snapshot - {}",
                      all.front());
    }
    if (!bounds.count && !bounds.end) {
        logger_->warn("No end snapshot or snapshot count was given. Sending all snapshots after {}",
                      bounds.start.value_or(all.empty() ? std::string{} : all.front()));
    }

    auto chain = slice_chain(all, bounds, dataset);
    logger_->info("Snapshot list for {} on {}: {} snapshot(s), {} .. {}",
                  dataset, executor_.describe(), chain.size(), chain.front(), chain.back());
    return chain;
}

std::string SnapshotEnumerator::describe_snapshots(const std::string& dataset) {
    const auto result = executor_.run(zfs::list_snapshots_with_creation(dataset), query_timeout_);
    result.check(fmt::format("listing snapshots of {} on {}", dataset, executor_.describe()));
    return result.out;
}

} // namespace zsend::replication
