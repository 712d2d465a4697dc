#include "replication/reconciler.hpp"

#include "common/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <utility>

namespace zsend::replication {

// ── plan_next_step ────────────────────────────────────────────────────────────

StepDecision plan_next_step(const std::string& dataset,
                            const zfs::SnapshotChain& target,
                            const std::optional<std::string>& destination_tip)
{
    if (target.empty()) {
        throw EmptyChainError(dataset, "cannot plan against an empty chain");
    }

    if (!destination_tip) {
        return full_plan(target.front());
    }

    const auto it = std::find(target.begin(), target.end(), *destination_tip);
    if (it == target.end()) {
        throw DivergedError(dataset, *destination_tip, fmt::format(
            "destination already exists, but its latest snapshot '{}' is not in the source chain",
            *destination_tip));
    }

    const auto next = std::next(it);
    if (next == target.end()) {
        return Converged{};
    }
    return incremental_plan(*it, *next);
}

// ── verify_ancestry ───────────────────────────────────────────────────────────

void verify_ancestry(const std::string& dataset,
                     const zfs::SnapshotChain& target,
                     const zfs::SnapshotChain& destination)
{
    auto position = [&](const std::string& name) -> std::ptrdiff_t {
        const auto it = std::find(target.begin(), target.end(), name);
        return it == target.end() ? -1 : std::distance(target.begin(), it);
    };

    auto d = destination.begin();
    while (d != destination.end() && position(*d) < 0) {
        ++d;
    }
    if (d == destination.end()) {
        if (!destination.empty()) {
            throw DivergedError(dataset, destination.back(),
                "destination shares no snapshot with the source chain");
        }
        return;
    }

    std::ptrdiff_t previous = position(*d);
    for (++d; d != destination.end(); ++d) {
        const auto pos = position(*d);
        if (pos < 0) {
            throw DivergedError(dataset, destination.back(), fmt::format(
                "destination snapshot '{}' is not in the source chain", *d));
        }
        if (pos <= previous) {
            throw DivergedError(dataset, destination.back(), fmt::format(
                "destination snapshot '{}' is out of order relative to the source chain", *d));
        }
        if (pos != previous + 1) {
            throw DivergedError(dataset, destination.back(), fmt::format(
                "destination is missing '{}' between '{}' and '{}'",
                target[static_cast<std::size_t>(previous + 1)],
                target[static_cast<std::size_t>(previous)], *d));
        }
        previous = pos;
    }
}

// ── ChainReconciler ───────────────────────────────────────────────────────────

ChainReconciler::ChainReconciler(SnapshotEnumerator& destination,
                                 std::string destination_dataset,
                                 bool strict,
                                 std::shared_ptr<spdlog::logger> logger)
    : destination_(destination),
      dataset_(std::move(destination_dataset)),
      strict_(strict),
      logger_(std::move(logger)) {}

ReconcileResult ChainReconciler::next_step(const zfs::SnapshotChain& target) {
    const auto chain = destination_.destination_chain(dataset_);

    ReconcileResult result{
        chain.empty() ? std::nullopt : std::optional<std::string>{chain.back()},
        Converged{}};

    if (strict_) {
        verify_ancestry(dataset_, target, chain);
    }

    result.decision = plan_next_step(dataset_, target, result.destination_tip);

    if (result.destination_tip) {
        logger_->debug("Destination {} tip: {}", dataset_, *result.destination_tip);
    } else {
        logger_->debug("Destination {} has no snapshots", dataset_);
    }
    return result;
}

} // namespace zsend::replication
