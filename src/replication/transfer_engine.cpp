#include "replication/transfer_engine.hpp"

#include "common/errors.hpp"
#include "replication/progress.hpp"
#include "zfs/output_parser.hpp"
#include "zfs/snapshot.hpp"

#include <fmt/format.h>

#include <system_error>
#include <utility>

namespace zsend::replication {

namespace {

// "sender exited with status 1: cannot open 'a@b': dataset does not exist"
std::string describe_stage(const char* stage, const exec::CommandResult& r) {
    if (r.ok()) {
        return {};
    }
    const auto err = trim_right(r.err);
    return err.empty()
        ? fmt::format("{} exited with status {}", stage, r.exit_status)
        : fmt::format("{} exited with status {}: {}", stage, r.exit_status, err);
}

} // anonymous namespace

TransferEngine::TransferEngine(exec::Executor& source,
                               exec::Executor& destination,
                               exec::StreamRunner& streams,
                               std::string source_dataset,
                               std::string destination_dataset,
                               TransferOptions options,
                               std::shared_ptr<spdlog::logger> logger,
                               const Clock& clock)
    : source_(source),
      destination_(destination),
      streams_(streams),
      source_dataset_(std::move(source_dataset)),
      destination_dataset_(std::move(destination_dataset)),
      options_(std::move(options)),
      logger_(std::move(logger)),
      clock_(clock) {}

// ── Phase 1: estimation ───────────────────────────────────────────────────────

uint64_t TransferEngine::estimate(const TransferPlan& plan) {
    const auto snapshot = zfs::snapshot_ref(source_dataset_, plan.to);
    const auto cmd = zfs::send_estimate(source_dataset_, plan.from, plan.to);

    exec::CommandResult result;
    try {
        result = source_.run(cmd, options_.query_timeout);
    } catch (const std::system_error& e) {
        throw EstimationError(fmt::format("estimating {}: {}", to_string(plan), e.what()));
    }

    if (result.timed_out) {
        throw EstimationError(fmt::format(
            "estimating {} on {}: dry run timed out", snapshot, source_.describe()));
    }
    if (result.exit_status != 0) {
        throw EstimationError(fmt::format(
            "estimating {} on {}: {}", snapshot, source_.describe(),
            describe_stage("zfs send -n", result)));
    }

    // The dry-run report goes to stdout on current OpenZFS, stderr on older releases.
    auto size = zfs::parse_estimated_size(result.out);
    if (!size) {
        size = zfs::parse_estimated_size(result.err);
    }
    if (!size) {
        throw EstimationError(fmt::format(
            "estimating {} on {}: unable to parse size from '{}'",
            snapshot, source_.describe(), trim_right(result.out.empty() ? result.err : result.out)));
    }

    logger_->info("Estimated size of {}: {}", to_string(plan), format_bytes(*size));
    return *size;
}

// ── Phase 2: execution ────────────────────────────────────────────────────────

uint64_t TransferEngine::execute(const TransferPlan& plan) {
    const auto producer = source_.wrap(zfs::send(source_dataset_, plan.from, plan.to));
    const auto consumer = destination_.wrap(zfs::receive(destination_dataset_, options_.receive));

    logger_->info("Starting ZFS send from {} {} to {} {}",
                  source_.is_remote() ? "remote" : "local", source_dataset_,
                  destination_.is_remote() ? "remote" : "local", destination_dataset_);
    logger_->debug("sender:   {}", exec::to_shell_string(producer));
    logger_->debug("receiver: {}", exec::to_shell_string(consumer));

    ProgressMeter meter(to_string(plan), plan.estimated_bytes, logger_, clock_,
                        options_.report_interval);

    exec::StreamResult result;
    try {
        result = streams_.run(producer, consumer, [&meter](std::size_t n) { meter.add(n); });
    } catch (const std::system_error& e) {
        throw TransferError(fmt::format("{}: {}", to_string(plan), e.what()));
    }

    if (!result.ok()) {
        std::string detail;
        for (const auto& part : {describe_stage("sender", result.producer),
                                 describe_stage("receiver", result.consumer),
                                 result.io_error}) {
            if (part.empty()) continue;
            if (!detail.empty()) detail += "; ";
            detail += part;
        }
        throw TransferError(fmt::format("{} of {} to {} failed after {}: {}",
            to_string(plan), zfs::snapshot_ref(source_dataset_, plan.to),
            destination_dataset_, format_bytes(result.bytes), detail));
    }

    meter.finish();
    return result.bytes;
}

uint64_t TransferEngine::transfer(TransferPlan& plan) {
    plan.estimated_bytes = estimate(plan);
    return execute(plan);
}

} // namespace zsend::replication
