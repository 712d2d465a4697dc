#include "replication/convergence_loop.hpp"

#include "common/errors.hpp"
#include "replication/progress.hpp"

#include <fmt/format.h>

#include <exception>
#include <utility>
#include <variant>

namespace zsend::replication {

const char* to_string(LoopState s) noexcept {
    switch (s) {
        case LoopState::Planning:     return "Planning";
        case LoopState::Transferring: return "Transferring";
        case LoopState::Converged:    return "Converged";
        case LoopState::Failed:       return "Failed";
    }
    return "Unknown";
}

ConvergenceLoop::ConvergenceLoop(ChainReconciler& reconciler,
                                 TransferEngine& engine,
                                 std::shared_ptr<spdlog::logger> logger)
    : reconciler_(reconciler),
      engine_(engine),
      logger_(std::move(logger)) {}

void ConvergenceLoop::set_state(LoopState s) {
    if (report_.state == s) return;
    logger_->debug("Convergence loop: {} → {}", to_string(report_.state), to_string(s));
    report_.state = s;
}

RunReport ConvergenceLoop::run(const zfs::SnapshotChain& target) {
    report_ = RunReport{};
    std::optional<std::string> expected_tip;  // set after each landed transfer

    try {
        for (;;) {
            set_state(LoopState::Planning);
            auto step = reconciler_.next_step(target);
            report_.final_tip = step.destination_tip;

            if (expected_tip && step.destination_tip != expected_tip) {
                throw TransferError(fmt::format(
                    "destination tip is '{}' after receiving '{}'",
                    step.destination_tip.value_or("<none>"), *expected_tip));
            }

            if (std::holds_alternative<Converged>(step.decision)) {
                set_state(LoopState::Converged);
                logger_->info("Transfer is complete. Destination is at {} ({} transfer(s) this run)",
                              report_.final_tip.value_or("<none>"), report_.transfers.size());
                return report_;
            }

            auto plan = std::get<TransferPlan>(std::move(step.decision));
            if (plan.kind == TransferKind::Full) {
                logger_->info("Beginning full send of snapshot {}", plan.to);
            } else {
                logger_->info("Beginning incremental send from {} to {}", *plan.from, plan.to);
            }

            set_state(LoopState::Transferring);
            const auto bytes = engine_.transfer(plan);
            logger_->info("Finished {}: {} transferred", to_string(plan), format_bytes(bytes));

            expected_tip = plan.to;
            report_.transfers.push_back({std::move(plan), bytes});
        }
    } catch (const Error& e) {
        set_state(LoopState::Failed);
        logger_->error("{} failed: {}", e.phase(), e.what());
        throw;
    } catch (const std::exception& e) {
        set_state(LoopState::Failed);
        logger_->error("run failed: {}", e.what());
        throw;
    }
}

} // namespace zsend::replication
