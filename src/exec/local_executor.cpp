#include "exec/local_executor.hpp"

#include "exec/runner.hpp"

#include <utility>

namespace zsend::exec {

LocalExecutor::LocalExecutor(std::shared_ptr<spdlog::logger> logger, RunFunction run_fn)
    : logger_(std::move(logger)),
      run_fn_(run_fn ? std::move(run_fn) : RunFunction{&run_captured}) {}

CommandResult LocalExecutor::run(const Command& cmd, std::chrono::milliseconds timeout) {
    logger_->debug("local: {}", to_shell_string(cmd));
    auto result = run_fn_(cmd, timeout);
    logger_->debug("local: exit status {}{}", result.exit_status,
                   result.timed_out ? " (timed out)" : "");
    return result;
}

} // namespace zsend::exec
