#pragma once

#include "exec/executor.hpp"

#include <spdlog/spdlog.h>

#include <memory>

namespace zsend::exec {

// Runs commands on this host.
class LocalExecutor final : public Executor {
public:
    explicit LocalExecutor(std::shared_ptr<spdlog::logger> logger, RunFunction run_fn = {});

    [[nodiscard]] CommandResult run(const Command& cmd,
                                    std::chrono::milliseconds timeout) override;

    [[nodiscard]] Command wrap(const Command& cmd) override { return cmd; }

    [[nodiscard]] bool is_remote() const noexcept override { return false; }

    [[nodiscard]] std::string describe() const override { return "localhost"; }

private:
    std::shared_ptr<spdlog::logger> logger_;
    RunFunction                     run_fn_;
};

} // namespace zsend::exec
