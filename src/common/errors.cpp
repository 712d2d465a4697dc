#include "common/errors.hpp"

#include <fmt/format.h>

#include <utility>

namespace zsend {

std::string trim_right(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' ||
                          s.back() == ' '  || s.back() == '\t')) {
        s.pop_back();
    }
    return s;
}

namespace {

std::string command_message(const std::string& context, int exit_status,
                            const std::string& stderr_text, bool timed_out) {
    const auto detail = trim_right(stderr_text);
    if (timed_out) {
        return detail.empty()
            ? fmt::format("{}: timed out", context)
            : fmt::format("{}: timed out: {}", context, detail);
    }
    return detail.empty()
        ? fmt::format("{}: exit status {}", context, exit_status)
        : fmt::format("{}: exit status {}: {}", context, exit_status, detail);
}

} // anonymous namespace

Error::Error(std::string phase, const std::string& message)
    : std::runtime_error(message),
      phase_(std::move(phase)) {}

ConnectionError::ConnectionError(std::string host, const std::string& message)
    : Error("connect", fmt::format("{}: {}", host, message)),
      host_(std::move(host)) {}

CommandError::CommandError(const std::string& context,
                           int exit_status,
                           std::string stderr_text,
                           bool timed_out)
    : Error("command", command_message(context, exit_status, stderr_text, timed_out)),
      exit_status_(exit_status),
      stderr_(std::move(stderr_text)),
      timed_out_(timed_out) {}

DatasetNotFoundError::DatasetNotFoundError(std::string dataset,
                                           const std::string& where,
                                           const std::string& detail)
    : Error("verify",
            trim_right(detail).empty()
                ? fmt::format("dataset {} does not exist on {}, or its pool is not imported",
                              dataset, where)
                : fmt::format("dataset {} does not exist on {}, or its pool is not imported: {}",
                              dataset, where, trim_right(detail))),
      dataset_(std::move(dataset)) {}

EmptyChainError::EmptyChainError(const std::string& dataset, const std::string& message)
    : Error("enumerate", fmt::format("{}: {}", dataset, message)) {}

DivergedError::DivergedError(std::string dataset, std::string destination_tip,
                             const std::string& message)
    : Error("reconcile", fmt::format("{}: {}", dataset, message)),
      dataset_(std::move(dataset)),
      tip_(std::move(destination_tip)) {}

EstimationError::EstimationError(const std::string& message)
    : Error("estimate", message) {}

TransferError::TransferError(const std::string& message)
    : Error("transfer", message) {}

} // namespace zsend
