#pragma once

#include <stdexcept>
#include <string>

namespace zsend {

// Strips trailing whitespace from captured command output so it reads well
// inside an error or log message.
[[nodiscard]] std::string trim_right(std::string s);

// ── Error ─────────────────────────────────────────────────────────────────────
//
// Base of every fatal replication error.  None of these are retried: each one
// means a precondition of the run no longer holds (missing dataset, broken
// chain, failed data-moving command).
//
// phase() names the stage of the run that failed and is used for the final
// log line printed by the CLI.

class Error : public std::runtime_error {
public:
    Error(std::string phase, const std::string& message);

    [[nodiscard]] const std::string& phase() const noexcept { return phase_; }

private:
    std::string phase_;
};

// The remote session could not be established within the connect timeout.
class ConnectionError final : public Error {
public:
    ConnectionError(std::string host, const std::string& message);

    [[nodiscard]] const std::string& host() const noexcept { return host_; }

private:
    std::string host_;
};

// A command returned non-zero (or was killed by its timeout).
class CommandError final : public Error {
public:
    CommandError(const std::string& context,
                 int exit_status,
                 std::string stderr_text,
                 bool timed_out = false);

    [[nodiscard]] int exit_status() const noexcept { return exit_status_; }
    [[nodiscard]] const std::string& stderr_text() const noexcept { return stderr_; }
    [[nodiscard]] bool timed_out() const noexcept { return timed_out_; }

private:
    int         exit_status_;
    std::string stderr_;
    bool        timed_out_;
};

// The source dataset is missing or its pool is not imported.
class DatasetNotFoundError final : public Error {
public:
    DatasetNotFoundError(std::string dataset, const std::string& where,
                         const std::string& detail);

    [[nodiscard]] const std::string& dataset() const noexcept { return dataset_; }

private:
    std::string dataset_;
};

// The bounded snapshot chain came out empty (or its bounds don't resolve).
class EmptyChainError final : public Error {
public:
    EmptyChainError(const std::string& dataset, const std::string& message);
};

// The destination holds a tip that is not part of the target chain.
class DivergedError final : public Error {
public:
    DivergedError(std::string dataset, std::string destination_tip, const std::string& message);

    [[nodiscard]] const std::string& dataset() const noexcept { return dataset_; }
    [[nodiscard]] const std::string& destination_tip() const noexcept { return tip_; }

private:
    std::string dataset_;
    std::string tip_;
};

// Dry-run size estimation failed or produced an unparsable size.
class EstimationError final : public Error {
public:
    explicit EstimationError(const std::string& message);
};

// The send | measure | receive pipeline failed.
class TransferError final : public Error {
public:
    explicit TransferError(const std::string& message);
};

} // namespace zsend
