#pragma once

#include "replication/clock.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace zsend::replication {

// ── ProgressSample ────────────────────────────────────────────────────────────

struct ProgressSample {
    uint64_t                            bytes = 0;
    uint64_t                            expected = 0;
    std::chrono::milliseconds           elapsed{0};
    double                              rate = 0.0;     // bytes per second
    std::optional<double>               percent;        // unset without an estimate
    std::optional<std::chrono::seconds> eta;            // unset without rate or estimate
};

// ── ProgressMeter ─────────────────────────────────────────────────────────────
//
// Byte counter of the measure stage.  Seeded with the dry-run estimate, it
// never touches the stream itself; it only counts and reports.  A line is
// logged at most once per report interval, plus a summary on finish().
//
// The estimate is only a scale: the count may run past it.

class ProgressMeter {
public:
    static constexpr std::chrono::milliseconds kDefaultInterval{2000};

    ProgressMeter(std::string label,
                  uint64_t expected_bytes,
                  std::shared_ptr<spdlog::logger> logger,
                  const Clock& clock,
                  std::chrono::milliseconds report_interval = kDefaultInterval);

    // Account for `n` more bytes; may emit a progress line.
    void add(std::size_t n);

    // Log the summary line.
    void finish();

    [[nodiscard]] ProgressSample sample() const;

    [[nodiscard]] uint64_t bytes() const noexcept { return bytes_; }
    [[nodiscard]] std::size_t reports() const noexcept { return reports_; }

private:
    void report(const char* prefix);

    std::string                     label_;
    uint64_t                        expected_;
    std::shared_ptr<spdlog::logger> logger_;
    const Clock&                    clock_;
    std::chrono::milliseconds       interval_;

    Clock::time_point               started_;
    Clock::time_point               last_report_;
    uint64_t                        bytes_ = 0;
    std::size_t                     reports_ = 0;
};

// 1536 → "1.5 KiB"; values below 1 KiB are printed as "N B".
[[nodiscard]] std::string format_bytes(uint64_t bytes);

// 3725s → "1:02:05"; below an hour → "2:05".
[[nodiscard]] std::string format_duration(std::chrono::seconds d);

} // namespace zsend::replication
