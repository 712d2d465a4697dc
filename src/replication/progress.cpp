#include "replication/progress.hpp"

#include <fmt/format.h>

#include <array>
#include <utility>

namespace zsend::replication {

ProgressMeter::ProgressMeter(std::string label,
                             uint64_t expected_bytes,
                             std::shared_ptr<spdlog::logger> logger,
                             const Clock& clock,
                             std::chrono::milliseconds report_interval)
    : label_(std::move(label)),
      expected_(expected_bytes),
      logger_(std::move(logger)),
      clock_(clock),
      interval_(report_interval),
      started_(clock.now()),
      last_report_(started_) {}

void ProgressMeter::add(std::size_t n) {
    bytes_ += n;

    const auto now = clock_.now();
    if (now - last_report_ >= interval_) {
        last_report_ = now;
        report("");
    }
}

void ProgressMeter::finish() {
    report("done ");
}

ProgressSample ProgressMeter::sample() const {
    ProgressSample s;
    s.bytes    = bytes_;
    s.expected = expected_;
    s.elapsed  = std::chrono::duration_cast<std::chrono::milliseconds>(clock_.since(started_));

    if (s.elapsed.count() > 0) {
        s.rate = static_cast<double>(bytes_) * 1000.0 / static_cast<double>(s.elapsed.count());
    }
    if (expected_ > 0) {
        s.percent = static_cast<double>(bytes_) * 100.0 / static_cast<double>(expected_);
        if (s.rate > 0.0 && bytes_ < expected_) {
            s.eta = std::chrono::seconds{
                static_cast<long long>(static_cast<double>(expected_ - bytes_) / s.rate)};
        } else if (bytes_ >= expected_) {
            s.eta = std::chrono::seconds{0};
        }
    }
    return s;
}

void ProgressMeter::report(const char* prefix) {
    ++reports_;
    const auto s = sample();
    const auto elapsed = format_duration(std::chrono::duration_cast<std::chrono::seconds>(s.elapsed));
    const auto rate = format_bytes(static_cast<uint64_t>(s.rate)) + "/s";

    if (s.percent) {
        logger_->info("{}: {}{} of {} ({:.1f}%) in {} at {}{}",
            label_, prefix, format_bytes(s.bytes), format_bytes(s.expected), *s.percent,
            elapsed, rate,
            s.eta && s.bytes < s.expected ? ", ETA " + format_duration(*s.eta) : std::string{});
    } else {
        logger_->info("{}: {}{} in {} at {}", label_, prefix, format_bytes(s.bytes), elapsed, rate);
    }
}

std::string format_bytes(uint64_t bytes) {
    static constexpr std::array<const char*, 6> kUnits{"KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};
    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    value /= 1024.0;
    while (value >= 1024.0 && unit + 1 < kUnits.size()) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", value, kUnits[unit]);
}

std::string format_duration(std::chrono::seconds d) {
    const auto total = d.count() < 0 ? 0 : d.count();
    const auto hours   = total / 3600;
    const auto minutes = (total % 3600) / 60;
    const auto seconds = total % 60;
    if (hours > 0) {
        return fmt::format("{}:{:02}:{:02}", hours, minutes, seconds);
    }
    return fmt::format("{}:{:02}", minutes, seconds);
}

} // namespace zsend::replication
