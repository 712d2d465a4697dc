#pragma once

#include <chrono>

namespace zsend::replication {

// ── Clock ────────────────────────────────────────────────────────────────────
//
// Time source for transfer progress (rate, ETA, report throttling).  Tests
// substitute a hand-advanced clock; see tests/manual_clock.hpp.

class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration   = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;

    [[nodiscard]] virtual time_point now() const = 0;

    [[nodiscard]] duration since(time_point earlier) const { return now() - earlier; }
};

class SteadyClock final : public Clock {
public:
    [[nodiscard]] time_point now() const override { return std::chrono::steady_clock::now(); }
};

} // namespace zsend::replication
