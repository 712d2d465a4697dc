#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace zsend::replication {

enum class TransferKind : uint8_t {
    Full        = 0,
    Incremental = 1,
};

// ── TransferPlan ──────────────────────────────────────────────────────────────
//
// One pending transfer.  Produced by the reconciler, consumed once by the
// transfer engine.  `from` is set exactly for incremental plans.

struct TransferPlan {
    TransferKind               kind = TransferKind::Full;
    std::optional<std::string> from;
    std::string                to;
    uint64_t                   estimated_bytes = 0;  // filled in by estimation

    bool operator==(const TransferPlan&) const = default;
};

[[nodiscard]] inline TransferPlan full_plan(std::string to) {
    return {TransferKind::Full, std::nullopt, std::move(to), 0};
}

[[nodiscard]] inline TransferPlan incremental_plan(std::string from, std::string to) {
    return {TransferKind::Incremental, std::move(from), std::move(to), 0};
}

// "full:s1", "incremental:s1->s2"
[[nodiscard]] inline std::string to_string(const TransferPlan& plan) {
    if (plan.kind == TransferKind::Full) {
        return "full:" + plan.to;
    }
    return "incremental:" + plan.from.value_or("?") + "->" + plan.to;
}

} // namespace zsend::replication
