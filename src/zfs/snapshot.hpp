#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace zsend::zfs {

// Ordered snapshot names of one dataset, oldest first.  Names are unique.
using SnapshotChain = std::vector<std::string>;

// ── ChainBounds ───────────────────────────────────────────────────────────────
//
// Selects a contiguous slice of a dataset's snapshot chain.
//   start – first snapshot of the slice; std::nullopt means the earliest one
//   count – number of snapshots *after* start (so count = 4 selects 5)
//   end   – last snapshot of the slice, inclusive
// count and end are mutually exclusive; neither means "to the chain's end".

struct ChainBounds {
    std::optional<std::string> start;
    std::optional<uint32_t>    count;
    std::optional<std::string> end;
};

// "pool/ds" + "snap" → "pool/ds@snap"
[[nodiscard]] inline std::string snapshot_ref(std::string_view dataset,
                                              std::string_view name) {
    std::string ref;
    ref.reserve(dataset.size() + 1 + name.size());
    ref.append(dataset);
    ref.push_back('@');
    ref.append(name);
    return ref;
}

// "pool/ds@snap" → {"pool/ds", "snap"}.  Returns std::nullopt without '@'.
[[nodiscard]] inline std::optional<std::pair<std::string, std::string>>
split_snapshot_ref(std::string_view ref) {
    const auto at = ref.find('@');
    if (at == std::string_view::npos) {
        return std::nullopt;
    }
    return std::pair<std::string, std::string>{
        std::string(ref.substr(0, at)), std::string(ref.substr(at + 1))};
}

} // namespace zsend::zfs
