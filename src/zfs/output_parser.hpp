#pragma once

#include "zfs/snapshot.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace zsend::zfs {

// ── Output parsers ────────────────────────────────────────────────────────────
//
// The only places that look at raw zfs(8) text.  Pure functions, no shared
// state; everything above works on the typed results.

// Parse `zfs list -H -o name -t snapshot` output into snapshot names of
// `dataset`, in output order.  Lines for other datasets (children, or the
// dataset itself without '@') are skipped; blank lines are ignored.
[[nodiscard]] SnapshotChain parse_snapshot_names(std::string_view raw,
                                                 std::string_view dataset);

// Parse `zfs send -n -v -P` output into the estimated stream size in bytes.
// Uses the last "size" line; without one, the second field of the last
// non-empty line.  Returns std::nullopt when no size can be found.
[[nodiscard]] std::optional<uint64_t> parse_estimated_size(std::string_view raw);

// Parse one size value: plain bytes ("123456"), or a number with a unit
// suffix, SI ("1.5K" = 1500, "2M") or IEC ("1Ki" = 1024, "3Gi").
// An optional trailing "B" is accepted.  Returns std::nullopt on garbage.
[[nodiscard]] std::optional<uint64_t> parse_size_value(std::string_view value);

} // namespace zsend::zfs
