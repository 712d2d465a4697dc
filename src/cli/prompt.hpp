#pragma once

#include <iosfwd>
#include <optional>
#include <string>

namespace zsend::cli {

// Prints `question` followed by a space and reads one line from `in`.
// Returns std::nullopt on EOF.
[[nodiscard]] std::optional<std::string> prompt_line(std::istream& in,
                                                     std::ostream& out,
                                                     const std::string& question);

// ── confirm_proceed ───────────────────────────────────────────────────────────
//
// Asks "Would you like to proceed? (y/n)" and re-asks until the answer is
// exactly one of y, Y, n, N.  True only for y/Y; EOF counts as declining.

[[nodiscard]] bool confirm_proceed(std::istream& in, std::ostream& out);

} // namespace zsend::cli
