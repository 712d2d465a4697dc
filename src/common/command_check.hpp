#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zsend {

// Search $PATH (or `path_env` when given) for an executable named `name`.
// Names containing '/' are checked as-is.
[[nodiscard]] std::optional<std::filesystem::path> find_in_path(
    std::string_view name,
    std::optional<std::string_view> path_env = std::nullopt);

// Returns the subset of `names` that cannot be found on $PATH.
[[nodiscard]] std::vector<std::string> missing_commands(const std::vector<std::string>& names);

} // namespace zsend
