#include "common/command_check.hpp"

#include <cstdlib>
#include <system_error>

#include <unistd.h>

namespace zsend {

namespace {

[[nodiscard]] bool is_executable_file(const std::filesystem::path& p) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(p, ec) || ec) {
        return false;
    }
    return ::access(p.c_str(), X_OK) == 0;
}

} // anonymous namespace

std::optional<std::filesystem::path> find_in_path(
    std::string_view name,
    std::optional<std::string_view> path_env)
{
    if (name.empty()) {
        return std::nullopt;
    }

    if (name.find('/') != std::string_view::npos) {
        std::filesystem::path p{std::string(name)};
        if (is_executable_file(p)) return p;
        return std::nullopt;
    }

    std::string_view remaining;
    if (path_env) {
        remaining = *path_env;
    } else if (const char* env = std::getenv("PATH")) {
        remaining = env;
    } else {
        remaining = "/usr/bin:/bin";
    }

    while (true) {
        const auto colon = remaining.find(':');
        std::string_view dir = remaining.substr(0, colon);
        if (dir.empty()) {
            dir = "."; // empty PATH element means the current directory
        }

        auto candidate = std::filesystem::path{std::string(dir)} / std::string(name);
        if (is_executable_file(candidate)) {
            return candidate;
        }

        if (colon == std::string_view::npos) break;
        remaining = remaining.substr(colon + 1);
    }
    return std::nullopt;
}

std::vector<std::string> missing_commands(const std::vector<std::string>& names) {
    std::vector<std::string> missing;
    for (const auto& n : names) {
        if (!find_in_path(n)) {
            missing.push_back(n);
        }
    }
    return missing;
}

} // namespace zsend
