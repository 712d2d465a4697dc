#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace zsend {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger "zsend".
//   level    – initial log level
//   log_file – when non-empty, every line is also appended to this file
// Call once at program start before any logging.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info,
                         const std::string& log_file = {});

// Create (or retrieve if already exists) a named component logger that shares
// the sinks of the default logger.
std::shared_ptr<spdlog::logger> make_logger(
    const std::string& name,
    spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace zsend
