#pragma once

#include <string>

#include <spdlog/spdlog.h>

namespace httpkv {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger used by every component (server,
// sessions, dispatcher, CLI).  Call once at program start before any logging.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

// True if `s` names one of the levels accepted by parse_log_level().
[[nodiscard]] bool is_valid_log_level(const std::string& s);

} // namespace httpkv
