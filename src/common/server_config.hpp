#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <boost/program_options.hpp>

namespace httpkv {

// ── ServerConfig ──────────────────────────────────────────────────────────────
// Full configuration for one httpkv-server process.
// Populated by parse_config() from CLI arguments.

struct ServerConfig {
    std::string   host          = "localhost"; // Bind address (name or IP)
    uint16_t      port          = 4000;        // HTTP listening port
    unsigned int  threads       = 0;           // io_context threads, 0 = hardware concurrency
    std::size_t   max_body_size = 1024 * 1024; // Largest accepted request body in bytes
    std::string   log_level     = "info";      // spdlog level string
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a ServerConfig.
//
// On success: returns a fully validated ServerConfig.
// On error  : throws std::runtime_error with a human-readable message.
//             --help also throws, carrying the help text as the message.
//
// Validates:
//   - host is non-empty
//   - port in [1, 65535]
//   - max-body-size > 0
//   - log-level is a known spdlog level name

[[nodiscard]] ServerConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with server options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace httpkv
