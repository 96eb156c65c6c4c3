#include "common/server_config.hpp"
#include "common/logger.hpp"

#include <format>
#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace httpkv {

namespace {

// Validate the fully populated ServerConfig.
void validate(const ServerConfig& cfg) {
    if (cfg.host.empty()) {
        throw std::runtime_error("--host must not be empty");
    }
    if (cfg.port == 0) {
        throw std::runtime_error("Port for --port must be in [1, 65535], got 0");
    }
    if (cfg.max_body_size == 0) {
        throw std::runtime_error("--max-body-size must be > 0");
    }
    if (!is_valid_log_level(cfg.log_level)) {
        throw std::runtime_error(
            std::format("--log-level must be one of trace|debug|info|warn|error|critical, got '{}'",
                        cfg.log_level));
    }
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    const ServerConfig defaults;
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("host",
            po::value<std::string>()->default_value(defaults.host),
            "Bind address for HTTP connections")
        ("port,p",
            po::value<uint16_t>()->default_value(defaults.port),
            "Port for HTTP connections")
        ("threads",
            po::value<unsigned int>()->default_value(defaults.threads),
            "Number of I/O threads (0 = hardware concurrency)")
        ("max-body-size",
            po::value<std::size_t>()->default_value(defaults.max_body_size),
            "Largest accepted request body in bytes")
        ("log-level",
            po::value<std::string>()->default_value(defaults.log_level),
            "Log level: trace|debug|info|warn|error|critical");
}

// ── parse_config ──────────────────────────────────────────────────────────────

ServerConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("httpkv-server options");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(
            po::parse_command_line(argc, argv, desc),
            vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(std::format("Argument error: {}", e.what()));
    }

    ServerConfig cfg;
    cfg.host          = vm["host"].as<std::string>();
    cfg.port          = vm["port"].as<uint16_t>();
    cfg.threads       = vm["threads"].as<unsigned int>();
    cfg.max_body_size = vm["max-body-size"].as<std::size_t>();
    cfg.log_level     = vm["log-level"].as<std::string>();

    validate(cfg);
    return cfg;
}

} // namespace httpkv
