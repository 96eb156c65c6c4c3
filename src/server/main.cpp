#include "common/logger.hpp"
#include "common/server_config.hpp"
#include "network/server.hpp"
#include "storage/key_value_store.hpp"

#include <boost/system/system_error.hpp>

#include <spdlog/spdlog.h>

#include <cstdio>
#include <stdexcept>

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    httpkv::ServerConfig cfg;
    try {
        cfg = httpkv::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    httpkv::init_default_logger(httpkv::parse_log_level(cfg.log_level));

    spdlog::info("httpkv-server starting – host={} port={} threads={} max_body_size={}",
                 cfg.host, cfg.port, cfg.threads, cfg.max_body_size);

    // ── Store ────────────────────────────────────────────────────────────────
    // The only state that outlives a request; injected into the server.
    httpkv::KeyValueStore store;

    // ── Server ───────────────────────────────────────────────────────────────
    try {
        httpkv::network::Server server{cfg, store};
        spdlog::info("### Key Value Database Server started http://{}:{} ###",
                     cfg.host, cfg.port);
        server.run();
    } catch (const boost::system::system_error& e) {
        spdlog::error("Failed to start server on {}:{}: {}", cfg.host, cfg.port, e.what());
        return 1;
    }

    spdlog::info("### Key Value Database Server stopped ###");
    return 0;
}
