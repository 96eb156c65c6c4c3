#include "api/outcome.hpp"
#include "cli/command.hpp"
#include "common/logger.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/program_options.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdio>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace po = boost::program_options;
namespace asio = boost::asio;
namespace http = boost::beast::http;
using tcp = asio::ip::tcp;
using httpkv::cli::UsageError;

namespace {

constexpr auto use_awaitable = asio::as_tuple(asio::use_awaitable);

// Sends one request on `socket` and prints "<status> <body>".
// Returns the status code, or nullopt on an I/O error.
asio::awaitable<std::optional<unsigned>>
round_trip(tcp::socket& socket, boost::beast::flat_buffer& buffer, httpkv::api::Request& req) {
    auto [wec, _] = co_await http::async_write(socket, req, use_awaitable);
    if (wec) {
        spdlog::error("httpkv-cli: send error: {}", wec.message());
        co_return std::nullopt;
    }

    httpkv::api::Response res;
    auto [rec, n] = co_await http::async_read(socket, buffer, res, use_awaitable);
    if (rec) {
        if (rec == http::error::end_of_stream) {
            fprintf(stdout, "Server disconnected.\n");
        } else {
            spdlog::error("httpkv-cli: recv error: {}", rec.message());
        }
        co_return std::nullopt;
    }

    fprintf(stdout, "%u %s\n", res.result_int(), res.body().c_str());
    co_return res.result_int();
}

// ── One-shot coroutine ────────────────────────────────────────────────────────

asio::awaitable<void> run_once(tcp::socket socket, httpkv::api::Request req, int& exit_code) {
    boost::beast::flat_buffer buffer;
    const auto status = co_await round_trip(socket, buffer, req);
    exit_code = status ? httpkv::cli::exit_status_for(*status) : 1;
}

// ── REPL coroutine ────────────────────────────────────────────────────────────

asio::awaitable<void> repl(tcp::socket socket, std::string host) {
    boost::beast::flat_buffer buffer;
    std::string line;
    while (true) {
        fprintf(stdout, "> ");
        fflush(stdout);

        if (!std::getline(std::cin, line)) {
            fprintf(stdout, "\n");
            break;
        }

        const auto words = httpkv::cli::split_words(line);
        if (words.empty()) {
            continue;
        }

        auto built = httpkv::cli::build_request(host, words);
        if (auto* err = std::get_if<UsageError>(&built)) {
            fprintf(stdout, "ERROR %s\n", err->message.c_str());
            continue;
        }

        auto& req = std::get<httpkv::api::Request>(built);
        req.keep_alive(true);
        if (!co_await round_trip(socket, buffer, req)) {
            break;
        }
    }
}

} // anonymous namespace

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    po::options_description desc("httpkv-cli options");
    desc.add_options()
        ("help,h",                                            "Show this help")
        ("host",   po::value<std::string>()->default_value("localhost"), "Server host")
        ("port,p", po::value<std::uint16_t>()->default_value(4000),      "Server port")
        ("log-level,l", po::value<std::string>()->default_value("warn"), "Log level");

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::vector<std::string>>(), "get|set|delete and arguments");

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add("command", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(all)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (const po::error& e) {
        fprintf(stderr, "Argument error: %s\n", e.what());
        return 1;
    }

    if (vm.count("help")) {
        std::ostringstream oss;
        oss << "Usage: httpkv-cli [options] [get <key> | set <key> <value> | delete <key>]\n"
            << desc;
        fprintf(stdout, "%s\n", oss.str().c_str());
        return 0;
    }

    const auto host      = vm["host"].as<std::string>();
    const auto port      = vm["port"].as<std::uint16_t>();
    const auto log_level = vm["log-level"].as<std::string>();

    httpkv::init_default_logger(httpkv::parse_log_level(log_level));

    // Positional words form a single command; none means interactive.
    std::optional<httpkv::api::Request> one_shot;
    if (vm.count("command")) {
        auto built = httpkv::cli::build_request(
            host, vm["command"].as<std::vector<std::string>>());
        if (auto* err = std::get_if<UsageError>(&built)) {
            fprintf(stderr, "%s\n", err->message.c_str());
            return 1;
        }
        one_shot = std::move(std::get<httpkv::api::Request>(built));
        one_shot->keep_alive(false);
    }

    spdlog::debug("httpkv-cli connecting to {}:{}", host, port);

    int exit_code = 0;
    try {
        asio::io_context ioc;
        tcp::resolver resolver{ioc};
        auto endpoints = resolver.resolve(host, std::to_string(port));

        tcp::socket socket{ioc};
        boost::system::error_code ec;
        asio::connect(socket, endpoints, ec);

        if (ec) {
            spdlog::error("httpkv-cli: failed to connect to {}:{} – {}", host, port, ec.message());
            return 1;
        }

        socket.set_option(tcp::no_delay(true));

        if (one_shot) {
            asio::co_spawn(ioc, run_once(std::move(socket), std::move(*one_shot), exit_code),
                           asio::detached);
        } else {
            fprintf(stdout, "Connected to %s:%u. "
                    "Type commands (get k, set k v, delete k). Ctrl+D to quit.\n",
                    host.c_str(), port);
            asio::co_spawn(ioc, repl(std::move(socket), host), asio::detached);
        }
        ioc.run();

    } catch (const std::exception& ex) {
        spdlog::error("httpkv-cli: exception: {}", ex.what());
        return 1;
    }

    return exit_code;
}
