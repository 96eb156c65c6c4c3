#include "network/server.hpp"
#include "network/session.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <thread>
#include <vector>

namespace httpkv::network {

namespace {

unsigned int pool_size(unsigned int requested) {
    if (requested > 0) {
        return requested;
    }
    return std::max(1u, std::thread::hardware_concurrency());
}

} // namespace

Server::Server(const ServerConfig& cfg, KeyValueStore& store)
    : host_(cfg.host),
      port_(cfg.port),
      threads_(pool_size(cfg.threads)),
      max_body_size_(cfg.max_body_size),
      store_(store),
      dispatcher_(store_),
      ioc_(static_cast<int>(threads_)),
      acceptor_(ioc_) {
    // Host may be a name such as "localhost"; bind to the first result.
    boost::asio::ip::tcp::resolver resolver{ioc_};
    const auto results = resolver.resolve(host_, std::to_string(port_));
    const boost::asio::ip::tcp::endpoint endpoint = *results.begin();

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();

    spdlog::info("Server listening on http://{}:{} ({})",
                 host_, port_, endpoint.address().to_string());
}

void Server::run() {
    // Install SIGINT / SIGTERM handler for graceful shutdown.
    boost::asio::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            spdlog::info("Server: received signal {}, shutting down", signo);
            stop();
        }
    });

    boost::asio::co_spawn(ioc_, accept_loop(), boost::asio::detached);

    std::vector<std::thread> pool;
    pool.reserve(threads_ - 1);
    for (unsigned int i = 1; i < threads_; ++i) {
        pool.emplace_back([this] { ioc_.run(); });
    }

    ioc_.run(); // Run on the calling thread as well.

    for (auto& t : pool) {
        t.join();
    }

    spdlog::info("Server: io_context stopped, {} keys held at shutdown", store_.size());
}

void Server::stop() {
    // The accept loop runs on the pool threads, so the acceptor is only
    // touched from inside the io_context.
    boost::asio::post(ioc_, [this] {
        boost::system::error_code ec;
        acceptor_.close(ec);
        if (ec) {
            spdlog::warn("Server: closing acceptor failed: {}", ec.message());
        }
        ioc_.stop();
    });
}

boost::asio::awaitable<void> Server::accept_loop() {
    spdlog::debug("Server: accept loop started");

    constexpr auto use_awaitable = boost::asio::as_tuple(boost::asio::use_awaitable);

    for (;;) {
        auto [ec, socket] = co_await acceptor_.async_accept(use_awaitable);

        if (ec) {
            if (ec != boost::asio::error::operation_aborted) {
                spdlog::warn("Server: accept error: {}", ec.message());
            }
            break; // Acceptor was closed – time to stop.
        }

        // Disable Nagle – send responses immediately.
        socket.set_option(boost::asio::ip::tcp::no_delay(true));

        auto session = std::make_shared<Session>(std::move(socket), dispatcher_, max_body_size_);
        boost::asio::co_spawn(
            ioc_,
            [sp = std::move(session)]() -> boost::asio::awaitable<void> {
                co_await sp->run();
            },
            boost::asio::detached);
    }

    spdlog::debug("Server: accept loop exited");
}

} // namespace httpkv::network
