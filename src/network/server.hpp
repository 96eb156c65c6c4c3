#pragma once

#include "api/route_dispatcher.hpp"
#include "common/server_config.hpp"
#include "storage/key_value_store.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace httpkv::network {

// Owns the io_context, the TCP acceptor and the dispatcher shared by every
// session.  The store is owned by the caller and must outlive the Server.
//
// Usage:
//   KeyValueStore store;
//   Server srv{cfg, store};
//   srv.run();   // blocks until SIGINT/SIGTERM or stop()
class Server {
public:
    // Resolves cfg.host, binds and listens.  Throws boost::system::system_error
    // if the address cannot be resolved or bound.
    Server(const ServerConfig& cfg, KeyValueStore& store);

    // Starts the thread pool, begins accepting connections, and installs signal
    // handlers for graceful shutdown (SIGINT / SIGTERM).
    // Blocks until the server stops.
    void run();

    // Closes the acceptor and stops the io_context, causing run() to return.
    // Safe to call from any thread; the work is posted to the io_context.
    void stop();

private:
    // Accept loop coroutine – runs until the acceptor is closed.
    boost::asio::awaitable<void> accept_loop();

    std::string host_;
    std::uint16_t port_;
    unsigned int threads_;
    std::size_t max_body_size_;
    KeyValueStore& store_;
    api::RouteDispatcher dispatcher_;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
};

} // namespace httpkv::network
