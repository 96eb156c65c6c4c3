#pragma once

#include "api/route_dispatcher.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/status.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace httpkv::network {

// Handles one HTTP connection for its lifetime.
//
// Each Session is co_spawned from Server::accept_loop() and serves requests
// one after another (HTTP/1.1 keep-alive) until the client closes, asks for
// close, or an I/O or framing error occurs.  Requests are read whole, with
// the body bounded by `max_body_size`, before being handed to the
// dispatcher.
class Session {
public:
    Session(boost::asio::ip::tcp::socket socket,
            api::RouteDispatcher& dispatcher,
            std::size_t max_body_size);

    // Main coroutine.  Returns when the connection closes.
    boost::asio::awaitable<void> run();

private:
    // Sends a JSON error for a request that could not be read, then the
    // caller closes the connection.
    boost::asio::awaitable<void> reject(const std::string& remote,
                                        boost::beast::http::status status,
                                        std::string_view message);

    boost::asio::ip::tcp::socket socket_;
    boost::beast::flat_buffer buffer_;
    api::RouteDispatcher& dispatcher_;
    std::size_t max_body_size_;
};

} // namespace httpkv::network
