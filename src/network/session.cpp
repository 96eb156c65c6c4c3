#include "network/session.hpp"
#include "api/response_builder.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <utility>

namespace httpkv::network {

namespace http = boost::beast::http;

namespace {
constexpr auto use_awaitable = boost::asio::as_tuple(boost::asio::use_awaitable);
} // namespace

Session::Session(boost::asio::ip::tcp::socket socket,
                 api::RouteDispatcher& dispatcher,
                 std::size_t max_body_size)
    : socket_(std::move(socket)), dispatcher_(dispatcher), max_body_size_(max_body_size) {}

boost::asio::awaitable<void> Session::run() {
    const auto remote = [&]() -> std::string {
        boost::system::error_code ec;
        const auto ep = socket_.remote_endpoint(ec);
        return ec ? "<unknown>" : ep.address().to_string() + ":" + std::to_string(ep.port());
    }();

    spdlog::debug("Session::run() - client connected from {}", remote);

    for (;;) {
        http::request_parser<http::string_body> parser;
        parser.body_limit(max_body_size_);

        auto [ec, n] = co_await http::async_read(socket_, buffer_, parser, use_awaitable);

        if (ec == http::error::end_of_stream) {
            break;
        }
        if (ec == http::error::body_limit) {
            spdlog::warn("Session {}: request body exceeds {} bytes", remote, max_body_size_);
            co_await reject(remote, http::status::payload_too_large, "Request body too large");
            break;
        }
        if (ec && ec.category() == http::make_error_code(http::error::bad_target).category()) {
            spdlog::debug("Session {}: malformed request: {}", remote, ec.message());
            co_await reject(remote, http::status::bad_request, "Malformed HTTP request");
            break;
        }
        if (ec) {
            if (ec != boost::asio::error::eof &&
                ec != boost::asio::error::connection_reset) {
                spdlog::warn("Session {}: read error: {}", remote, ec.message());
            }
            break;
        }

        const auto req = parser.release();
        const auto outcome = dispatcher_.handle(req);
        auto res = api::build_response(outcome, req.version(), req.keep_alive());

        spdlog::debug("Session {}: {} {} -> {}", remote,
                      api::to_string_view(req.method_string()),
                      api::to_string_view(req.target()),
                      res.result_int());

        auto [wec, _] = co_await http::async_write(socket_, res, use_awaitable);

        if (wec) {
            spdlog::warn("Session {}: write error: {}", remote, wec.message());
            break;
        }
        if (res.need_eof()) {
            break;
        }
    }

    boost::system::error_code sec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_send, sec);
    if (sec && sec != boost::asio::error::not_connected) {
        spdlog::debug("Session {}: shutdown error: {}", remote, sec.message());
    }

    spdlog::debug("Session::run() - client disconnected: {}", remote);
}

boost::asio::awaitable<void> Session::reject(const std::string& remote,
                                             http::status status,
                                             std::string_view message) {
    auto res = api::build_response(
        api::error_outcome(status, std::string(message)), 11, /*keep_alive=*/false);

    auto [wec, _] = co_await http::async_write(socket_, res, use_awaitable);
    if (wec) {
        spdlog::debug("Session {}: error response not delivered: {}", remote, wec.message());
    }
}

} // namespace httpkv::network
