#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <boost/beast/core/string.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>

#include <nlohmann/json.hpp>

namespace httpkv::api {

namespace http = boost::beast::http;

// Media type of every response body and of accepted request bodies.
inline constexpr std::string_view kJsonMediaType = "application/json";

// Requests arrive fully buffered: the transport has already read the
// Content-Length bytes of the body before dispatch.
using Request  = http::request<http::string_body>;
using Response = http::response<http::string_body>;

// Result of one operation, consumed by build_response().
struct OperationOutcome {
    http::status   status = http::status::ok;
    nlohmann::ordered_json body   = nlohmann::ordered_json::object();
};

// Beast's string_view is not std::string_view on every Boost release.
[[nodiscard]] inline std::string_view to_string_view(boost::beast::string_view sv) noexcept {
    return {sv.data(), sv.size()};
}

// Convenience for the `{"error": message}` shape every failure uses.
[[nodiscard]] inline OperationOutcome error_outcome(http::status status, std::string message) {
    return OperationOutcome{status, nlohmann::ordered_json{{"error", std::move(message)}}};
}

} // namespace httpkv::api
