#pragma once

#include "api/outcome.hpp"

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace httpkv::api {

// Returned for any request that is not shaped like a JSON request (missing
// Content-Length, JSON not acceptable, non-JSON Content-Type).
inline constexpr std::string_view kNotJsonRequestMessage =
    "Request should accept JSON and its body should be a JSON object; "
    "a length header must also be specified.";

struct ValidationError {
    std::string message;
};

// Accepted: the decoded body, always a JSON object.
using ValidationResult = std::variant<nlohmann::ordered_json, ValidationError>;

// ── Individual checks (exposed for testing) ──────────────────────────────────

// True if the Accept header value lists application/json or */*.  An empty
// value means the client stated no preference and is treated as accepting.
[[nodiscard]] bool accepts_json(std::string_view accept);

// True if the Content-Type value contains the JSON media type, so that
// "application/json; charset=utf-8" qualifies.
[[nodiscard]] bool is_json_content_type(std::string_view content_type);

// Returns `raw` unchanged if it is valid UTF-8, otherwise an empty string.
[[nodiscard]] std::string decode_utf8_body(std::string_view raw);

// Parses `text` as JSON.  Parse errors, `null` and any non-object value
// all yield an empty object.
[[nodiscard]] nlohmann::ordered_json parse_json_object(std::string_view text);

// ── validate_json_request ────────────────────────────────────────────────────
//
// Decides whether `req` is a JSON request whose body object carries every
// field in `expected_params`.
//
// The request shape (length header, Accept, Content-Type) is a hard check
// that fails with kNotJsonRequestMessage.  Body parsing is soft: a body that
// does not decode to an object counts as `{}`, so the field check that
// follows reports which fields were expected and which were found.

[[nodiscard]] ValidationResult validate_json_request(
    const Request& req, const std::vector<std::string>& expected_params);

[[nodiscard]] ValidationResult validate_json_request(
    const Request& req, std::string_view expected_param);

} // namespace httpkv::api
