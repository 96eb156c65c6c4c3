#pragma once

#include "api/outcome.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace httpkv::api {

inline constexpr const char* kServerName = "httpkv";

// Compact JSON text for a response body.  Strings holding invalid UTF-8
// (possible for keys decoded from a URL) are written with U+FFFD instead of
// throwing.
[[nodiscard]] std::string serialize_body(const nlohmann::ordered_json& body);

// Turns an outcome into a complete response: status line, Server,
// Content-Type: application/json, Content-Length and the body.
[[nodiscard]] Response build_response(const OperationOutcome& outcome,
                                      unsigned version,
                                      bool keep_alive);

} // namespace httpkv::api
