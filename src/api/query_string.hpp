#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace httpkv::api {

// A request target split at the first '?'.  A '#' fragment, if a client
// sends one, is dropped.
struct Target {
    std::string_view path;
    std::string_view query;
};

[[nodiscard]] Target split_target(std::string_view target) noexcept;

// Decode %XX escapes.  Malformed escapes are kept verbatim.  When
// `plus_as_space` is set, '+' decodes to ' ' (form encoding).
[[nodiscard]] std::string percent_decode(std::string_view in, bool plus_as_space = false);

// Encode everything except RFC 3986 unreserved characters.
[[nodiscard]] std::string percent_encode(std::string_view in);

// Returns the decoded value of the first `name=value` pair in `query` whose
// value is non-empty.  Pairs without '=' and pairs with an empty value are
// ignored, so "?key=" behaves like a missing parameter.
[[nodiscard]] std::optional<std::string> query_param(std::string_view query,
                                                     std::string_view name);

} // namespace httpkv::api
