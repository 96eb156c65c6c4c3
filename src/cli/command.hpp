#pragma once

#include "api/outcome.hpp"

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace httpkv::cli {

// A command line that cannot be turned into a request.
struct UsageError {
    std::string message;
};

using BuiltRequest = std::variant<api::Request, UsageError>;

// Split an interactive line on runs of spaces and tabs.
[[nodiscard]] std::vector<std::string> split_words(std::string_view line);

// The value argument of `set` is JSON when it parses as JSON and a plain
// string otherwise, so both `set n 42` and `set greeting hello` work.
[[nodiscard]] nlohmann::ordered_json value_from_arg(std::string_view arg);

// Builds the HTTP request for one command:
//   get <key> | set <key> <value...> | delete <key>
// Every word after the key of `set` forms the value, joined by single spaces.
[[nodiscard]] BuiltRequest build_request(const std::string& host,
                                         const std::vector<std::string>& words);

// 0 for a 2xx status, 1 for anything else.
[[nodiscard]] int exit_status_for(unsigned status) noexcept;

} // namespace httpkv::cli
