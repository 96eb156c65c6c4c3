#include "cli/command.hpp"
#include "api/query_string.hpp"

#include <boost/beast/http/field.hpp>

#include <utility>

namespace httpkv::cli {

namespace {

api::Request post_json(const std::string& host, std::string target,
                       const nlohmann::ordered_json& body) {
    api::Request req{api::http::verb::post, target, 11};
    req.set(api::http::field::host, host);
    req.set(api::http::field::content_type, std::string(api::kJsonMediaType));
    req.set(api::http::field::accept, std::string(api::kJsonMediaType));
    req.body() = body.dump();
    req.prepare_payload();
    return req;
}

} // namespace

std::vector<std::string> split_words(std::string_view line) {
    std::vector<std::string> words;
    std::size_t pos = 0;
    while (pos < line.size()) {
        const auto start = line.find_first_not_of(" \t\r", pos);
        if (start == std::string_view::npos) {
            break;
        }
        auto end = line.find_first_of(" \t\r", start);
        if (end == std::string_view::npos) {
            end = line.size();
        }
        words.emplace_back(line.substr(start, end - start));
        pos = end;
    }
    return words;
}

nlohmann::ordered_json value_from_arg(std::string_view arg) {
    auto parsed = nlohmann::ordered_json::parse(arg, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        return std::string(arg);
    }
    return parsed;
}

BuiltRequest build_request(const std::string& host, const std::vector<std::string>& words) {
    if (words.empty()) {
        return UsageError{"no command given (get, set, delete)"};
    }
    const auto& verb = words.front();

    if (verb == "get" || verb == "delete") {
        if (words.size() != 2) {
            return UsageError{verb + " takes exactly one key"};
        }
        const auto& key = words[1];
        if (verb == "delete") {
            return post_json(host, "/delete", nlohmann::ordered_json{{"key", key}});
        }
        api::Request req{api::http::verb::get, "/get?key=" + api::percent_encode(key), 11};
        req.set(api::http::field::host, host);
        req.set(api::http::field::accept, std::string(api::kJsonMediaType));
        return req;
    }

    if (verb == "set") {
        if (words.size() < 3) {
            return UsageError{"set requires a key and a value"};
        }
        std::string value = words[2];
        for (std::size_t i = 3; i < words.size(); ++i) {
            value += ' ';
            value += words[i];
        }
        return post_json(host, "/set",
                         nlohmann::ordered_json{{"key", words[1]},
                                                {"value", value_from_arg(value)}});
    }

    return UsageError{"unknown command '" + verb + "' (get, set, delete)"};
}

int exit_status_for(unsigned status) noexcept {
    return (status >= 200 && status < 300) ? 0 : 1;
}

} // namespace httpkv::cli
