#include "api/route_dispatcher.hpp"
#include "api/query_string.hpp"
#include "api/request_validator.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <format>
#include <string>
#include <variant>
#include <vector>

namespace httpkv::api {

namespace {

constexpr std::string_view kInternalError = "Internal Server Error";

bool starts_with(std::string_view s, std::string_view prefix) noexcept {
    return s.substr(0, prefix.size()) == prefix;
}

// Reports the target as the client sent it, query string included.
OperationOutcome unavailable(const Request& req) {
    return error_outcome(http::status::not_found,
                         std::format("invalid path `{}`. Unavailable resource",
                                     to_string_view(req.target())));
}

// Keys are strings in the store; a JSON number or object in the `key` field
// is a client error rather than something to coerce.
const nlohmann::ordered_json* string_key(const nlohmann::ordered_json& payload) {
    const auto& key = payload.at("key");
    return key.is_string() ? &key : nullptr;
}

OperationOutcome key_not_string() {
    return error_outcome(http::status::bad_request, "Parameter `key` must be a string");
}

} // namespace

Route classify_route(std::string_view path) noexcept {
    if (starts_with(path, "/get"))    return Route::Get;
    if (starts_with(path, "/set"))    return Route::Set;
    if (starts_with(path, "/delete")) return Route::Delete;
    return Route::Unknown;
}

RouteDispatcher::RouteDispatcher(KeyValueStore& store) : store_(store) {}

OperationOutcome RouteDispatcher::handle(const Request& req) {
    try {
        return dispatch(req);
    } catch (const std::exception& e) {
        spdlog::error("Unhandled error for {} {}: {}",
                      to_string_view(req.method_string()),
                      to_string_view(req.target()), e.what());
        return error_outcome(http::status::internal_server_error, std::string(kInternalError));
    }
}

OperationOutcome RouteDispatcher::dispatch(const Request& req) {
    const auto [path, query] = split_target(to_string_view(req.target()));

    switch (req.method()) {
    case http::verb::get:
        return do_get(req, path, query);
    case http::verb::post:
        return do_post(req, path);
    default:
        return error_outcome(
            http::status::not_implemented,
            std::format("Unsupported method `{}`", to_string_view(req.method_string())));
    }
}

OperationOutcome RouteDispatcher::do_get(const Request& req, std::string_view path,
                                         std::string_view query) {
    switch (classify_route(path)) {
    case Route::Get:
        return get_key(query);
    case Route::Set:
    case Route::Delete:
        return error_outcome(http::status::method_not_allowed,
                             "Method Not Allowed. Using GET instead of POST");
    case Route::Unknown:
        break;
    }
    return unavailable(req);
}

OperationOutcome RouteDispatcher::do_post(const Request& req, std::string_view path) {
    switch (classify_route(path)) {
    case Route::Set:
        return set_key(req);
    case Route::Delete:
        return delete_key(req);
    case Route::Get:
        return error_outcome(http::status::method_not_allowed,
                             "Method Not Allowed. Using POST instead of GET");
    case Route::Unknown:
        break;
    }
    return unavailable(req);
}

OperationOutcome RouteDispatcher::get_key(std::string_view query) {
    const auto key = query_param(query, "key");
    if (!key) {
        return error_outcome(http::status::bad_request, "Missing key parameter");
    }

    auto value = store_.get(*key);
    if (!value) {
        spdlog::debug("GET miss for key {}", *key);
        return error_outcome(http::status::not_found,
                             std::format("Key `{}` does not exist in the database", *key));
    }
    return {http::status::ok, nlohmann::ordered_json{{"key", *key}, {"value", std::move(*value)}}};
}

OperationOutcome RouteDispatcher::set_key(const Request& req) {
    auto result = validate_json_request(req, std::vector<std::string>{"key", "value"});
    if (auto* err = std::get_if<ValidationError>(&result)) {
        return error_outcome(http::status::bad_request, std::move(err->message));
    }
    const auto& payload = std::get<nlohmann::ordered_json>(result);
    const auto* key = string_key(payload);
    if (!key) {
        return key_not_string();
    }

    const auto& value = payload.at("value");
    auto previous = store_.set(key->get<std::string>(), value);
    if (previous) {
        spdlog::info("Overriding existing key {} --> {} with new value: {}",
                     key->get_ref<const std::string&>(), previous->dump(), value.dump());
    } else {
        spdlog::info("Inserting new key-value pair: {} --> {}",
                     key->get_ref<const std::string&>(), value.dump());
    }

    // Echo exactly what was stored; extra fields in the request are dropped.
    return {http::status::ok, nlohmann::ordered_json{{"key", *key}, {"value", value}}};
}

OperationOutcome RouteDispatcher::delete_key(const Request& req) {
    auto result = validate_json_request(req, "key");
    if (auto* err = std::get_if<ValidationError>(&result)) {
        return error_outcome(http::status::bad_request, std::move(err->message));
    }
    const auto& payload = std::get<nlohmann::ordered_json>(result);
    const auto* key = string_key(payload);
    if (!key) {
        return key_not_string();
    }

    const auto& name = key->get_ref<const std::string&>();
    auto removed = store_.del(name);
    if (!removed) {
        spdlog::info("Tried to delete non-existent key: {}", name);
        return {http::status::ok,
                nlohmann::ordered_json{{"message", std::format("Key `{}` does not exist", name)}}};
    }

    spdlog::info("Deleted key-value pair: {} --> {}", name, removed->dump());
    return {http::status::ok, nlohmann::ordered_json{{"key", name}, {"value", std::move(*removed)}}};
}

} // namespace httpkv::api
