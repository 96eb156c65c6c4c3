#pragma once

#include "api/outcome.hpp"
#include "storage/key_value_store.hpp"

#include <string_view>

namespace httpkv::api {

// The three resources the server exposes.  Selection is by path prefix, so
// "/get/", "/getter" and "/get?key=a" all select Route::Get.
enum class Route {
    Get,
    Set,
    Delete,
    Unknown,
};

[[nodiscard]] Route classify_route(std::string_view path) noexcept;

// Maps a request to an operation on the shared store and returns the
// outcome to send back.
//
//   GET  /get?key=k       -> 200 {key, value} | 400 | 404
//   POST /set {key,value} -> 200 echo | 400
//   POST /delete {key}    -> 200 {key, value} | 200 {message} | 400
//   wrong verb on a known resource -> 405, unknown path -> 404,
//   verbs other than GET/POST -> 501.
//
// Every outcome of normal operation is an explicit return value; the only
// exception channel is the one handle() closes off with a 500.
class RouteDispatcher {
public:
    explicit RouteDispatcher(KeyValueStore& store);
    virtual ~RouteDispatcher() = default;

    RouteDispatcher(const RouteDispatcher&)            = delete;
    RouteDispatcher& operator=(const RouteDispatcher&) = delete;

    // Request boundary: calls dispatch() and turns any std::exception into
    // 500 {"error": "Internal Server Error"}.  The exception text is logged
    // and never reaches the client.
    [[nodiscard]] OperationOutcome handle(const Request& req);

    // Routing proper.  May throw only on unexpected faults.
    [[nodiscard]] virtual OperationOutcome dispatch(const Request& req);

private:
    [[nodiscard]] OperationOutcome do_get(const Request& req, std::string_view path,
                                          std::string_view query);
    [[nodiscard]] OperationOutcome do_post(const Request& req, std::string_view path);

    [[nodiscard]] OperationOutcome get_key(std::string_view query);
    [[nodiscard]] OperationOutcome set_key(const Request& req);
    [[nodiscard]] OperationOutcome delete_key(const Request& req);

    KeyValueStore& store_;
};

} // namespace httpkv::api
