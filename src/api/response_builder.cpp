#include "api/response_builder.hpp"

#include <boost/beast/http/field.hpp>

#include <string>

namespace httpkv::api {

std::string serialize_body(const nlohmann::ordered_json& body) {
    return body.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

Response build_response(const OperationOutcome& outcome, unsigned version, bool keep_alive) {
    Response res{outcome.status, version};
    res.set(http::field::server, kServerName);
    res.set(http::field::content_type, std::string(kJsonMediaType));
    res.keep_alive(keep_alive);
    res.body() = serialize_body(outcome.body);
    res.prepare_payload();
    return res;
}

} // namespace httpkv::api
