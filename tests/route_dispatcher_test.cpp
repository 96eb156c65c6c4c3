#include "api/route_dispatcher.hpp"
#include "api/request_validator.hpp"
#include "api/response_builder.hpp"

#include <boost/beast/http/field.hpp>

#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace httpkv::api {

using json = nlohmann::ordered_json;

// ── Helpers ───────────────────────────────────────────────────────────────────

static Request make_get(const std::string& target) {
    return Request{http::verb::get, target, 11};
}

static Request make_post(const std::string& target, std::string body,
                         std::string content_type = "application/json") {
    Request req{http::verb::post, target, 11};
    req.set(http::field::content_type, content_type);
    req.body() = std::move(body);
    req.prepare_payload();
    return req;
}

// ── classify_route ────────────────────────────────────────────────────────────

TEST(ClassifyRoute, MatchesByPrefix) {
    EXPECT_EQ(classify_route("/get"), Route::Get);
    EXPECT_EQ(classify_route("/get/"), Route::Get);
    EXPECT_EQ(classify_route("/getter"), Route::Get);
    EXPECT_EQ(classify_route("/set"), Route::Set);
    EXPECT_EQ(classify_route("/set/extra/segments"), Route::Set);
    EXPECT_EQ(classify_route("/delete"), Route::Delete);
}

TEST(ClassifyRoute, UnknownPaths) {
    EXPECT_EQ(classify_route("/"), Route::Unknown);
    EXPECT_EQ(classify_route(""), Route::Unknown);
    EXPECT_EQ(classify_route("/nonexistent"), Route::Unknown);
    EXPECT_EQ(classify_route("/ge"), Route::Unknown);
    EXPECT_EQ(classify_route("get"), Route::Unknown);
    EXPECT_EQ(classify_route("/del"), Route::Unknown);
}

// ── Fixture ───────────────────────────────────────────────────────────────────

class RouteDispatcherTest : public ::testing::Test {
protected:
    OperationOutcome get(const std::string& target) {
        return dispatcher_.handle(make_get(target));
    }
    OperationOutcome post(const std::string& target, const std::string& body) {
        return dispatcher_.handle(make_post(target, body));
    }

    KeyValueStore store_;
    RouteDispatcher dispatcher_{store_};
};

// ── GET /get ──────────────────────────────────────────────────────────────────

TEST_F(RouteDispatcherTest, GetExistingKey) {
    store_.set("a", 1);
    auto out = get("/get?key=a");
    EXPECT_EQ(out.status, http::status::ok);
    EXPECT_EQ(out.body, (json{{"key", "a"}, {"value", 1}}));
}

TEST_F(RouteDispatcherTest, GetMissingKeyParameter) {
    auto out = get("/get");
    EXPECT_EQ(out.status, http::status::bad_request);
    EXPECT_EQ(out.body, (json{{"error", "Missing key parameter"}}));
}

TEST_F(RouteDispatcherTest, GetBlankKeyParameterIsMissing) {
    EXPECT_EQ(get("/get?key=").status, http::status::bad_request);
}

TEST_F(RouteDispatcherTest, GetUnknownKey) {
    auto out = get("/get?key=ghost");
    EXPECT_EQ(out.status, http::status::not_found);
    EXPECT_EQ(out.body, (json{{"error", "Key `ghost` does not exist in the database"}}));
}

TEST_F(RouteDispatcherTest, GetDecodesKey) {
    store_.set("hello world", "hi");
    auto out = get("/get?key=hello%20world");
    EXPECT_EQ(out.status, http::status::ok);
    EXPECT_EQ(out.body["value"], json("hi"));
}

TEST_F(RouteDispatcherTest, GetWithTrailingSegmentStillRoutes) {
    store_.set("a", true);
    EXPECT_EQ(get("/get/?key=a").status, http::status::ok);
}

TEST_F(RouteDispatcherTest, GetIgnoresBody) {
    store_.set("a", 1);
    auto req = make_get("/get?key=a");
    req.body() = "garbage";
    EXPECT_EQ(dispatcher_.handle(req).status, http::status::ok);
}

// ── Wrong verbs and unknown paths ─────────────────────────────────────────────

TEST_F(RouteDispatcherTest, GetOnSetIsMethodNotAllowed) {
    auto out = get("/set");
    EXPECT_EQ(out.status, http::status::method_not_allowed);
    EXPECT_EQ(out.body, (json{{"error", "Method Not Allowed. Using GET instead of POST"}}));
}

TEST_F(RouteDispatcherTest, GetOnDeleteIsMethodNotAllowed) {
    EXPECT_EQ(get("/delete?key=a").status, http::status::method_not_allowed);
}

TEST_F(RouteDispatcherTest, PostOnGetIsMethodNotAllowed) {
    auto out = post("/get", R"({"key":"a"})");
    EXPECT_EQ(out.status, http::status::method_not_allowed);
    EXPECT_EQ(out.body, (json{{"error", "Method Not Allowed. Using POST instead of GET"}}));
}

TEST_F(RouteDispatcherTest, GetUnknownPath) {
    auto out = get("/nonexistent");
    EXPECT_EQ(out.status, http::status::not_found);
    EXPECT_EQ(out.body, (json{{"error", "invalid path `/nonexistent`. Unavailable resource"}}));
}

TEST_F(RouteDispatcherTest, GetUnknownPathReportsFullTarget) {
    auto out = get("/foo?x=1");
    EXPECT_EQ(out.status, http::status::not_found);
    EXPECT_EQ(out.body, (json{{"error", "invalid path `/foo?x=1`. Unavailable resource"}}));
}

TEST_F(RouteDispatcherTest, PostUnknownPath) {
    EXPECT_EQ(post("/", R"({"key":"a"})").status, http::status::not_found);
}

TEST_F(RouteDispatcherTest, PostUnknownPathReportsFullTarget) {
    auto out = post("/nothing?verbose=1", R"({"key":"a"})");
    EXPECT_EQ(out.status, http::status::not_found);
    EXPECT_EQ(out.body,
              (json{{"error", "invalid path `/nothing?verbose=1`. Unavailable resource"}}));
}

TEST_F(RouteDispatcherTest, OtherVerbsNotImplemented) {
    Request req{http::verb::put, "/set", 11};
    auto out = dispatcher_.handle(req);
    EXPECT_EQ(out.status, http::status::not_implemented);
    EXPECT_EQ(out.body, (json{{"error", "Unsupported method `PUT`"}}));
}

// ── POST /set ─────────────────────────────────────────────────────────────────

TEST_F(RouteDispatcherTest, SetStoresAndEchoes) {
    auto out = post("/set", R"({"key":"a","value":1})");
    EXPECT_EQ(out.status, http::status::ok);
    EXPECT_EQ(out.body, (json{{"key", "a"}, {"value", 1}}));
    EXPECT_EQ(*store_.get("a"), json(1));
}

TEST_F(RouteDispatcherTest, SetThenGetRoundTrip) {
    ASSERT_EQ(post("/set", R"({"key":"a","value":{"x":[1,2,null]}})").status, http::status::ok);
    auto out = get("/get?key=a");
    EXPECT_EQ(out.status, http::status::ok);
    EXPECT_EQ(out.body, json::parse(R"({"key":"a","value":{"x":[1,2,null]}})"));
}

TEST_F(RouteDispatcherTest, SetThenGetKeepsObjectKeyOrder) {
    ASSERT_EQ(post("/set", R"({"key":"k","value":{"zeta":1,"alpha":2}})").status,
              http::status::ok);
    auto out = get("/get?key=k");
    EXPECT_EQ(out.status, http::status::ok);
    EXPECT_EQ(serialize_body(out.body), R"({"key":"k","value":{"zeta":1,"alpha":2}})");
}

TEST_F(RouteDispatcherTest, SetOverwriteKeepsOnlyLatest) {
    post("/set", R"({"key":"a","value":"old"})");
    post("/set", R"({"key":"a","value":"new"})");
    EXPECT_EQ(get("/get?key=a").body["value"], json("new"));
    EXPECT_EQ(store_.size(), 1u);
}

TEST_F(RouteDispatcherTest, SetNullValueIsStored) {
    EXPECT_EQ(post("/set", R"({"key":"a","value":null})").status, http::status::ok);
    auto out = get("/get?key=a");
    EXPECT_EQ(out.status, http::status::ok);
    EXPECT_TRUE(out.body["value"].is_null());
}

TEST_F(RouteDispatcherTest, SetMissingValueRejected) {
    auto out = post("/set", R"({"key":"a"})");
    EXPECT_EQ(out.status, http::status::bad_request);
    const auto msg = out.body["error"].get<std::string>();
    EXPECT_NE(msg.find("\"value\""), std::string::npos);
    EXPECT_EQ(msg, R"(Request is missing parameters. Expected: ["key","value"], Found: ["key"])");
    EXPECT_EQ(store_.size(), 0u);
}

TEST_F(RouteDispatcherTest, SetTextPlainRejectedRegardlessOfBody) {
    auto out = dispatcher_.handle(
        make_post("/set", R"({"key":"a","value":1})", "text/plain"));
    EXPECT_EQ(out.status, http::status::bad_request);
    EXPECT_EQ(out.body["error"].get<std::string>(), kNotJsonRequestMessage);
    EXPECT_EQ(store_.size(), 0u);
}

TEST_F(RouteDispatcherTest, SetWithoutContentLengthRejected) {
    Request req{http::verb::post, "/set", 11};
    req.set(http::field::content_type, "application/json");
    req.body() = R"({"key":"a","value":1})";
    EXPECT_EQ(dispatcher_.handle(req).status, http::status::bad_request);
}

TEST_F(RouteDispatcherTest, SetNonStringKeyRejected) {
    auto out = post("/set", R"({"key":7,"value":1})");
    EXPECT_EQ(out.status, http::status::bad_request);
    EXPECT_EQ(out.body, (json{{"error", "Parameter `key` must be a string"}}));
    EXPECT_EQ(store_.size(), 0u);
}

TEST_F(RouteDispatcherTest, SetEchoDropsExtraFields) {
    auto out = post("/set", R"({"key":"a","value":1,"ttl":5})");
    EXPECT_EQ(out.body, (json{{"key", "a"}, {"value", 1}}));
}

// ── POST /delete ──────────────────────────────────────────────────────────────

TEST_F(RouteDispatcherTest, DeleteExistingKeyReturnsValue) {
    store_.set("a", "v");
    auto out = post("/delete", R"({"key":"a"})");
    EXPECT_EQ(out.status, http::status::ok);
    EXPECT_EQ(out.body, (json{{"key", "a"}, {"value", "v"}}));
    EXPECT_FALSE(store_.get("a").has_value());
}

TEST_F(RouteDispatcherTest, DeleteMissingKeyIsIdempotentSuccess) {
    auto out = post("/delete", R"({"key":"ghost"})");
    EXPECT_EQ(out.status, http::status::ok);
    EXPECT_EQ(out.body, (json{{"message", "Key `ghost` does not exist"}}));
}

TEST_F(RouteDispatcherTest, DeleteTwice) {
    store_.set("a", 1);
    auto first  = post("/delete", R"({"key":"a"})");
    auto second = post("/delete", R"({"key":"a"})");
    EXPECT_EQ(first.status, http::status::ok);
    EXPECT_TRUE(first.body.contains("value"));
    EXPECT_EQ(second.status, http::status::ok);
    EXPECT_TRUE(second.body.contains("message"));
}

TEST_F(RouteDispatcherTest, DeleteMissingKeyFieldRejected) {
    auto out = post("/delete", R"({"name":"a"})");
    EXPECT_EQ(out.status, http::status::bad_request);
    EXPECT_EQ(out.body["error"].get<std::string>(),
              R"(Request is missing parameters. Expected: ["key"], Found: ["name"])");
}

TEST_F(RouteDispatcherTest, DeleteThenGetIsNotFound) {
    post("/set", R"({"key":"a","value":1})");
    post("/delete", R"({"key":"a"})");
    EXPECT_EQ(get("/get?key=a").status, http::status::not_found);
}

// ── Concurrency ───────────────────────────────────────────────────────────────

TEST_F(RouteDispatcherTest, ConcurrentSetsOnOneKeyLeaveOneSubmittedValue) {
    constexpr int kThreads = 16;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t] {
            auto out = post("/set", json{{"key", "k"}, {"value", t}}.dump());
            EXPECT_EQ(out.status, http::status::ok);
        });
    }
    for (auto& th : threads) th.join();

    auto out = get("/get?key=k");
    ASSERT_EQ(out.status, http::status::ok);
    const int v = out.body["value"].get<int>();
    EXPECT_GE(v, 0);
    EXPECT_LT(v, kThreads);
}

// ── Internal faults ───────────────────────────────────────────────────────────

// Fails every request the way an unexpected bug would.
class FaultyDispatcher : public RouteDispatcher {
public:
    using RouteDispatcher::RouteDispatcher;

    OperationOutcome dispatch(const Request&) override {
        throw std::logic_error("secret detail: table corrupted");
    }
};

TEST(RouteDispatcherFault, UnhandledExceptionBecomesGeneric500) {
    KeyValueStore store;
    FaultyDispatcher dispatcher{store};
    auto out = dispatcher.handle(make_get("/get?key=a"));
    EXPECT_EQ(out.status, http::status::internal_server_error);
    EXPECT_EQ(out.body, (json{{"error", "Internal Server Error"}}));
    EXPECT_EQ(out.body.dump().find("secret"), std::string::npos);
}

} // namespace httpkv::api
