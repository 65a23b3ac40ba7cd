#include <gtest/gtest.h>
#include "smcp/router.hpp"
#include "smcp/error.hpp"
#include <stdexcept>

using namespace smcp;

namespace {

JsonRpcRequest make_request(RequestId id, const std::string& method,
                            std::optional<nlohmann::json> params = std::nullopt) {
    JsonRpcRequest req;
    req.id = std::move(id);
    req.method = method;
    req.params = std::move(params);
    return req;
}

JsonRpcNotification make_notification(const std::string& method) {
    JsonRpcNotification notif;
    notif.method = method;
    return notif;
}

} // namespace

TEST(Router, DispatchRequest) {
    Router router;
    router.on_request("ping", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json{{"pong", true}};
    });

    auto resp = router.dispatch(make_request(RequestId{int64_t{1}}, "ping"));
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(std::get<int64_t>(*resp->id), 1);
    ASSERT_TRUE(resp->result.has_value());
    EXPECT_EQ((*resp->result)["pong"], true);
    EXPECT_FALSE(resp->error.has_value());
}

TEST(Router, ParamsArePassedThrough) {
    Router router;
    nlohmann::json seen;
    router.on_request("echo", [&](const nlohmann::json& params) -> HandlerResult {
        seen = params;
        return nlohmann::json::object();
    });

    (void)router.dispatch(make_request(RequestId{int64_t{1}}, "echo", nlohmann::json{{"x", 1}}));
    EXPECT_EQ(seen, (nlohmann::json{{"x", 1}}));

    (void)router.dispatch(make_request(RequestId{int64_t{2}}, "echo"));
    EXPECT_TRUE(seen.is_null());
}

TEST(Router, MethodNotFound) {
    Router router;
    auto resp = router.dispatch(make_request(RequestId{std::string{"q"}}, "nonexistent"));
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(std::get<std::string>(*resp->id), "q");
    ASSERT_TRUE(resp->error.has_value());
    EXPECT_EQ(resp->error->code, error::MethodNotFound);
    EXPECT_EQ(resp->error->message, "Method not found: nonexistent");
}

TEST(Router, HandlerReturnsError) {
    Router router;
    router.on_request("fail", [](const nlohmann::json&) -> HandlerResult {
        return JsonRpcError{error::InvalidParams, "Invalid parameters", std::nullopt};
    });

    auto resp = router.dispatch(make_request(RequestId{int64_t{1}}, "fail"));
    ASSERT_TRUE(resp.has_value());
    ASSERT_TRUE(resp->error.has_value());
    EXPECT_EQ(resp->error->code, error::InvalidParams);
    EXPECT_EQ(resp->error->message, "Invalid parameters");
    EXPECT_FALSE(resp->result.has_value());
}

TEST(Router, ProtocolErrorKeepsItsCodeAndMessage) {
    Router router;
    router.on_request("strict", [](const nlohmann::json&) -> HandlerResult {
        throw McpProtocolError(error::InvalidParams, "Invalid parameters: bad cursor");
    });

    auto resp = router.dispatch(make_request(RequestId{int64_t{1}}, "strict"));
    ASSERT_TRUE(resp->error.has_value());
    EXPECT_EQ(resp->error->code, error::InvalidParams);
    EXPECT_EQ(resp->error->message, "Invalid parameters: bad cursor");
}

TEST(Router, HandlerExceptionDetailIsNotLeaked) {
    Router router;
    router.on_request("crash", [](const nlohmann::json&) -> HandlerResult {
        throw std::runtime_error("secret stack detail");
    });

    auto resp = router.dispatch(make_request(RequestId{int64_t{1}}, "crash"));
    ASSERT_TRUE(resp.has_value());
    ASSERT_TRUE(resp->error.has_value());
    EXPECT_EQ(resp->error->code, error::InternalError);
    EXPECT_EQ(resp->error->message.find("secret"), std::string::npos);
}

TEST(Router, NotificationToUnknownMethodIsSilent) {
    Router router;
    EXPECT_FALSE(router.dispatch(make_notification("unknown/method")).has_value());
}

TEST(Router, NotificationHandlerRuns) {
    Router router;
    int calls = 0;
    router.on_notification("initialized", [&](const nlohmann::json&) { ++calls; });

    EXPECT_FALSE(router.dispatch(make_notification("initialized")).has_value());
    EXPECT_EQ(calls, 1);
}

TEST(Router, SilentMethodIgnoresId) {
    Router router;
    int calls = 0;
    router.on_notification("cancelled", [&](const nlohmann::json&) { ++calls; });

    EXPECT_FALSE(router.dispatch(make_request(RequestId{int64_t{9}}, "cancelled")).has_value());
    EXPECT_EQ(calls, 1);
}

TEST(Router, NotificationToRequestMethodRunsButIsNotAnswered) {
    Router router;
    int calls = 0;
    router.on_request("tools/list", [&](const nlohmann::json&) -> HandlerResult {
        ++calls;
        return nlohmann::json{{"tools", nlohmann::json::array()}};
    });
    router.on_request("broken", [&](const nlohmann::json&) -> HandlerResult {
        ++calls;
        throw std::runtime_error("boom");
    });

    EXPECT_FALSE(router.dispatch(make_notification("tools/list")).has_value());
    EXPECT_FALSE(router.dispatch(make_notification("broken")).has_value());
    EXPECT_EQ(calls, 2);
}

TEST(Router, NotificationHandlerFailureIsContained) {
    Router router;
    router.on_notification("initialized", [](const nlohmann::json&) {
        throw std::runtime_error("boom");
    });
    EXPECT_NO_THROW({
        auto resp = router.dispatch(make_notification("initialized"));
        EXPECT_FALSE(resp.has_value());
    });
}

TEST(Router, LaterRegistrationReplacesEarlier) {
    Router router;
    router.on_request("m", [](const nlohmann::json&) -> HandlerResult { return nlohmann::json(1); });
    router.on_request("m", [](const nlohmann::json&) -> HandlerResult { return nlohmann::json(2); });

    auto resp = router.dispatch(make_request(RequestId{int64_t{1}}, "m"));
    EXPECT_EQ(*resp->result, 2);
}
