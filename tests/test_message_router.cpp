//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_message_router.cpp
// Purpose: Tests for JsonRpcMessageRouter
//==========================================================================================================

#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <string>

#include "lsp/JSONRPCTypes.h"
#include "lsp/JsonRpcMessageRouter.h"

namespace lsp {

TEST(Router, ClassifyBasic) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    EXPECT_EQ(router->classify(ParseJSON(R"({"jsonrpc":"2.0","id":7,"method":"workspace/configuration"})")),
              IJsonRpcMessageRouter::MessageKind::Request);
    EXPECT_EQ(router->classify(ParseJSON(R"({"jsonrpc":"2.0","method":"window/logMessage","params":{}})")),
              IJsonRpcMessageRouter::MessageKind::Notification);
    EXPECT_EQ(router->classify(ParseJSON(R"({"jsonrpc":"2.0","id":1,"result":null})")),
              IJsonRpcMessageRouter::MessageKind::Response);
    EXPECT_EQ(router->classify(ParseJSON(R"({"jsonrpc":"2.0","id":1,"error":{"code":-1,"message":"x"}})")),
              IJsonRpcMessageRouter::MessageKind::Response);
}

TEST(Router, ClassifyIdWithoutResultIsResponse) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    EXPECT_EQ(router->classify(ParseJSON(R"({"jsonrpc":"2.0","id":4})")),
              IJsonRpcMessageRouter::MessageKind::Response);
    EXPECT_EQ(router->classify(ParseJSON(R"({"jsonrpc":"2.0"})")), IJsonRpcMessageRouter::MessageKind::Unknown);
    EXPECT_EQ(router->classify(ParseJSON("[1,2]")), IJsonRpcMessageRouter::MessageKind::Unknown);
}

TEST(Router, ResponseGoesToResolverWithNumericId) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    RouterHandlers handlers{};
    std::optional<int64_t> resolvedId;
    JSONValue resolvedMessage;
    auto out = router->route(ParseJSON(R"({"jsonrpc":"2.0","id":"42","result":{"ok":true}})"), handlers,
                             [&](int64_t id, JSONValue&& msg) { resolvedId = id; resolvedMessage = std::move(msg); });
    EXPECT_FALSE(out.has_value());
    ASSERT_TRUE(resolvedId.has_value());
    EXPECT_EQ(resolvedId.value(), 42);
    const JSONValue* result = FindMember(resolvedMessage, "result");
    ASSERT_NE(result, nullptr);
    EXPECT_TRUE(JSONEquals(*result, ParseJSON(R"({"ok":true})")));
}

TEST(Router, ResponseWithNonNumericIdIsDropped) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    RouterHandlers handlers{};
    bool resolved = false;
    router->route(ParseJSON(R"({"jsonrpc":"2.0","id":"abc","result":1})"), handlers,
                  [&](int64_t, JSONValue&&) { resolved = true; });
    EXPECT_FALSE(resolved);
}

TEST(Router, RequestHandlerReplyKeepsServerId) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    RouterHandlers handlers{};
    handlers.requestHandler = [](const JSONRPCRequest& req) {
        JSONRPCResponse resp;
        resp.result = JSONValue(req.method);
        return resp;
    };
    auto out = router->route(ParseJSON(R"({"jsonrpc":"2.0","id":"srv-1","method":"m"})"), handlers,
                             [](int64_t, JSONValue&&) {});
    ASSERT_TRUE(out.has_value());
    const JSONValue json = ParseJSON(out->Serialize());
    EXPECT_EQ(GetStringMember(json, "id").value_or(""), "srv-1");
    EXPECT_TRUE(JSONEquals(*FindMember(json, "result"), JSONValue("m")));
}

TEST(Router, RequestHandlerThrowsReturnsInternalError) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    RouterHandlers handlers{};
    handlers.requestHandler = [](const JSONRPCRequest&) -> JSONRPCResponse {
        throw std::runtime_error("handler threw");
    };
    auto out = router->route(ParseJSON(R"({"jsonrpc":"2.0","id":3,"method":"boom"})"), handlers,
                             [](int64_t, JSONValue&&) {});
    ASSERT_TRUE(out.has_value());
    ASSERT_TRUE(out->IsError());
    EXPECT_EQ(GetIntMember(*out->error, "code").value_or(0), JSONRPCErrorCodes::InternalError);
}

TEST(Router, RequestWithoutHandlerIsMethodNotFound) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    RouterHandlers handlers{};
    auto out = router->route(ParseJSON(R"({"jsonrpc":"2.0","id":4,"method":"x/y"})"), handlers,
                             [](int64_t, JSONValue&&) {});
    ASSERT_TRUE(out.has_value());
    ASSERT_TRUE(out->IsError());
    EXPECT_EQ(GetIntMember(*out->error, "code").value_or(0), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(GetStringMember(*out->error, "message").value_or(""), "Method not found: x/y");
}

TEST(Router, NotificationHandlerExceptionIsContained) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    RouterHandlers handlers{};
    int calls = 0;
    handlers.notificationHandler = [&](const JSONRPCNotification&) {
        ++calls;
        throw std::runtime_error("bad hook");
    };
    std::optional<JSONRPCResponse> out;
    EXPECT_NO_THROW(out = router->route(ParseJSON(R"({"jsonrpc":"2.0","method":"n"})"), handlers,
                                        [](int64_t, JSONValue&&) {}));
    EXPECT_FALSE(out.has_value());
    EXPECT_EQ(calls, 1);
}

TEST(Router, UnknownShapeCallsErrorHandler) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    RouterHandlers handlers{};
    std::string error;
    handlers.errorHandler = [&](const std::string& e) { error = e; };
    auto out = router->route(ParseJSON(R"({"jsonrpc":"2.0"})"), handlers, [](int64_t, JSONValue&&) {});
    EXPECT_FALSE(out.has_value());
    EXPECT_FALSE(error.empty());
}

} // namespace lsp
