//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json.cpp
// Purpose: Tests for JSONValue parsing, serialization and JSON-RPC message shapes
//==========================================================================================================

#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>
#include <string>

#include "lsp/JSONRPCTypes.h"

using namespace lsp;

TEST(JSONParse, ScalarsAndContainers) {
    JSONValue v = ParseJSON(R"({"a":1,"b":[true,null,"x"],"c":{"d":-2.5}})");
    ASSERT_TRUE(v.isObject());
    EXPECT_EQ(GetIntMember(v, "a").value_or(0), 1);
    const JSONValue* b = FindMember(v, "b");
    ASSERT_NE(b, nullptr);
    ASSERT_TRUE(b->isArray());
    const auto& arr = std::get<JSONValue::Array>(b->value);
    ASSERT_EQ(arr.size(), 3u);
    EXPECT_TRUE(std::get<bool>(arr[0]->value));
    EXPECT_TRUE(arr[1]->isNull());
    EXPECT_EQ(std::get<std::string>(arr[2]->value), "x");
    const JSONValue* c = FindMember(v, "c");
    ASSERT_NE(c, nullptr);
    EXPECT_DOUBLE_EQ(std::get<double>(FindMember(*c, "d")->value), -2.5);
}

TEST(JSONParse, RejectsTrailingData) {
    EXPECT_THROW(ParseJSON("{} {}"), std::runtime_error);
    EXPECT_THROW(ParseJSON("[1,]"), std::runtime_error);
    EXPECT_THROW(ParseJSON(""), std::runtime_error);
    EXPECT_NO_THROW(ParseJSON("  {}\r\n"));
}

TEST(JSONParse, SurrogatePairEscape) {
    JSONValue v = ParseJSON("\"\\uD83D\\uDE00\"");
    EXPECT_EQ(std::get<std::string>(v.value), "\xF0\x9F\x98\x80");
}

TEST(JSONParse, DepthIsLimited) {
    std::string deep(600, '[');
    deep += std::string(600, ']');
    EXPECT_THROW(ParseJSON(deep), std::runtime_error);
}

TEST(JSONParse, HugeIntegerDegradesToDouble) {
    JSONValue v = ParseJSON("123456789012345678901234567890");
    EXPECT_TRUE(std::holds_alternative<double>(v.value));
}

TEST(JSONSerialize, EscapesAndDoubles) {
    EXPECT_EQ(SerializeJSON(JSONValue("a\"b\\c\n")), R"("a\"b\\c\n")");
    EXPECT_EQ(SerializeJSON(JSONValue(2.0)), "2.0");
    EXPECT_EQ(SerializeJSON(JSONValue(0.5)), "0.5");
    EXPECT_EQ(SerializeJSON(JSONValue(std::numeric_limits<double>::infinity())), "null");
    EXPECT_EQ(SerializeJSON(MakeObject({{"k\"", JSONValue(static_cast<int64_t>(1))}})), R"({"k\"":1})");
}

TEST(JSONHelpers, FindMemberDistinguishesNullFromAbsent) {
    JSONValue v = ParseJSON(R"({"result":null})");
    const JSONValue* r = FindMember(v, "result");
    ASSERT_NE(r, nullptr);
    EXPECT_TRUE(r->isNull());
    EXPECT_EQ(FindMember(v, "error"), nullptr);
    EXPECT_EQ(FindMember(JSONValue("not an object"), "x"), nullptr);
}

TEST(JSONHelpers, IntMemberAcceptsIntegralDoubles) {
    JSONValue v = ParseJSON(R"({"a":3.0,"b":3.5,"c":"3"})");
    EXPECT_EQ(GetIntMember(v, "a").value_or(-1), 3);
    EXPECT_FALSE(GetIntMember(v, "b").has_value());
    EXPECT_FALSE(GetIntMember(v, "c").has_value());
}

TEST(JSONHelpers, NumericIds) {
    EXPECT_EQ(ParseNumericId(JSONValue(static_cast<int64_t>(9))).value_or(0), 9);
    EXPECT_EQ(ParseNumericId(JSONValue("17")).value_or(0), 17);
    EXPECT_FALSE(ParseNumericId(JSONValue("17a")).has_value());
    EXPECT_FALSE(ParseNumericId(JSONValue(nullptr)).has_value());
}

TEST(JSONHelpers, EqualsIgnoresKeyOrder) {
    EXPECT_TRUE(JSONEquals(ParseJSON(R"({"a":1,"b":[1,2]})"), ParseJSON(R"({"b":[1,2],"a":1})")));
    EXPECT_FALSE(JSONEquals(ParseJSON("[1,2]"), ParseJSON("[2,1]")));
}

TEST(JSONRPC, RequestShape) {
    JSONRPCRequest req(static_cast<int64_t>(5), "textDocument/hover", MakeObject({{"x", JSONValue(true)}}));
    JSONValue json = ParseJSON(req.Serialize());
    EXPECT_EQ(GetStringMember(json, "jsonrpc").value_or(""), "2.0");
    EXPECT_EQ(GetIntMember(json, "id").value_or(0), 5);
    EXPECT_EQ(GetStringMember(json, "method").value_or(""), "textDocument/hover");
    ASSERT_NE(FindMember(json, "params"), nullptr);
}

TEST(JSONRPC, NotificationWithoutParamsOmitsMember) {
    JSONRPCNotification note("exit");
    JSONValue json = ParseJSON(note.Serialize());
    EXPECT_EQ(FindMember(json, "params"), nullptr);
    EXPECT_EQ(FindMember(json, "id"), nullptr);
}

TEST(JSONRPC, ResponseRequiresResultOrError) {
    JSONRPCResponse resp;
    EXPECT_FALSE(resp.Deserialize(R"({"jsonrpc":"2.0","id":1})"));
    EXPECT_TRUE(resp.Deserialize(R"({"jsonrpc":"2.0","id":1,"result":null})"));
    EXPECT_FALSE(resp.IsError());
    EXPECT_TRUE(resp.Deserialize(R"({"jsonrpc":"2.0","id":"a","error":{"code":-32601,"message":"m"}})"));
    EXPECT_TRUE(resp.IsError());
}

TEST(JSONRPC, ErrorResponseCarriesCodeAndMessage) {
    auto resp = CreateErrorResponse(JSONRPCId{static_cast<int64_t>(3)}, JSONRPCErrorCodes::MethodNotFound, "nope");
    JSONValue json = ParseJSON(resp->Serialize());
    const JSONValue* err = FindMember(json, "error");
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(GetIntMember(*err, "code").value_or(0), -32601);
    EXPECT_EQ(GetStringMember(*err, "message").value_or(""), "nope");
    EXPECT_EQ(FindMember(json, "result"), nullptr);
}
