//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for typed error structures and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>

#include "lsp/JSONRPCTypes.h"
#include "lsp/errors/Errors.h"

using namespace lsp;

TEST(Errors, KindMapping) {
    using errors::JsonRpcErrorKind;
    EXPECT_EQ(errors::jsonRpcKindFromCode(JSONRPCErrorCodes::ParseError), JsonRpcErrorKind::Parse);
    EXPECT_EQ(errors::jsonRpcKindFromCode(JSONRPCErrorCodes::MethodNotFound), JsonRpcErrorKind::MethodNotFound);
    EXPECT_EQ(errors::jsonRpcKindFromCode(JSONRPCErrorCodes::InternalError), JsonRpcErrorKind::Internal);
    EXPECT_EQ(errors::jsonRpcKindFromCode(-32002), JsonRpcErrorKind::ServerNotInitialized);
    EXPECT_EQ(errors::jsonRpcKindFromCode(-32800), JsonRpcErrorKind::RequestCancelled);
    EXPECT_EQ(errors::jsonRpcKindFromCode(-32801), JsonRpcErrorKind::ContentModified);
    EXPECT_EQ(errors::jsonRpcKindFromCode(-32802), JsonRpcErrorKind::ServerCancelled);
    EXPECT_EQ(errors::jsonRpcKindFromCode(-32803), JsonRpcErrorKind::RequestFailed);
    EXPECT_EQ(errors::jsonRpcKindFromCode(12345), JsonRpcErrorKind::Unknown);
}

TEST(Errors, ServerErrorBecomesProtocolError) {
    JSONValue errVal = ParseJSON(R"({"code":-32801,"message":"content modified","data":{"uri":"file:///a"}})");
    auto err = errors::lspErrorFromErrorValue(errVal, "textDocument/hover");
    EXPECT_EQ(err.category, errors::ErrorCategory::Protocol);
    EXPECT_EQ(err.code, -32801);
    EXPECT_EQ(err.method, "textDocument/hover");
    EXPECT_EQ(err.message, "LSP request textDocument/hover failed (-32801): content modified");
    ASSERT_TRUE(err.data.has_value());
    EXPECT_EQ(GetStringMember(err.data.value(), "uri").value_or(""), "file:///a");
}

TEST(Errors, MalformedServerErrorKeepsRawValue) {
    JSONValue errVal = ParseJSON(R"("boom")");
    auto err = errors::lspErrorFromErrorValue(errVal, "shutdown");
    EXPECT_EQ(err.category, errors::ErrorCategory::Protocol);
    EXPECT_EQ(err.code, JSONRPCErrorCodes::InternalError);
    ASSERT_TRUE(err.data.has_value());
    EXPECT_TRUE(JSONEquals(err.data.value(), errVal));
}

TEST(Errors, ExceptionCarriesTypedError) {
    try {
        throw errors::makeException(errors::ErrorCategory::Timeout, "LSP request x timed out after 5 ms", "x");
    } catch (const errors::LspException& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::Timeout);
        EXPECT_EQ(e.error().method, "x");
        EXPECT_STREQ(e.what(), "LSP request x timed out after 5 ms");
        return;
    }
    FAIL() << "expected LspException";
}

TEST(Errors, ErrorValueRoundTripsCodeAndData) {
    errors::LspError err;
    err.code = JSONRPCErrorCodes::InvalidParams;
    err.message = "bad";
    err.data = MakeObject({{"field", JSONValue("uri")}});
    JSONValue v = errors::makeErrorValue(err);
    EXPECT_EQ(GetIntMember(v, "code").value_or(0), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(GetStringMember(v, "message").value_or(""), "bad");
    ASSERT_NE(FindMember(v, "data"), nullptr);
}

TEST(Errors, CategoryNames) {
    EXPECT_STREQ(errors::categoryName(errors::ErrorCategory::ConnectionClosed), "connection_closed");
    EXPECT_STREQ(errors::categoryName(errors::ErrorCategory::CommandNotTrusted), "command_not_trusted");
}
