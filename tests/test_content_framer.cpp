//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_content_framer.cpp
// Purpose: Tests for the Content-Length framer
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "lsp/ContentFramer.h"
#include "lsp/JSONRPCTypes.h"

using lsp::IContentFramer;

TEST(ContentLengthFramerTest, EncodeUsesByteLength) {
    auto framer = lsp::MakeContentLengthFramer();
    // Two UTF-8 bytes for the e-acute
    const std::string payload = "{\"t\":\"\xC3\xA9\"}";
    EXPECT_EQ(framer->encode(payload), "Content-Length: 10\r\n\r\n" + payload);
}

TEST(ContentLengthFramerTest, DecodesTwoFramesFromOneBuffer) {
    auto framer = lsp::MakeContentLengthFramer();
    std::string buffer = framer->encode("{\"a\":1}") + framer->encode("[]");
    auto first = framer->tryDecode(buffer);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), "{\"a\":1}");
    auto second = framer->tryDecode(buffer);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value(), "[]");
    EXPECT_TRUE(buffer.empty());
}

TEST(ContentLengthFramerTest, IgnoresOtherHeadersAndTrimsValue) {
    auto framer = lsp::MakeContentLengthFramer();
    std::string buffer =
        "Content-Type: application/vscode-jsonrpc; charset=utf-8\r\nContent-Length:   2  \r\n\r\n{}";
    auto ex = framer->tryDecodeEx(buffer);
    ASSERT_EQ(ex.status, IContentFramer::DecodeStatus::Ok);
    EXPECT_EQ(ex.payload.value(), "{}");
    EXPECT_EQ(ex.bytesConsumed, buffer.size());
}

TEST(ContentLengthFramerTest, IncompleteBodyWaitsForMoreBytes) {
    auto framer = lsp::MakeContentLengthFramer();
    std::string buffer = "Content-Length: 10\r\n\r\n{\"a\":";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::Incomplete);
    EXPECT_FALSE(framer->tryDecode(buffer).has_value());
    EXPECT_EQ(buffer, "Content-Length: 10\r\n\r\n{\"a\":");
    buffer += "true}";
    auto out = framer->tryDecode(buffer);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out.value(), "{\"a\":true}");
}

TEST(ContentLengthFramerTest, IncompleteHeader) {
    auto framer = lsp::MakeContentLengthFramer();
    auto ex = framer->tryDecodeEx("Content-Leng");
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::Incomplete);
    EXPECT_EQ(ex.bytesConsumed, 0u);
}

TEST(ContentLengthFramerTest, HeaderNameIsCaseSensitive) {
    auto framer = lsp::MakeContentLengthFramer();
    auto ex = framer->tryDecodeEx("content-length: 2\r\n\r\n{}");
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::MissingContentLength);
}

TEST(ContentLengthFramerTest, MissingContentLength) {
    auto framer = lsp::MakeContentLengthFramer();
    std::string buffer = "Content-Type: x\r\n\r\n{}";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::MissingContentLength);
    EXPECT_FALSE(framer->tryDecode(buffer).has_value());
    EXPECT_EQ(buffer, "Content-Type: x\r\n\r\n{}");
}

TEST(ContentLengthFramerTest, NonNumericLengthIsInvalid) {
    auto framer = lsp::MakeContentLengthFramer();
    EXPECT_EQ(framer->tryDecodeEx("Content-Length: abc\r\n\r\n{}").status,
              IContentFramer::DecodeStatus::InvalidHeader);
    EXPECT_EQ(framer->tryDecodeEx("Content-Length: -1\r\n\r\n{}").status,
              IContentFramer::DecodeStatus::InvalidHeader);
    EXPECT_EQ(framer->tryDecodeEx("Content-Length: \r\n\r\n{}").status,
              IContentFramer::DecodeStatus::InvalidHeader);
}

TEST(ContentLengthFramerTest, UnterminatedHeaderIsCapped) {
    auto framer = lsp::MakeContentLengthFramer(1024, 64);
    std::string buffer(65, 'x');
    EXPECT_EQ(framer->tryDecodeEx(buffer).status, IContentFramer::DecodeStatus::HeaderTooLarge);
    // Below the cap the framer keeps waiting for the terminator
    EXPECT_EQ(framer->tryDecodeEx(std::string(64, 'x')).status, IContentFramer::DecodeStatus::Incomplete);
}

TEST(ContentLengthFramerTest, DefaultHeaderCapIs16KiB) {
    auto framer = lsp::MakeContentLengthFramer();
    std::string buffer(lsp::kDefaultMaxHeaderBytes + 1, 'h');
    EXPECT_EQ(framer->tryDecodeEx(buffer).status, IContentFramer::DecodeStatus::HeaderTooLarge);
}

TEST(ContentLengthFramerTest, BodyAboveLimitIsRejected) {
    auto framer = lsp::MakeContentLengthFramer(4);
    EXPECT_EQ(framer->tryDecodeEx("Content-Length: 4\r\n\r\nabcd").status, IContentFramer::DecodeStatus::Ok);
    EXPECT_EQ(framer->tryDecodeEx("Content-Length: 5\r\n\r\nabcde").status,
              IContentFramer::DecodeStatus::BodyTooLarge);
    EXPECT_EQ(framer->tryDecodeEx("Content-Length: 99999999999999999999999\r\n\r\n").status,
              IContentFramer::DecodeStatus::BodyTooLarge);
}

TEST(ContentLengthFramerTest, StatusNames) {
    EXPECT_STREQ(lsp::DecodeStatusName(IContentFramer::DecodeStatus::HeaderTooLarge), "header too large");
    EXPECT_STREQ(lsp::DecodeStatusName(IContentFramer::DecodeStatus::MissingContentLength),
                 "missing Content-Length");
}

TEST(ContentLengthFramerTest, JsonMessagesSurviveTheWire) {
    auto framer = lsp::MakeContentLengthFramer();
    const lsp::JSONValue messages[] = {
        lsp::ParseJSON(R"({"jsonrpc":"2.0","id":3,"method":"textDocument/hover",)"
                       R"("params":{"textDocument":{"uri":"file:///src/caf\u00e9.ts"},"position":{"line":4,"character":7}}})"),
        lsp::ParseJSON("{\"jsonrpc\":\"2.0\",\"method\":\"window/logMessage\","
                       "\"params\":{\"type\":3,\"message\":\"\xE6\x97\xA5\xE6\x9C\xAC \xF0\x9F\x98\x80 \\\"ok\\\"\"}}"),
        lsp::ParseJSON(R"({"jsonrpc":"2.0","id":9,"result":[{"range":{"start":{"line":0,"character":0}},"tags":[1,2]},null,true,-1.5]})")
    };

    std::string wire;
    for (const auto& message : messages) {
        wire += framer->encode(lsp::SerializeJSON(message));
    }
    for (const auto& expected : messages) {
        auto payload = framer->tryDecode(wire);
        ASSERT_TRUE(payload.has_value());
        EXPECT_TRUE(lsp::JSONEquals(lsp::ParseJSON(payload.value()), expected)) << payload.value();
    }
    EXPECT_TRUE(wire.empty());
}
