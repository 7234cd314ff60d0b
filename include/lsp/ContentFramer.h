//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: Interface for Content-Length message framing over a language server's stdio
//========================================================================================================

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <memory>

namespace lsp {

class IContentFramer {
public:
    virtual ~IContentFramer() = default;
    enum class DecodeStatus {
        Ok,
        Incomplete,
        InvalidHeader,
        MissingContentLength,
        HeaderTooLarge,
        BodyTooLarge
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // present when status==Ok
        std::size_t bytesConsumed{0};       // full frame bytes to drop when status==Ok
    };
    virtual std::string encode(const std::string& payload) = 0;
    // Decodes one frame from the front of buffer and erases it on success.
    virtual std::optional<std::string> tryDecode(std::string& buffer) = 0;
    // Inspects buffer without modifying it. Any status other than Ok/Incomplete is fatal for the stream:
    // byte-stream framing cannot resynchronize after a bad header.
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;
};

constexpr std::size_t kDefaultMaxHeaderBytes = 16 * 1024;
constexpr std::size_t kDefaultMaxContentLength = 64 * 1024 * 1024;

std::unique_ptr<IContentFramer> MakeContentLengthFramer(
    std::size_t maxContentLength = kDefaultMaxContentLength,
    std::size_t maxHeaderBytes = kDefaultMaxHeaderBytes);

const char* DecodeStatusName(IContentFramer::DecodeStatus status);

} // namespace lsp
