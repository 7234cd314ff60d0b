//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentLengthFramer.cpp
// Purpose: Default Content-Length based framer for language server stdio streams
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "lsp/ContentFramer.h"

namespace lsp {

namespace {
constexpr const char* kContentLengthPrefix = "Content-Length:";

std::string trim(const std::string& s) {
    auto notSpace = [](unsigned char ch){ return !std::isspace(ch); };
    auto first = std::find_if(s.begin(), s.end(), notSpace);
    auto last = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    if (first >= last) {
        return std::string();
    }
    return std::string(first, last);
}

class ContentLengthFramer : public IContentFramer {
public:
    ContentLengthFramer(std::size_t maxLen, std::size_t maxHeader)
        : maxContentLength(maxLen), maxHeaderBytes(maxHeader) {}

    std::string encode(const std::string& payload) override {
        std::string header = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
        std::string frame; frame.reserve(header.size() + payload.size());
        frame.append(header);
        frame.append(payload);
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        const std::string sep = "\r\n\r\n";
        std::size_t headerEnd = buffer.find(sep);
        if (headerEnd == std::string::npos) {
            // A process that never terminates its header must not make us buffer forever
            if (buffer.size() > maxHeaderBytes) {
                LOG_WARN("Header exceeds {} bytes without terminator", maxHeaderBytes);
                return { DecodeStatus::HeaderTooLarge, std::nullopt, 0 };
            }
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        const std::size_t headerAndSep = headerEnd + sep.size();
        if (headerAndSep > maxHeaderBytes) {
            LOG_WARN("Header of {} bytes exceeds limit {}", headerAndSep, maxHeaderBytes);
            return { DecodeStatus::HeaderTooLarge, std::nullopt, 0 };
        }

        std::size_t pos = 0;
        std::size_t contentLength = 0;
        bool haveLength = false;
        const std::size_t prefixLen = std::char_traits<char>::length(kContentLengthPrefix);
        while (pos < headerEnd) {
            std::size_t eol = buffer.find("\r\n", pos);
            if (eol == std::string::npos || eol > headerEnd) {
                eol = headerEnd;
            }
            // Header name match is case-sensitive; other header lines (Content-Type) are ignored
            if (buffer.compare(pos, prefixLen, kContentLengthPrefix) == 0 && pos + prefixLen <= eol) {
                std::string value = trim(buffer.substr(pos + prefixLen, eol - pos - prefixLen));
                if (value.empty() || !std::all_of(value.begin(), value.end(),
                                                  [](unsigned char c){ return std::isdigit(c) != 0; })) {
                    LOG_WARN("Invalid Content-Length header: {}", value);
                    return { DecodeStatus::InvalidHeader, std::nullopt, 0 };
                }
                try {
                    unsigned long long v64 = std::stoull(value);
                    if (v64 > maxContentLength || v64 > std::numeric_limits<std::size_t>::max()) {
                        LOG_WARN("Content-Length {} exceeds limits (max={})", v64, maxContentLength);
                        return { DecodeStatus::BodyTooLarge, std::nullopt, 0 };
                    }
                    contentLength = static_cast<std::size_t>(v64);
                    haveLength = true;
                } catch (const std::out_of_range&) {
                    LOG_WARN("Content-Length out of range: {}", value);
                    return { DecodeStatus::BodyTooLarge, std::nullopt, 0 };
                }
            }
            pos = eol + 2;
        }

        if (!haveLength) {
            LOG_WARN("Missing Content-Length header");
            return { DecodeStatus::MissingContentLength, std::nullopt, 0 };
        }

        std::size_t frameTotal = headerAndSep + contentLength;
        if (buffer.size() < frameTotal) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }

        std::string payload = buffer.substr(headerAndSep, contentLength);
        return { DecodeStatus::Ok, std::make_optional(std::move(payload)), frameTotal };
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.status == DecodeStatus::Ok && r.payload.has_value()) {
            if (r.bytesConsumed > 0 && r.bytesConsumed <= buffer.size()) {
                buffer.erase(0, r.bytesConsumed);
            }
            return r.payload;
        }
        return std::nullopt;
    }

private:
    std::size_t maxContentLength;
    std::size_t maxHeaderBytes;
};
} // namespace

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength, std::size_t maxHeaderBytes) {
    return std::make_unique<ContentLengthFramer>(maxContentLength, maxHeaderBytes);
}

const char* DecodeStatusName(IContentFramer::DecodeStatus status) {
    switch (status) {
        case IContentFramer::DecodeStatus::Ok: return "ok";
        case IContentFramer::DecodeStatus::Incomplete: return "incomplete";
        case IContentFramer::DecodeStatus::InvalidHeader: return "invalid header";
        case IContentFramer::DecodeStatus::MissingContentLength: return "missing Content-Length";
        case IContentFramer::DecodeStatus::HeaderTooLarge: return "header too large";
        case IContentFramer::DecodeStatus::BodyTooLarge: return "body too large";
    }
    return "unknown";
}

} // namespace lsp
