//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: JSON conversion of positional types and feature result shaping
//==========================================================================================================

#include "lsp/Protocol.h"

namespace lsp {

JSONValue ToJSON(const Position& position) {
    return MakeObject({
        {"line", JSONValue(position.line)},
        {"character", JSONValue(position.character)}
    });
}

JSONValue ToJSON(const Range& range) {
    return MakeObject({
        {"start", ToJSON(range.start)},
        {"end", ToJSON(range.end)}
    });
}

JSONValue ToJSON(const TextDocumentContentChange& change) {
    JSONValue out = MakeObject({{"text", JSONValue(change.text)}});
    if (change.range.has_value()) {
        SetMember(out, "range", ToJSON(change.range.value()));
    }
    if (change.rangeLength.has_value()) {
        SetMember(out, "rangeLength", JSONValue(change.rangeLength.value()));
    }
    return out;
}

namespace {
std::optional<JSONValue> normalizeLocation(const JSONValue& value) {
    if (!value.isObject()) {
        return std::nullopt;
    }
    auto uri = GetStringMember(value, "uri");
    const JSONValue* range = FindMember(value, "range");
    if (uri.has_value() && range != nullptr) {
        return MakeObject({{"uri", JSONValue(uri.value())}, {"range", *range}});
    }

    // LocationLink
    auto targetUri = GetStringMember(value, "targetUri");
    const JSONValue* targetRange = FindMember(value, "targetSelectionRange");
    if (targetRange == nullptr) {
        targetRange = FindMember(value, "targetRange");
    }
    if (targetUri.has_value() && targetRange != nullptr) {
        return MakeObject({{"uri", JSONValue(targetUri.value())}, {"range", *targetRange}});
    }
    return std::nullopt;
}
} // namespace

JSONValue NormalizeLocationResult(const JSONValue& raw) {
    std::vector<JSONValue> out;
    if (raw.isArray()) {
        for (const auto& item : std::get<JSONValue::Array>(raw.value)) {
            if (!item) {
                continue;
            }
            if (auto loc = normalizeLocation(*item)) {
                out.push_back(std::move(loc.value()));
            }
        }
    } else if (raw.isObject()) {
        if (auto loc = normalizeLocation(raw)) {
            out.push_back(std::move(loc.value()));
        }
    }
    return MakeArray(std::move(out));
}

JSONValue NullAs(JSONValue raw, JSONValue fallback) {
    if (raw.isNull()) {
        return fallback;
    }
    return raw;
}

} // namespace lsp
