//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EventSink.cpp
// Purpose: Event payload builders
//==========================================================================================================

#include "lsp/EventSink.h"

namespace lsp {

const char* ServerStatusName(ServerStatus status) {
    switch (status) {
        case ServerStatus::Starting: return "starting";
        case ServerStatus::Connected: return "connected";
        case ServerStatus::Error: return "error";
        case ServerStatus::Disconnected: return "disconnected";
    }
    return "error";
}

JSONValue MakeDiagnosticsPayload(const std::string& sessionId, const std::string& uri,
                                 const JSONValue& diagnostics, std::optional<int64_t> version) {
    return MakeObject({
        {"sessionId", JSONValue(sessionId)},
        {"uri", JSONValue(uri)},
        {"diagnostics", diagnostics},
        {"version", version.has_value() ? JSONValue(version.value()) : JSONValue(nullptr)}
    });
}

JSONValue MakeStatusPayload(const std::string& languageId, ServerStatus status,
                            const std::optional<std::string>& sessionId,
                            const std::optional<std::string>& reason) {
    JSONValue out = MakeObject({
        {"languageId", JSONValue(languageId)},
        {"status", JSONValue(ServerStatusName(status))}
    });
    if (sessionId.has_value()) {
        SetMember(out, "sessionId", JSONValue(sessionId.value()));
    }
    if (reason.has_value()) {
        SetMember(out, "reason", JSONValue(reason.value()));
    }
    return out;
}

} // namespace lsp
