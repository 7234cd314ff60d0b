//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NotificationDispatcher.cpp
// Purpose: Diagnostics versioning and routing of inbound notifications
//==========================================================================================================

#include "logging/Logger.h"
#include "lsp/NotificationDispatcher.h"
#include "lsp/Protocol.h"

namespace lsp {

NotificationDispatcher::NotificationDispatcher(std::string sessionId, std::shared_ptr<DocumentTracker> documents,
                                               std::shared_ptr<IEventSink> sink)
    : sessionId(std::move(sessionId)), documents(std::move(documents)), sink(std::move(sink)) {}

NotificationDispatcher::Outcome NotificationDispatcher::Dispatch(const JSONRPCNotification& notification) {
    const std::string& method = notification.method;
    if (method == Methods::PublishDiagnostics) {
        return onPublishDiagnostics(notification.params.value_or(JSONValue(nullptr)));
    }
    if (method == Methods::CancelRequest) {
        // Server-to-client cancellation is not supported; nothing we run on behalf of the server is cancelable
        const JSONValue* id = notification.params.has_value() ? FindMember(notification.params.value(), "id") : nullptr;
        LOG_DEBUG("[{}] server sent $/cancelRequest for {}", sessionId, id ? SerializeJSON(*id) : std::string("?"));
        return Outcome::Logged;
    }
    if (method == Methods::LogMessage) {
        auto message = notification.params.has_value()
            ? GetStringMember(notification.params.value(), "message") : std::nullopt;
        LOG_DEBUG("[{}] server log: {}", sessionId, message.value_or(""));
        return Outcome::Logged;
    }
    return Outcome::Ignored;
}

NotificationDispatcher::Outcome NotificationDispatcher::onPublishDiagnostics(const JSONValue& params) {
    auto uri = GetStringMember(params, "uri");
    if (!uri.has_value()) {
        LOG_WARN("[{}] publishDiagnostics without uri ignored", sessionId);
        return Outcome::Dropped;
    }
    const JSONValue* diags = FindMember(params, "diagnostics");
    JSONValue diagnostics = (diags != nullptr && diags->isArray()) ? *diags : JSONValue(JSONValue::Array{});
    std::optional<int64_t> version = GetIntMember(params, "version");

    if (!documents->AcceptsDiagnostics(uri.value(), version)) {
        LOG_DEBUG("[{}] dropping diagnostics for {} (version {}, open version {})", sessionId, uri.value(),
                  version.has_value() ? std::to_string(version.value()) : std::string("none"),
                  documents->VersionOf(uri.value()).has_value()
                      ? std::to_string(documents->VersionOf(uri.value()).value()) : std::string("closed"));
        return Outcome::Dropped;
    }
    if (sink) {
        sink->Emit(Topics::Diagnostics, MakeDiagnosticsPayload(sessionId, uri.value(), diagnostics, version));
    }
    return Outcome::Forwarded;
}

void NotificationDispatcher::EmitCleared(const std::string& uri) const {
    if (sink) {
        sink->Emit(Topics::Diagnostics,
                   MakeDiagnosticsPayload(sessionId, uri, JSONValue(JSONValue::Array{}), std::nullopt));
    }
}

const char* OutcomeName(NotificationDispatcher::Outcome outcome) {
    switch (outcome) {
        case NotificationDispatcher::Outcome::Forwarded: return "forwarded";
        case NotificationDispatcher::Outcome::Dropped: return "dropped";
        case NotificationDispatcher::Outcome::Logged: return "logged";
        case NotificationDispatcher::Outcome::Ignored: return "ignored";
    }
    return "ignored";
}

} // namespace lsp
