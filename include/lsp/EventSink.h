//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EventSink.h
// Purpose: Outbound event delivery seam (diagnostics and server status) toward the host UI layer
//==========================================================================================================

#pragma once

#include <functional>
#include <optional>
#include <string>

#include "lsp/JSONRPCTypes.h"

namespace lsp {

namespace Topics {
    constexpr const char* Diagnostics = "lsp://diagnostics";
    constexpr const char* ServerStatus = "lsp://server-status";
}

enum class ServerStatus {
    Starting,
    Connected,
    Error,
    Disconnected
};

const char* ServerStatusName(ServerStatus status);

//==========================================================================================================
// IEventSink
// Purpose: Receives engine events. Emit may be called from engine worker threads and must not block on
//          engine calls of its own.
//==========================================================================================================
class IEventSink {
public:
    virtual ~IEventSink() = default;
    virtual void Emit(const std::string& topic, const JSONValue& payload) = 0;
};

// Adapts a std::function to IEventSink.
class CallbackEventSink : public IEventSink {
public:
    using Callback = std::function<void(const std::string&, const JSONValue&)>;
    explicit CallbackEventSink(Callback cb) : callback(std::move(cb)) {}
    void Emit(const std::string& topic, const JSONValue& payload) override {
        if (callback) {
            callback(topic, payload);
        }
    }

private:
    Callback callback;
};

// Payload builders: {sessionId, uri, diagnostics, version} and {languageId, status, sessionId?, reason?}
JSONValue MakeDiagnosticsPayload(const std::string& sessionId, const std::string& uri,
                                 const JSONValue& diagnostics, std::optional<int64_t> version);
JSONValue MakeStatusPayload(const std::string& languageId, ServerStatus status,
                            const std::optional<std::string>& sessionId,
                            const std::optional<std::string>& reason);

} // namespace lsp
