//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NotificationDispatcher.h
// Purpose: Classifies server notifications; forwards version-checked diagnostics to the host event sink
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "lsp/DocumentTracker.h"
#include "lsp/EventSink.h"
#include "lsp/JSONRPCTypes.h"

namespace lsp {

class NotificationDispatcher {
public:
    enum class Outcome {
        Forwarded,  // diagnostics delivered to the sink
        Dropped,    // diagnostics for a closed document or a superseded version
        Logged,     // recorded in the log only
        Ignored     // unknown method
    };

    NotificationDispatcher(std::string sessionId, std::shared_ptr<DocumentTracker> documents,
                           std::shared_ptr<IEventSink> sink);

    Outcome Dispatch(const JSONRPCNotification& notification);

    // Emits an empty diagnostics list for uri (document closed or session gone).
    void EmitCleared(const std::string& uri) const;

private:
    Outcome onPublishDiagnostics(const JSONValue& params);

    std::string sessionId;
    std::shared_ptr<DocumentTracker> documents;
    std::shared_ptr<IEventSink> sink;
};

const char* OutcomeName(NotificationDispatcher::Outcome outcome);

} // namespace lsp
