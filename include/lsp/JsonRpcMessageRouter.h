//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.h
// Purpose: Interface for JSON-RPC message routing (classification and dispatch) of inbound server messages
//========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <memory>

#include "lsp/JSONRPCTypes.h"

namespace lsp {

struct RouterHandlers {
    // Server-initiated request; the returned response is written back with the request's id.
    std::function<JSONRPCResponse(const JSONRPCRequest&)> requestHandler;
    std::function<void(const JSONRPCNotification&)> notificationHandler;
    std::function<void(const std::string&)> errorHandler;
};

// Invoked with the numeric id and the whole response message (result or error member intact).
using ResponseResolver = std::function<void(int64_t, JSONValue&&)>;

class IJsonRpcMessageRouter {
public:
    virtual ~IJsonRpcMessageRouter() = default;

    enum class MessageKind {
        Request,
        Response,
        Notification,
        Unknown
    };

    // Classify a JSON-RPC message without invoking handlers.
    virtual MessageKind classify(const JSONValue& message) = 0;

    // Routes a JSON-RPC message. For requests, returns the response to send back; for responses and
    // notifications returns std::nullopt. Handler exceptions never escape: a throwing request handler
    // yields an InternalError response, a throwing notification handler is logged.
    virtual std::optional<JSONRPCResponse> route(
        JSONValue message,
        RouterHandlers& handlers,
        const ResponseResolver& resolve) = 0;
};

// Factory: returns the default router implementation
std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter();

} // namespace lsp
