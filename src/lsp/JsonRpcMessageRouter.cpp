//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.cpp
// Purpose: Default implementation for JSON-RPC message routing
//========================================================================================================

#include <optional>
#include <string>

#include "logging/Logger.h"
#include "lsp/JsonRpcMessageRouter.h"
#include "lsp/JSONRPCTypes.h"

namespace lsp {

namespace {
class JsonRpcMessageRouter : public IJsonRpcMessageRouter {
public:
    MessageKind classify(const JSONValue& message) override {
        if (!message.isObject()) {
            return MessageKind::Unknown;
        }
        const bool hasMethod = GetStringMember(message, "method").has_value();
        const bool hasId = FindMember(message, "id") != nullptr;
        if (hasMethod) {
            return hasId ? MessageKind::Request : MessageKind::Notification;
        }
        // Any method-less message carrying an id answers a pending request; a missing result reads as null
        if (hasId) {
            return MessageKind::Response;
        }
        return MessageKind::Unknown;
    }

    std::optional<JSONRPCResponse> route(
        JSONValue message,
        RouterHandlers& handlers,
        const ResponseResolver& resolve) override {
        switch (classify(message)) {
            case MessageKind::Response: {
                auto id = ParseNumericId(*FindMember(message, "id"));
                if (!id.has_value()) {
                    LOG_WARN("Router: response with non-numeric id ignored");
                    return std::nullopt;
                }
                resolve(id.value(), std::move(message));
                return std::nullopt;
            }
            case MessageKind::Request: {
                JSONRPCRequest request;
                if (!request.FromJSON(message)) {
                    break;
                }
                if (!handlers.requestHandler) {
                    return *CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound,
                                                "Method not found: " + request.method);
                }
                try {
                    JSONRPCResponse resp = handlers.requestHandler(request);
                    resp.id = request.id;
                    return resp;
                } catch (const std::exception& e) {
                    LOG_ERROR("Request handler exception for {}: {}", request.method, e.what());
                    return *CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, e.what());
                }
            }
            case MessageKind::Notification: {
                JSONRPCNotification notification;
                if (!notification.FromJSON(message)) {
                    break;
                }
                if (handlers.notificationHandler) {
                    try {
                        handlers.notificationHandler(notification);
                    } catch (const std::exception& e) {
                        LOG_ERROR("Notification handler exception for {}: {}", notification.method, e.what());
                    }
                }
                return std::nullopt;
            }
            case MessageKind::Unknown:
                break;
        }

        LOG_WARN("Router: unrecognized JSON-RPC message: {}", SerializeJSON(message));
        if (handlers.errorHandler) {
            handlers.errorHandler("Router: unrecognized JSON-RPC message");
        }
        return std::nullopt;
    }
};
} // namespace

std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter() {
    return std::make_unique<JsonRpcMessageRouter>();
}

} // namespace lsp
