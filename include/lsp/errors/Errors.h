//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures, the exception carried through futures, and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "lsp/JSONRPCTypes.h"

namespace lsp {
namespace errors {

// What went wrong, from the host's point of view.
enum class ErrorCategory {
    Transport,
    Protocol,
    Timeout,
    Canceled,
    ConnectionClosed,
    SessionNotFound,
    CommandNotTrusted,
    LaunchUnavailable,
    SpawnFailed,
    InvalidArgument
};

// Categorization of the numeric codes a server may put into a JSON-RPC error object.
enum class JsonRpcErrorKind {
    Parse,
    InvalidRequest,
    MethodNotFound,
    InvalidParams,
    Internal,
    ServerNotInitialized,
    RequestCancelled,
    ContentModified,
    ServerCancelled,
    RequestFailed,
    Unknown
};

// Typed error representation used by the engine.
struct LspError {
    ErrorCategory category{ErrorCategory::Transport};
    std::string message;
    std::string method;     // request method when the error belongs to one call
    int code{0};            // JSON-RPC code for Protocol errors
    std::optional<JSONValue> data;
};

const char* categoryName(ErrorCategory category);

//==========================================================================================================
// LspException
// Purpose: Exception type stored into futures returned by the engine. what() is the error message.
//==========================================================================================================
class LspException : public std::runtime_error {
public:
    explicit LspException(LspError err)
        : std::runtime_error(err.message), error_(std::move(err)) {}

    const LspError& error() const noexcept { return error_; }
    ErrorCategory category() const noexcept { return error_.category; }

private:
    LspError error_;
};

inline LspException makeException(ErrorCategory category, std::string message, std::string method = {}) {
    LspError err;
    err.category = category;
    err.message = std::move(message);
    err.method = std::move(method);
    return LspException(std::move(err));
}

// Map a JSON-RPC/LSP numeric error code to a JsonRpcErrorKind.
inline JsonRpcErrorKind jsonRpcKindFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return JsonRpcErrorKind::Parse;
        case JSONRPCErrorCodes::InvalidRequest: return JsonRpcErrorKind::InvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return JsonRpcErrorKind::MethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return JsonRpcErrorKind::InvalidParams;
        case JSONRPCErrorCodes::InternalError: return JsonRpcErrorKind::Internal;
        case JSONRPCErrorCodes::ServerNotInitialized: return JsonRpcErrorKind::ServerNotInitialized;
        case JSONRPCErrorCodes::RequestCancelled: return JsonRpcErrorKind::RequestCancelled;
        case JSONRPCErrorCodes::ContentModified: return JsonRpcErrorKind::ContentModified;
        case JSONRPCErrorCodes::ServerCancelled: return JsonRpcErrorKind::ServerCancelled;
        case JSONRPCErrorCodes::RequestFailed: return JsonRpcErrorKind::RequestFailed;
        default: return JsonRpcErrorKind::Unknown;
    }
}

// Convert a server's JSON-RPC error member into a Protocol LspError for the given request method.
// Tolerates malformed error objects: missing code becomes InternalError and the raw value is kept as data.
//
// Args:
//   errVal: The `error` member of a response.
//   method: Method of the request that failed.
//
// Returns:
//   LspError with category Protocol.
LspError lspErrorFromErrorValue(const JSONValue& errVal, const std::string& method);

// Create a JSONValue error object from a typed LspError ({ code, message, data? }).
inline JSONValue makeErrorValue(const LspError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error for a server-initiated request id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, int code, const std::string& message) {
    return CreateErrorResponse(id, code, message);
}

} // namespace errors
} // namespace lsp
