//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.cpp
// Purpose: Error category names and server error object conversion
//==========================================================================================================

#include <format>

#include "lsp/errors/Errors.h"

namespace lsp {
namespace errors {

const char* categoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Transport: return "transport";
        case ErrorCategory::Protocol: return "protocol";
        case ErrorCategory::Timeout: return "timeout";
        case ErrorCategory::Canceled: return "canceled";
        case ErrorCategory::ConnectionClosed: return "connection_closed";
        case ErrorCategory::SessionNotFound: return "session_not_found";
        case ErrorCategory::CommandNotTrusted: return "command_not_trusted";
        case ErrorCategory::LaunchUnavailable: return "launch_unavailable";
        case ErrorCategory::SpawnFailed: return "spawn_failed";
        case ErrorCategory::InvalidArgument: return "invalid_argument";
    }
    return "unknown";
}

LspError lspErrorFromErrorValue(const JSONValue& errVal, const std::string& method) {
    LspError err;
    err.category = ErrorCategory::Protocol;
    err.method = method;

    auto code = GetIntMember(errVal, "code");
    auto message = GetStringMember(errVal, "message");
    if (!code.has_value() || !message.has_value()) {
        err.code = JSONRPCErrorCodes::InternalError;
        err.message = std::format("LSP request {} failed: {}", method, SerializeJSON(errVal));
        err.data = errVal;
        return err;
    }

    err.code = static_cast<int>(code.value());
    err.message = std::format("LSP request {} failed ({}): {}", method, err.code, message.value());
    if (const JSONValue* data = FindMember(errVal, "data")) {
        err.data = *data;
    }
    return err;
}

} // namespace errors
} // namespace lsp
