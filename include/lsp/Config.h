//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Engine tunables with defaults, environment overrides and "key=value;..." configuration strings
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace lsp {

// Ceiling for every response timeout, configured or caller supplied.
constexpr std::chrono::milliseconds kHardMaxTimeout{120000};

//==========================================================================================================
// TimeoutPolicy
// Purpose: Per-method default response timeouts and the hard cap applied to caller supplied timeouts.
//==========================================================================================================
struct TimeoutPolicy {
    std::chrono::milliseconds defaultTimeout{10000};
    std::chrono::milliseconds initializeTimeout{20000};
    std::chrono::milliseconds workspaceSymbolTimeout{15000};
    std::chrono::milliseconds maxTimeout{kHardMaxTimeout};
};

//==========================================================================================================
// EngineOptions
// Purpose: All engine settings. Defaults match a desktop host talking to typical language servers.
// Fields:
//   timeouts: Response timeout policy.
//   maxHeaderBytes: Cap on a frame header before the stream is declared broken.
//   maxContentLength: Cap on a frame body.
//   workerThreads: Threads driving the shared io_context.
//   clientName/clientVersion: Announced in initialize.clientInfo.
//==========================================================================================================
struct EngineOptions {
    TimeoutPolicy timeouts;
    std::size_t maxHeaderBytes{16 * 1024};
    std::size_t maxContentLength{64 * 1024 * 1024};
    unsigned int workerThreads{2};
    std::string clientName{"lsp-session-engine"};
    std::string clientVersion;

    EngineOptions();

    //======================================================================================================
    // FromEnvironment
    // Purpose: Defaults overridden by LSP_DEFAULT_TIMEOUT_MS, LSP_INITIALIZE_TIMEOUT_MS,
    //          LSP_WORKSPACE_SYMBOL_TIMEOUT_MS, LSP_MAX_TIMEOUT_MS, LSP_MAX_HEADER_BYTES,
    //          LSP_MAX_CONTENT_LENGTH, LSP_WORKER_THREADS, LSP_CLIENT_NAME and LSP_CLIENT_VERSION.
    //======================================================================================================
    static EngineOptions FromEnvironment();

    //======================================================================================================
    // ApplyConfigString
    // Purpose: Applies "key=value;key=value" pairs (same keys as the env vars, lower case, without the
    //          LSP_ prefix). Unknown keys and malformed values are logged and skipped.
    // Args:
    //   config: Configuration string; empty is a no-op.
    //======================================================================================================
    void ApplyConfigString(const std::string& config);

    // Applies one setting; returns false when the key is unknown or the value is malformed. Timeouts above
    // kHardMaxTimeout are rejected.
    bool Set(const std::string& key, const std::string& value);
};

} // namespace lsp
