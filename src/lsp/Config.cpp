//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: EngineOptions parsing from environment variables and configuration strings
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <utility>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "lsp/Config.h"
#include "lsp/version.h"

namespace lsp {

namespace {
bool parseUint(const std::string& s, uint64_t& out) {
    if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) {
        return false;
    }
    try {
        out = static_cast<uint64_t>(std::stoull(s));
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

std::string trim(const std::string& s) {
    std::size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    std::size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// Env var name for each config key
constexpr std::pair<const char*, const char*> kEnvKeys[] = {
    {"default_timeout_ms", "LSP_DEFAULT_TIMEOUT_MS"},
    {"initialize_timeout_ms", "LSP_INITIALIZE_TIMEOUT_MS"},
    {"workspace_symbol_timeout_ms", "LSP_WORKSPACE_SYMBOL_TIMEOUT_MS"},
    {"max_timeout_ms", "LSP_MAX_TIMEOUT_MS"},
    {"max_header_bytes", "LSP_MAX_HEADER_BYTES"},
    {"max_content_length", "LSP_MAX_CONTENT_LENGTH"},
    {"worker_threads", "LSP_WORKER_THREADS"},
    {"client_name", "LSP_CLIENT_NAME"},
    {"client_version", "LSP_CLIENT_VERSION"},
};
} // namespace

EngineOptions::EngineOptions() : clientVersion(getVersionString()) {}

bool EngineOptions::Set(const std::string& key, const std::string& value) {
    if (key == "client_name") {
        if (value.empty()) return false;
        clientName = value;
        return true;
    }
    if (key == "client_version") {
        if (value.empty()) return false;
        clientVersion = value;
        return true;
    }
    uint64_t v = 0;
    if (!parseUint(value, v) || v == 0) {
        return false;
    }
    const bool isTimeout = key == "default_timeout_ms" || key == "initialize_timeout_ms" ||
                           key == "workspace_symbol_timeout_ms" || key == "max_timeout_ms";
    if (isTimeout && v > static_cast<uint64_t>(kHardMaxTimeout.count())) {
        return false;
    }
    if (key == "default_timeout_ms") {
        timeouts.defaultTimeout = std::chrono::milliseconds(static_cast<int64_t>(v));
    } else if (key == "initialize_timeout_ms") {
        timeouts.initializeTimeout = std::chrono::milliseconds(static_cast<int64_t>(v));
    } else if (key == "workspace_symbol_timeout_ms") {
        timeouts.workspaceSymbolTimeout = std::chrono::milliseconds(static_cast<int64_t>(v));
    } else if (key == "max_timeout_ms") {
        timeouts.maxTimeout = std::chrono::milliseconds(static_cast<int64_t>(v));
    } else if (key == "max_header_bytes") {
        maxHeaderBytes = static_cast<std::size_t>(v);
    } else if (key == "max_content_length") {
        maxContentLength = static_cast<std::size_t>(v);
    } else if (key == "worker_threads") {
        if (v > 64) return false;
        workerThreads = static_cast<unsigned int>(v);
    } else {
        return false;
    }
    return true;
}

EngineOptions EngineOptions::FromEnvironment() {
    EngineOptions options;
    for (const auto& [key, envName] : kEnvKeys) {
        auto value = GetEnvOptional(envName);
        if (!value.has_value()) {
            continue;
        }
        if (!options.Set(key, trim(value.value()))) {
            LOG_WARN("Ignoring invalid {}={}", envName, value.value());
        }
    }
    return options;
}

void EngineOptions::ApplyConfigString(const std::string& config) {
    std::size_t i = 0;
    while (i < config.size()) {
        std::size_t end = config.find(';', i);
        if (end == std::string::npos) end = config.size();
        std::string token = trim(config.substr(i, end - i));
        i = end + 1;
        if (token.empty()) {
            continue;
        }
        auto eq = token.find('=');
        if (eq == std::string::npos) {
            LOG_WARN("Ignoring malformed config entry '{}'", token);
            continue;
        }
        const std::string key = trim(token.substr(0, eq));
        const std::string val = trim(token.substr(eq + 1));
        if (!Set(key, val)) {
            LOG_WARN("Ignoring config entry {}={}", key, val);
        }
    }
}

} // namespace lsp
