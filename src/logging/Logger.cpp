//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Definitions for Logger static members; initial level comes from LSP_LOG_LEVEL.
//==========================================================================================================

#include "logging/Logger.h"

namespace {
LogLevel initialLogLevel() {
    const std::string v = GetEnvOrDefault("LSP_LOG_LEVEL", "");
    if (v.empty()) {
        return LogLevel::LOG_INFO_LEVEL;
    }
    return Logger::toLogLevel(Logger::levelFromString(v));
}
} // namespace

// Define static members
LogLevel Logger::sLogLevel = initialLogLevel();
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
