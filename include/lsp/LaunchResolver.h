//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LaunchResolver.h
// Purpose: Collaborator deciding which executable to launch for a language, and the command allow-list
//==========================================================================================================

#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace lsp {

struct LaunchSpec {
    std::string command;
    std::vector<std::string> args;
    bool trusted{false};
};

//==========================================================================================================
// ILaunchResolver
// Purpose: Server discovery seam. How launches are found or installed is up to the implementation.
// Methods:
//   ResolveLaunch(languageId, preferredProviders, autoInstall): Launch spec or throws
//     errors::LspException(LaunchUnavailable) with an LSP_DEPENDENCY_MISSING / LSP_UNSUPPORTED_LANGUAGE
//     prefixed message.
//   IsCommandAllowed(command): Allow-list check applied before spawning explicit or untrusted commands.
//   NormalizeLanguageId(raw): Canonical language id ("TSX" -> "typescript").
//==========================================================================================================
class ILaunchResolver {
public:
    virtual ~ILaunchResolver() = default;
    virtual LaunchSpec ResolveLaunch(const std::string& languageId,
                                     const std::vector<std::string>& preferredProviders,
                                     bool autoInstall) = 0;
    virtual bool IsCommandAllowed(const std::string& command) = 0;
    virtual std::string NormalizeLanguageId(const std::string& raw) = 0;
};

// Lower-cases, trims and maps common aliases to canonical LSP language ids.
std::string NormalizeLanguageIdDefault(const std::string& raw);

// Hard-coded fallback launch used when resolution fails and fallback is allowed.
std::pair<std::string, std::vector<std::string>> DefaultServerForLanguage(const std::string& languageId);

//==========================================================================================================
// StaticLaunchResolver
// Purpose: In-memory resolver: language -> launch spec table plus a command allow-list.
// Notes:
//   Registering a trusted launch also allows its command. Thread-safe.
//==========================================================================================================
class StaticLaunchResolver : public ILaunchResolver {
public:
    StaticLaunchResolver() = default;

    void Register(const std::string& languageId, LaunchSpec spec);
    void AllowCommand(const std::string& command);

    LaunchSpec ResolveLaunch(const std::string& languageId,
                             const std::vector<std::string>& preferredProviders,
                             bool autoInstall) override;
    bool IsCommandAllowed(const std::string& command) override;
    std::string NormalizeLanguageId(const std::string& raw) override;

private:
    std::mutex mutex;
    std::unordered_map<std::string, LaunchSpec> launches;
    std::unordered_set<std::string> allowedCommands;
};

} // namespace lsp
