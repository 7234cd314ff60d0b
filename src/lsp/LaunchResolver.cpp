//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LaunchResolver.cpp
// Purpose: Language id normalization, fallback server table and the static resolver
//==========================================================================================================

#include <cctype>
#include <format>

#include "logging/Logger.h"
#include "lsp/LaunchResolver.h"
#include "lsp/errors/Errors.h"

namespace lsp {

std::string NormalizeLanguageIdDefault(const std::string& raw) {
    std::string s;
    s.reserve(raw.size());
    for (char c : raw) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    static const std::unordered_map<std::string, std::string> aliases = {
        {"ts", "typescript"}, {"tsx", "typescript"}, {"typescriptreact", "typescript"},
        {"mts", "typescript"}, {"cts", "typescript"},
        {"js", "javascript"}, {"jsx", "javascript"}, {"javascriptreact", "javascript"},
        {"mjs", "javascript"}, {"cjs", "javascript"},
        {"py", "python"}, {"python3", "python"},
        {"rs", "rust"},
        {"golang", "go"},
        {"c++", "cpp"}, {"cxx", "cpp"}, {"cc", "cpp"}, {"hpp", "cpp"},
        {"h", "c"},
        {"yml", "yaml"},
        {"md", "markdown"},
        {"sh", "shellscript"}, {"bash", "shellscript"},
    };
    auto it = aliases.find(s);
    return it != aliases.end() ? it->second : s;
}

std::pair<std::string, std::vector<std::string>> DefaultServerForLanguage(const std::string& languageId) {
    const std::string lang = NormalizeLanguageIdDefault(languageId);
    if (lang == "python") {
        return {"pyright-langserver", {"--stdio"}};
    }
    if (lang == "rust") {
        return {"rust-analyzer", {}};
    }
    if (lang == "go") {
        return {"gopls", {}};
    }
    if (lang == "c" || lang == "cpp") {
        return {"clangd", {}};
    }
    // typescript, javascript and everything else
    return {"typescript-language-server", {"--stdio"}};
}

void StaticLaunchResolver::Register(const std::string& languageId, LaunchSpec spec) {
    std::lock_guard<std::mutex> lk(mutex);
    if (spec.trusted) {
        allowedCommands.insert(spec.command);
    }
    launches[NormalizeLanguageIdDefault(languageId)] = std::move(spec);
}

void StaticLaunchResolver::AllowCommand(const std::string& command) {
    std::lock_guard<std::mutex> lk(mutex);
    allowedCommands.insert(command);
}

LaunchSpec StaticLaunchResolver::ResolveLaunch(const std::string& languageId,
                                               const std::vector<std::string>& preferredProviders,
                                               bool autoInstall) {
    const std::string lang = NormalizeLanguageIdDefault(languageId);
    {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = launches.find(lang);
        if (it != launches.end()) {
            LOG_DEBUG("Resolved '{}' to '{}'", lang, it->second.command);
            return it->second;
        }
    }
    if (!autoInstall) {
        throw errors::makeException(errors::ErrorCategory::LaunchUnavailable,
            std::format("LSP_DEPENDENCY_MISSING: no available runtime for '{}' and auto-install disabled", languageId));
    }
    // This resolver cannot install anything; say which providers were asked for
    std::string providers;
    for (const auto& p : preferredProviders) {
        if (!providers.empty()) providers += ",";
        providers += p;
    }
    throw errors::makeException(errors::ErrorCategory::LaunchUnavailable,
        std::format("LSP_UNSUPPORTED_LANGUAGE: no installable server for '{}' (providers: {})",
                    languageId, providers.empty() ? "default" : providers));
}

bool StaticLaunchResolver::IsCommandAllowed(const std::string& command) {
    std::lock_guard<std::mutex> lk(mutex);
    return allowedCommands.count(command) > 0;
}

std::string StaticLaunchResolver::NormalizeLanguageId(const std::string& raw) {
    return NormalizeLanguageIdDefault(raw);
}

} // namespace lsp
