//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for the LSP session engine (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace lsp {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

// Library semantic version components.
VersionInfo getVersion();

// Semantic version formatted as "MAJOR.MINOR.PATCH"; also the default clientInfo.version.
std::string getVersionString();

} // namespace lsp
