//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Implements version helpers returning semantic version string.
//==========================================================================================================
#include "lsp/version.h"

#include <format>

namespace lsp {

VersionInfo getVersion() {
    return VersionInfo{0, 3, 0};
}

std::string getVersionString() {
    const auto v = getVersion();
    return std::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace lsp
