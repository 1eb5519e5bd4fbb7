//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Implements version helpers returning the mcphost semantic version.
//==========================================================================================================
#include "mcphost/version.h"

#include <format>

#ifndef MCPHOST_VERSION_MAJOR
#define MCPHOST_VERSION_MAJOR 0
#define MCPHOST_VERSION_MINOR 1
#define MCPHOST_VERSION_PATCH 0
#endif

namespace mcphost {

VersionInfo getVersion() {
    return VersionInfo{MCPHOST_VERSION_MAJOR, MCPHOST_VERSION_MINOR, MCPHOST_VERSION_PATCH};
}

std::string getVersionString() {
    const auto v = getVersion();
    return std::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace mcphost
