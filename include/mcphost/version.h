//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for mcphost; also the clientInfo.version sent during initialize.
//==========================================================================================================
#pragma once

#include <string>

namespace mcphost {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

//==========================================================================================================
// getVersion
// Purpose: Returns the library semantic version components.
//==========================================================================================================
VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: Returns the semantic version formatted as "MAJOR.MINOR.PATCH".
//==========================================================================================================
std::string getVersionString();

} // namespace mcphost
