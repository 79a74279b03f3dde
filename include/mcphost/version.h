//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Library version reported as serverInfo.version and on /health.
//==========================================================================================================
#pragma once

#include <string>

#define MCPHOST_VERSION_MAJOR 1
#define MCPHOST_VERSION_MINOR 0
#define MCPHOST_VERSION_PATCH 0

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

VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: Returns the semantic version string.
// Returns:
//   std::string formatted as "MAJOR.MINOR.PATCH"
//==========================================================================================================
std::string getVersionString();

} // namespace mcphost
