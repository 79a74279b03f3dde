//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Implements version helpers.
//==========================================================================================================
#include "mcphost/version.h"

#include <fmt/format.h>

namespace mcphost {

VersionInfo getVersion() {
    return VersionInfo{MCPHOST_VERSION_MAJOR, MCPHOST_VERSION_MINOR, MCPHOST_VERSION_PATCH};
}

std::string getVersionString() {
    const auto v = getVersion();
    return fmt::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace mcphost
