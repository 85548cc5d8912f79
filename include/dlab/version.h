//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for dlab (semantic version helpers and protocol constants).
//==========================================================================================================
#pragma once

#include <string>

namespace dlab {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

// Product name reported in serverInfo and the gateway's connected event.
inline constexpr const char* kServerName = "discoverylab";

// Tool-protocol revision advertised by initialize.
inline constexpr const char* kProtocolVersion = "2024-11-05";

// Returns the library semantic version components.
VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: Returns the semantic version string.
// Returns:
//   std::string formatted as "MAJOR.MINOR.PATCH"
//==========================================================================================================
std::string getVersionString();

} // namespace dlab
