//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for the credo authentication library.
//==========================================================================================================
#pragma once

#include <string>

#define CREDO_VERSION_MAJOR 0
#define CREDO_VERSION_MINOR 3
#define CREDO_VERSION_PATCH 0

namespace credo {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

// Returns the library semantic version components.
VersionInfo getVersion();

// Returns the semantic version as "MAJOR.MINOR.PATCH".
std::string getVersionString();

} // namespace credo
