//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Implements version helpers returning semantic version string.
//==========================================================================================================
#include "credo/version.h"

#include <sstream>

namespace credo {

VersionInfo getVersion() {
    return VersionInfo{CREDO_VERSION_MAJOR, CREDO_VERSION_MINOR, CREDO_VERSION_PATCH};
}

std::string getVersionString() {
    const auto v = getVersion();
    std::ostringstream oss;
    oss << v.major << "." << v.minor << "." << v.patch;
    return oss.str();
}

} // namespace credo
