//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: KeyValueConfig.h
// Purpose: Semicolon-delimited key=value configuration string helpers
//==========================================================================================================

#pragma once

#include <functional>
#include <string>

namespace credo::config {

// Invokes fn(key, value) for every "key=value" entry of "k1=v1; k2=v2"; keys and values are trimmed.
// Entries without '=' are skipped with a warning.
void forEachKeyValue(const std::string& config, const std::function<void(const std::string&, const std::string&)>& fn);

// Parses an unsigned integer into out; logs a warning and leaves out untouched when val is not numeric.
void parseUnsignedInto(const std::string& key, const std::string& val, unsigned int& out);

// Accepts 1/0, true/false, yes/no (case-insensitive); logs a warning otherwise.
void parseBoolInto(const std::string& key, const std::string& val, bool& out);

} // namespace credo::config
