//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LoginInfo.h
// Purpose: Identity of a principal across providers and its JSON representation
//==========================================================================================================

#pragma once

#include <string>

#include "credo/JSONValue.h"

namespace credo {

//==========================================================================================================
// LoginInfo
// Purpose: (provider, provider-specific user key) pair uniquely identifying a principal.
// Fields:
//   providerID: Provider identifier (e.g. "facebook", "credentials").
//   providerKey: User key unique within the provider.
//==========================================================================================================
struct LoginInfo {
    std::string providerID;
    std::string providerKey;
};

inline bool operator==(const LoginInfo& a, const LoginInfo& b) {
    return a.providerID == b.providerID && a.providerKey == b.providerKey;
}
inline bool operator!=(const LoginInfo& a, const LoginInfo& b) { return !(a == b); }

// {"providerID": "...", "providerKey": "..."}
JSONValue toJSON(const LoginInfo& info);

// Returns false when the value is not an object carrying both string members.
bool fromJSON(const JSONValue& value, LoginInfo& out);

} // namespace credo
