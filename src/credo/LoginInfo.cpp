//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LoginInfo.cpp
// Purpose: LoginInfo JSON mapping
//==========================================================================================================

#include "credo/LoginInfo.h"

namespace credo {

JSONValue toJSON(const LoginInfo& info) {
    return makeObject({
        {"providerID", JSONValue(info.providerID)},
        {"providerKey", JSONValue(info.providerKey)}
    });
}

bool fromJSON(const JSONValue& value, LoginInfo& out) {
    auto id = getStringMember(value, "providerID");
    auto key = getStringMember(value, "providerKey");
    if (!id.has_value() || !key.has_value()) {
        return false;
    }
    out.providerID = std::move(*id);
    out.providerKey = std::move(*key);
    return true;
}

} // namespace credo
