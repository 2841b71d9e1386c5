//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OAuth2Info.h
// Purpose: Token endpoint result and the normalized social profile
//==========================================================================================================

#pragma once

#include <map>
#include <optional>
#include <string>

#include "credo/Clock.h"
#include "credo/JSONValue.h"
#include "credo/LoginInfo.h"

namespace credo::oauth2 {

//==========================================================================================================
// OAuth2Info
// Fields:
//   expiresIn: Seconds as reported by the provider.
//   expiresAt: Absolute expiry computed at exchange time (now + expiresIn).
//   params: Remaining string members of the token response (e.g. granted scope).
//==========================================================================================================
struct OAuth2Info {
    std::string accessToken;
    std::optional<std::string> tokenType;
    std::optional<int64_t> expiresIn;
    std::optional<std::string> refreshToken;
    std::optional<Instant> expiresAt;
    std::optional<std::map<std::string, std::string>> params;
};

// Decodes a token response. Returns nullopt when access_token is missing or not a string.
// expires_in may be a number or a numeric string.
std::optional<OAuth2Info> oauth2InfoFromJSON(const JSONValue& json, Instant now);

//==========================================================================================================
// SocialProfile
// Purpose: Identity produced by a delegated login. loginInfo.providerKey is the provider's user id.
//==========================================================================================================
struct SocialProfile {
    LoginInfo loginInfo;
    std::optional<std::string> firstName;
    std::optional<std::string> lastName;
    std::optional<std::string> fullName;
    std::optional<std::string> email;
    std::optional<std::string> avatarUri;
};

} // namespace credo::oauth2
