//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OAuth2Settings.h
// Purpose: Per-provider endpoint and client configuration for the OAuth2 engine
//==========================================================================================================

#pragma once

#include <map>
#include <string>
#include <vector>

#include "credo/http/Message.h"

namespace credo::oauth2 {

//==========================================================================================================
// OAuth2Settings
// Fields:
//   providerId: Becomes LoginInfo::providerID and prefixes provider error messages.
//   authorizationUrl/accessTokenUrl: Provider endpoints.
//   apiUrl: Profile endpoint. A "%s" placeholder receives the access token; otherwise the token is sent as
//           "Authorization: Bearer".
//   redirectUrl: Callback URL registered with the provider (redirect_uri; omitted when empty).
//   scope: Space separated scopes (omitted when empty).
//   authorizationParams/accessTokenParams: Extra parameters for the authorization URL / token request.
//   customHeaders: Added to token and profile requests.
//==========================================================================================================
struct OAuth2Settings {
    std::string providerId;
    std::string authorizationUrl;
    std::string accessTokenUrl;
    std::string apiUrl;
    std::string redirectUrl;
    std::string clientId;
    std::string clientSecret;
    std::string scope;
    std::map<std::string, std::string> authorizationParams;
    std::map<std::string, std::string> accessTokenParams;
    std::vector<http::HeaderKV> customHeaders;

    // Throws AuthException(ConfigurationError) naming the first missing required field.
    void Validate() const;

    //==========================================================================================================
    // Parse
    // Purpose: Semicolon-delimited key=value form, e.g.
    //   "providerId=github; clientId=abc; scope=read:user user:email; authorizationUrl=https://...;
    //    authorizationParams.prompt=consent; accessTokenParams.audience=api; header.X-Api=1"
    // Notes:
    //   - Unknown keys are ignored with a warning.
    //   - The result is not validated; call Validate().
    //==========================================================================================================
    static OAuth2Settings Parse(const std::string& config);
};

} // namespace credo::oauth2
