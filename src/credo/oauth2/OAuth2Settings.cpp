//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OAuth2Settings.cpp
// Purpose: OAuth2 settings parsing and validation
//==========================================================================================================

#include "credo/config/KeyValueConfig.h"
#include "credo/errors/Errors.h"
#include "credo/oauth2/OAuth2Settings.h"
#include "logging/Logger.h"

namespace credo::oauth2 {

namespace {

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() > prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

void requireField(const std::string& value, const char* name) {
    if (value.empty()) {
        errors::raise(errors::ConfigurationError(std::string("OAuth2 setting ") + name + std::string(" is required")));
    }
}

} // namespace

void OAuth2Settings::Validate() const {
    requireField(providerId, "providerId");
    requireField(authorizationUrl, "authorizationUrl");
    requireField(accessTokenUrl, "accessTokenUrl");
    requireField(apiUrl, "apiUrl");
    requireField(clientId, "clientId");
    requireField(clientSecret, "clientSecret");
}

OAuth2Settings OAuth2Settings::Parse(const std::string& config) {
    OAuth2Settings s;
    config::forEachKeyValue(config, [&](const std::string& key, const std::string& val) {
        if (key == "providerId" || key == "provider") {
            s.providerId = val;
        }
        else if (key == "authorizationUrl") {
            s.authorizationUrl = val;
        }
        else if (key == "accessTokenUrl" || key == "tokenUrl") {
            s.accessTokenUrl = val;
        }
        else if (key == "apiUrl") {
            s.apiUrl = val;
        }
        else if (key == "redirectUrl") {
            s.redirectUrl = val;
        }
        else if (key == "clientId") {
            s.clientId = val;
        }
        else if (key == "clientSecret") {
            s.clientSecret = val;
        }
        else if (key == "scope") {
            s.scope = val;
        }
        else if (startsWith(key, "authorizationParams.")) {
            s.authorizationParams[key.substr(std::string("authorizationParams.").size())] = val;
        }
        else if (startsWith(key, "accessTokenParams.")) {
            s.accessTokenParams[key.substr(std::string("accessTokenParams.").size())] = val;
        }
        else if (startsWith(key, "header.")) {
            s.customHeaders.push_back(http::HeaderKV{key.substr(std::string("header.").size()), val});
        }
        else {
            LOG_WARN("OAuth2Settings: ignoring unknown key {}", key);
        }
    });
    return s;
}

} // namespace credo::oauth2
