//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OAuth2Info.cpp
// Purpose: Token response decoding
//==========================================================================================================

#include <chrono>
#include <string>

#include "credo/oauth2/OAuth2Info.h"
#include "logging/Logger.h"

namespace credo::oauth2 {

namespace {

// Lifetimes outside [0, ten years] are treated as not reported.
constexpr int64_t kMaxExpiresInSeconds = 10LL * 365 * 24 * 60 * 60;

std::optional<int64_t> boundedExpiresIn(std::optional<int64_t> seconds) {
    if (seconds.has_value() && (*seconds < 0 || *seconds > kMaxExpiresInSeconds)) {
        LOG_WARN("OAuth2Info: ignoring expires_in {} outside [0, {}]", *seconds, kMaxExpiresInSeconds);
        return std::nullopt;
    }
    return seconds;
}

std::optional<int64_t> parseExpiresIn(const JSONValue& json) {
    const JSONValue* v = findMember(json, "expires_in");
    if (v == nullptr) {
        return std::nullopt;
    }
    if (v->isNumber()) {
        return boundedExpiresIn(getIntegerMember(json, "expires_in"));
    }
    if (v->isString()) {
        const std::string& s = std::get<std::string>(v->value);
        if (!s.empty() && s.size() < 19 && s.find_first_not_of("0123456789") == std::string::npos) {
            return boundedExpiresIn(static_cast<int64_t>(std::stoll(s)));
        }
    }
    return std::nullopt;
}

} // namespace

std::optional<OAuth2Info> oauth2InfoFromJSON(const JSONValue& json, Instant now) {
    auto accessToken = getStringMember(json, "access_token");
    if (!accessToken.has_value() || accessToken->empty()) {
        return std::nullopt;
    }
    OAuth2Info info;
    info.accessToken = std::move(*accessToken);
    info.tokenType = getStringMember(json, "token_type");
    info.refreshToken = getStringMember(json, "refresh_token");
    info.expiresIn = parseExpiresIn(json);
    if (info.expiresIn.has_value()) {
        info.expiresAt = now + std::chrono::seconds(*info.expiresIn);
    }

    std::map<std::string, std::string> params;
    for (const auto& [key, value] : std::get<JSONValue::Object>(json.value)) {
        if (key == "access_token" || key == "token_type" || key == "expires_in" || key == "refresh_token") {
            continue;
        }
        if (value && value->isString()) {
            params[key] = std::get<std::string>(value->value);
        }
    }
    if (!params.empty()) {
        info.params = std::move(params);
    }
    return info;
}

} // namespace credo::oauth2
