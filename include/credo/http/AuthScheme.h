//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AuthScheme.h
// Purpose: Basic and Bearer authentication-scheme framing for header values
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

namespace credo::http {

struct BasicCredentials {
    std::string identifier;
    std::string password;
};

inline bool operator==(const BasicCredentials& a, const BasicCredentials& b) {
    return a.identifier == b.identifier && a.password == b.password;
}

struct BearerToken {
    std::string value;
};

inline bool operator==(const BearerToken& a, const BearerToken& b) { return a.value == b.value; }

//==========================================================================================================
// BasicAuthScheme
// Purpose: "Basic " + Base64("identifier:password").
// Decode: prefix is matched case-insensitively; a value that is not Base64 or lacks ':' yields nullopt.
//==========================================================================================================
struct BasicAuthScheme {
    using Value = BasicCredentials;
    static std::string Encode(const BasicCredentials& credentials);
    static std::optional<BasicCredentials> Decode(const std::string& headerValue);
};

//==========================================================================================================
// BearerAuthScheme
// Purpose: "Bearer " + token. Decode yields nullopt for other schemes or an empty token.
//==========================================================================================================
struct BearerAuthScheme {
    using Value = BearerToken;
    static std::string Encode(const BearerToken& token);
    static std::optional<BearerToken> Decode(const std::string& headerValue);
};

} // namespace credo::http
