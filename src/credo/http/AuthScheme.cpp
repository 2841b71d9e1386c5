//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AuthScheme.cpp
// Purpose: Basic/Bearer scheme encoding and tolerant decoding
//==========================================================================================================

#include "credo/crypto/Base64.h"
#include "credo/http/AuthScheme.h"
#include "credo/http/Message.h"

namespace credo::http {

namespace {

// Returns the credential part after "<scheme> " when the prefix matches case-insensitively.
std::optional<std::string> stripScheme(const std::string& headerValue, const std::string& scheme) {
    const std::string pfx = scheme + std::string(" ");
    if (headerValue.size() < pfx.size() || !iequals(headerValue.substr(0, pfx.size()), pfx)) {
        return std::nullopt;
    }
    std::size_t i = pfx.size();
    while (i < headerValue.size() && headerValue[i] == ' ') {
        ++i;
    }
    return headerValue.substr(i);
}

} // namespace

std::string BasicAuthScheme::Encode(const BasicCredentials& credentials) {
    return std::string("Basic ") + crypto::base64Encode(credentials.identifier + std::string(":") + credentials.password);
}

std::optional<BasicCredentials> BasicAuthScheme::Decode(const std::string& headerValue) {
    auto encoded = stripScheme(headerValue, "Basic");
    if (!encoded.has_value()) {
        return std::nullopt;
    }
    auto decoded = crypto::base64Decode(*encoded);
    if (!decoded.has_value()) {
        return std::nullopt;
    }
    const std::size_t colon = decoded->find(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }
    return BasicCredentials{decoded->substr(0, colon), decoded->substr(colon + 1)};
}

std::string BearerAuthScheme::Encode(const BearerToken& token) {
    return std::string("Bearer ") + token.value;
}

std::optional<BearerToken> BearerAuthScheme::Decode(const std::string& headerValue) {
    auto token = stripScheme(headerValue, "Bearer");
    if (!token.has_value() || token->empty()) {
        return std::nullopt;
    }
    return BearerToken{*token};
}

} // namespace credo::http
