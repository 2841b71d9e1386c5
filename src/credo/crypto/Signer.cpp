//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Signer.cpp
// Purpose: HMAC signer implementation
//==========================================================================================================

#include "credo/crypto/Signer.h"
#include "credo/crypto/Base64.h"
#include "credo/crypto/Hmac.h"
#include "credo/errors/Errors.h"

namespace credo::crypto {

HmacSigner::HmacSigner(std::string key) : key(std::move(key)) {
    if (this->key.empty()) {
        errors::raise(errors::ConfigurationError("signer key must not be empty"));
    }
}

std::string HmacSigner::Sign(const std::string& data) const {
    const std::string body = base64UrlEncode(data);
    return body + std::string(".") + base64UrlEncode(hmacSha256(key, body));
}

std::optional<std::string> HmacSigner::Extract(const std::string& signedValue) const {
    const std::size_t dot = signedValue.find('.');
    if (dot == std::string::npos || signedValue.find('.', dot + 1) != std::string::npos) {
        return std::nullopt;
    }
    const std::string body = signedValue.substr(0, dot);
    auto signature = base64UrlDecode(signedValue.substr(dot + 1));
    if (!signature.has_value()) {
        return std::nullopt;
    }
    if (!constantTimeEquals(*signature, hmacSha256(key, body))) {
        return std::nullopt;
    }
    return base64UrlDecode(body);
}

} // namespace credo::crypto
