//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Hmac.cpp
// Purpose: OpenSSL-backed MAC and randomness primitives
//==========================================================================================================

#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include "credo/crypto/Hmac.h"

namespace credo::crypto {

std::string hmacSha256(const std::string& key, const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    const auto* k = reinterpret_cast<const unsigned char*>(key.data());
    const auto* d = reinterpret_cast<const unsigned char*>(data.data());
    if (!::HMAC(::EVP_sha256(), k, static_cast<int>(key.size()), d, data.size(), digest, &digestLen)) {
        throw std::runtime_error("HMAC-SHA256 failed: error " + std::to_string(::ERR_get_error()));
    }
    return std::string(reinterpret_cast<const char*>(digest), digestLen);
}

std::string secureRandomBytes(std::size_t count) {
    std::string out(count, '\0');
    if (count == 0) {
        return out;
    }
    if (::RAND_bytes(reinterpret_cast<unsigned char*>(out.data()), static_cast<int>(count)) != 1) {
        throw std::runtime_error("Failed to generate secure random bytes: error " + std::to_string(::ERR_get_error()));
    }
    return out;
}

std::string toHex(const std::string& bytes) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char c : bytes) {
        out.push_back(hex[(c >> 4) & 0xFu]);
        out.push_back(hex[c & 0xFu]);
    }
    return out;
}

bool constantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return ::CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace credo::crypto
