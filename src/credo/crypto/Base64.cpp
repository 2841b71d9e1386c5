//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Base64.cpp
// Purpose: Base64 helpers implemented with EVP_EncodeBlock / EVP_DecodeBlock
//==========================================================================================================

#include <algorithm>
#include <vector>

#include <openssl/evp.h>

#include "credo/crypto/Base64.h"

namespace credo::crypto {

namespace {

bool isStandardChar(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

bool isUrlChar(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
}

} // namespace

std::string base64Encode(const std::string& data) {
    if (data.empty()) {
        return std::string();
    }
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    const int n = ::EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                    reinterpret_cast<const unsigned char*>(data.data()),
                                    static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(n));
    return out;
}

std::optional<std::string> base64Decode(const std::string& encoded) {
    if (encoded.empty()) {
        return std::string();
    }
    if (encoded.size() % 4 != 0) {
        return std::nullopt;
    }
    // EVP_DecodeBlock tolerates surrounding whitespace and keeps padding bytes; validate first.
    std::size_t padding = 0;
    for (std::size_t i = 0; i < encoded.size(); ++i) {
        const char c = encoded[i];
        if (c == '=') {
            if (i + 2 < encoded.size()) {
                return std::nullopt;
            }
            ++padding;
            continue;
        }
        if (padding > 0 || !isStandardChar(c)) {
            return std::nullopt;
        }
    }
    std::vector<unsigned char> buf(3 * encoded.size() / 4);
    const int n = ::EVP_DecodeBlock(buf.data(),
                                    reinterpret_cast<const unsigned char*>(encoded.data()),
                                    static_cast<int>(encoded.size()));
    if (n < 0 || static_cast<std::size_t>(n) < padding) {
        return std::nullopt;
    }
    return std::string(reinterpret_cast<const char*>(buf.data()), static_cast<std::size_t>(n) - padding);
}

std::string base64UrlEncode(const std::string& data) {
    std::string out = base64Encode(data);
    std::replace(out.begin(), out.end(), '+', '-');
    std::replace(out.begin(), out.end(), '/', '_');
    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    return out;
}

std::optional<std::string> base64UrlDecode(const std::string& encoded) {
    if (encoded.size() % 4 == 1) {
        return std::nullopt;
    }
    std::string std64;
    std64.reserve(encoded.size() + 2);
    for (char c : encoded) {
        if (!isUrlChar(c)) {
            return std::nullopt;
        }
        std64.push_back(c == '-' ? '+' : (c == '_' ? '/' : c));
    }
    while (std64.size() % 4 != 0) {
        std64.push_back('=');
    }
    return base64Decode(std64);
}

} // namespace credo::crypto
