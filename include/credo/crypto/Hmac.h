//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Hmac.h
// Purpose: HMAC-SHA256, secure random bytes and constant-time comparison (OpenSSL)
//==========================================================================================================

#pragma once

#include <cstddef>
#include <string>

namespace credo::crypto {

// Raw 32-byte HMAC-SHA256 of data under key. Throws std::runtime_error if OpenSSL fails.
std::string hmacSha256(const std::string& key, const std::string& data);

// Cryptographically secure random bytes from RAND_bytes. Throws std::runtime_error on failure.
std::string secureRandomBytes(std::size_t count);

// Lowercase hex rendering of raw bytes.
std::string toHex(const std::string& bytes);

// Length check followed by CRYPTO_memcmp over equal-length inputs.
bool constantTimeEquals(const std::string& a, const std::string& b);

} // namespace credo::crypto
