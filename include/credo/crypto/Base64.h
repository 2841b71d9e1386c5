//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Base64.h
// Purpose: Standard and URL-safe Base64 over OpenSSL EVP block coding
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

namespace credo::crypto {

// Padded standard alphabet.
std::string base64Encode(const std::string& data);

// Returns nullopt when the input is not canonical padded Base64.
std::optional<std::string> base64Decode(const std::string& encoded);

// URL-safe alphabet ('-', '_') without padding, as used in JWS segments.
std::string base64UrlEncode(const std::string& data);
std::optional<std::string> base64UrlDecode(const std::string& encoded);

} // namespace credo::crypto
