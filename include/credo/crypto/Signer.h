//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Signer.h
// Purpose: Signing collaborator that binds a payload to a keyed MAC
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

namespace credo::crypto {

//==========================================================================================================
// ISigner
// Purpose: Produces a self-contained signed value and recovers its payload after verification.
//==========================================================================================================
class ISigner {
public:
    virtual ~ISigner() = default;

    // Returns the signed representation of data.
    virtual std::string Sign(const std::string& data) const = 0;

    // Returns the original data when the signature verifies; nullopt when the value is malformed or tampered.
    virtual std::optional<std::string> Extract(const std::string& signedValue) const = 0;
};

//==========================================================================================================
// HmacSigner
// Purpose: "<base64url(data)>.<base64url(HMAC-SHA256(key, base64url(data)))>"
// Throws:
//   AuthException(ConfigurationError) when constructed with an empty key.
//==========================================================================================================
class HmacSigner : public ISigner {
public:
    explicit HmacSigner(std::string key);

    std::string Sign(const std::string& data) const override;
    std::optional<std::string> Extract(const std::string& signedValue) const override;

private:
    std::string key;
};

} // namespace credo::crypto
