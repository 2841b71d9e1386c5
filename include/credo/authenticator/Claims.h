//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Claims.h
// Purpose: Signed-token claim set and the injected reader/writer interfaces that verify and sign it
//==========================================================================================================

#pragma once

#include <future>
#include <optional>
#include <string>
#include <vector>

#include "credo/Clock.h"
#include "credo/JSONValue.h"

namespace credo::authenticator {

//==========================================================================================================
// Claims
// Purpose: Registered JWT claims plus a custom object carrying tags, fingerprint and payload.
//==========================================================================================================
struct Claims {
    std::optional<std::string> issuer;
    std::optional<std::string> subject;
    std::optional<std::vector<std::string>> audience;
    std::optional<Instant> expirationTime;
    std::optional<Instant> notBefore;
    std::optional<Instant> issuedAt;
    std::optional<std::string> jwtID;
    JSONValue custom{JSONValue::Object{}};
};

//==========================================================================================================
// IClaimsReader
// Purpose: Verifies a raw token and returns its claims. Failures are delivered through the future.
//==========================================================================================================
class IClaimsReader {
public:
    virtual ~IClaimsReader() = default;
    virtual std::future<Claims> Read(const std::string& rawToken) = 0;
};

//==========================================================================================================
// IClaimsWriter
// Purpose: Signs a claim set into a raw token.
//==========================================================================================================
class IClaimsWriter {
public:
    virtual ~IClaimsWriter() = default;
    virtual std::future<std::string> Write(const Claims& claims) = 0;
};

} // namespace credo::authenticator
