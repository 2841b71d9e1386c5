//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Authenticator.h
// Purpose: Immutable session credential value and its lifecycle transformations
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "credo/Clock.h"
#include "credo/JSONValue.h"
#include "credo/LoginInfo.h"

namespace credo::authenticator {

using IdGenerator = std::function<std::string()>;

// Hex rendering of 32 bytes from the OpenSSL CSPRNG.
std::string secureRandomId();

//==========================================================================================================
// Authenticator
// Purpose: Session credential. id and loginInfo are fixed at construction; every other field is changed
//          through a With*/Touch method that returns a new value.
// Fields:
//   touched: Last activity instant.
//   expires: Absolute expiry (absent = never expires).
//   fingerprint: Client binding (absent = not bound).
//   tags: Ordered labels, duplicates permitted.
//   payload: Application-defined JSON object.
//==========================================================================================================
class Authenticator {
public:
    Authenticator(std::string id, LoginInfo loginInfo);

    // Mint a credential for a freshly resolved identity; id from idGenerator or secureRandomId().
    static Authenticator Create(LoginInfo loginInfo, const IdGenerator& idGenerator = IdGenerator());

    const std::string& Id() const { return id; }
    const LoginInfo& Login() const { return loginInfo; }
    const std::optional<Instant>& Touched() const { return touched; }
    const std::optional<Instant>& Expires() const { return expires; }
    const std::optional<std::string>& Fingerprint() const { return fingerprint; }
    const std::vector<std::string>& Tags() const { return tags; }
    const std::optional<JSONValue>& Payload() const { return payload; }

    Authenticator WithExpiry(std::chrono::milliseconds lifetime, const IClock& clock) const;
    Authenticator WithExpiry(Instant at) const;
    Authenticator WithoutExpiry() const;
    Authenticator WithFingerprint(std::string value) const;
    Authenticator WithTags(std::vector<std::string> values) const;
    Authenticator WithTag(std::string value) const;

    // Throws AuthException(MalformedClaimValue) when value is not a JSON object.
    Authenticator WithPayload(JSONValue value) const;

    Authenticator WithTouched(Instant at) const;
    Authenticator Touch(const IClock& clock) const;

    // Remaining lifetime (negative once expired); nullopt when no expiry is set.
    std::optional<std::chrono::milliseconds> ExpiresIn(const IClock& clock) const;

    // Elapsed time since the last touch; nullopt when never touched.
    std::optional<std::chrono::milliseconds> TouchedAt(const IClock& clock) const;

    bool IsTouched() const { return touched.has_value(); }

    friend bool operator==(const Authenticator& a, const Authenticator& b);

private:
    std::string id;
    LoginInfo loginInfo;
    std::optional<Instant> touched;
    std::optional<Instant> expires;
    std::optional<std::string> fingerprint;
    std::vector<std::string> tags;
    std::optional<JSONValue> payload;
};

inline bool operator!=(const Authenticator& a, const Authenticator& b) { return !(a == b); }

} // namespace credo::authenticator
