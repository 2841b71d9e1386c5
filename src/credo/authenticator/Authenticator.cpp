//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Authenticator.cpp
// Purpose: Authenticator construction, transformations and queries
//==========================================================================================================

#include "credo/authenticator/Authenticator.h"
#include "credo/crypto/Hmac.h"
#include "credo/errors/Errors.h"

using namespace std::chrono;

namespace credo::authenticator {

std::string secureRandomId() {
    return crypto::toHex(crypto::secureRandomBytes(32));
}

Authenticator::Authenticator(std::string id, LoginInfo loginInfo)
    : id(std::move(id)), loginInfo(std::move(loginInfo)) {}

Authenticator Authenticator::Create(LoginInfo loginInfo, const IdGenerator& idGenerator) {
    std::string newId = idGenerator ? idGenerator() : secureRandomId();
    if (newId.empty()) {
        errors::raise(errors::ConfigurationError("authenticator id generator returned an empty id"));
    }
    return Authenticator(std::move(newId), std::move(loginInfo));
}

Authenticator Authenticator::WithExpiry(milliseconds lifetime, const IClock& clock) const {
    return WithExpiry(clock.Now() + lifetime);
}

Authenticator Authenticator::WithExpiry(Instant at) const {
    Authenticator copy(*this);
    copy.expires = at;
    return copy;
}

Authenticator Authenticator::WithoutExpiry() const {
    Authenticator copy(*this);
    copy.expires.reset();
    return copy;
}

Authenticator Authenticator::WithFingerprint(std::string value) const {
    Authenticator copy(*this);
    copy.fingerprint = std::move(value);
    return copy;
}

Authenticator Authenticator::WithTags(std::vector<std::string> values) const {
    Authenticator copy(*this);
    copy.tags = std::move(values);
    return copy;
}

Authenticator Authenticator::WithTag(std::string value) const {
    Authenticator copy(*this);
    copy.tags.push_back(std::move(value));
    return copy;
}

Authenticator Authenticator::WithPayload(JSONValue value) const {
    if (!value.isObject()) {
        errors::raise(errors::UnexpectedJsonValue("payload", serializeJSONValue(value), "object"));
    }
    Authenticator copy(*this);
    copy.payload = std::move(value);
    return copy;
}

Authenticator Authenticator::WithTouched(Instant at) const {
    Authenticator copy(*this);
    copy.touched = at;
    return copy;
}

Authenticator Authenticator::Touch(const IClock& clock) const {
    return WithTouched(clock.Now());
}

std::optional<milliseconds> Authenticator::ExpiresIn(const IClock& clock) const {
    if (!expires.has_value()) {
        return std::nullopt;
    }
    return std::chrono::floor<milliseconds>(*expires - clock.Now());
}

std::optional<milliseconds> Authenticator::TouchedAt(const IClock& clock) const {
    if (!touched.has_value()) {
        return std::nullopt;
    }
    return duration_cast<milliseconds>(clock.Now() - *touched);
}

bool operator==(const Authenticator& a, const Authenticator& b) {
    return a.id == b.id &&
           a.loginInfo == b.loginInfo &&
           a.touched == b.touched &&
           a.expires == b.expires &&
           a.fingerprint == b.fingerprint &&
           a.tags == b.tags &&
           a.payload == b.payload;
}

} // namespace credo::authenticator
