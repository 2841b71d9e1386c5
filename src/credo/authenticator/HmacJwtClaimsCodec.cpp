//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HmacJwtClaimsCodec.cpp
// Purpose: HS256 JWS encoding and verification with OpenSSL HMAC
//==========================================================================================================

#include <array>
#include <chrono>

#include "credo/authenticator/HmacJwtClaimsCodec.h"
#include "credo/crypto/Base64.h"
#include "credo/crypto/Hmac.h"
#include "credo/errors/Errors.h"
#include "logging/Logger.h"

using namespace std::chrono;

namespace credo::authenticator {

namespace {

const std::array<const char*, 7> kRegistered = {"iss", "sub", "aud", "exp", "nbf", "iat", "jti"};

bool isRegistered(const std::string& key) {
    for (const char* name : kRegistered) {
        if (key == name) {
            return true;
        }
    }
    return false;
}

std::shared_ptr<JSONValue> numericDate(Instant t) {
    return std::make_shared<JSONValue>(static_cast<int64_t>(duration_cast<seconds>(t.time_since_epoch()).count()));
}

[[noreturn]] void fail(const std::string& detail) {
    errors::raise(errors::TokenDecodingFailure(detail));
}

JSONValue decodeSegment(const std::string& segment, const char* what) {
    auto raw = crypto::base64UrlDecode(segment);
    if (!raw.has_value()) {
        fail(std::string(what) + " is not base64url");
    }
    JSONValue value;
    try {
        value = parseJSON(*raw);
    } catch (const std::runtime_error& e) {
        fail(std::string(what) + " is not JSON: " + e.what());
    }
    if (!value.isObject()) {
        fail(std::string(what) + " is not a JSON object");
    }
    return value;
}

std::optional<std::string> stringClaim(const JSONValue& payload, const char* key) {
    const JSONValue* v = findMember(payload, key);
    if (v == nullptr) {
        return std::nullopt;
    }
    if (!v->isString()) {
        fail(std::string("claim ") + key + " is not a string");
    }
    return std::get<std::string>(v->value);
}

std::optional<Instant> dateClaim(const JSONValue& payload, const char* key) {
    const JSONValue* v = findMember(payload, key);
    if (v == nullptr) {
        return std::nullopt;
    }
    if (!v->isNumber()) {
        fail(std::string("claim ") + key + " is not a NumericDate");
    }
    // Instant::duration must hold the value without overflowing.
    constexpr int64_t kMaxSeconds = duration_cast<seconds>(Instant::duration::max()).count() - 1;
    auto secs = getIntegerMember(payload, key);
    if (!secs.has_value() || *secs > kMaxSeconds || *secs < -kMaxSeconds) {
        fail(std::string("claim ") + key + " is out of range");
    }
    return Instant(duration_cast<Instant::duration>(seconds(*secs)));
}

std::optional<std::vector<std::string>> audienceClaim(const JSONValue& payload) {
    const JSONValue* v = findMember(payload, "aud");
    if (v == nullptr) {
        return std::nullopt;
    }
    if (v->isString()) {
        return std::vector<std::string>{std::get<std::string>(v->value)};
    }
    if (!v->isArray()) {
        fail("claim aud is neither a string nor an array");
    }
    std::vector<std::string> out;
    for (const auto& item : std::get<JSONValue::Array>(v->value)) {
        if (!item || !item->isString()) {
            fail("claim aud contains a non-string element");
        }
        out.push_back(std::get<std::string>(item->value));
    }
    return out;
}

} // namespace

HmacJwtClaimsCodec::HmacJwtClaimsCodec(Options opts) : opts(std::move(opts)) {
    if (this->opts.secret.empty()) {
        errors::raise(errors::ConfigurationError("HS256 secret must not be empty"));
    }
}

std::future<Claims> HmacJwtClaimsCodec::Read(const std::string& rawToken) {
    return coRead(rawToken).toFuture();
}

std::future<std::string> HmacJwtClaimsCodec::Write(const Claims& claims) {
    return coWrite(claims).toFuture();
}

async::Task<Claims> HmacJwtClaimsCodec::coRead(std::string rawToken) {
    co_return Decode(rawToken);
}

async::Task<std::string> HmacJwtClaimsCodec::coWrite(Claims claims) {
    co_return Encode(claims);
}

std::string HmacJwtClaimsCodec::Encode(const Claims& claims) const {
    JSONValue::Object header;
    header["alg"] = std::make_shared<JSONValue>("HS256");
    header["typ"] = std::make_shared<JSONValue>("JWT");
    if (!opts.keyId.empty()) {
        header["kid"] = std::make_shared<JSONValue>(opts.keyId);
    }

    JSONValue::Object payload;
    if (claims.custom.isObject()) {
        for (const auto& [key, value] : std::get<JSONValue::Object>(claims.custom.value)) {
            if (isRegistered(key)) {
                LOG_DEBUG("HmacJwtClaimsCodec: ignoring reserved custom claim {}", key);
                continue;
            }
            payload[key] = value;
        }
    }
    if (claims.issuer) payload["iss"] = std::make_shared<JSONValue>(*claims.issuer);
    if (claims.subject) payload["sub"] = std::make_shared<JSONValue>(*claims.subject);
    if (claims.audience) payload["aud"] = std::make_shared<JSONValue>(makeStringArray(*claims.audience));
    if (claims.expirationTime) payload["exp"] = numericDate(*claims.expirationTime);
    if (claims.notBefore) payload["nbf"] = numericDate(*claims.notBefore);
    if (claims.issuedAt) payload["iat"] = numericDate(*claims.issuedAt);
    if (claims.jwtID) payload["jti"] = std::make_shared<JSONValue>(*claims.jwtID);

    const std::string signingInput =
        crypto::base64UrlEncode(serializeJSONValue(JSONValue(std::move(header)))) + std::string(".") +
        crypto::base64UrlEncode(serializeJSONValue(JSONValue(std::move(payload))));
    return signingInput + std::string(".") + crypto::base64UrlEncode(crypto::hmacSha256(opts.secret, signingInput));
}

Claims HmacJwtClaimsCodec::Decode(const std::string& rawToken) const {
    const std::size_t d1 = rawToken.find('.');
    const std::size_t d2 = (d1 == std::string::npos) ? std::string::npos : rawToken.find('.', d1 + 1);
    if (d2 == std::string::npos || rawToken.find('.', d2 + 1) != std::string::npos) {
        fail("expected three dot-separated segments");
    }

    // Nothing is parsed until the signature over header.payload checks out.
    auto signature = crypto::base64UrlDecode(rawToken.substr(d2 + 1));
    if (!signature.has_value() ||
        !crypto::constantTimeEquals(*signature, crypto::hmacSha256(opts.secret, rawToken.substr(0, d2)))) {
        fail("signature mismatch");
    }

    const JSONValue header = decodeSegment(rawToken.substr(0, d1), "header");
    if (getStringMember(header, "alg") != std::optional<std::string>("HS256")) {
        fail("unsupported alg (expected HS256)");
    }

    const JSONValue payload = decodeSegment(rawToken.substr(d1 + 1, d2 - d1 - 1), "payload");

    Claims claims;
    claims.issuer = stringClaim(payload, "iss");
    claims.subject = stringClaim(payload, "sub");
    claims.audience = audienceClaim(payload);
    claims.expirationTime = dateClaim(payload, "exp");
    claims.notBefore = dateClaim(payload, "nbf");
    claims.issuedAt = dateClaim(payload, "iat");
    claims.jwtID = stringClaim(payload, "jti");

    JSONValue::Object custom;
    for (const auto& [key, value] : std::get<JSONValue::Object>(payload.value)) {
        if (!isRegistered(key)) {
            custom[key] = value;
        }
    }
    claims.custom = JSONValue(std::move(custom));
    return claims;
}

} // namespace credo::authenticator
