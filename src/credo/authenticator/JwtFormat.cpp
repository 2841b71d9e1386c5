//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JwtFormat.cpp
// Purpose: Authenticator <-> claims mapping and async token codec
//==========================================================================================================

#include <algorithm>

#include "credo/async/FutureAwaitable.h"
#include "credo/authenticator/JwtFormat.h"
#include "credo/crypto/Base64.h"
#include "credo/errors/Errors.h"
#include "logging/Logger.h"

namespace credo::authenticator {

namespace {

const char* kTagsKey = "tags";
const char* kFingerprintKey = "fingerprint";
const char* kPayloadKey = "payload";

std::vector<std::string> readTags(const JSONValue& custom) {
    std::vector<std::string> out;
    const JSONValue* tags = findMember(custom, kTagsKey);
    if (tags == nullptr) {
        return out;
    }
    if (!tags->isArray()) {
        errors::raise(errors::UnexpectedJsonValue(kTagsKey, serializeJSONValue(*tags), "array"));
    }
    const auto& arr = std::get<JSONValue::Array>(tags->value);
    out.reserve(arr.size());
    for (std::size_t i = 0; i < arr.size(); ++i) {
        const JSONValue element = arr[i] ? *arr[i] : JSONValue();
        if (!element.isString()) {
            errors::raise(errors::UnexpectedJsonValue(
                std::string(kTagsKey) + "[" + std::to_string(i) + "]", serializeJSONValue(element), "string"));
        }
        out.push_back(std::get<std::string>(element.value));
    }
    return out;
}

std::optional<Instant> selectTouched(const Claims& claims, TouchedClaim touchedClaim) {
    switch (touchedClaim) {
        case TouchedClaim::NotBefore:
            return claims.notBefore;
        case TouchedClaim::Latest:
            if (claims.issuedAt.has_value() && claims.notBefore.has_value()) {
                return std::max(*claims.issuedAt, *claims.notBefore);
            }
            return claims.issuedAt.has_value() ? claims.issuedAt : claims.notBefore;
        case TouchedClaim::IssuedAt:
        default:
            return claims.issuedAt;
    }
}

} // namespace

std::string encodeSubject(const LoginInfo& info) {
    return crypto::base64Encode(serializeJSONValue(toJSON(info)));
}

LoginInfo decodeSubject(const std::string& subject) {
    auto decoded = crypto::base64Decode(subject);
    if (!decoded.has_value()) {
        errors::raise(errors::JsonParseError(subject));
    }
    LoginInfo info;
    try {
        if (fromJSON(parseJSON(*decoded), info)) {
            return info;
        }
    } catch (const std::runtime_error& e) {
        LOG_DEBUG("JwtFormat: subject is not JSON: {}", e.what());
    }
    errors::raise(errors::JsonParseError(*decoded));
}

JwtFormat::JwtFormat(std::shared_ptr<IClaimsReader> reader, std::shared_ptr<IClaimsWriter> writer)
    : JwtFormat(std::move(reader), std::move(writer), Options()) {}

JwtFormat::JwtFormat(std::shared_ptr<IClaimsReader> reader, std::shared_ptr<IClaimsWriter> writer, Options opts)
    : reader(std::move(reader)), writer(std::move(writer)), opts(std::move(opts)) {
    if (!this->reader || !this->writer) {
        errors::raise(errors::ConfigurationError("JwtFormat requires a claims reader and writer"));
    }
}

std::future<Authenticator> JwtFormat::Read(const std::string& rawToken) {
    return coRead(rawToken).toFuture();
}

std::future<std::string> JwtFormat::Write(const Authenticator& authenticator) {
    return coWrite(authenticator).toFuture();
}

async::Task<Authenticator> JwtFormat::coRead(std::string rawToken) {
    FUNC_SCOPE();
    Claims claims = co_await async::makeFutureAwaitable(reader->Read(rawToken));
    try {
        co_return ToAuthenticator(claims, opts.touchedClaim);
    } catch (const errors::AuthException& e) {
        LOG_WARN("JwtFormat: rejected claims ({}): {}", errors::toString(e.category()), e.what());
        throw;
    }
}

async::Task<std::string> JwtFormat::coWrite(Authenticator authenticator) {
    FUNC_SCOPE();
    std::string token = co_await async::makeFutureAwaitable(writer->Write(ToClaims(authenticator)));
    co_return token;
}

Authenticator JwtFormat::ToAuthenticator(const Claims& claims, TouchedClaim touchedClaim) {
    if (!claims.jwtID.has_value()) {
        errors::raise(errors::MissingMandatoryClaim("jwtID"));
    }
    if (!claims.subject.has_value()) {
        errors::raise(errors::MissingMandatoryClaim("subject"));
    }

    Authenticator result(*claims.jwtID, decodeSubject(*claims.subject));

    if (claims.expirationTime.has_value()) {
        result = result.WithExpiry(*claims.expirationTime);
    }
    auto touched = selectTouched(claims, touchedClaim);
    if (touched.has_value()) {
        result = result.WithTouched(*touched);
    }

    result = result.WithTags(readTags(claims.custom));

    if (const JSONValue* fp = findMember(claims.custom, kFingerprintKey)) {
        if (!fp->isString()) {
            errors::raise(errors::UnexpectedJsonValue(kFingerprintKey, serializeJSONValue(*fp), "string"));
        }
        result = result.WithFingerprint(std::get<std::string>(fp->value));
    }
    if (const JSONValue* payload = findMember(claims.custom, kPayloadKey)) {
        if (!payload->isObject()) {
            errors::raise(errors::UnexpectedJsonValue(kPayloadKey, serializeJSONValue(*payload), "object"));
        }
        result = result.WithPayload(*payload);
    }
    return result;
}

Claims JwtFormat::ToClaims(const Authenticator& authenticator) const {
    Claims claims;
    if (!opts.issuer.empty()) {
        claims.issuer = opts.issuer;
    }
    if (!opts.audience.empty()) {
        claims.audience = opts.audience;
    }
    claims.subject = encodeSubject(authenticator.Login());
    claims.jwtID = authenticator.Id();
    claims.expirationTime = authenticator.Expires();
    claims.issuedAt = authenticator.Touched();
    claims.notBefore = authenticator.Touched();

    JSONValue::Object custom;
    if (!authenticator.Tags().empty()) {
        custom[kTagsKey] = std::make_shared<JSONValue>(makeStringArray(authenticator.Tags()));
    }
    if (authenticator.Fingerprint().has_value()) {
        custom[kFingerprintKey] = std::make_shared<JSONValue>(*authenticator.Fingerprint());
    }
    if (authenticator.Payload().has_value()) {
        custom[kPayloadKey] = std::make_shared<JSONValue>(*authenticator.Payload());
    }
    claims.custom = JSONValue(std::move(custom));
    return claims;
}

} // namespace credo::authenticator
