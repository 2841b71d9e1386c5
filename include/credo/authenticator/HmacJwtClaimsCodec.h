//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HmacJwtClaimsCodec.h
// Purpose: HS256 compact JWS claims reader/writer
//==========================================================================================================

#pragma once

#include <future>
#include <string>

#include "credo/async/Task.h"
#include "credo/authenticator/Claims.h"

namespace credo::authenticator {

//==========================================================================================================
// HmacJwtClaimsCodecOptions
// Fields:
//   secret: HMAC-SHA256 key (must not be empty).
//   keyId: Optional "kid" header value.
//==========================================================================================================
struct HmacJwtClaimsCodecOptions {
    std::string secret;
    std::string keyId;
};

//==========================================================================================================
// HmacJwtClaimsCodec
// Purpose: Signs and verifies "header.payload.signature" tokens. Registered claims are serialized as
//          iss, sub, aud, exp, nbf, iat (NumericDate seconds) and jti; custom members are merged at the
//          top level of the payload.
// Throws / fails with:
//   AuthException(TokenDecodingFailure) for malformed tokens, non-HS256 headers and bad signatures.
//==========================================================================================================
class HmacJwtClaimsCodec : public IClaimsReader, public IClaimsWriter {
public:
    using Options = HmacJwtClaimsCodecOptions;

    explicit HmacJwtClaimsCodec(Options opts);

    std::future<Claims> Read(const std::string& rawToken) override;
    std::future<std::string> Write(const Claims& claims) override;

    std::string Encode(const Claims& claims) const;
    Claims Decode(const std::string& rawToken) const;

private:
    async::Task<Claims> coRead(std::string rawToken);
    async::Task<std::string> coWrite(Claims claims);

    Options opts;
};

} // namespace credo::authenticator
