//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_hmac_jwt_claims_codec.cpp
// Purpose: GoogleTests for the HS256 claims codec and its use underneath JwtFormat
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

#include "credo/authenticator/HmacJwtClaimsCodec.h"
#include "credo/authenticator/JwtFormat.h"
#include "credo/crypto/Base64.h"
#include "credo/crypto/Hmac.h"
#include "credo/errors/Errors.h"

using namespace credo;
using namespace credo::authenticator;
using namespace std::chrono;

namespace {

Instant atSeconds(int64_t epochSeconds) {
    return Instant(seconds(epochSeconds));
}

HmacJwtClaimsCodec makeCodec(const std::string& secret = "top-secret", const std::string& kid = "") {
    HmacJwtClaimsCodecOptions opts;
    opts.secret = secret;
    opts.keyId = kid;
    return HmacJwtClaimsCodec(opts);
}

std::string segment(const std::string& token, int index) {
    std::size_t start = 0;
    for (int i = 0; i < index; ++i) {
        start = token.find('.', start) + 1;
    }
    const std::size_t end = token.find('.', start);
    return token.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

errors::ErrorCategory decodeCategory(const HmacJwtClaimsCodec& codec, const std::string& token) {
    try {
        codec.Decode(token);
    } catch (const errors::AuthException& ex) {
        return ex.category();
    }
    return errors::ErrorCategory::Unknown;
}

// Signs header.payload with the given secret so alg and layout checks can be exercised.
std::string handSigned(const std::string& headerJson, const std::string& payloadJson, const std::string& secret) {
    const std::string input = crypto::base64UrlEncode(headerJson) + "." + crypto::base64UrlEncode(payloadJson);
    return input + "." + crypto::base64UrlEncode(crypto::hmacSha256(secret, input));
}

} // namespace

TEST(HmacJwtClaimsCodec, EmptySecretIsConfigurationError) {
    try {
        makeCodec("");
        FAIL() << "expected AuthException";
    } catch (const errors::AuthException& ex) {
        EXPECT_EQ(ex.category(), errors::ErrorCategory::ConfigurationError);
    }
}

TEST(HmacJwtClaimsCodec, TokenLayout) {
    auto codec = makeCodec("top-secret", "key-1");
    Claims c;
    c.issuer = "credo";
    c.subject = "sub";
    c.audience = std::vector<std::string>{"a1", "a2"};
    c.issuedAt = atSeconds(1'700'000'000);
    c.jwtID = "jti";
    c.custom = makeObject({{"tags", makeStringArray({"x"})}, {"iss", JSONValue("shadowed")}});

    const std::string token = codec.Encode(c);
    EXPECT_EQ(crypto::base64UrlDecode(segment(token, 0)).value_or(""),
              std::string("{\"alg\":\"HS256\",\"kid\":\"key-1\",\"typ\":\"JWT\"}"));
    EXPECT_EQ(crypto::base64UrlDecode(segment(token, 1)).value_or(""),
              std::string("{\"aud\":[\"a1\",\"a2\"],\"iat\":1700000000,\"iss\":\"credo\",\"jti\":\"jti\","
                          "\"sub\":\"sub\",\"tags\":[\"x\"]}"));
}

TEST(HmacJwtClaimsCodec, DecodeRestoresRegisteredAndCustomClaims) {
    auto codec = makeCodec();
    Claims c;
    c.subject = "sub";
    c.expirationTime = atSeconds(2'000);
    c.notBefore = atSeconds(1'000);
    c.issuedAt = atSeconds(1'000);
    c.jwtID = "jti";
    c.custom = makeObject({{"fingerprint", JSONValue("fp")}});

    Claims back = codec.Read(codec.Encode(c)).get();
    EXPECT_FALSE(back.issuer.has_value());
    EXPECT_FALSE(back.audience.has_value());
    EXPECT_EQ(back.subject, c.subject);
    EXPECT_EQ(back.expirationTime, c.expirationTime);
    EXPECT_EQ(back.notBefore, c.notBefore);
    EXPECT_EQ(back.issuedAt, c.issuedAt);
    EXPECT_EQ(back.jwtID, c.jwtID);
    EXPECT_EQ(back.custom, c.custom);
}

TEST(HmacJwtClaimsCodec, AudienceMayBeAString) {
    auto codec = makeCodec();
    const std::string token = handSigned("{\"alg\":\"HS256\"}", "{\"aud\":\"only\",\"jti\":\"j\"}", "top-secret");
    Claims back = codec.Decode(token);
    ASSERT_TRUE(back.audience.has_value());
    ASSERT_EQ(back.audience->size(), 1u);
    EXPECT_EQ(back.audience->front(), std::string("only"));
}

TEST(HmacJwtClaimsCodec, RejectsMalformedTokens) {
    auto codec = makeCodec();
    using errors::ErrorCategory;
    EXPECT_EQ(decodeCategory(codec, "only.two"), ErrorCategory::TokenDecodingFailure);
    EXPECT_EQ(decodeCategory(codec, "a.b.c.d"), ErrorCategory::TokenDecodingFailure);
    EXPECT_EQ(decodeCategory(codec, "!!.e30.sig"), ErrorCategory::TokenDecodingFailure);
    EXPECT_EQ(decodeCategory(codec, handSigned("[]", "{}", "top-secret")), ErrorCategory::TokenDecodingFailure);
    EXPECT_EQ(decodeCategory(codec, handSigned("{\"alg\":\"none\"}", "{}", "top-secret")),
              ErrorCategory::TokenDecodingFailure);
    EXPECT_EQ(decodeCategory(codec, handSigned("{\"alg\":\"HS256\"}", "not json", "top-secret")),
              ErrorCategory::TokenDecodingFailure);
    EXPECT_EQ(decodeCategory(codec, handSigned("{\"alg\":\"HS256\"}", "{\"exp\":\"soon\"}", "top-secret")),
              ErrorCategory::TokenDecodingFailure);
    EXPECT_EQ(decodeCategory(codec, handSigned("{\"alg\":\"HS256\"}", "{\"sub\":1}", "top-secret")),
              ErrorCategory::TokenDecodingFailure);
}

TEST(HmacJwtClaimsCodec, DeeplyNestedSegmentsAreRejected) {
    auto codec = makeCodec();
    const std::string nested = std::string(200000, '[') + std::string(200000, ']');

    // Unsigned: refused before the header is looked at.
    try {
        codec.Decode(crypto::base64UrlEncode(nested) + ".e30.sig");
        FAIL() << "expected AuthException";
    } catch (const errors::AuthException& ex) {
        EXPECT_EQ(ex.category(), errors::ErrorCategory::TokenDecodingFailure);
        EXPECT_EQ(std::string(ex.what()), std::string("Invalid token: signature mismatch"));
    }

    // Correctly signed: the parser's nesting limit turns it into a decoding failure.
    try {
        codec.Decode(handSigned("{\"alg\":\"HS256\"}", nested, "top-secret"));
        FAIL() << "expected AuthException";
    } catch (const errors::AuthException& ex) {
        EXPECT_EQ(ex.category(), errors::ErrorCategory::TokenDecodingFailure);
        EXPECT_NE(std::string(ex.what()).find("payload is not JSON"), std::string::npos);
    }
}

TEST(HmacJwtClaimsCodec, OutOfRangeNumericDatesAreRejected) {
    auto codec = makeCodec();
    for (const char* exp : {"1e300", "-1e300", "9223372036854775807", "99999999999"}) {
        const std::string token =
            handSigned("{\"alg\":\"HS256\"}", std::string("{\"jti\":\"j\",\"exp\":") + exp + "}", "top-secret");
        try {
            codec.Decode(token);
            FAIL() << "expected AuthException for exp " << exp;
        } catch (const errors::AuthException& ex) {
            EXPECT_EQ(ex.category(), errors::ErrorCategory::TokenDecodingFailure);
            EXPECT_EQ(std::string(ex.what()), std::string("Invalid token: claim exp is out of range"));
        }
    }

    auto claims = codec.Decode(handSigned("{\"alg\":\"HS256\"}", "{\"exp\":4102444800}", "top-secret"));
    ASSERT_TRUE(claims.expirationTime.has_value());
    EXPECT_EQ(duration_cast<seconds>(claims.expirationTime->time_since_epoch()).count(), 4102444800);
}

TEST(HmacJwtClaimsCodec, RejectsForeignSignatures) {
    auto codec = makeCodec();
    const std::string token = handSigned("{\"alg\":\"HS256\"}", "{\"jti\":\"j\"}", "other-secret");
    try {
        codec.Read(token).get();
        FAIL() << "expected AuthException";
    } catch (const errors::AuthException& ex) {
        EXPECT_EQ(ex.category(), errors::ErrorCategory::TokenDecodingFailure);
        EXPECT_EQ(std::string(ex.what()), std::string("Invalid token: signature mismatch"));
    }
}

TEST(HmacJwtClaimsCodec, JwtFormatRoundTripOnSecondBoundaries) {
    auto codec = std::make_shared<HmacJwtClaimsCodec>(HmacJwtClaimsCodecOptions{"top-secret", ""});
    JwtFormat format(codec, codec);
    auto original = Authenticator("id-9", LoginInfo{"credentials", "user@example.com"})
                        .WithExpiry(atSeconds(1'800'000'000))
                        .WithTouched(atSeconds(1'700'000'000))
                        .WithTags({"a", "b"})
                        .WithFingerprint("fp")
                        .WithPayload(makeObject({{"n", JSONValue(static_cast<int64_t>(1))}}));

    const std::string token = format.Write(original).get();
    EXPECT_EQ(format.Read(token).get(), original);

    std::string tampered = token;
    const std::size_t pos = token.find('.') + 1;
    tampered[pos] = tampered[pos] == 'e' ? 'f' : 'e';
    EXPECT_THROW(format.Read(tampered).get(), errors::AuthException);
}
