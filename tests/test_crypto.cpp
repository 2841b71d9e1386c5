//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_crypto.cpp
// Purpose: GoogleTests for Base64 codecs, HMAC-SHA256 helpers and the HMAC signer
//==========================================================================================================

#include <gtest/gtest.h>

#include <set>
#include <string>

#include "credo/crypto/Base64.h"
#include "credo/crypto/Hmac.h"
#include "credo/crypto/Signer.h"
#include "credo/errors/Errors.h"

using namespace credo;

TEST(Base64, StandardAlphabetWithPadding) {
    EXPECT_EQ(crypto::base64Encode("f"), std::string("Zg=="));
    EXPECT_EQ(crypto::base64Encode("fo"), std::string("Zm8="));
    EXPECT_EQ(crypto::base64Encode("foobar"), std::string("Zm9vYmFy"));
    EXPECT_EQ(crypto::base64Encode(""), std::string(""));
    EXPECT_EQ(crypto::base64Decode("Zm8=").value_or("?"), std::string("fo"));
    EXPECT_EQ(crypto::base64Decode("Zg==").value_or("?"), std::string("f"));
}

TEST(Base64, RejectsMalformedInput) {
    EXPECT_FALSE(crypto::base64Decode("Zm8").has_value());
    EXPECT_FALSE(crypto::base64Decode("Zm!=").has_value());
    EXPECT_FALSE(crypto::base64Decode("Z=m8").has_value());
    EXPECT_FALSE(crypto::base64Decode("Z===").has_value());
    EXPECT_FALSE(crypto::base64Decode("Zm-_").has_value());
}

TEST(Base64, UrlAlphabetWithoutPadding) {
    const std::string bytes("\xfb\xff\xbf", 3);
    EXPECT_EQ(crypto::base64Encode(bytes), std::string("+/+/"));
    EXPECT_EQ(crypto::base64UrlEncode(bytes), std::string("-_-_"));
    EXPECT_EQ(crypto::base64UrlEncode("f"), std::string("Zg"));
    EXPECT_EQ(crypto::base64UrlDecode("Zg").value_or("?"), std::string("f"));
    EXPECT_EQ(crypto::base64UrlDecode("-_-_").value_or("?"), bytes);
    EXPECT_FALSE(crypto::base64UrlDecode("Z").has_value());
    EXPECT_FALSE(crypto::base64UrlDecode("+/+/").has_value());
}

TEST(Hmac, KnownAnswerVector) {
    const std::string mac = crypto::hmacSha256("Jefe", "what do ya want for nothing?");
    ASSERT_EQ(mac.size(), 32u);
    EXPECT_EQ(crypto::toHex(mac), std::string("5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843"));
}

TEST(Hmac, RandomBytesAndComparison) {
    std::set<std::string> seen;
    for (int i = 0; i < 16; ++i) {
        auto bytes = crypto::secureRandomBytes(32);
        ASSERT_EQ(bytes.size(), 32u);
        seen.insert(bytes);
    }
    EXPECT_EQ(seen.size(), 16u);
    EXPECT_TRUE(crypto::constantTimeEquals("abc", "abc"));
    EXPECT_FALSE(crypto::constantTimeEquals("abc", "abd"));
    EXPECT_FALSE(crypto::constantTimeEquals("abc", "abcd"));
}

TEST(HmacSigner, SignAndExtract) {
    crypto::HmacSigner signer("secret");
    const std::string signedValue = signer.Sign("{\"id\":\"x\"}");
    EXPECT_EQ(signedValue.find('.'), signedValue.rfind('.'));
    EXPECT_EQ(signer.Extract(signedValue).value_or("?"), std::string("{\"id\":\"x\"}"));
}

TEST(HmacSigner, RejectsTamperedOrForeignValues) {
    crypto::HmacSigner signer("secret");
    crypto::HmacSigner other("another-secret");
    const std::string signedValue = signer.Sign("payload");
    EXPECT_FALSE(other.Extract(signedValue).has_value());

    std::string tampered = signedValue;
    tampered[0] = tampered[0] == 'A' ? 'B' : 'A';
    EXPECT_FALSE(signer.Extract(tampered).has_value());
    EXPECT_FALSE(signer.Extract("no-dot").has_value());
    EXPECT_FALSE(signer.Extract(signedValue + ".extra").has_value());
}

TEST(HmacSigner, EmptyKeyIsConfigurationError) {
    try {
        crypto::HmacSigner signer("");
        FAIL() << "expected AuthException";
    } catch (const errors::AuthException& ex) {
        EXPECT_EQ(ex.category(), errors::ErrorCategory::ConfigurationError);
    }
}
