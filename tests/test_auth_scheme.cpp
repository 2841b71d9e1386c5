//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_auth_scheme.cpp
// Purpose: GoogleTests for Basic/Bearer scheme framing and URL/query helpers
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "credo/http/AuthScheme.h"
#include "credo/http/Url.h"

using namespace credo::http;

TEST(BasicAuthScheme, EncodeAndDecode) {
    const std::string header = BasicAuthScheme::Encode(BasicCredentials{"Aladdin", "open sesame"});
    EXPECT_EQ(header, std::string("Basic QWxhZGRpbjpvcGVuIHNlc2FtZQ=="));
    auto decoded = BasicAuthScheme::Decode(header);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, (BasicCredentials{"Aladdin", "open sesame"}));
}

TEST(BasicAuthScheme, PasswordMayContainColons) {
    auto decoded = BasicAuthScheme::Decode(BasicAuthScheme::Encode(BasicCredentials{"user", "a:b:c"}));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->identifier, std::string("user"));
    EXPECT_EQ(decoded->password, std::string("a:b:c"));
}

TEST(BasicAuthScheme, TolerantPrefixAndStrictPayload) {
    EXPECT_TRUE(BasicAuthScheme::Decode("basic   QWxhZGRpbjpvcGVuIHNlc2FtZQ==").has_value());
    EXPECT_FALSE(BasicAuthScheme::Decode("Bearer QWxhZGRpbjpvcGVuIHNlc2FtZQ==").has_value());
    EXPECT_FALSE(BasicAuthScheme::Decode("Basic !!!!").has_value());
    // "nocolon"
    EXPECT_FALSE(BasicAuthScheme::Decode("Basic bm9jb2xvbg==").has_value());
    EXPECT_FALSE(BasicAuthScheme::Decode("Basic").has_value());
}

TEST(BearerAuthScheme, EncodeAndDecode) {
    EXPECT_EQ(BearerAuthScheme::Encode(BearerToken{"abc.def"}), std::string("Bearer abc.def"));
    EXPECT_EQ(BearerAuthScheme::Decode("Bearer abc.def"), std::optional<BearerToken>(BearerToken{"abc.def"}));
    EXPECT_EQ(BearerAuthScheme::Decode("bearer xyz"), std::optional<BearerToken>(BearerToken{"xyz"}));
    EXPECT_FALSE(BearerAuthScheme::Decode("Bearer ").has_value());
    EXPECT_FALSE(BearerAuthScheme::Decode("Basic abc").has_value());
    EXPECT_FALSE(BearerAuthScheme::Decode("").has_value());
}

TEST(Url, EncodeDecodeFormComponents) {
    EXPECT_EQ(UrlEncode("a b&c=d/é"), std::string("a+b%26c%3Dd%2F%C3%A9"));
    EXPECT_EQ(UrlEncode("safe-_.~"), std::string("safe-_.~"));
    EXPECT_EQ(UrlDecode("a+b%26c%3dd"), std::string("a b&c=d"));
    EXPECT_EQ(UrlDecode("100%"), std::string("100%"));
    EXPECT_EQ(UrlDecode("%zz"), std::string("%zz"));
}

TEST(Url, QueryBuildParseAndAppend) {
    QueryParams params{{"client_id", "my app"}, {"state", "x.y"}};
    EXPECT_EQ(BuildQuery(params), std::string("client_id=my+app&state=x.y"));

    auto parsed = ParseQuery("a=1&&flag&b=two+words");
    ASSERT_EQ(parsed.size(), 3u);
    EXPECT_EQ(parsed[0], (std::pair<std::string, std::string>("a", "1")));
    EXPECT_EQ(parsed[1], (std::pair<std::string, std::string>("flag", "")));
    EXPECT_EQ(parsed[2], (std::pair<std::string, std::string>("b", "two words")));

    EXPECT_EQ(AppendQuery("https://p/auth", {{"k", "v"}}), std::string("https://p/auth?k=v"));
    EXPECT_EQ(AppendQuery("https://p/auth?x=1", {{"k", "v"}}), std::string("https://p/auth?x=1&k=v"));
    EXPECT_EQ(AppendQuery("https://p/auth", {}), std::string("https://p/auth"));
}

TEST(Url, ParseAbsoluteUrls) {
    auto https = parseUrl("https://api.example.com/v1/me?fields=id");
    EXPECT_EQ(https.scheme, std::string("https"));
    EXPECT_EQ(https.host, std::string("api.example.com"));
    EXPECT_EQ(https.port, std::string("443"));
    EXPECT_EQ(https.target, std::string("/v1/me?fields=id"));

    auto local = parseUrl("http://127.0.0.1:8080");
    EXPECT_EQ(local.port, std::string("8080"));
    EXPECT_EQ(local.target, std::string("/"));

    auto queryOnly = parseUrl("http://host?x=1");
    EXPECT_EQ(queryOnly.host, std::string("host"));
    EXPECT_EQ(queryOnly.port, std::string("80"));
    EXPECT_EQ(queryOnly.target, std::string("/?x=1"));
}
