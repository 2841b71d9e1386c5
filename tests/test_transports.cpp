//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_transports.cpp
// Purpose: GoogleTests for HTTP message values and the header, cookie, query-string and scheme carriers
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "credo/errors/Errors.h"
#include "credo/http/Message.h"
#include "credo/transport/CookieTransport.hpp"
#include "credo/transport/HeaderTransport.hpp"
#include "credo/transport/QueryStringTransport.hpp"
#include "credo/transport/SchemeTransport.hpp"

using namespace credo;
using namespace credo::transport;
using http::HttpRequest;
using http::HttpResponse;

TEST(HttpMessage, HeadersAreCaseInsensitiveAndReplaced) {
    auto req = HttpRequest().WithHeader("X-Auth-Token", "one").WithHeader("x-auth-token", "two");
    EXPECT_EQ(req.Header("X-AUTH-TOKEN").value_or(""), std::string("two"));
    EXPECT_EQ(req.AllHeaders().Items().size(), 1u);
}

TEST(HttpMessage, RequestFromUriParsesPathAndQuery) {
    auto req = HttpRequest::FromUri("GET", "https://app.example.com/callback?code=abc%20d&state=s1#frag");
    EXPECT_EQ(req.Method(), std::string("GET"));
    EXPECT_EQ(req.Path(), std::string("/callback"));
    EXPECT_EQ(req.QueryParam("code").value_or(""), std::string("abc d"));
    EXPECT_EQ(req.QueryParam("state").value_or(""), std::string("s1"));
    EXPECT_FALSE(req.QueryParam("missing").has_value());
    EXPECT_EQ(req.Uri(), std::string("/callback?code=abc+d&state=s1"));
}

TEST(HttpMessage, CookiesFromMapOrHeader) {
    auto req = HttpRequest().WithHeader("Cookie", "a=1; session=\"quoted\"; b=2");
    EXPECT_EQ(req.Cookie("session").value_or(""), std::string("quoted"));
    EXPECT_EQ(req.Cookie("b").value_or(""), std::string("2"));
    EXPECT_FALSE(req.Cookie("c").has_value());
    EXPECT_EQ(req.WithCookie("b", "explicit").Cookie("b").value_or(""), std::string("explicit"));
}

TEST(HttpMessage, SetCookieRendering) {
    http::Cookie c;
    c.name = "id";
    c.value = "v";
    c.domain = "example.com";
    c.maxAge = std::chrono::seconds(60);
    c.secure = true;
    c.sameSite = "Lax";
    EXPECT_EQ(c.ToSetCookieHeader(), std::string("id=v; Path=/; Domain=example.com; Max-Age=60; Secure; HttpOnly; SameSite=Lax"));
}

TEST(HttpMessage, RedirectAndCookieReplacement) {
    auto resp = HttpResponse::Redirect("https://p/auth");
    EXPECT_EQ(resp.Status(), 303);
    EXPECT_EQ(resp.Header("location").value_or(""), std::string("https://p/auth"));

    http::Cookie first;
    first.name = "n";
    first.value = "1";
    http::Cookie second = first;
    second.value = "2";
    resp = resp.WithCookie(first).WithCookie(second);
    ASSERT_EQ(resp.Cookies().size(), 1u);
    EXPECT_EQ(resp.Cookie("n")->value, std::string("2"));
}

TEST(HeaderTransport, RetrieveSmuggleEmbed) {
    HeaderTransport carrier;
    EXPECT_EQ(carrier.Name(), std::string("X-Auth-Token"));
    EXPECT_FALSE(carrier.Retrieve(HttpRequest()).has_value());

    auto req = carrier.Smuggle("payload", HttpRequest());
    EXPECT_EQ(carrier.Retrieve(req).value_or(""), std::string("payload"));

    auto resp = carrier.Embed("payload", HttpResponse());
    EXPECT_EQ(resp.Header("X-Auth-Token").value_or(""), std::string("payload"));
    EXPECT_EQ(carrier.RetrieveFromResponse(resp).value_or(""), std::string("payload"));
}

TEST(HeaderTransport, EmptyNameIsConfigurationError) {
    EXPECT_THROW(HeaderTransport(""), errors::AuthException);
    EXPECT_THROW(CookieTransport(""), errors::AuthException);
    EXPECT_THROW(QueryStringTransport(""), errors::AuthException);
}

TEST(CookieTransport, EmbedUsesConfiguredAttributes) {
    CookieTransportOptions opts;
    opts.maxAge = std::chrono::seconds(300);
    opts.domain = "example.com";
    CookieTransport carrier("authenticator", opts);

    auto resp = carrier.Embed("token", HttpResponse());
    auto cookie = resp.Cookie("authenticator");
    ASSERT_TRUE(cookie.has_value());
    EXPECT_EQ(cookie->ToSetCookieHeader(),
              std::string("authenticator=token; Path=/; Domain=example.com; Max-Age=300; Secure; HttpOnly; SameSite=Lax"));
    EXPECT_EQ(carrier.RetrieveFromResponse(resp).value_or(""), std::string("token"));

    auto req = carrier.Smuggle("token", HttpRequest());
    EXPECT_EQ(carrier.Retrieve(req).value_or(""), std::string("token"));
}

TEST(CookieTransport, DiscardExpiresTheCookie) {
    CookieTransport carrier("authenticator");
    auto resp = carrier.Discard(carrier.Embed("token", HttpResponse()));
    auto cookie = resp.Cookie("authenticator");
    ASSERT_TRUE(cookie.has_value());
    EXPECT_EQ(cookie->value, std::string());
    EXPECT_EQ(cookie->maxAge, std::optional<std::chrono::seconds>(std::chrono::seconds(0)));
    EXPECT_FALSE(carrier.RetrieveFromResponse(resp).has_value());
}

TEST(QueryStringTransport, EmbedRewritesRedirectTarget) {
    QueryStringTransport carrier("token");
    auto resp = carrier.Embed("abc", HttpResponse::Redirect("https://app/home?x=1&token=old#top"));
    EXPECT_EQ(resp.Header("Location").value_or(""), std::string("https://app/home?x=1&token=abc#top"));
    EXPECT_EQ(carrier.RetrieveFromResponse(resp).value_or(""), std::string("abc"));

    auto bare = carrier.Embed("a b", HttpResponse());
    EXPECT_EQ(bare.Header("Location").value_or(""), std::string("/?token=a+b"));
}

TEST(QueryStringTransport, RetrieveAndSmuggle) {
    QueryStringTransport carrier("token");
    auto req = carrier.Smuggle("v2", HttpRequest::FromUri("GET", "/api?token=v1&other=1"));
    EXPECT_EQ(carrier.Retrieve(req).value_or(""), std::string("v2"));
    EXPECT_EQ(req.Uri(), std::string("/api?other=1&token=v2"));
}

TEST(RetrieveFirst, TriesCarriersInOrder) {
    HeaderTransport header;
    CookieTransport cookie("authenticator");
    QueryStringTransport query("token");

    auto req = HttpRequest::FromUri("GET", "/?token=from-query").WithCookie("authenticator", "from-cookie");
    EXPECT_EQ(RetrieveFirst(req, header, cookie, query).value_or(""), std::string("from-cookie"));
    EXPECT_EQ(RetrieveFirst(req, header, query, cookie).value_or(""), std::string("from-query"));
    EXPECT_FALSE(RetrieveFirst(HttpRequest(), header, cookie, query).has_value());

    std::vector<std::shared_ptr<const IRetrieveFromRequest>> carriers{
        std::make_shared<HeaderTransport>(), std::make_shared<QueryStringTransport>("token")};
    EXPECT_EQ(RetrieveFirst(req, carriers).value_or(""), std::string("from-query"));
}

TEST(SchemeTransport, BearerOverAuthorizationHeader) {
    auto transport = bearerTokenHeaderTransport();
    auto req = transport.Smuggle(http::BearerToken{"jwt"}, HttpRequest());
    EXPECT_EQ(req.Header("Authorization").value_or(""), std::string("Bearer jwt"));
    EXPECT_EQ(transport.Retrieve(req), std::optional<http::BearerToken>(http::BearerToken{"jwt"}));

    EXPECT_FALSE(transport.Retrieve(HttpRequest()).has_value());
    EXPECT_FALSE(transport.Retrieve(HttpRequest().WithHeader("Authorization", "Basic abc")).has_value());
}

TEST(SchemeTransport, BasicOverCustomHeader) {
    auto transport = basicCredentialsHeaderTransport("X-Credentials");
    auto resp = transport.Embed(http::BasicCredentials{"user", "pw"}, HttpResponse());
    EXPECT_EQ(resp.Header("X-Credentials").value_or(""), std::string("Basic dXNlcjpwdw=="));

    auto req = HttpRequest().WithHeader("X-Credentials", "Basic dXNlcjpwdw==");
    auto creds = transport.Retrieve(req);
    ASSERT_TRUE(creds.has_value());
    EXPECT_EQ(creds->identifier, std::string("user"));
    EXPECT_EQ(transport.carrierRef().Name(), std::string("X-Credentials"));
}
