//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transports.cpp
// Purpose: Header, cookie and query-string carrier implementations
//==========================================================================================================

#include "credo/errors/Errors.h"
#include "credo/transport/CookieTransport.hpp"
#include "credo/transport/HeaderTransport.hpp"
#include "credo/transport/QueryStringTransport.hpp"

namespace credo::transport {

namespace {

void requireName(const std::string& name, const char* carrier) {
    if (name.empty()) {
        errors::raise(errors::ConfigurationError(std::string(carrier) + " name must not be empty"));
    }
}

// Sets (or replaces) param in the query of target, keeping any fragment.
std::string replaceQueryParam(const std::string& target, const std::string& name, const std::string& value) {
    std::string base = target;
    std::string fragment;
    const std::size_t hash = base.find('#');
    if (hash != std::string::npos) {
        fragment = base.substr(hash);
        base = base.substr(0, hash);
    }
    http::QueryParams params;
    const std::size_t q = base.find('?');
    if (q != std::string::npos) {
        params = http::ParseQuery(base.substr(q + 1));
        base = base.substr(0, q);
    }
    http::QueryParams kept;
    for (auto& p : params) {
        if (p.first != name) {
            kept.push_back(std::move(p));
        }
    }
    kept.emplace_back(name, value);
    return base + std::string("?") + http::BuildQuery(kept) + fragment;
}

} // namespace

std::optional<std::string> RetrieveFirst(const http::HttpRequest& request,
                                         const std::vector<std::shared_ptr<const IRetrieveFromRequest>>& carriers) {
    for (const auto& carrier : carriers) {
        if (!carrier) continue;
        auto found = carrier->Retrieve(request);
        if (found.has_value()) {
            return found;
        }
    }
    return std::nullopt;
}

//------------------------------ HeaderTransport ------------------------------

HeaderTransport::HeaderTransport(std::string headerName) : headerName(std::move(headerName)) {
    requireName(this->headerName, "header");
}

std::optional<std::string> HeaderTransport::Retrieve(const http::HttpRequest& request) const {
    return request.Header(headerName);
}

http::HttpRequest HeaderTransport::Smuggle(const std::string& payload, const http::HttpRequest& request) const {
    return request.WithHeader(headerName, payload);
}

http::HttpResponse HeaderTransport::Embed(const std::string& payload, const http::HttpResponse& response) const {
    return response.WithHeader(headerName, payload);
}

std::optional<std::string> HeaderTransport::RetrieveFromResponse(const http::HttpResponse& response) const {
    return response.Header(headerName);
}

//------------------------------ CookieTransport ------------------------------

CookieTransport::CookieTransport(std::string cookieName) : CookieTransport(std::move(cookieName), Options()) {}

CookieTransport::CookieTransport(std::string cookieName, Options opts)
    : cookieName(std::move(cookieName)), opts(std::move(opts)) {
    requireName(this->cookieName, "cookie");
}

http::Cookie CookieTransport::makeCookie(const std::string& value) const {
    http::Cookie c;
    c.name = cookieName;
    c.value = value;
    c.path = opts.path;
    c.domain = opts.domain;
    c.maxAge = opts.maxAge;
    c.secure = opts.secure;
    c.httpOnly = opts.httpOnly;
    c.sameSite = opts.sameSite;
    return c;
}

std::optional<std::string> CookieTransport::Retrieve(const http::HttpRequest& request) const {
    return request.Cookie(cookieName);
}

http::HttpRequest CookieTransport::Smuggle(const std::string& payload, const http::HttpRequest& request) const {
    return request.WithCookie(cookieName, payload);
}

http::HttpResponse CookieTransport::Embed(const std::string& payload, const http::HttpResponse& response) const {
    return response.WithCookie(makeCookie(payload));
}

std::optional<std::string> CookieTransport::RetrieveFromResponse(const http::HttpResponse& response) const {
    auto cookie = response.Cookie(cookieName);
    if (!cookie.has_value() || (cookie->maxAge.has_value() && cookie->maxAge->count() <= 0)) {
        return std::nullopt;
    }
    return cookie->value;
}

http::HttpResponse CookieTransport::Discard(const http::HttpResponse& response) const {
    http::Cookie c = makeCookie(std::string());
    c.maxAge = std::chrono::seconds(0);
    return response.WithCookie(std::move(c));
}

//------------------------------ QueryStringTransport ------------------------------

QueryStringTransport::QueryStringTransport(std::string paramName) : paramName(std::move(paramName)) {
    requireName(this->paramName, "query parameter");
}

std::optional<std::string> QueryStringTransport::Retrieve(const http::HttpRequest& request) const {
    return request.QueryParam(paramName);
}

http::HttpRequest QueryStringTransport::Smuggle(const std::string& payload, const http::HttpRequest& request) const {
    return request.WithQueryParam(paramName, payload);
}

http::HttpResponse QueryStringTransport::Embed(const std::string& payload, const http::HttpResponse& response) const {
    const std::string target = response.Header("Location").value_or(std::string("/"));
    return response.WithHeader("Location", replaceQueryParam(target, paramName, payload));
}

std::optional<std::string> QueryStringTransport::RetrieveFromResponse(const http::HttpResponse& response) const {
    auto location = response.Header("Location");
    if (!location.has_value()) {
        return std::nullopt;
    }
    return http::HttpRequest::FromUri("GET", *location).QueryParam(paramName);
}

} // namespace credo::transport
