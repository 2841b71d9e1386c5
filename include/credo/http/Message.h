//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Message.h
// Purpose: Immutable HTTP request/response values consumed by the transport carriers
//==========================================================================================================

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "credo/http/Url.h"

namespace credo::http {

struct HeaderKV {
    std::string name;
    std::string value;
};

// Case-insensitive ASCII comparison used for header names and scheme prefixes.
bool iequals(const std::string& a, const std::string& b);

//==========================================================================================================
// Headers
// Purpose: Ordered header list with case-insensitive lookup. Set() replaces every value of a name.
//==========================================================================================================
class Headers {
public:
    std::optional<std::string> Get(const std::string& name) const;
    void Set(const std::string& name, const std::string& value);
    void Remove(const std::string& name);
    const std::vector<HeaderKV>& Items() const { return items; }

private:
    std::vector<HeaderKV> items;
};

//==========================================================================================================
// Cookie
// Purpose: A response cookie and its attributes; rendered as a Set-Cookie header value.
//==========================================================================================================
struct Cookie {
    std::string name;
    std::string value;
    std::string path{"/"};
    std::string domain;
    std::optional<std::chrono::seconds> maxAge;
    bool secure{false};
    bool httpOnly{true};
    std::string sameSite;

    std::string ToSetCookieHeader() const;
};

//==========================================================================================================
// HttpRequest
// Purpose: Read-only request view; With* methods return modified copies.
// Notes:
//   - Cookie() consults explicit cookies first, then the "Cookie" header.
//   - Query parameters keep their order; WithQueryParam replaces every occurrence of a name.
//==========================================================================================================
class HttpRequest {
public:
    HttpRequest() = default;
    HttpRequest(std::string method, std::string path);

    // Parses "path?query" (or an absolute URL, whose path and query are kept) with percent-decoding.
    static HttpRequest FromUri(std::string method, const std::string& uri);

    const std::string& Method() const { return method; }
    const std::string& Path() const { return path; }
    const std::string& Body() const { return body; }
    const Headers& AllHeaders() const { return headers; }
    const QueryParams& AllQueryParams() const { return query; }

    std::optional<std::string> Header(const std::string& name) const { return headers.Get(name); }
    std::optional<std::string> Cookie(const std::string& name) const;
    std::optional<std::string> QueryParam(const std::string& name) const;

    HttpRequest WithHeader(const std::string& name, const std::string& value) const;
    HttpRequest WithCookie(const std::string& name, const std::string& value) const;
    HttpRequest WithQueryParam(const std::string& name, const std::string& value) const;
    HttpRequest WithBody(std::string value) const;

    // path + "?" + encoded query (query omitted when empty).
    std::string Uri() const;

private:
    std::string method{"GET"};
    std::string path{"/"};
    Headers headers;
    std::map<std::string, std::string> cookies;
    QueryParams query;
    std::string body;
};

//==========================================================================================================
// HttpResponse
// Purpose: Outgoing response value; cookies are kept as structured Set-Cookie entries.
//==========================================================================================================
class HttpResponse {
public:
    HttpResponse() = default;
    explicit HttpResponse(int status);

    // 303 See Other with Location set.
    static HttpResponse Redirect(const std::string& location);

    int Status() const { return status; }
    const std::string& Body() const { return body; }
    const Headers& AllHeaders() const { return headers; }
    const std::vector<http::Cookie>& Cookies() const { return cookies; }

    std::optional<std::string> Header(const std::string& name) const { return headers.Get(name); }
    std::optional<http::Cookie> Cookie(const std::string& name) const;

    HttpResponse WithStatus(int value) const;
    HttpResponse WithHeader(const std::string& name, const std::string& value) const;
    HttpResponse WithCookie(http::Cookie cookie) const;
    HttpResponse WithBody(std::string value) const;

private:
    int status{200};
    Headers headers;
    std::vector<http::Cookie> cookies;
    std::string body;
};

} // namespace credo::http
