//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Message.cpp
// Purpose: HTTP request/response value implementation
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <sstream>

#include "credo/http/Message.h"

namespace credo::http {

namespace {

std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) ++b;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) --e;
    return s.substr(b, e - b);
}

// Parses a Cookie request header ("a=1; b=2") looking for name.
std::optional<std::string> findInCookieHeader(const std::string& header, const std::string& name) {
    std::size_t pos = 0;
    while (pos <= header.size()) {
        std::size_t semi = header.find(';', pos);
        if (semi == std::string::npos) semi = header.size();
        const std::string pair = trim(header.substr(pos, semi - pos));
        const std::size_t eq = pair.find('=');
        if (eq != std::string::npos && pair.substr(0, eq) == name) {
            std::string value = pair.substr(eq + 1);
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            return value;
        }
        pos = semi + 1;
    }
    return std::nullopt;
}

} // namespace

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

//------------------------------ Headers ------------------------------

std::optional<std::string> Headers::Get(const std::string& name) const {
    for (const auto& kv : items) {
        if (iequals(kv.name, name)) {
            return kv.value;
        }
    }
    return std::nullopt;
}

void Headers::Set(const std::string& name, const std::string& value) {
    Remove(name);
    items.push_back(HeaderKV{name, value});
}

void Headers::Remove(const std::string& name) {
    items.erase(std::remove_if(items.begin(), items.end(),
                               [&](const HeaderKV& kv) { return iequals(kv.name, name); }),
                items.end());
}

//------------------------------ Cookie ------------------------------

std::string Cookie::ToSetCookieHeader() const {
    std::ostringstream oss;
    oss << name << '=' << value;
    if (!path.empty()) oss << "; Path=" << path;
    if (!domain.empty()) oss << "; Domain=" << domain;
    if (maxAge.has_value()) oss << "; Max-Age=" << maxAge->count();
    if (secure) oss << "; Secure";
    if (httpOnly) oss << "; HttpOnly";
    if (!sameSite.empty()) oss << "; SameSite=" << sameSite;
    return oss.str();
}

//------------------------------ HttpRequest ------------------------------

HttpRequest::HttpRequest(std::string method, std::string path)
    : method(std::move(method)), path(std::move(path)) {}

HttpRequest HttpRequest::FromUri(std::string method, const std::string& uri) {
    std::string local = uri;
    const std::size_t schemeEnd = local.find("://");
    if (schemeEnd != std::string::npos) {
        const std::size_t start = local.find_first_of("/?", schemeEnd + 3);
        local = (start == std::string::npos) ? std::string("/") : local.substr(start);
    }
    const std::size_t hash = local.find('#');
    if (hash != std::string::npos) {
        local = local.substr(0, hash);
    }
    HttpRequest req;
    req.method = std::move(method);
    const std::size_t q = local.find('?');
    if (q == std::string::npos) {
        req.path = local.empty() ? std::string("/") : local;
    } else {
        req.path = (q == 0) ? std::string("/") : local.substr(0, q);
        req.query = ParseQuery(local.substr(q + 1));
    }
    return req;
}

std::optional<std::string> HttpRequest::Cookie(const std::string& name) const {
    auto it = cookies.find(name);
    if (it != cookies.end()) {
        return it->second;
    }
    auto header = headers.Get("Cookie");
    if (!header.has_value()) {
        return std::nullopt;
    }
    return findInCookieHeader(*header, name);
}

std::optional<std::string> HttpRequest::QueryParam(const std::string& name) const {
    for (const auto& [key, value] : query) {
        if (key == name) {
            return value;
        }
    }
    return std::nullopt;
}

HttpRequest HttpRequest::WithHeader(const std::string& name, const std::string& value) const {
    HttpRequest copy(*this);
    copy.headers.Set(name, value);
    return copy;
}

HttpRequest HttpRequest::WithCookie(const std::string& name, const std::string& value) const {
    HttpRequest copy(*this);
    copy.cookies[name] = value;
    return copy;
}

HttpRequest HttpRequest::WithQueryParam(const std::string& name, const std::string& value) const {
    HttpRequest copy(*this);
    copy.query.erase(std::remove_if(copy.query.begin(), copy.query.end(),
                                    [&](const std::pair<std::string, std::string>& p) { return p.first == name; }),
                     copy.query.end());
    copy.query.emplace_back(name, value);
    return copy;
}

HttpRequest HttpRequest::WithBody(std::string value) const {
    HttpRequest copy(*this);
    copy.body = std::move(value);
    return copy;
}

std::string HttpRequest::Uri() const {
    if (query.empty()) {
        return path;
    }
    return path + std::string("?") + BuildQuery(query);
}

//------------------------------ HttpResponse ------------------------------

HttpResponse::HttpResponse(int status) : status(status) {}

HttpResponse HttpResponse::Redirect(const std::string& location) {
    return HttpResponse(303).WithHeader("Location", location);
}

std::optional<http::Cookie> HttpResponse::Cookie(const std::string& name) const {
    for (const auto& c : cookies) {
        if (c.name == name) {
            return c;
        }
    }
    return std::nullopt;
}

HttpResponse HttpResponse::WithStatus(int value) const {
    HttpResponse copy(*this);
    copy.status = value;
    return copy;
}

HttpResponse HttpResponse::WithHeader(const std::string& name, const std::string& value) const {
    HttpResponse copy(*this);
    copy.headers.Set(name, value);
    return copy;
}

HttpResponse HttpResponse::WithCookie(http::Cookie cookie) const {
    HttpResponse copy(*this);
    copy.cookies.erase(std::remove_if(copy.cookies.begin(), copy.cookies.end(),
                                      [&](const http::Cookie& c) { return c.name == cookie.name; }),
                       copy.cookies.end());
    copy.cookies.push_back(std::move(cookie));
    return copy;
}

HttpResponse HttpResponse::WithBody(std::string value) const {
    HttpResponse copy(*this);
    copy.body = std::move(value);
    return copy;
}

} // namespace credo::http
