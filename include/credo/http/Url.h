//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Url.h
// Purpose: Form/query percent-encoding and URL splitting helpers
//==========================================================================================================

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace credo::http {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// application/x-www-form-urlencoded encoding (unreserved kept, space -> '+', others %XX).
std::string UrlEncode(const std::string& s);

// Inverse of UrlEncode; malformed %-sequences are kept verbatim.
std::string UrlDecode(const std::string& s);

// "k1=v1&k2=v2" with both keys and values encoded, in the given order.
std::string BuildQuery(const QueryParams& params);

// Splits "a=1&b=2" into decoded pairs; a key without '=' gets an empty value.
QueryParams ParseQuery(const std::string& query);

// Appends params to url, using '?' or '&' depending on whether url already has a query.
std::string AppendQuery(const std::string& url, const QueryParams& params);

//==========================================================================================================
// UrlParts
// Purpose: Components of an absolute http(s) URL. target is path plus query ("/" when empty).
//==========================================================================================================
struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
};

// Defaults: scheme "http" when absent; port 443 for https, 80 otherwise.
UrlParts parseUrl(const std::string& url);

} // namespace credo::http
