//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CookieTransport.hpp
// Purpose: Carrier storing the payload in a named cookie
//==========================================================================================================

#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "credo/transport/Transport.h"

namespace credo::transport {

//==========================================================================================================
// CookieTransportOptions
// Purpose: Attributes written with the Set-Cookie entry on Embed.
// Fields:
//   maxAge: Absent = session cookie.
//   sameSite: "Lax", "Strict", "None" or empty to omit.
//==========================================================================================================
struct CookieTransportOptions {
    std::string path{"/"};
    std::string domain;
    std::optional<std::chrono::seconds> maxAge;
    bool secure{true};
    bool httpOnly{true};
    std::string sameSite{"Lax"};
};

class CookieTransport : public ICarrier {
public:
    using Options = CookieTransportOptions;

    explicit CookieTransport(std::string cookieName);
    CookieTransport(std::string cookieName, Options opts);

    std::optional<std::string> Retrieve(const http::HttpRequest& request) const override;
    http::HttpRequest Smuggle(const std::string& payload, const http::HttpRequest& request) const override;
    http::HttpResponse Embed(const std::string& payload, const http::HttpResponse& response) const override;

    // Empty/expired cookies (Max-Age=0) are reported as absent.
    std::optional<std::string> RetrieveFromResponse(const http::HttpResponse& response) const override;
    const std::string& Name() const override { return cookieName; }

    // Expires the cookie on the client (empty value, Max-Age=0).
    http::HttpResponse Discard(const http::HttpResponse& response) const;

    const Options& options() const { return opts; }

private:
    http::Cookie makeCookie(const std::string& value) const;

    std::string cookieName;
    Options opts;
};

} // namespace credo::transport
