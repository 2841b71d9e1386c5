//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemeTransport.hpp
// Purpose: Composition of an authentication-scheme codec with a raw carrier
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <utility>

#include "credo/http/AuthScheme.h"
#include "credo/transport/HeaderTransport.hpp"

namespace credo::transport {

//==========================================================================================================
// SchemeTransport
// Purpose: Frames values with Scheme before handing them to Carrier.
// Template parameters:
//   Scheme: Provides Value, static std::string Encode(const Value&) and
//           static std::optional<Value> Decode(const std::string&).
//   Carrier: Provides Retrieve/Smuggle/Embed over raw strings.
// Notes:
//   - Retrieve yields nullopt when the slot is missing or the framing does not decode; it never throws.
//   - Smuggle and Embed always succeed.
//==========================================================================================================
template <typename Scheme, typename Carrier>
class SchemeTransport {
public:
    using Value = typename Scheme::Value;

    explicit SchemeTransport(Carrier carrier) : carrier(std::move(carrier)) {}

    std::optional<Value> Retrieve(const http::HttpRequest& request) const {
        auto raw = carrier.Retrieve(request);
        if (!raw.has_value()) {
            return std::nullopt;
        }
        return Scheme::Decode(*raw);
    }

    http::HttpRequest Smuggle(const Value& value, const http::HttpRequest& request) const {
        return carrier.Smuggle(Scheme::Encode(value), request);
    }

    http::HttpResponse Embed(const Value& value, const http::HttpResponse& response) const {
        return carrier.Embed(Scheme::Encode(value), response);
    }

    const Carrier& carrierRef() const { return carrier; }

private:
    Carrier carrier;
};

using BearerTokenHeaderTransport = SchemeTransport<http::BearerAuthScheme, HeaderTransport>;
using BasicCredentialsHeaderTransport = SchemeTransport<http::BasicAuthScheme, HeaderTransport>;

inline BearerTokenHeaderTransport bearerTokenHeaderTransport(std::string headerName = "Authorization") {
    return BearerTokenHeaderTransport(HeaderTransport(std::move(headerName)));
}

inline BasicCredentialsHeaderTransport basicCredentialsHeaderTransport(std::string headerName = "Authorization") {
    return BasicCredentialsHeaderTransport(HeaderTransport(std::move(headerName)));
}

} // namespace credo::transport
