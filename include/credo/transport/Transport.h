//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Carrier interfaces for moving a serialized credential in and out of HTTP messages
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "credo/http/Message.h"

namespace credo::transport {

// Looks up the carrier slot. Absence is not an error.
class IRetrieveFromRequest {
public:
    virtual ~IRetrieveFromRequest() = default;
    virtual std::optional<std::string> Retrieve(const http::HttpRequest& request) const = 0;
};

// Client side: re-inject a payload into a request being forwarded.
class ISmuggleIntoRequest {
public:
    virtual ~ISmuggleIntoRequest() = default;
    virtual http::HttpRequest Smuggle(const std::string& payload, const http::HttpRequest& request) const = 0;
};

// Server side: hand a payload back to the client.
class IEmbedIntoResponse {
public:
    virtual ~IEmbedIntoResponse() = default;
    virtual http::HttpResponse Embed(const std::string& payload, const http::HttpResponse& response) const = 0;
};

// A carrier implementing all three operations over one named slot.
class ICarrier : public IRetrieveFromRequest, public ISmuggleIntoRequest, public IEmbedIntoResponse {
public:
    // Reads back what Embed wrote (client side of a response).
    virtual std::optional<std::string> RetrieveFromResponse(const http::HttpResponse& response) const = 0;
    virtual const std::string& Name() const = 0;
};

//==========================================================================================================
// RetrieveFirst
// Purpose: Returns the first payload found, trying carriers in order.
//==========================================================================================================
template <typename... Carriers>
std::optional<std::string> RetrieveFirst(const http::HttpRequest& request, const Carriers&... carriers) {
    std::optional<std::string> found;
    (void)((found = carriers.Retrieve(request), found.has_value()) || ...);
    return found;
}

std::optional<std::string> RetrieveFirst(const http::HttpRequest& request,
                                         const std::vector<std::shared_ptr<const IRetrieveFromRequest>>& carriers);

} // namespace credo::transport
