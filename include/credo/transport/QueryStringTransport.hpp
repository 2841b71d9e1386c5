//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: QueryStringTransport.hpp
// Purpose: Carrier storing the payload in a named query-string parameter
//==========================================================================================================

#pragma once

#include <string>

#include "credo/transport/Transport.h"

namespace credo::transport {

//==========================================================================================================
// QueryStringTransport
// Purpose: Request query parameter carrier. Embed writes the parameter into the response's redirect target
//          (Location header), replacing any existing value of the same name; "/" is used when no Location
//          is set yet.
//==========================================================================================================
class QueryStringTransport : public ICarrier {
public:
    explicit QueryStringTransport(std::string paramName);

    std::optional<std::string> Retrieve(const http::HttpRequest& request) const override;
    http::HttpRequest Smuggle(const std::string& payload, const http::HttpRequest& request) const override;
    http::HttpResponse Embed(const std::string& payload, const http::HttpResponse& response) const override;
    std::optional<std::string> RetrieveFromResponse(const http::HttpResponse& response) const override;
    const std::string& Name() const override { return paramName; }

private:
    std::string paramName;
};

} // namespace credo::transport
