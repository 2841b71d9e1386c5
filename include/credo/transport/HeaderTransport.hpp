//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HeaderTransport.hpp
// Purpose: Carrier storing the payload in a named HTTP header
//==========================================================================================================

#pragma once

#include <string>

#include "credo/transport/Transport.h"

namespace credo::transport {

class HeaderTransport : public ICarrier {
public:
    explicit HeaderTransport(std::string headerName = "X-Auth-Token");

    std::optional<std::string> Retrieve(const http::HttpRequest& request) const override;
    http::HttpRequest Smuggle(const std::string& payload, const http::HttpRequest& request) const override;
    http::HttpResponse Embed(const std::string& payload, const http::HttpResponse& response) const override;
    std::optional<std::string> RetrieveFromResponse(const http::HttpResponse& response) const override;
    const std::string& Name() const override { return headerName; }

private:
    std::string headerName;
};

} // namespace credo::transport
