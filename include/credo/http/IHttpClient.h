//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: IHttpClient.h
// Purpose: Injected outbound HTTP capability used by the OAuth2 engine
//==========================================================================================================

#pragma once

#include <future>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "credo/http/Message.h"

namespace credo::http {

//==========================================================================================================
// HttpCall
// Purpose: One outbound request. url is absolute (http or https).
//==========================================================================================================
struct HttpCall {
    std::string method{"GET"};
    std::string url;
    std::vector<HeaderKV> headers;
    std::string body;
};

struct HttpCallResult {
    int status{0};
    std::vector<HeaderKV> headers;
    std::string body;

    std::optional<std::string> Header(const std::string& name) const {
        for (const auto& kv : headers) {
            if (iequals(kv.name, name)) return kv.value;
        }
        return std::nullopt;
    }

    bool IsSuccess() const { return status >= 200 && status < 300; }
};

// Network-level failure (resolve, connect, TLS, timeout, malformed response).
class HttpClientError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//==========================================================================================================
// IHttpClient
// Purpose: Executes a call; transport failures are delivered as exceptions through the future.
//==========================================================================================================
class IHttpClient {
public:
    virtual ~IHttpClient() = default;
    virtual std::future<HttpCallResult> Execute(HttpCall call) = 0;
};

} // namespace credo::http
