//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BeastHttpClient.hpp
// Purpose: Boost.Beast implementation of IHttpClient (HTTP and HTTPS via OpenSSL)
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "credo/http/IHttpClient.h"

namespace credo::http {

//==========================================================================================================
// BeastHttpClientOptions
// Fields:
//   connectTimeoutMs: Resolve + connect + TLS handshake budget.
//   readTimeoutMs: Write request + read response budget.
//   caFile/caPath: Extra trust anchors for https (system defaults are always loaded).
//   verifyPeer: Verify the server certificate chain and host name.
//   userAgent: Sent as User-Agent unless the call sets one; empty selects "credo/<version>".
//==========================================================================================================
struct BeastHttpClientOptions {
    unsigned int connectTimeoutMs{5000};
    unsigned int readTimeoutMs{10000};
    std::string caFile;
    std::string caPath;
    bool verifyPeer{true};
    std::string userAgent;
};

//==========================================================================================================
// BeastHttpClient
// Purpose: Runs each call as a Boost.Asio coroutine on a private io_context thread.
// Notes:
//   - One connection per call ("Connection: close").
//   - Failures surface as HttpClientError from the returned future.
//==========================================================================================================
class BeastHttpClient : public IHttpClient {
public:
    using Options = BeastHttpClientOptions;

    BeastHttpClient();
    explicit BeastHttpClient(Options opts);
    ~BeastHttpClient() override;

    BeastHttpClient(const BeastHttpClient&) = delete;
    BeastHttpClient& operator=(const BeastHttpClient&) = delete;

    std::future<HttpCallResult> Execute(HttpCall call) override;

    // Semicolon-delimited key=value config, e.g. "connectTimeoutMs=500; readTimeoutMs=1500; verifyPeer=0".
    // Timeout defaults come from CREDO_HTTP_CONNECT_TIMEOUT_MS / CREDO_HTTP_READ_TIMEOUT_MS when set.
    static Options ParseOptions(const std::string& config);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace credo::http
