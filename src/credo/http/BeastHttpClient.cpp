//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BeastHttpClient.cpp
// Purpose: Coroutine-based Boost.Beast HTTP/HTTPS client running on a private io_context
//==========================================================================================================

#include <chrono>
#include <string>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include "credo/config/KeyValueConfig.h"
#include "credo/errors/Errors.h"
#include "credo/http/BeastHttpClient.hpp"
#include "credo/http/Url.h"
#include "credo/version.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace credo::http {

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

using Request = bhttp::request<bhttp::string_body>;

template <typename Stream>
void armTimer(Stream& stream, unsigned int timeoutMs) {
    if (timeoutMs > 0) {
        beast::get_lowest_layer(stream).expires_after(std::chrono::milliseconds(timeoutMs));
    } else {
        beast::get_lowest_layer(stream).expires_never();
    }
}

template <typename Stream>
net::awaitable<HttpCallResult> roundTrip(Stream& stream, Request& req, unsigned int readTimeoutMs) {
    armTimer(stream, readTimeoutMs);
    co_await bhttp::async_write(stream, req, net::use_awaitable);
    beast::flat_buffer buffer;
    bhttp::response<bhttp::string_body> res;
    co_await bhttp::async_read(stream, buffer, res, net::use_awaitable);

    HttpCallResult out;
    out.status = static_cast<int>(res.result_int());
    for (const auto& field : res) {
        out.headers.push_back(HeaderKV{std::string(field.name_string()), std::string(field.value())});
    }
    out.body = std::move(res.body());
    co_return out;
}

} // namespace

class BeastHttpClient::Impl {
public:
    Options opts;
    net::io_context ioc;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::thread ioThread;
    std::unique_ptr<ssl::context> sslCtx;

    explicit Impl(Options o) : opts(std::move(o)) {
        if (opts.userAgent.empty()) {
            opts.userAgent = std::string("credo/") + getVersionString();
        }
        sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
        ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_2_VERSION);
        ::ERR_clear_error();
        try {
            sslCtx->set_default_verify_paths();
        } catch (const boost::system::system_error& e) {
            LOG_DEBUG("BeastHttpClient: set_default_verify_paths failed: {}", e.what());
        }
        try {
            if (!opts.caFile.empty()) { sslCtx->load_verify_file(opts.caFile); }
            if (!opts.caPath.empty()) { sslCtx->add_verify_path(opts.caPath); }
        } catch (const boost::system::system_error& e) {
            LOG_ERROR("BeastHttpClient: failed to load CA file/path: {}", e.what());
            errors::raise(errors::ConfigurationError(std::string("cannot load CA material: ") + e.what()));
        }
        sslCtx->set_verify_mode(opts.verifyPeer ? ssl::verify_peer : ssl::verify_none);

        workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(ioc));
        ioThread = std::thread([this]() { ioc.run(); });
    }

    ~Impl() {
        workGuard.reset();
        ioc.stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }
    }

    Request buildRequest(const HttpCall& call, const UrlParts& u, bhttp::verb verb) const {
        Request req{verb, u.target, 11};
        const bool defaultPort = (u.scheme == "https" && u.port == "443") || (u.scheme == "http" && u.port == "80");
        req.set(bhttp::field::host, defaultPort ? u.host : u.host + std::string(":") + u.port);
        req.set(bhttp::field::user_agent, opts.userAgent);
        req.set(bhttp::field::connection, "close");
        for (const auto& h : call.headers) {
            req.set(h.name, h.value);
        }
        if (!call.body.empty() || verb == bhttp::verb::post || verb == bhttp::verb::put) {
            req.body() = call.body;
            req.prepare_payload();
        }
        return req;
    }

    net::awaitable<HttpCallResult> coExchange(HttpCall call) {
        UrlParts u = parseUrl(call.url);
        if (u.scheme != "http" && u.scheme != "https") {
            throw HttpClientError(std::string("unsupported URL scheme: ") + u.scheme);
        }
        const bhttp::verb verb = bhttp::string_to_verb(call.method);
        if (verb == bhttp::verb::unknown) {
            throw HttpClientError(std::string("unsupported HTTP method: ") + call.method);
        }
        Request req = buildRequest(call, u, verb);

        auto executor = co_await net::this_coro::executor;
        tcp::resolver resolver(executor);
        LOG_DEBUG("BeastHttpClient: {} {}:{}{}", call.method, u.host, u.port, u.target);

        if (u.scheme == "https") {
            // TLS host setup precedes resolution so a name OpenSSL refuses never reaches DNS.
            beast::ssl_stream<beast::tcp_stream> stream(executor, *sslCtx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), u.host.c_str())) {
                throw HttpClientError(std::string("failed to set SNI host name ") + u.host);
            }
            if (opts.verifyPeer && !::SSL_set1_host(stream.native_handle(), u.host.c_str())) {
                throw HttpClientError(std::string("failed to set verified host name ") + u.host);
            }
            auto results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);
            armTimer(stream, opts.connectTimeoutMs);
            co_await beast::get_lowest_layer(stream).async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            HttpCallResult out = co_await roundTrip(stream, req, opts.readTimeoutMs);
            boost::system::error_code ec;
            co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
            if (ec && ec != net::ssl::error::stream_truncated) {
                LOG_DEBUG("BeastHttpClient: TLS shutdown: {}", ec.message());
            }
            co_return out;
        }

        auto results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);
        beast::tcp_stream stream(executor);
        armTimer(stream, opts.connectTimeoutMs);
        co_await stream.async_connect(results, net::use_awaitable);
        HttpCallResult out = co_await roundTrip(stream, req, opts.readTimeoutMs);
        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return out;
    }

    net::awaitable<HttpCallResult> coExecute(HttpCall call) {
        const std::string url = call.url;
        try {
            co_return co_await coExchange(std::move(call));
        } catch (const boost::system::system_error& e) {
            LOG_WARN("BeastHttpClient: request to {} failed: {}", url, e.what());
            throw HttpClientError(std::string("HTTP request to ") + url + std::string(" failed: ") + e.what());
        }
    }
};

BeastHttpClient::BeastHttpClient() : BeastHttpClient(Options()) {}

BeastHttpClient::BeastHttpClient(Options opts) : pImpl(std::make_unique<Impl>(std::move(opts))) {}

BeastHttpClient::~BeastHttpClient() = default;

std::future<HttpCallResult> BeastHttpClient::Execute(HttpCall call) {
    return net::co_spawn(pImpl->ioc, pImpl->coExecute(std::move(call)), net::use_future);
}

BeastHttpClient::Options BeastHttpClient::ParseOptions(const std::string& config) {
    Options opts;
    opts.connectTimeoutMs = static_cast<unsigned int>(
        GetEnvUnsignedOrDefault("CREDO_HTTP_CONNECT_TIMEOUT_MS", opts.connectTimeoutMs));
    opts.readTimeoutMs = static_cast<unsigned int>(
        GetEnvUnsignedOrDefault("CREDO_HTTP_READ_TIMEOUT_MS", opts.readTimeoutMs));
    config::forEachKeyValue(config, [&](const std::string& key, const std::string& val) {
        if (key == "connectTimeoutMs") {
            config::parseUnsignedInto(key, val, opts.connectTimeoutMs);
        }
        else if (key == "readTimeoutMs") {
            config::parseUnsignedInto(key, val, opts.readTimeoutMs);
        }
        else if (key == "caFile") {
            opts.caFile = val;
        }
        else if (key == "caPath") {
            opts.caPath = val;
        }
        else if (key == "verifyPeer") {
            config::parseBoolInto(key, val, opts.verifyPeer);
        }
        else if (key == "userAgent") {
            opts.userAgent = val;
        }
        else {
            LOG_WARN("BeastHttpClient: ignoring unknown option {}", key);
        }
    });
    return opts;
}

} // namespace credo::http
