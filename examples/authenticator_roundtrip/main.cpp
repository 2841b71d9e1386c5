//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Example minting an authenticator, carrying it as a signed JWT cookie and validating it back
//==========================================================================================================

#include <chrono>
#include <iostream>
#include <memory>

#include "credo/authenticator/HmacJwtClaimsCodec.h"
#include "credo/authenticator/JwtFormat.h"
#include "credo/errors/Errors.h"
#include "credo/transport/CookieTransport.hpp"
#include "credo/transport/SchemeTransport.hpp"
#include "credo/validation/Validators.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

using namespace credo;

int main() {
    Logger::configureFromEnvironment();
    auto clock = std::make_shared<SystemClock>();

    authenticator::HmacJwtClaimsCodecOptions codecOpts;
    codecOpts.secret = GetEnvOrDefault("CREDO_DEMO_SECRET", "change-me");
    auto codec = std::make_shared<authenticator::HmacJwtClaimsCodec>(codecOpts);
    authenticator::JwtFormat format(codec, codec);

    // Server side: mint, encode and embed into a cookie
    auto auth = authenticator::Authenticator::Create(LoginInfo{"credentials", "user@example.com"})
                    .WithExpiry(std::chrono::hours(12), *clock)
                    .WithFingerprint("demo-browser")
                    .WithTag("admin")
                    .Touch(*clock);
    const std::string token = format.Write(auth).get();

    transport::CookieTransport cookies("authenticator");
    auto response = cookies.Embed(token, http::HttpResponse::Redirect("/dashboard"));
    std::cout << "Set-Cookie: " << response.Cookie("authenticator")->ToSetCookieHeader() << "\n";

    // Next request: the browser sends the cookie back; an API client uses a bearer header instead
    auto bearer = transport::bearerTokenHeaderTransport();
    auto request = cookies.Smuggle(token, http::HttpRequest::FromUri("GET", "/dashboard"));
    auto apiRequest = bearer.Smuggle(http::BearerToken{token}, http::HttpRequest::FromUri("GET", "/api/me"));

    validation::ValidatorChain chain;
    chain.Add(std::make_shared<validation::ExpirationValidator>(clock))
         .Add(std::make_shared<validation::FingerprintValidator>("demo-browser"))
         .Add(std::make_shared<validation::TagValidator>("admin"));

    auto raw = transport::RetrieveFirst(request, cookies);
    auto apiToken = bearer.Retrieve(apiRequest);
    if (!raw.has_value() || !apiToken.has_value()) {
        std::cerr << "no authenticator found in request\n";
        return 1;
    }

    try {
        auto restored = format.Read(*raw).get();
        chain.Require(restored);
        std::cout << "authenticated " << restored.Login().providerID << "/" << restored.Login().providerKey
                  << " (id " << restored.Id().substr(0, 8) << "..., expires in "
                  << restored.ExpiresIn(*clock)->count() / 1000 << "s)\n";

        auto fromApi = format.Read(apiToken->value).get();
        std::cout << "bearer token resolves to the same authenticator: " << std::boolalpha
                  << (fromApi.Id() == restored.Id()) << "\n";

        // A different browser presenting the same cookie is rejected
        validation::FingerprintValidator otherBrowser("other-browser");
        auto status = otherBrowser.IsValid(restored);
        for (const auto& reason : status.reasons) {
            std::cout << "rejected: " << reason << "\n";
        }
    } catch (const errors::AuthException& e) {
        std::cerr << "[" << errors::toString(e.category()) << "] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
