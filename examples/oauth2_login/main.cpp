//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Example demonstrating the OAuth2 authorization-code flow against an in-process fake provider
//==========================================================================================================

#include <chrono>
#include <iostream>
#include <memory>

#include "credo/async/Task.h"
#include "credo/authenticator/Authenticator.h"
#include "credo/crypto/Signer.h"
#include "credo/errors/Errors.h"
#include "credo/http/Url.h"
#include "credo/oauth2/OAuth2Provider.h"
#include "credo/state/NonceLedger.h"
#include "logging/Logger.h"

using namespace credo;

namespace {

// Stands in for the provider's token and user endpoints.
class FakeProvider : public http::IHttpClient {
public:
    std::future<http::HttpCallResult> Execute(http::HttpCall call) override {
        http::HttpCallResult r;
        r.status = 200;
        r.headers.push_back(http::HeaderKV{"Content-Type", "application/json"});
        if (call.url.find("/token") != std::string::npos) {
            std::cout << "  provider <- POST " << call.url << " body: " << call.body << "\n";
            r.body = "{\"access_token\":\"demo-token\",\"token_type\":\"bearer\",\"expires_in\":3600}";
        } else {
            std::cout << "  provider <- GET " << call.url << "\n";
            r.body = "{\"id\":7,\"name\":\"Grace Hopper\",\"email\":\"grace@example.com\"}";
        }
        return async::makeReadyFuture<http::HttpCallResult>(std::move(r));
    }
};

} // namespace

int main() {
    Logger::configureFromEnvironment();

    auto settings = oauth2::OAuth2Settings::Parse(
        "provider=demo; authorizationUrl=https://provider.local/authorize; tokenUrl=https://provider.local/token;"
        " apiUrl=https://provider.local/user; redirectUrl=https://app.local/callback;"
        " clientId=demo-client; clientSecret=demo-secret; scope=profile email");

    auto clock = std::make_shared<SystemClock>();
    auto stateHandler = std::make_shared<state::StateHandler>(
        std::make_shared<crypto::HmacSigner>("state-signing-key"), clock, std::make_shared<state::InMemoryNonceLedger>());

    oauth2::OAuth2Provider provider(settings, std::make_shared<FakeProvider>(), stateHandler, clock,
                                    oauth2::JsonProfileParser("demo", oauth2::JsonProfilePaths{}));

    try {
        // Step 1: send the browser to the provider, remembering where the user wanted to go
        auto redirect = provider.BuildAuthorizationRequest(JSONValue("/settings"));
        std::cout << "redirect to: " << redirect.url << "\n";

        // Step 2: the provider sends the browser back with a code and the echoed state
        const std::string stateCookie = redirect.response.Cookie(stateHandler->options().cookieName)->value;
        auto callback = http::HttpRequest::FromUri(
                            "GET", "https://app.local/callback?code=one-time-code&state=" +
                                       http::UrlEncode(redirect.state.value))
                            .WithCookie(stateHandler->options().cookieName, stateCookie);

        auto result = provider.Authenticate(callback).get();
        std::cout << "signed in " << result.profile.loginInfo.providerID << "/" << result.profile.loginInfo.providerKey
                  << " (" << result.profile.fullName.value_or("?") << ")\n";
        if (result.userState.has_value()) {
            std::cout << "return to: " << serializeJSONValue(*result.userState) << "\n";
        }

        // Step 3: mint a session for the principal and clear the state cookie
        auto auth = authenticator::Authenticator::Create(result.profile.loginInfo)
                        .WithExpiry(std::chrono::hours(1), *clock)
                        .Touch(*clock);
        auto response = result.finalizeResponse(http::HttpResponse::Redirect("/settings"));
        std::cout << "session " << auth.Id().substr(0, 8) << "... status " << response.Status() << "\n";

        // Replaying the same callback is refused
        try {
            provider.Authenticate(callback).get();
            std::cout << "unexpected: replay accepted\n";
            return 1;
        } catch (const errors::AuthException& e) {
            std::cout << "replay rejected: " << e.what() << "\n";
        }
    } catch (const errors::AuthException& e) {
        std::cerr << "[" << errors::toString(e.category()) << "] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
