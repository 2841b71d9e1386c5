//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OAuth2Provider.h
// Purpose: Generic OAuth2 authorization-code engine parameterized by settings and a profile parser
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "credo/Clock.h"
#include "credo/JSONValue.h"
#include "credo/async/Task.h"
#include "credo/http/IHttpClient.h"
#include "credo/http/Message.h"
#include "credo/oauth2/JsonProfileParser.h"
#include "credo/oauth2/OAuth2Info.h"
#include "credo/oauth2/OAuth2Settings.h"
#include "credo/state/StateHandler.h"

namespace credo::oauth2 {

//==========================================================================================================
// AuthorizationRedirect
// Fields:
//   url: Provider authorization URL (client_id, redirect_uri, response_type, scope, state + extras).
//   state: The issued state item.
//   response: 303 redirect to url carrying the state cookie.
//==========================================================================================================
struct AuthorizationRedirect {
    std::string url;
    state::StateItem state;
    http::HttpResponse response;
};

//==========================================================================================================
// AuthenticationResult
// Fields:
//   profile: Normalized identity.
//   info: Token endpoint result.
//   userState: Payload bound into the state at authorization time.
//   finalizeResponse: Expires the state cookie on the response sent back to the client.
//==========================================================================================================
struct AuthenticationResult {
    SocialProfile profile;
    OAuth2Info info;
    std::optional<JSONValue> userState;
    std::function<http::HttpResponse(const http::HttpResponse&)> finalizeResponse;
};

//==========================================================================================================
// OAuth2Provider
// Purpose: Start -> AuthorizationRequested -> CallbackReceived -> StateVerified -> CodeExchanged
//          -> ProfileFetched -> Done, aborting on the first failure.
// Failures (delivered through the returned futures as AuthException):
//   - StateMismatch / StateExpired from state verification.
//   - ProviderCommunicationFailure for an error callback, a missing code, a non-2xx or undecodable token
//     response, a non-2xx profile response or one carrying a top-level "error" member, and for transport
//     failures of the HTTP client (status 0).
//   - ProfileFieldMissing from the profile parser.
//==========================================================================================================
class OAuth2Provider {
public:
    OAuth2Provider(OAuth2Settings settings,
                   std::shared_ptr<http::IHttpClient> httpClient,
                   std::shared_ptr<const state::StateHandler> stateHandler,
                   std::shared_ptr<const IClock> clock,
                   ProfileParser profileParser);

    const std::string& Id() const { return settings.providerId; }
    const OAuth2Settings& Settings() const { return settings; }

    AuthorizationRedirect BuildAuthorizationRequest(std::optional<JSONValue> userState = std::nullopt) const;

    std::future<AuthenticationResult> Authenticate(const http::HttpRequest& callback);

    // Fetches and parses the profile for an already obtained token.
    std::future<SocialProfile> RetrieveProfile(const OAuth2Info& info);

    // grant_type=refresh_token exchange against accessTokenUrl.
    std::future<OAuth2Info> RefreshAccessToken(const std::string& refreshToken);

private:
    async::Task<AuthenticationResult> coAuthenticate(http::HttpRequest callback);
    async::Task<OAuth2Info> coExchange(http::QueryParams form);
    async::Task<SocialProfile> coRetrieveProfile(OAuth2Info info);
    async::Task<http::HttpCallResult> coCall(http::HttpCall call);

    http::HttpCall makeTokenCall(const http::QueryParams& form) const;

    OAuth2Settings settings;
    std::shared_ptr<http::IHttpClient> httpClient;
    std::shared_ptr<const state::StateHandler> stateHandler;
    std::shared_ptr<const IClock> clock;
    ProfileParser profileParser;
};

} // namespace credo::oauth2
