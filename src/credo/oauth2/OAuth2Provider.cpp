//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OAuth2Provider.cpp
// Purpose: Authorization URL construction, code exchange and profile retrieval
//==========================================================================================================

#include <sstream>

#include "credo/async/FutureAwaitable.h"
#include "credo/errors/Errors.h"
#include "credo/http/Url.h"
#include "credo/oauth2/OAuth2Provider.h"
#include "logging/Logger.h"

namespace credo::oauth2 {

namespace {

constexpr std::size_t kMaxLoggedBody = 256;

std::string truncateForLog(const std::string& body) {
    if (body.size() <= kMaxLoggedBody) {
        return body;
    }
    return body.substr(0, kMaxLoggedBody) + std::string("...");
}

} // namespace

OAuth2Provider::OAuth2Provider(OAuth2Settings settings,
                               std::shared_ptr<http::IHttpClient> httpClient,
                               std::shared_ptr<const state::StateHandler> stateHandler,
                               std::shared_ptr<const IClock> clock,
                               ProfileParser profileParser)
    : settings(std::move(settings)),
      httpClient(std::move(httpClient)),
      stateHandler(std::move(stateHandler)),
      clock(std::move(clock)),
      profileParser(std::move(profileParser)) {
    this->settings.Validate();
    if (!this->httpClient || !this->stateHandler || !this->clock || !this->profileParser) {
        errors::raise(errors::ConfigurationError("OAuth2Provider requires an HTTP client, a state handler, a clock and a profile parser"));
    }
}

AuthorizationRedirect OAuth2Provider::BuildAuthorizationRequest(std::optional<JSONValue> userState) const {
    AuthorizationRedirect redirect;
    redirect.state = stateHandler->Issue(std::move(userState));

    http::QueryParams params;
    params.emplace_back("client_id", settings.clientId);
    if (!settings.redirectUrl.empty()) {
        params.emplace_back("redirect_uri", settings.redirectUrl);
    }
    params.emplace_back("response_type", "code");
    if (!settings.scope.empty()) {
        params.emplace_back("scope", settings.scope);
    }
    params.emplace_back(stateHandler->options().queryParam, redirect.state.value);
    for (const auto& [key, value] : settings.authorizationParams) {
        params.emplace_back(key, value);
    }

    redirect.url = http::AppendQuery(settings.authorizationUrl, params);
    redirect.response = stateHandler->Publish(redirect.state, http::HttpResponse::Redirect(redirect.url));
    LOG_INFO("[{}] authorization requested", settings.providerId);
    return redirect;
}

std::future<AuthenticationResult> OAuth2Provider::Authenticate(const http::HttpRequest& callback) {
    return coAuthenticate(callback).toFuture();
}

std::future<SocialProfile> OAuth2Provider::RetrieveProfile(const OAuth2Info& info) {
    return coRetrieveProfile(info).toFuture();
}

std::future<OAuth2Info> OAuth2Provider::RefreshAccessToken(const std::string& refreshToken) {
    http::QueryParams form;
    form.emplace_back("client_id", settings.clientId);
    form.emplace_back("client_secret", settings.clientSecret);
    form.emplace_back("grant_type", "refresh_token");
    form.emplace_back("refresh_token", refreshToken);
    return coExchange(std::move(form)).toFuture();
}

async::Task<AuthenticationResult> OAuth2Provider::coAuthenticate(http::HttpRequest callback) {
    FUNC_SCOPE();
    if (auto error = callback.QueryParam("error")) {
        std::string detail = *error;
        if (auto description = callback.QueryParam("error_description")) {
            detail += std::string(": ") + *description;
        }
        LOG_WARN("[{}] provider returned an error callback: {}", settings.providerId, detail);
        errors::raise(errors::ProviderCommunicationFailure(settings.providerId, 0, detail));
    }
    auto code = callback.QueryParam("code");
    if (!code.has_value() || code->empty()) {
        LOG_WARN("[{}] callback carries no authorization code", settings.providerId);
        errors::raise(errors::ProviderCommunicationFailure(settings.providerId, 0, "authorization code is missing from the callback"));
    }

    state::StateItem verified = stateHandler->Verify(callback);
    LOG_DEBUG("[{}] state verified", settings.providerId);

    http::QueryParams form;
    form.emplace_back("client_id", settings.clientId);
    form.emplace_back("client_secret", settings.clientSecret);
    form.emplace_back("grant_type", "authorization_code");
    form.emplace_back("code", *code);
    if (!settings.redirectUrl.empty()) {
        form.emplace_back("redirect_uri", settings.redirectUrl);
    }
    for (const auto& [key, value] : settings.accessTokenParams) {
        form.emplace_back(key, value);
    }

    OAuth2Info info = co_await async::makeFutureAwaitable(coExchange(std::move(form)).toFuture());
    LOG_DEBUG("[{}] authorization code exchanged", settings.providerId);

    SocialProfile profile = co_await async::makeFutureAwaitable(coRetrieveProfile(info).toFuture());
    LOG_INFO("[{}] authenticated user {}", settings.providerId, profile.loginInfo.providerKey);

    AuthenticationResult result;
    result.profile = std::move(profile);
    result.info = std::move(info);
    result.userState = std::move(verified.payload);
    result.finalizeResponse = [handler = stateHandler](const http::HttpResponse& response) {
        return handler->Discard(response);
    };
    co_return result;
}

http::HttpCall OAuth2Provider::makeTokenCall(const http::QueryParams& form) const {
    http::HttpCall call;
    call.method = "POST";
    call.url = settings.accessTokenUrl;
    call.headers.push_back(http::HeaderKV{"Content-Type", "application/x-www-form-urlencoded"});
    call.headers.push_back(http::HeaderKV{"Accept", "application/json"});
    for (const auto& h : settings.customHeaders) {
        call.headers.push_back(h);
    }
    call.body = http::BuildQuery(form);
    return call;
}

async::Task<http::HttpCallResult> OAuth2Provider::coCall(http::HttpCall call) {
    const std::string url = call.url;
    try {
        co_return co_await async::makeFutureAwaitable(httpClient->Execute(std::move(call)));
    } catch (const errors::AuthException&) {
        throw;
    } catch (const std::exception& e) {
        LOG_WARN("[{}] HTTP call to {} failed: {}", settings.providerId, url, e.what());
        errors::raise(errors::ProviderCommunicationFailure(settings.providerId, 0, e.what()));
    }
}

async::Task<OAuth2Info> OAuth2Provider::coExchange(http::QueryParams form) {
    http::HttpCallResult res = co_await async::makeFutureAwaitable(coCall(makeTokenCall(form)).toFuture());
    if (!res.IsSuccess()) {
        LOG_WARN("[{}] token endpoint answered {}: {}", settings.providerId, res.status, truncateForLog(res.body));
        errors::raise(errors::ProviderCommunicationFailure(settings.providerId, res.status, res.body));
    }
    std::optional<OAuth2Info> info;
    try {
        info = oauth2InfoFromJSON(parseJSON(res.body), clock->Now());
    } catch (const std::runtime_error& e) {
        LOG_WARN("[{}] token response is not JSON: {}", settings.providerId, e.what());
    }
    if (!info.has_value()) {
        errors::raise(errors::ProviderCommunicationFailure(settings.providerId, res.status, res.body));
    }
    co_return *info;
}

async::Task<SocialProfile> OAuth2Provider::coRetrieveProfile(OAuth2Info info) {
    http::HttpCall call;
    call.method = "GET";
    const std::size_t placeholder = settings.apiUrl.find("%s");
    if (placeholder != std::string::npos) {
        call.url = settings.apiUrl;
        call.url.replace(placeholder, 2, http::UrlEncode(info.accessToken));
    } else {
        call.url = settings.apiUrl;
        call.headers.push_back(http::HeaderKV{"Authorization", std::string("Bearer ") + info.accessToken});
    }
    call.headers.push_back(http::HeaderKV{"Accept", "application/json"});
    for (const auto& h : settings.customHeaders) {
        call.headers.push_back(h);
    }

    http::HttpCallResult res = co_await async::makeFutureAwaitable(coCall(std::move(call)).toFuture());
    if (!res.IsSuccess()) {
        LOG_WARN("[{}] profile endpoint answered {}: {}", settings.providerId, res.status, truncateForLog(res.body));
        errors::raise(errors::ProviderCommunicationFailure(settings.providerId, res.status, res.body));
    }
    JSONValue document;
    bool parsed = false;
    try {
        document = parseJSON(res.body);
        parsed = true;
    } catch (const std::runtime_error& e) {
        LOG_WARN("[{}] profile response is not JSON: {}", settings.providerId, e.what());
    }
    if (!parsed) {
        errors::raise(errors::ProviderCommunicationFailure(settings.providerId, res.status, res.body));
    }
    // Any error member, even null, marks a logical failure behind an HTTP 200.
    if (findMember(document, "error") != nullptr) {
        LOG_WARN("[{}] profile response carries an error: {}", settings.providerId, truncateForLog(res.body));
        errors::raise(errors::ProviderCommunicationFailure(settings.providerId, res.status, res.body));
    }
    co_return profileParser(document, info);
}

} // namespace credo::oauth2
