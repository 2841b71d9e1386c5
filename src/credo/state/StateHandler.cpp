//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StateHandler.cpp
// Purpose: Issue, publish and verify signed OAuth2 state values
//==========================================================================================================

#include <chrono>

#include "credo/crypto/Hmac.h"
#include "credo/errors/Errors.h"
#include "credo/state/StateHandler.h"
#include "logging/Logger.h"

using namespace std::chrono;

namespace credo::state {

namespace {

constexpr std::size_t kStateIdBytes = 32;

transport::CookieTransportOptions carrierOptions(const StateHandlerOptions& opts) {
    transport::CookieTransportOptions c = opts.cookie;
    if (!c.maxAge.has_value()) {
        c.maxAge = duration_cast<seconds>(opts.lifetime);
    }
    return c;
}

// Short prefix of the id for log correlation.
std::string shortId(const std::string& id) {
    return id.substr(0, 8);
}

} // namespace

StateHandler::StateHandler(std::shared_ptr<const crypto::ISigner> signer,
                           std::shared_ptr<const IClock> clock,
                           std::shared_ptr<INonceLedger> ledger)
    : StateHandler(std::move(signer), std::move(clock), std::move(ledger), Options()) {}

StateHandler::StateHandler(std::shared_ptr<const crypto::ISigner> signer,
                           std::shared_ptr<const IClock> clock,
                           std::shared_ptr<INonceLedger> ledger,
                           Options opts)
    : signer(std::move(signer)),
      clock(std::move(clock)),
      ledger(std::move(ledger)),
      opts(std::move(opts)),
      carrier(this->opts.cookieName, carrierOptions(this->opts)) {
    if (!this->signer || !this->clock || !this->ledger) {
        errors::raise(errors::ConfigurationError("StateHandler requires a signer, a clock and a nonce ledger"));
    }
    if (this->opts.lifetime <= milliseconds(0)) {
        errors::raise(errors::ConfigurationError("state lifetime must be positive"));
    }
}

StateItem StateHandler::Issue(std::optional<JSONValue> userPayload) const {
    StateItem item;
    item.id = crypto::toHex(crypto::secureRandomBytes(kStateIdBytes));
    item.expiresAt = clock->Now() + opts.lifetime;
    item.payload = std::move(userPayload);

    JSONValue::Object body;
    body["id"] = std::make_shared<JSONValue>(item.id);
    body["exp"] = std::make_shared<JSONValue>(
        static_cast<int64_t>(duration_cast<milliseconds>(item.expiresAt.time_since_epoch()).count()));
    if (item.payload.has_value()) {
        body["payload"] = std::make_shared<JSONValue>(*item.payload);
    }
    item.value = signer->Sign(serializeJSONValue(JSONValue(std::move(body))));
    LOG_DEBUG("StateHandler: issued state {} valid for {}ms", shortId(item.id), opts.lifetime.count());
    return item;
}

http::HttpResponse StateHandler::Publish(const StateItem& item, const http::HttpResponse& response) const {
    return carrier.Embed(item.value, response);
}

http::HttpResponse StateHandler::Discard(const http::HttpResponse& response) const {
    return carrier.Discard(response);
}

StateItem StateHandler::Verify(const http::HttpRequest& request) const {
    return Verify(request, request.QueryParam(opts.queryParam));
}

StateItem StateHandler::Verify(const http::HttpRequest& request, const std::optional<std::string>& callbackValue) const {
    auto stored = carrier.Retrieve(request);
    if (!stored.has_value() || stored->empty()) {
        LOG_WARN("StateHandler: state cookie {} is missing", opts.cookieName);
        errors::raise(errors::StateMismatch("state cookie is missing"));
    }
    if (!callbackValue.has_value() || callbackValue->empty()) {
        LOG_WARN("StateHandler: callback carries no {} parameter", opts.queryParam);
        errors::raise(errors::StateMismatch("state parameter is missing from the callback"));
    }

    StateItem item = decode(*stored);

    if (!crypto::constantTimeEquals(*stored, *callbackValue)) {
        LOG_WARN("StateHandler: callback state does not match cookie for {}", shortId(item.id));
        errors::raise(errors::StateMismatch("callback state does not match the stored state"));
    }

    const Instant now = clock->Now();
    if (now > item.expiresAt) {
        const auto ago = std::chrono::ceil<milliseconds>(now - item.expiresAt).count();
        LOG_WARN("StateHandler: state {} expired {}ms ago", shortId(item.id), ago);
        errors::raise(errors::StateExpired(std::string("state expired ") + std::to_string(ago) + std::string("ms ago")));
    }

    if (!ledger->Consume(item.id, item.expiresAt, now)) {
        LOG_WARN("StateHandler: state {} was already used", shortId(item.id));
        errors::raise(errors::StateMismatch("state has already been used"));
    }

    LOG_DEBUG("StateHandler: verified state {}", shortId(item.id));
    return item;
}

StateItem StateHandler::decode(const std::string& signedValue) const {
    auto body = signer->Extract(signedValue);
    if (!body.has_value()) {
        LOG_WARN("StateHandler: state signature is invalid");
        errors::raise(errors::StateMismatch("state signature is invalid"));
    }
    JSONValue parsed;
    try {
        parsed = parseJSON(*body);
    } catch (const std::runtime_error& e) {
        errors::raise(errors::StateMismatch(std::string("state body is not JSON: ") + e.what()));
    }
    auto id = getStringMember(parsed, "id");
    auto exp = getIntegerMember(parsed, "exp");
    if (!id.has_value() || id->empty() || !exp.has_value()) {
        errors::raise(errors::StateMismatch("state body lacks id or exp"));
    }

    StateItem item;
    item.id = *id;
    item.expiresAt = Instant(duration_cast<Instant::duration>(milliseconds(*exp)));
    if (const JSONValue* payload = findMember(parsed, "payload")) {
        item.payload = *payload;
    }
    item.value = signedValue;
    return item;
}

} // namespace credo::state
