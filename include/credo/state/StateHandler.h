//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StateHandler.h
// Purpose: Signed, time-bounded, single-use anti-forgery state for redirect-based login flows
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "credo/Clock.h"
#include "credo/JSONValue.h"
#include "credo/crypto/Signer.h"
#include "credo/http/Message.h"
#include "credo/state/NonceLedger.h"
#include "credo/transport/CookieTransport.hpp"

namespace credo::state {

//==========================================================================================================
// StateItem
// Purpose: One issued state.
// Fields:
//   id: Hex of 32 random bytes.
//   expiresAt: End of the validity window.
//   payload: Caller data bound into the signature (e.g. the originally requested URL).
//   value: Signed wire value sent as the state parameter and stored in the carrier cookie.
//==========================================================================================================
struct StateItem {
    std::string id;
    Instant expiresAt;
    std::optional<JSONValue> payload;
    std::string value;
};

//==========================================================================================================
// StateHandlerOptions
// Fields:
//   cookieName: Carrier cookie holding the signed value between redirect-out and callback.
//   queryParam: Callback parameter echoing the value.
//   lifetime: Validity window of an issued state.
//   cookie: Cookie attributes; maxAge defaults to lifetime when unset.
//==========================================================================================================
struct StateHandlerOptions {
    std::string cookieName{"OAuth2State"};
    std::string queryParam{"state"};
    std::chrono::milliseconds lifetime{std::chrono::minutes(5)};
    transport::CookieTransportOptions cookie;
};

//==========================================================================================================
// StateHandler
// Purpose: Issue -> Publish (cookie) -> Verify (cookie vs callback, signature, expiry, single use).
// Throws (Verify):
//   AuthException(StateMismatch) when the carrier or callback value is missing, the signature or body is
//     invalid, the two values differ, or the state was already consumed.
//   AuthException(StateExpired) when the validity window has passed.
//==========================================================================================================
class StateHandler {
public:
    using Options = StateHandlerOptions;

    StateHandler(std::shared_ptr<const crypto::ISigner> signer,
                 std::shared_ptr<const IClock> clock,
                 std::shared_ptr<INonceLedger> ledger);
    StateHandler(std::shared_ptr<const crypto::ISigner> signer,
                 std::shared_ptr<const IClock> clock,
                 std::shared_ptr<INonceLedger> ledger,
                 Options opts);

    StateItem Issue(std::optional<JSONValue> userPayload = std::nullopt) const;

    http::HttpResponse Publish(const StateItem& item, const http::HttpResponse& response) const;
    http::HttpResponse Discard(const http::HttpResponse& response) const;

    StateItem Verify(const http::HttpRequest& request, const std::optional<std::string>& callbackValue) const;

    // Uses the configured query parameter of request as the callback value.
    StateItem Verify(const http::HttpRequest& request) const;

    const Options& options() const { return opts; }

private:
    StateItem decode(const std::string& signedValue) const;

    std::shared_ptr<const crypto::ISigner> signer;
    std::shared_ptr<const IClock> clock;
    std::shared_ptr<INonceLedger> ledger;
    Options opts;
    transport::CookieTransport carrier;
};

} // namespace credo::state
