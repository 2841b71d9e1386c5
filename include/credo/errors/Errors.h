//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures and the exception carrying them for credo operations
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace credo {
namespace errors {

// Categorization of failures raised by the codec, state, validator and OAuth2 layers.
enum class ErrorCategory {
    TokenDecodingFailure,
    MissingMandatoryClaim,
    MalformedClaimValue,
    ValidationRejected,
    StateMismatch,
    StateExpired,
    ProviderCommunicationFailure,
    ProfileFieldMissing,
    ConfigurationError,
    Unknown
};

// Returns a stable name for the category (e.g. "MissingMandatoryClaim").
const char* toString(ErrorCategory category);

//==========================================================================================================
// AuthError
// Purpose: Typed error record. Only the fields relevant to the category are populated.
// Fields:
//   field: Claim or parameter the error refers to (e.g. "jwtID", "tags").
//   actual/expected: Offending rendered value and the expected JSON kind (MalformedClaimValue).
//   status/body: Provider HTTP status and raw body (ProviderCommunicationFailure, 0 when no response).
//   path: JSON path that could not be resolved (ProfileFieldMissing).
//   reasons: Every rejection message (ValidationRejected).
//==========================================================================================================
struct AuthError {
    ErrorCategory category{ErrorCategory::Unknown};
    std::string message;
    std::optional<std::string> field;
    std::optional<std::string> actual;
    std::optional<std::string> expected;
    std::optional<int> status;
    std::optional<std::string> body;
    std::optional<std::string> path;
    std::vector<std::string> reasons;
};

//==========================================================================================================
// AuthException
// Purpose: Exception type thrown (or stored in a std::future) for every AuthError.
//==========================================================================================================
class AuthException : public std::runtime_error {
public:
    explicit AuthException(AuthError err)
        : std::runtime_error(err.message), err(std::move(err)) {}

    const AuthError& error() const noexcept { return err; }
    ErrorCategory category() const noexcept { return err.category; }

private:
    AuthError err;
};

//------------------------------ Factories with canonical messages -----------------------------------------

// Underlying claims reader rejected the raw token.
AuthError TokenDecodingFailure(const std::string& detail);

// "Cannot get value for claim `<field>` from JWT"
AuthError MissingMandatoryClaim(const std::string& field);

// "Cannot parse Json: <raw>" (subject could not be decoded into a LoginInfo)
AuthError JsonParseError(const std::string& raw);

// "Unexpected Json value: <actual>; expected <expected>"
AuthError UnexpectedJsonValue(const std::string& field, const std::string& actual, const std::string& expected);

// Accumulated validator messages.
AuthError ValidationRejected(std::vector<std::string> reasons);

AuthError StateMismatch(const std::string& detail);
AuthError StateExpired(const std::string& detail);

// "[<provider>] Got unexpected response `<body>`; status code: <status>"
AuthError ProviderCommunicationFailure(const std::string& provider, int status, const std::string& body);

// "[<provider>] Cannot access field `<path>` in Json: <document>"
AuthError ProfileFieldMissing(const std::string& provider, const std::string& path, const std::string& document);

AuthError ConfigurationError(const std::string& detail);

// Throws AuthException for err.
[[noreturn]] void raise(AuthError err);

} // namespace errors
} // namespace credo
