//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.cpp
// Purpose: Canonical messages for typed credo errors
//==========================================================================================================

#include <sstream>

#include "credo/errors/Errors.h"

namespace credo {
namespace errors {

const char* toString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::TokenDecodingFailure: return "TokenDecodingFailure";
        case ErrorCategory::MissingMandatoryClaim: return "MissingMandatoryClaim";
        case ErrorCategory::MalformedClaimValue: return "MalformedClaimValue";
        case ErrorCategory::ValidationRejected: return "ValidationRejected";
        case ErrorCategory::StateMismatch: return "StateMismatch";
        case ErrorCategory::StateExpired: return "StateExpired";
        case ErrorCategory::ProviderCommunicationFailure: return "ProviderCommunicationFailure";
        case ErrorCategory::ProfileFieldMissing: return "ProfileFieldMissing";
        case ErrorCategory::ConfigurationError: return "ConfigurationError";
        case ErrorCategory::Unknown:
        default: return "Unknown";
    }
}

AuthError TokenDecodingFailure(const std::string& detail) {
    AuthError e;
    e.category = ErrorCategory::TokenDecodingFailure;
    e.message = std::string("Invalid token: ") + detail;
    return e;
}

AuthError MissingMandatoryClaim(const std::string& field) {
    AuthError e;
    e.category = ErrorCategory::MissingMandatoryClaim;
    e.message = std::string("Cannot get value for claim `") + field + std::string("` from JWT");
    e.field = field;
    return e;
}

AuthError JsonParseError(const std::string& raw) {
    AuthError e;
    e.category = ErrorCategory::MalformedClaimValue;
    e.message = std::string("Cannot parse Json: ") + raw;
    e.field = std::string("subject");
    e.actual = raw;
    return e;
}

AuthError UnexpectedJsonValue(const std::string& field, const std::string& actual, const std::string& expected) {
    AuthError e;
    e.category = ErrorCategory::MalformedClaimValue;
    e.message = std::string("Unexpected Json value: ") + actual + std::string("; expected ") + expected;
    e.field = field;
    e.actual = actual;
    e.expected = expected;
    return e;
}

AuthError ValidationRejected(std::vector<std::string> reasons) {
    AuthError e;
    e.category = ErrorCategory::ValidationRejected;
    std::ostringstream oss;
    oss << "Authenticator rejected: ";
    for (std::size_t i = 0; i < reasons.size(); ++i) {
        if (i > 0) oss << "; ";
        oss << reasons[i];
    }
    e.message = oss.str();
    e.reasons = std::move(reasons);
    return e;
}

AuthError StateMismatch(const std::string& detail) {
    AuthError e;
    e.category = ErrorCategory::StateMismatch;
    e.message = std::string("State validation failed: ") + detail;
    return e;
}

AuthError StateExpired(const std::string& detail) {
    AuthError e;
    e.category = ErrorCategory::StateExpired;
    e.message = std::string("State expired: ") + detail;
    return e;
}

AuthError ProviderCommunicationFailure(const std::string& provider, int status, const std::string& body) {
    AuthError e;
    e.category = ErrorCategory::ProviderCommunicationFailure;
    std::ostringstream oss;
    oss << "[" << provider << "] Got unexpected response `" << body << "`; status code: " << status;
    e.message = oss.str();
    e.status = status;
    e.body = body;
    return e;
}

AuthError ProfileFieldMissing(const std::string& provider, const std::string& path, const std::string& document) {
    AuthError e;
    e.category = ErrorCategory::ProfileFieldMissing;
    e.message = std::string("[") + provider + std::string("] Cannot access field `") + path +
                std::string("` in Json: ") + document;
    e.path = path;
    e.body = document;
    return e;
}

AuthError ConfigurationError(const std::string& detail) {
    AuthError e;
    e.category = ErrorCategory::ConfigurationError;
    e.message = std::string("Invalid configuration: ") + detail;
    return e;
}

void raise(AuthError err) {
    throw AuthException(std::move(err));
}

} // namespace errors
} // namespace credo
