//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for typed error categories and canonical error messages
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "credo/errors/Errors.h"

using namespace credo;

TEST(Errors, CategoryNames) {
    using errors::ErrorCategory;
    EXPECT_STREQ(errors::toString(ErrorCategory::TokenDecodingFailure), "TokenDecodingFailure");
    EXPECT_STREQ(errors::toString(ErrorCategory::MissingMandatoryClaim), "MissingMandatoryClaim");
    EXPECT_STREQ(errors::toString(ErrorCategory::MalformedClaimValue), "MalformedClaimValue");
    EXPECT_STREQ(errors::toString(ErrorCategory::ValidationRejected), "ValidationRejected");
    EXPECT_STREQ(errors::toString(ErrorCategory::StateMismatch), "StateMismatch");
    EXPECT_STREQ(errors::toString(ErrorCategory::StateExpired), "StateExpired");
    EXPECT_STREQ(errors::toString(ErrorCategory::ProviderCommunicationFailure), "ProviderCommunicationFailure");
    EXPECT_STREQ(errors::toString(ErrorCategory::ProfileFieldMissing), "ProfileFieldMissing");
    EXPECT_STREQ(errors::toString(ErrorCategory::ConfigurationError), "ConfigurationError");
    EXPECT_STREQ(errors::toString(ErrorCategory::Unknown), "Unknown");
}

TEST(Errors, MissingMandatoryClaimMessage) {
    auto e = errors::MissingMandatoryClaim("jwtID");
    EXPECT_EQ(e.category, errors::ErrorCategory::MissingMandatoryClaim);
    EXPECT_EQ(e.message, std::string("Cannot get value for claim `jwtID` from JWT"));
    ASSERT_TRUE(e.field.has_value());
    EXPECT_EQ(*e.field, std::string("jwtID"));
}

TEST(Errors, MalformedClaimMessages) {
    auto parse = errors::JsonParseError("not-json");
    EXPECT_EQ(parse.category, errors::ErrorCategory::MalformedClaimValue);
    EXPECT_EQ(parse.message, std::string("Cannot parse Json: not-json"));

    auto unexpected = errors::UnexpectedJsonValue("tags", "\"x\"", "array");
    EXPECT_EQ(unexpected.category, errors::ErrorCategory::MalformedClaimValue);
    EXPECT_EQ(unexpected.message, std::string("Unexpected Json value: \"x\"; expected array"));
    EXPECT_EQ(unexpected.field.value_or(""), std::string("tags"));
    EXPECT_EQ(unexpected.expected.value_or(""), std::string("array"));
}

TEST(Errors, ValidationRejectedJoinsReasons) {
    auto e = errors::ValidationRejected({"first", "second"});
    EXPECT_EQ(e.message, std::string("Authenticator rejected: first; second"));
    ASSERT_EQ(e.reasons.size(), 2u);
    EXPECT_EQ(e.reasons[1], std::string("second"));
}

TEST(Errors, ProviderMessagesCarryStatusAndBody) {
    auto e = errors::ProviderCommunicationFailure("github", 500, "oops");
    EXPECT_EQ(e.message, std::string("[github] Got unexpected response `oops`; status code: 500"));
    EXPECT_EQ(e.status.value_or(-1), 500);
    EXPECT_EQ(e.body.value_or(""), std::string("oops"));

    auto missing = errors::ProfileFieldMissing("github", "id", "{}");
    EXPECT_EQ(missing.category, errors::ErrorCategory::ProfileFieldMissing);
    EXPECT_EQ(missing.message, std::string("[github] Cannot access field `id` in Json: {}"));
    EXPECT_EQ(missing.path.value_or(""), std::string("id"));
}

TEST(Errors, RaiseThrowsAuthException) {
    try {
        errors::raise(errors::StateExpired("state expired 10ms ago"));
        FAIL() << "expected AuthException";
    } catch (const errors::AuthException& ex) {
        EXPECT_EQ(ex.category(), errors::ErrorCategory::StateExpired);
        EXPECT_STREQ(ex.what(), "State expired: state expired 10ms ago");
        EXPECT_EQ(ex.error().message, std::string(ex.what()));
    }
}
