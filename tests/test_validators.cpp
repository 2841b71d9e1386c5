//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_validators.cpp
// Purpose: GoogleTests for the expiration, fingerprint and tag validators and the validator chain
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

#include "credo/errors/Errors.h"
#include "credo/validation/Validators.h"

using namespace credo;
using namespace credo::validation;
using authenticator::Authenticator;
using namespace std::chrono;

namespace {

Instant at(int64_t epochMs) {
    return Instant(milliseconds(epochMs));
}

Authenticator sample() {
    return Authenticator("id", LoginInfo{"p", "k"});
}

} // namespace

TEST(ExpirationValidator, ValidWithoutExpiryOrBeforeDeadline) {
    auto clock = std::make_shared<FixedClock>(at(10'000));
    ExpirationValidator v(clock);
    EXPECT_TRUE(v.IsValid(sample()).IsValid());
    EXPECT_TRUE(v.IsValid(sample().WithExpiry(at(10'500))).IsValid());
    EXPECT_TRUE(v.IsValid(sample().WithExpiry(at(10'000))).IsValid());
}

TEST(ExpirationValidator, ReportsHowLongAgoItExpired) {
    auto clock = std::make_shared<FixedClock>(at(10'000));
    ExpirationValidator v(clock);
    auto status = v.IsValid(sample().WithExpiry(at(9'750)));
    ASSERT_FALSE(status.IsValid());
    ASSERT_EQ(status.reasons.size(), 1u);
    EXPECT_EQ(status.reasons[0], std::string("Authenticator is expired 250ms ago"));
}

TEST(ExpirationValidator, OneMillisecondPastDeadline) {
    auto clock = std::make_shared<FixedClock>(at(10'000));
    ExpirationValidator v(clock);
    auto status = v.IsValid(sample().WithExpiry(at(9'999)));
    ASSERT_FALSE(status.IsValid());
    EXPECT_EQ(status.reasons[0], std::string("Authenticator is expired 1ms ago"));
}

TEST(ExpirationValidator, SubMillisecondExpiryIsStillExpired) {
    auto clock = std::make_shared<FixedClock>(at(10'000));
    ExpirationValidator v(clock);

    auto justPast = v.IsValid(sample().WithExpiry(at(10'000) - microseconds(900)));
    ASSERT_FALSE(justPast.IsValid());
    EXPECT_EQ(justPast.reasons[0], std::string("Authenticator is expired 1ms ago"));

    auto almostTwo = v.IsValid(sample().WithExpiry(at(10'000) - microseconds(1'900)));
    ASSERT_FALSE(almostTwo.IsValid());
    EXPECT_EQ(almostTwo.reasons[0], std::string("Authenticator is expired 2ms ago"));

    EXPECT_TRUE(v.IsValid(sample().WithExpiry(at(10'000) + microseconds(1))).IsValid());
}

TEST(ExpirationValidator, NullClockIsConfigurationError) {
    EXPECT_THROW(ExpirationValidator(nullptr), errors::AuthException);
}

TEST(FingerprintValidator, MatchesExactlyOrIgnoresUnbound) {
    FingerprintValidator v("browser-1");
    EXPECT_TRUE(v.IsValid(sample()).IsValid());
    EXPECT_TRUE(v.IsValid(sample().WithFingerprint("browser-1")).IsValid());

    auto status = v.IsValid(sample().WithFingerprint("Browser-1"));
    ASSERT_FALSE(status.IsValid());
    EXPECT_EQ(status.reasons[0],
              std::string("Fingerprint `browser-1` doesn't match the authenticators fingerprint `Browser-1`"));
}

TEST(TagValidator, RequiresTag) {
    TagValidator v("admin");
    EXPECT_TRUE(v.IsValid(sample().WithTags({"user", "admin"})).IsValid());
    auto status = v.IsValid(sample().WithTag("user"));
    ASSERT_FALSE(status.IsValid());
    EXPECT_EQ(status.reasons[0], std::string("Authenticator is missing the required tag `admin`"));
}

TEST(ValidatorChain, EmptyChainAcceptsEverything) {
    ValidatorChain chain;
    EXPECT_EQ(chain.size(), 0u);
    EXPECT_TRUE(chain.Validate(sample()).IsValid());
    EXPECT_NO_THROW(chain.Require(sample()));
}

TEST(ValidatorChain, CollectsEveryReasonInOrder) {
    auto clock = std::make_shared<FixedClock>(at(10'000));
    ValidatorChain chain;
    chain.Add(std::make_shared<ExpirationValidator>(clock))
         .Add(std::make_shared<FingerprintValidator>("expected"))
         .Add(std::make_shared<TagValidator>("admin"));
    ASSERT_EQ(chain.size(), 3u);

    auto bad = sample().WithExpiry(at(9'000)).WithFingerprint("actual");
    auto status = chain.Validate(bad);
    ASSERT_EQ(status.reasons.size(), 3u);
    EXPECT_EQ(status.reasons[0], std::string("Authenticator is expired 1000ms ago"));
    EXPECT_EQ(status.reasons[2], std::string("Authenticator is missing the required tag `admin`"));

    try {
        chain.Require(bad);
        FAIL() << "expected AuthException";
    } catch (const errors::AuthException& ex) {
        EXPECT_EQ(ex.category(), errors::ErrorCategory::ValidationRejected);
        EXPECT_EQ(ex.error().reasons, status.reasons);
    }

    auto good = sample().WithExpiry(at(20'000)).WithFingerprint("expected").WithTag("admin");
    EXPECT_TRUE(chain.Validate(good).IsValid());
}
