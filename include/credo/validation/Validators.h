//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validators.h
// Purpose: Expiration, fingerprint and tag validators for authenticators
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "credo/Clock.h"
#include "credo/validation/Validation.h"

namespace credo {
namespace validation {

//==========================================================================================================
// ExpirationValidator
// Purpose: Valid when no expiry is set or expires - now >= 0.
//          Otherwise "Authenticator is expired <N>ms ago".
//==========================================================================================================
class ExpirationValidator : public IValidator {
public:
    explicit ExpirationValidator(std::shared_ptr<const IClock> clock);
    ValidationStatus IsValid(const authenticator::Authenticator& authenticator) const override;

private:
    std::shared_ptr<const IClock> clock;
};

//==========================================================================================================
// FingerprintValidator
// Purpose: Valid when the authenticator carries no fingerprint or an exact (byte-wise) match.
//==========================================================================================================
class FingerprintValidator : public IValidator {
public:
    explicit FingerprintValidator(std::string expected);
    ValidationStatus IsValid(const authenticator::Authenticator& authenticator) const override;

private:
    std::string expected;
};

// Requires requiredTag to be present among the authenticator's tags.
class TagValidator : public IValidator {
public:
    explicit TagValidator(std::string requiredTag);
    ValidationStatus IsValid(const authenticator::Authenticator& authenticator) const override;

private:
    std::string requiredTag;
};

} // namespace validation
} // namespace credo
