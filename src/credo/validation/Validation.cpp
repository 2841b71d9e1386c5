//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validation.cpp
// Purpose: Validator chain and built-in validators
//==========================================================================================================

#include <algorithm>
#include <chrono>
#include <sstream>

#include "credo/errors/Errors.h"
#include "credo/validation/Validators.h"
#include "logging/Logger.h"

using namespace std::chrono;

namespace credo {
namespace validation {

ValidatorChain::ValidatorChain(std::vector<std::shared_ptr<const IValidator>> validators)
    : validators(std::move(validators)) {}

ValidatorChain& ValidatorChain::Add(std::shared_ptr<const IValidator> validator) {
    if (validator) {
        validators.push_back(std::move(validator));
    }
    return *this;
}

ValidationStatus ValidatorChain::Validate(const authenticator::Authenticator& authenticator) const {
    std::vector<std::string> reasons;
    for (const auto& v : validators) {
        if (!v) continue;
        ValidationStatus status = v->IsValid(authenticator);
        reasons.insert(reasons.end(), status.reasons.begin(), status.reasons.end());
    }
    return reasons.empty() ? ValidationStatus::Valid() : ValidationStatus::Invalid(std::move(reasons));
}

void ValidatorChain::Require(const authenticator::Authenticator& authenticator) const {
    ValidationStatus status = Validate(authenticator);
    if (!status.IsValid()) {
        LOG_INFO("Authenticator {} rejected with {} reason(s)", authenticator.Id(), status.reasons.size());
        errors::raise(errors::ValidationRejected(std::move(status.reasons)));
    }
}

ExpirationValidator::ExpirationValidator(std::shared_ptr<const IClock> clock) : clock(std::move(clock)) {
    if (!this->clock) {
        errors::raise(errors::ConfigurationError("ExpirationValidator requires a clock"));
    }
}

ValidationStatus ExpirationValidator::IsValid(const authenticator::Authenticator& authenticator) const {
    const auto& expires = authenticator.Expires();
    const Instant now = clock->Now();
    if (!expires.has_value() || *expires >= now) {
        return ValidationStatus::Valid();
    }
    // Rounded up so an authenticator past its deadline never reads "0ms ago".
    const auto ago = std::chrono::ceil<std::chrono::milliseconds>(now - *expires);
    std::ostringstream oss;
    oss << "Authenticator is expired " << ago.count() << "ms ago";
    return ValidationStatus::Invalid({oss.str()});
}

FingerprintValidator::FingerprintValidator(std::string expected) : expected(std::move(expected)) {}

ValidationStatus FingerprintValidator::IsValid(const authenticator::Authenticator& authenticator) const {
    const auto& actual = authenticator.Fingerprint();
    if (!actual.has_value() || *actual == expected) {
        return ValidationStatus::Valid();
    }
    return ValidationStatus::Invalid({
        std::string("Fingerprint `") + expected + std::string("` doesn't match the authenticators fingerprint `") +
        *actual + std::string("`")
    });
}

TagValidator::TagValidator(std::string requiredTag) : requiredTag(std::move(requiredTag)) {}

ValidationStatus TagValidator::IsValid(const authenticator::Authenticator& authenticator) const {
    const auto& tags = authenticator.Tags();
    if (std::find(tags.begin(), tags.end(), requiredTag) != tags.end()) {
        return ValidationStatus::Valid();
    }
    return ValidationStatus::Invalid({std::string("Authenticator is missing the required tag `") + requiredTag + std::string("`")});
}

} // namespace validation
} // namespace credo
