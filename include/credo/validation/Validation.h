//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validation.h
// Purpose: Validation status, validator interface and an accumulating validator chain
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "credo/authenticator/Authenticator.h"

namespace credo {
namespace validation {

//==========================================================================================================
// ValidationStatus
// Purpose: Valid, or Invalid with every reason collected.
//==========================================================================================================
struct ValidationStatus {
    std::vector<std::string> reasons;

    static ValidationStatus Valid() { return ValidationStatus{}; }
    static ValidationStatus Invalid(std::vector<std::string> reasons) { return ValidationStatus{std::move(reasons)}; }

    bool IsValid() const { return reasons.empty(); }
};

// Pure predicate over a decoded authenticator.
class IValidator {
public:
    virtual ~IValidator() = default;
    virtual ValidationStatus IsValid(const authenticator::Authenticator& authenticator) const = 0;
};

//==========================================================================================================
// ValidatorChain
// Purpose: Runs every configured validator and concatenates their reasons in order. Never short-circuits.
//==========================================================================================================
class ValidatorChain {
public:
    ValidatorChain() = default;
    explicit ValidatorChain(std::vector<std::shared_ptr<const IValidator>> validators);

    ValidatorChain& Add(std::shared_ptr<const IValidator> validator);

    ValidationStatus Validate(const authenticator::Authenticator& authenticator) const;

    // Throws AuthException(ValidationRejected) carrying every reason when the authenticator is invalid.
    void Require(const authenticator::Authenticator& authenticator) const;

    std::size_t size() const { return validators.size(); }

private:
    std::vector<std::shared_ptr<const IValidator>> validators;
};

} // namespace validation
} // namespace credo
