#pragma once

#include "rolegate/types.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace rolegate {

/// Raised at the require boundary when a decision denies access.
class PermissionDenied : public std::runtime_error {
public:
    explicit PermissionDenied(AccessDecision decision)
        : std::runtime_error("Access denied: " + decision.reason),
          decision_(std::move(decision)) {}

    const AccessDecision& decision() const { return decision_; }
    const std::string& reason() const { return decision_.reason; }

private:
    AccessDecision decision_;
};

/// Malformed policy registration or settings, detected before evaluation.
class ConfigurationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Identity could not be built from the supplied authentication data.
class ContextError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace rolegate
