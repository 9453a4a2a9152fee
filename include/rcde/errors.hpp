#pragma once

/// @file include/rcde/errors.hpp
/// @brief Precondition violations raised by `DesignEngine::design`.
///
/// Only malformed input is an error. Inadequate designs and clamped numeric
/// solutions are reported in the result data.

#include <stdexcept>
#include <string>

namespace rcde {

/// One violated input precondition.
struct InputViolation {
    std::string field;   ///< Dotted path, e.g. "geometry.width"
    double      value;   ///< Offending value
    std::string reason;  ///< e.g. "must be positive"
};

/// Thrown for a `DesignInput` that fails validation.
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(InputViolation violation);

    [[nodiscard]] const std::string& field() const noexcept { return violation_.field; }
    [[nodiscard]] double value() const noexcept { return violation_.value; }
    [[nodiscard]] const InputViolation& violation() const noexcept { return violation_; }

private:
    InputViolation violation_;
};

}  // namespace rcde
