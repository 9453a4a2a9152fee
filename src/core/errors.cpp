/// @file src/core/errors.cpp
/// @brief InvalidInputError implementation.

#include "rcde/errors.hpp"

#include <fmt/format.h>

#include <utility>

namespace rcde {

InvalidInputError::InvalidInputError(InputViolation violation)
    : std::invalid_argument(fmt::format("invalid input: {} = {} ({})",
                                        violation.field, violation.value, violation.reason))
    , violation_(std::move(violation)) {}

}  // namespace rcde
