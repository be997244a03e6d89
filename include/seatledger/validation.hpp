#pragma once

#include <string>
#include "errors.hpp"

namespace seatledger {
namespace validation {

/**
 * Require that a value is positive (greater than zero).
 */
template<typename T>
void require_positive(T value, const std::string& field_name = "value") {
    if (value <= 0) {
        throw InvalidArgumentError(field_name + " must be positive");
    }
}

/**
 * Require that a string is not empty.
 */
inline void require_not_empty(const std::string& value, const std::string& field_name = "value") {
    if (value.empty()) {
        throw InvalidArgumentError(field_name + " must not be empty");
    }
}

} // namespace validation
} // namespace seatledger
