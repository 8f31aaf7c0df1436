#pragma once

#include <string>
#include "errors.hpp"

namespace floorstock {
namespace validation {

/**
 * Require that a value is positive (greater than zero).
 */
template<typename T>
void require_positive(T value, const std::string& field_name = "value") {
    if (!(value > 0)) {
        throw InventoryError::invalid_argument(field_name + " must be positive");
    }
}

/**
 * Require that a value is non-negative (zero or greater).
 */
template<typename T>
void require_non_negative(T value, const std::string& field_name = "value") {
    if (!(value >= 0)) {
        throw InventoryError::invalid_argument(field_name + " must be non-negative");
    }
}

/**
 * Require that a string is not empty.
 */
inline void require_not_empty(const std::string& value, const std::string& field_name = "value") {
    if (value.empty()) {
        throw InventoryError::invalid_argument(field_name + " must not be empty");
    }
}

} // namespace validation
} // namespace floorstock
