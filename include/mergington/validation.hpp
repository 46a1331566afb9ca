#pragma once

#include <set>
#include <string>
#include <vector>
#include "errors.hpp"

namespace mergington {
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
 * Require that a value lies in [low, high].
 */
template<typename T>
void require_in_range(T value, T low, T high, const std::string& field_name = "value") {
    if (value < low || value > high) {
        throw InvalidArgumentError(field_name + " must be between " +
            std::to_string(low) + " and " + std::to_string(high));
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

/**
 * Require that a collection holds no repeated entries.
 */
inline void require_unique(const std::vector<std::string>& values, const std::string& field_name = "values") {
    std::set<std::string> seen;
    for (const auto& value : values) {
        if (!seen.insert(value).second) {
            throw InvalidArgumentError(field_name + " contains duplicate entry: " + value);
        }
    }
}

} // namespace validation
} // namespace mergington
