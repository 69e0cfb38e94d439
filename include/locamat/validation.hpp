#pragma once

#include <optional>
#include <string>
#include <vector>
#include "locamat/types.pb.h"
#include "errors.hpp"
#include "helpers.hpp"

namespace locamat {
namespace validation {

/**
 * Require that a selection is not empty.
 */
template<typename T>
void require_not_empty(const std::vector<T>& collection, const std::string& message) {
    if (collection.empty()) {
        throw ValidationError(message);
    }
}

/**
 * Require that an optional input was supplied.
 */
template<typename T>
void require_present(const std::optional<T>& value, const std::string& message) {
    if (!value.has_value()) {
        throw ValidationError(message);
    }
}

/**
 * Require that a caller-supplied date is a real calendar day.
 */
inline void require_valid_date(const Date& date, const std::string& field_name = "date") {
    if (!helpers::is_valid(date)) {
        throw ValidationError(field_name + " is not a valid date");
    }
}

/**
 * Require that `end` does not fall before `start`.
 */
inline void require_date_order(const Date& start, const Date& end,
                               const std::string& message = "invalid date range") {
    if (helpers::is_before(end, start)) {
        throw ValidationError(message);
    }
}

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
 * Require that a value is non-negative (zero or greater).
 */
template<typename T>
void require_non_negative(T value, const std::string& field_name = "value") {
    if (value < 0) {
        throw InvalidArgumentError(field_name + " must be non-negative");
    }
}

} // namespace validation
} // namespace locamat
