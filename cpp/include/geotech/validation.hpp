/**
 * @file validation.hpp
 * @brief Argument checks shared by the formula functions.
 *
 * Each check raises InvalidInput with the calling function name, the
 * parameter name and the violated constraint. NaN and infinite values
 * fail every check.
 */

#ifndef GEOTECH_VALIDATION_HPP
#define GEOTECH_VALIDATION_HPP

#include "geotech/errors.hpp"
#include "geotech/numeric_utils.hpp"

#include <sstream>
#include <string>

namespace geotech {
namespace validation {

/**
 * @brief Require value > 0
 */
inline void require_positive(const char* function, const char* name, double value) {
    require_finite(function, name, value);
    if (!(value > 0.0)) {
        throw InvalidInput(GeotechError::invalid_input(function, name, value, "> 0"));
    }
}

/**
 * @brief Require value >= 0
 */
inline void require_non_negative(const char* function, const char* name, double value) {
    require_finite(function, name, value);
    if (!(value >= 0.0)) {
        throw InvalidInput(GeotechError::invalid_input(function, name, value, ">= 0"));
    }
}

/**
 * @brief Require value > bound
 */
inline void require_greater(const char* function, const char* name, double value, double bound) {
    require_finite(function, name, value);
    if (!(value > bound)) {
        std::ostringstream oss;
        oss << "> " << bound;
        throw InvalidInput(GeotechError::invalid_input(function, name, value, oss.str()));
    }
}

/**
 * @brief Require value >= bound
 */
inline void require_at_least(const char* function, const char* name, double value, double bound) {
    require_finite(function, name, value);
    if (!(value >= bound)) {
        std::ostringstream oss;
        oss << ">= " << bound;
        throw InvalidInput(GeotechError::invalid_input(function, name, value, oss.str()));
    }
}

/**
 * @brief Require low <= value < high
 */
inline void require_half_open(const char* function, const char* name, double value,
                              double low, double high) {
    require_finite(function, name, value);
    if (!(value >= low && value < high)) {
        std::ostringstream oss;
        oss << "in [" << low << ", " << high << ")";
        throw InvalidInput(GeotechError::invalid_input(function, name, value, oss.str()));
    }
}

/**
 * @brief Require low <= value <= high
 */
inline void require_closed(const char* function, const char* name, double value,
                           double low, double high) {
    require_finite(function, name, value);
    if (!(value >= low && value <= high)) {
        std::ostringstream oss;
        oss << "in [" << low << ", " << high << "]";
        throw InvalidInput(GeotechError::invalid_input(function, name, value, oss.str()));
    }
}

/**
 * @brief Friction angle check shared by the earth pressure family, 0 <= phi < 90
 */
inline void require_friction_angle(const char* function, double phi_deg) {
    require_half_open(function, "phi", phi_deg, 0.0, 90.0);
}

}  // namespace validation
}  // namespace geotech

#endif  // GEOTECH_VALIDATION_HPP
