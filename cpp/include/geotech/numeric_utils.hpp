#pragma once

#include <string>

namespace geotech {

/// Pi to double precision
constexpr double PI = 3.14159265358979323846;

/**
 * @brief Convert an angle from degrees to radians
 *
 * @param deg Angle [deg]
 * @return double Angle [rad]
 */
double deg_to_rad(double deg);

/**
 * @brief Convert an angle from radians to degrees
 *
 * @param rad Angle [rad]
 * @return double Angle [deg]
 */
double rad_to_deg(double rad);

/**
 * @brief Absolute-tolerance comparison
 *
 * @param a First value
 * @param b Second value
 * @param tolerance Absolute tolerance (>= 0)
 * @return true iff |a - b| <= tolerance
 * @throws InvalidInput if tolerance is negative or not finite
 */
bool approx_equal(double a, double b, double tolerance = 1e-9);

/**
 * @brief Tangent with an explicit domain check
 *
 * The tangent is undefined where cos(x) = 0, i.e. at ±90°. All earth
 * pressure and bearing capacity formulas pass 45° ± φ/2 or similar angle
 * sums through here, so a singular angle surfaces as DomainError instead
 * of a huge or infinite coefficient.
 *
 * @param rad Angle [rad]
 * @throws DomainError if |cos(rad)| < 1e-12
 */
double safe_tan(double rad);

/**
 * @brief Tangent of an angle given in degrees
 *
 * @param deg Angle [deg], must lie strictly inside (-90, 90)
 * @throws DomainError otherwise
 */
double safe_tan_deg(double deg);

/**
 * @brief Square root with an explicit domain check
 * @throws DomainError if x < 0 or x is not finite
 */
double safe_sqrt(double x);

/**
 * @brief Exponential with an overflow check
 * @throws DomainError if the result is not finite
 */
double safe_exp(double x);

/**
 * @brief Natural logarithm with an explicit domain check
 * @throws DomainError if x <= 0 or x is not finite
 */
double safe_log(double x);

/**
 * @brief Division with an explicit zero-denominator check
 *
 * @param num Numerator
 * @param den Denominator
 * @param context Description used in the error message
 * @throws DomainError if den == 0 or the quotient is not finite
 */
double safe_divide(double num, double den, const std::string& context = "division");

/**
 * @brief Reject NaN and infinite arguments
 *
 * @param function Name of the calling formula function
 * @param name Parameter name
 * @param value Parameter value
 * @throws InvalidInput if value is not finite
 */
void require_finite(const std::string& function, const std::string& name, double value);

} // namespace geotech
