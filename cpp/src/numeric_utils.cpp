#include "geotech/numeric_utils.hpp"
#include "geotech/errors.hpp"
#include <cmath>

namespace geotech {

double deg_to_rad(double deg) {
    return deg * PI / 180.0;
}

double rad_to_deg(double rad) {
    return rad * 180.0 / PI;
}

bool approx_equal(double a, double b, double tolerance) {
    if (!std::isfinite(tolerance) || tolerance < 0.0) {
        throw InvalidInput(GeotechError::invalid_input(
            "approx_equal", "tolerance", tolerance, ">= 0"));
    }
    return std::abs(a - b) <= tolerance;
}

double safe_tan(double rad) {
    if (!std::isfinite(rad)) {
        throw DomainError(GeotechError::domain("tan", rad, "argument is not finite"));
    }
    if (std::abs(std::cos(rad)) < 1e-12) {
        throw DomainError(GeotechError::domain("tan", rad, "angle is an odd multiple of 90 deg"));
    }
    return std::tan(rad);
}

double safe_tan_deg(double deg) {
    if (!(deg > -90.0 && deg < 90.0)) {
        throw DomainError(GeotechError::domain("tan", deg, "angle must lie in (-90, 90) deg"));
    }
    return safe_tan(deg_to_rad(deg));
}

double safe_sqrt(double x) {
    if (!std::isfinite(x) || x < 0.0) {
        throw DomainError(GeotechError::domain("sqrt", x, "argument must be finite and >= 0"));
    }
    return std::sqrt(x);
}

double safe_exp(double x) {
    double result = std::exp(x);
    if (!std::isfinite(result)) {
        throw DomainError(GeotechError::overflow("exp", x));
    }
    return result;
}

double safe_log(double x) {
    if (!std::isfinite(x) || x <= 0.0) {
        throw DomainError(GeotechError::domain("log", x, "argument must be finite and > 0"));
    }
    return std::log(x);
}

double safe_divide(double num, double den, const std::string& context) {
    if (den == 0.0) {
        throw DomainError(GeotechError::division_by_zero(context));
    }
    double result = num / den;
    if (!std::isfinite(result)) {
        throw DomainError(GeotechError::overflow(context, den));
    }
    return result;
}

void require_finite(const std::string& function, const std::string& name, double value) {
    if (!std::isfinite(value)) {
        throw InvalidInput(GeotechError::non_finite(function, name, value));
    }
}

} // namespace geotech
