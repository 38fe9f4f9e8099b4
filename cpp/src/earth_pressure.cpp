#include "geotech/earth_pressure.hpp"
#include "geotech/numeric_utils.hpp"
#include "geotech/validation.hpp"
#include <algorithm>
#include <cmath>

namespace geotech {

using namespace validation;

namespace {

// Shared checks for K·γ·z style pressures
void check_pressure_args(const char* function, const char* k_name,
                         double K, double gamma, double z) {
    require_positive(function, k_name, K);
    require_positive(function, "gamma", gamma);
    require_non_negative(function, "z", z);
}

void check_coulomb_angles(const char* function, double phi, double delta,
                          double theta, double beta) {
    require_friction_angle(function, phi);
    require_closed(function, "delta", delta, 0.0, phi);
    require_finite(function, "theta", theta);
    if (!(std::abs(theta) < 90.0)) {
        throw InvalidInput(GeotechError::invalid_input(function, "theta", theta, "in (-90, 90)"));
    }
    require_closed(function, "beta", beta, -phi, phi);
}

} // namespace

double rankine_active_coefficient(double phi) {
    require_friction_angle("rankine_active_coefficient", phi);
    double t = safe_tan_deg(45.0 - phi / 2.0);
    return t * t;
}

double rankine_passive_coefficient(double phi) {
    require_friction_angle("rankine_passive_coefficient", phi);
    double t = safe_tan_deg(45.0 + phi / 2.0);
    return t * t;
}

double rankine_active_pressure(double Ka, double gamma, double z) {
    check_pressure_args("rankine_active_pressure", "Ka", Ka, gamma, z);
    return Ka * gamma * z;
}

double rankine_passive_pressure(double Kp, double gamma, double z) {
    check_pressure_args("rankine_passive_pressure", "Kp", Kp, gamma, z);
    return Kp * gamma * z;
}

double rankine_active_force(double Ka, double gamma, double H) {
    require_positive("rankine_active_force", "Ka", Ka);
    require_positive("rankine_active_force", "gamma", gamma);
    require_non_negative("rankine_active_force", "H", H);
    return 0.5 * Ka * gamma * H * H;
}

double rankine_passive_force(double Kp, double gamma, double H) {
    require_positive("rankine_passive_force", "Kp", Kp);
    require_positive("rankine_passive_force", "gamma", gamma);
    require_non_negative("rankine_passive_force", "H", H);
    return 0.5 * Kp * gamma * H * H;
}

LateralThrust rankine_active_thrust(double Ka, double gamma, double H) {
    LateralThrust thrust;
    thrust.force = rankine_active_force(Ka, gamma, H);
    thrust.height = H / 3.0;
    return thrust;
}

double rankine_active_pressure_cohesive(double Ka, double gamma, double z, double c) {
    check_pressure_args("rankine_active_pressure_cohesive", "Ka", Ka, gamma, z);
    require_non_negative("rankine_active_pressure_cohesive", "c", c);
    // Soil cannot pull on the wall: no pressure above the tension crack
    return std::max(0.0, Ka * gamma * z - 2.0 * c * safe_sqrt(Ka));
}

double rankine_passive_pressure_cohesive(double Kp, double gamma, double z, double c) {
    check_pressure_args("rankine_passive_pressure_cohesive", "Kp", Kp, gamma, z);
    require_non_negative("rankine_passive_pressure_cohesive", "c", c);
    return Kp * gamma * z + 2.0 * c * safe_sqrt(Kp);
}

double tension_crack_depth(double Ka, double gamma, double c) {
    require_positive("tension_crack_depth", "Ka", Ka);
    require_positive("tension_crack_depth", "gamma", gamma);
    require_non_negative("tension_crack_depth", "c", c);
    return 2.0 * c / (gamma * safe_sqrt(Ka));
}

double surcharge_active_pressure(double K, double q) {
    require_positive("surcharge_active_pressure", "K", K);
    require_non_negative("surcharge_active_pressure", "q", q);
    return K * q;
}

Eigen::VectorXd active_pressure_profile(double Ka, double gamma,
                                        const Eigen::VectorXd& depths) {
    require_positive("active_pressure_profile", "Ka", Ka);
    require_positive("active_pressure_profile", "gamma", gamma);
    for (Eigen::Index i = 0; i < depths.size(); ++i) {
        require_non_negative("active_pressure_profile", "depths[i]", depths(i));
    }
    return (Ka * gamma) * depths;
}

double coulomb_active_coefficient(double phi, double delta, double theta, double beta) {
    check_coulomb_angles("coulomb_active_coefficient", phi, delta, theta, beta);

    double p = deg_to_rad(phi);
    double d = deg_to_rad(delta);
    double t = deg_to_rad(theta);
    double b = deg_to_rad(beta);

    double cos_dt = std::cos(d + t);
    double cos_tb = std::cos(t - b);
    double root = safe_sqrt(safe_divide(std::sin(p + d) * std::sin(p - b), cos_dt * cos_tb,
                                        "coulomb_active_coefficient root term"));

    double cos_t = std::cos(t);
    double denom = cos_t * cos_t * cos_dt * (1.0 + root) * (1.0 + root);
    double num = std::cos(p - t) * std::cos(p - t);
    double Ka = safe_divide(num, denom, "coulomb_active_coefficient");
    if (!(Ka > 0.0)) {
        throw DomainError(GeotechError::domain("coulomb_active_coefficient", Ka,
            "angle combination gives a non-positive coefficient"));
    }
    return Ka;
}

double coulomb_passive_coefficient(double phi, double delta, double theta, double beta) {
    check_coulomb_angles("coulomb_passive_coefficient", phi, delta, theta, beta);

    double p = deg_to_rad(phi);
    double d = deg_to_rad(delta);
    double t = deg_to_rad(theta);
    double b = deg_to_rad(beta);

    double cos_dt = std::cos(d - t);
    double cos_tb = std::cos(t - b);
    double root = safe_sqrt(safe_divide(std::sin(p + d) * std::sin(p + b), cos_dt * cos_tb,
                                        "coulomb_passive_coefficient root term"));
    if (root >= 1.0 - 1e-12) {
        throw DomainError(GeotechError::domain("coulomb_passive_coefficient", root,
            "root term reaches 1, passive resistance is unbounded"));
    }

    double cos_t = std::cos(t);
    double denom = cos_t * cos_t * cos_dt * (1.0 - root) * (1.0 - root);
    double num = std::cos(p + t) * std::cos(p + t);
    double Kp = safe_divide(num, denom, "coulomb_passive_coefficient");
    if (!(Kp > 0.0)) {
        throw DomainError(GeotechError::domain("coulomb_passive_coefficient", Kp,
            "angle combination gives a non-positive coefficient"));
    }
    return Kp;
}

double at_rest_coefficient(double phi) {
    require_friction_angle("at_rest_coefficient", phi);
    return 1.0 - std::sin(deg_to_rad(phi));
}

double at_rest_coefficient_overconsolidated(double phi, double ocr) {
    require_friction_angle("at_rest_coefficient_overconsolidated", phi);
    require_at_least("at_rest_coefficient_overconsolidated", "ocr", ocr, 1.0);
    double s = std::sin(deg_to_rad(phi));
    return (1.0 - s) * std::pow(ocr, s);
}

double at_rest_pressure(double K0, double gamma, double z) {
    check_pressure_args("at_rest_pressure", "K0", K0, gamma, z);
    return K0 * gamma * z;
}

} // namespace geotech
