#include "geotech/bearing_capacity.hpp"
#include "geotech/numeric_utils.hpp"
#include "geotech/validation.hpp"
#include <cmath>

namespace geotech {

using namespace validation;

namespace {

/// Upper end of the friction angle range covered by the published fits [deg]
constexpr double PHI_MAX = 50.0;

/// Below this angle [rad] Nc uses its analytical limit instead of 0/0
constexpr double PHI_SMALL = 1e-6;

void check_phi(const char* function, double phi) {
    require_closed(function, "phi", phi, 0.0, PHI_MAX);
}

// Nq without argument checks, phi in radians
double nq_rad(double phi) {
    if (phi == 0.0) {
        return 1.0;
    }
    double a = safe_exp((0.75 * PI - phi / 2.0) * safe_tan(phi));
    double c = std::cos(PI / 4.0 + phi / 2.0);
    return safe_divide(a * a, 2.0 * c * c, "terzaghi_nq");
}

} // namespace

double terzaghi_nq(double phi) {
    check_phi("terzaghi_nq", phi);
    return nq_rad(deg_to_rad(phi));
}

double terzaghi_nc(double phi) {
    check_phi("terzaghi_nc", phi);
    double p = deg_to_rad(phi);
    if (p < PHI_SMALL) {
        // lim (Nq - 1)·cot φ as φ -> 0
        return 1.5 * PI + 1.0;
    }
    return safe_divide(nq_rad(p) - 1.0, safe_tan(p), "terzaghi_nc");
}

double terzaghi_ngamma(double phi, NgammaMethod method) {
    check_phi("terzaghi_ngamma", phi);
    double p = deg_to_rad(phi);
    if (p < PHI_SMALL) {
        // Every fit vanishes at φ = 0; avoid round-off below zero
        return 0.0;
    }
    double Nq = nq_rad(p);
    switch (method) {
        case NgammaMethod::Hansen:
            return 1.5 * (Nq - 1.0) * safe_tan(p);
        case NgammaMethod::Meyerhof:
            return (Nq - 1.0) * safe_tan(1.4 * p);
        case NgammaMethod::Vesic:
            return 2.0 * (Nq + 1.0) * safe_tan(p);
    }
    throw InvalidInput(GeotechError::invalid_input("terzaghi_ngamma", "method",
        static_cast<double>(method), "a known NgammaMethod"));
}

BearingCapacityFactors terzaghi_factors(double phi, NgammaMethod method) {
    BearingCapacityFactors f;
    f.Nc = terzaghi_nc(phi);
    f.Nq = terzaghi_nq(phi);
    f.Ngamma = terzaghi_ngamma(phi, method);
    return f;
}

double terzaghi_bearing_capacity(double c, double q, double gamma, double B, double phi) {
    return terzaghi_bearing_capacity_shaped(c, q, gamma, B, phi, FootingShape::Strip);
}

double terzaghi_bearing_capacity_shaped(double c, double q, double gamma, double B,
                                        double phi, FootingShape shape,
                                        NgammaMethod method) {
    const char* fn = "terzaghi_bearing_capacity";
    require_non_negative(fn, "c", c);
    require_non_negative(fn, "q", q);
    require_positive(fn, "gamma", gamma);
    require_positive(fn, "B", B);
    check_phi(fn, phi);

    double sc = 1.0;
    double sg = 0.5;
    switch (shape) {
        case FootingShape::Strip:
            break;
        case FootingShape::Square:
            sc = 1.3;
            sg = 0.4;
            break;
        case FootingShape::Circular:
            sc = 1.3;
            sg = 0.3;
            break;
    }

    BearingCapacityFactors f = terzaghi_factors(phi, method);
    return sc * c * f.Nc + q * f.Nq + sg * gamma * B * f.Ngamma;
}

ShearStrength local_shear_parameters(double c, double phi) {
    require_non_negative("local_shear_parameters", "c", c);
    require_half_open("local_shear_parameters", "phi", phi, 0.0, 90.0);
    ShearStrength reduced;
    reduced.c = 2.0 / 3.0 * c;
    reduced.phi = rad_to_deg(std::atan(2.0 / 3.0 * safe_tan_deg(phi)));
    return reduced;
}

double overburden_pressure(double gamma, double Df) {
    require_positive("overburden_pressure", "gamma", gamma);
    require_non_negative("overburden_pressure", "Df", Df);
    return gamma * Df;
}

double bearing_capacity_design(double qu, double Fs) {
    require_non_negative("bearing_capacity_design", "qu", qu);
    require_positive("bearing_capacity_design", "Fs", Fs);
    return qu / Fs;
}

} // namespace geotech
