#include "geotech/seepage.hpp"
#include "geotech/validation.hpp"

namespace geotech {

using namespace validation;

double darcy_velocity(double k, double i) {
    require_positive("darcy_velocity", "k", k);
    require_finite("darcy_velocity", "i", i);
    return k * i;
}

double darcy_flow_rate(double k, double i, double A) {
    require_positive("darcy_flow_rate", "A", A);
    return darcy_velocity(k, i) * A;
}

double hydraulic_gradient(double delta_h, double L) {
    require_finite("hydraulic_gradient", "delta_h", delta_h);
    require_positive("hydraulic_gradient", "L", L);
    return delta_h / L;
}

double critical_hydraulic_gradient(double Gs, double e) {
    require_greater("critical_hydraulic_gradient", "Gs", Gs, 1.0);
    require_greater("critical_hydraulic_gradient", "e", e, -1.0);
    return (Gs - 1.0) / (1.0 + e);
}

bool is_piping(double i, double icr) {
    require_finite("is_piping", "i", i);
    require_positive("is_piping", "icr", icr);
    return i >= icr;
}

double piping_safety_factor(double i, double icr) {
    require_positive("piping_safety_factor", "i", i);
    require_positive("piping_safety_factor", "icr", icr);
    return icr / i;
}

double seepage_velocity(double v, double n) {
    require_finite("seepage_velocity", "v", v);
    require_closed("seepage_velocity", "n", n, 0.0, 1.0);
    if (n == 0.0) {
        throw InvalidInput(GeotechError::invalid_input("seepage_velocity", "n", n, "in (0, 1]"));
    }
    return v / n;
}

double flow_net_rate(double k, double delta_h, double Nf, double Nd) {
    const char* fn = "flow_net_rate";
    require_positive(fn, "k", k);
    require_non_negative(fn, "delta_h", delta_h);
    require_positive(fn, "Nf", Nf);
    require_positive(fn, "Nd", Nd);
    return k * delta_h * Nf / Nd;
}

double seepage_force(double i, double gamma_w, double V) {
    require_non_negative("seepage_force", "i", i);
    require_positive("seepage_force", "gamma_w", gamma_w);
    require_non_negative("seepage_force", "V", V);
    return i * gamma_w * V;
}

} // namespace geotech
