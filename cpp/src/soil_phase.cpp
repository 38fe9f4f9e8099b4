#include "geotech/soil_phase.hpp"
#include "geotech/validation.hpp"

namespace geotech {

using namespace validation;

double void_ratio(double n) {
    require_half_open("void_ratio", "n", n, 0.0, 1.0);
    return n / (1.0 - n);
}

double porosity(double e) {
    require_non_negative("porosity", "e", e);
    return e / (1.0 + e);
}

double degree_of_saturation(double Vw, double Vv) {
    require_positive("degree_of_saturation", "Vv", Vv);
    require_closed("degree_of_saturation", "Vw", Vw, 0.0, Vv);
    return Vw / Vv * 100.0;
}

double dry_density(double rho, double w) {
    require_positive("dry_density", "rho", rho);
    require_non_negative("dry_density", "w", w);
    return rho / (1.0 + w / 100.0);
}

double saturated_unit_weight(double Gs, double e, double gamma_w) {
    require_positive("saturated_unit_weight", "Gs", Gs);
    require_non_negative("saturated_unit_weight", "e", e);
    require_positive("saturated_unit_weight", "gamma_w", gamma_w);
    return (Gs + e) * gamma_w / (1.0 + e);
}

double submerged_unit_weight(double gamma_sat, double gamma_w) {
    require_positive("submerged_unit_weight", "gamma_w", gamma_w);
    require_greater("submerged_unit_weight", "gamma_sat", gamma_sat, gamma_w);
    return gamma_sat - gamma_w;
}

double void_ratio_from_water_content(double w, double Gs, double S) {
    require_non_negative("void_ratio_from_water_content", "w", w);
    require_positive("void_ratio_from_water_content", "Gs", Gs);
    require_closed("void_ratio_from_water_content", "S", S, 0.0, 100.0);
    if (S == 0.0) {
        throw InvalidInput(GeotechError::invalid_input("void_ratio_from_water_content",
            "S", S, "in (0, 100]"));
    }
    return w * Gs / S;
}

} // namespace geotech
