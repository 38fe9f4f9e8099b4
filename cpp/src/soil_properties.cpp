#include "geotech/soil_properties.hpp"
#include "geotech/diagnostics.hpp"
#include "geotech/seepage.hpp"
#include "geotech/soil_phase.hpp"
#include "geotech/validation.hpp"
#include <utility>

namespace geotech {

using namespace validation;

SoilProperties::SoilProperties(int id, std::string name, double phi, double c, double gamma,
                               double e, double Gs, double k)
    : id(id), name(std::move(name)), phi(phi), c(c), gamma(gamma), e(e), Gs(Gs), k(k) {
}

void SoilProperties::validate() const {
    const char* fn = "SoilProperties::validate";
    require_half_open(fn, "phi", phi, 0.0, 90.0);
    require_non_negative(fn, "c", c);
    require_positive(fn, "gamma", gamma);
    require_positive(fn, "e", e);
    require_greater(fn, "Gs", Gs, 1.0);
    require_positive(fn, "k", k);
}

WarningList SoilProperties::check_typical_ranges() const {
    WarningList list;
    check_range(list, WarningCode::ATYPICAL_FRICTION_ANGLE, "friction angle [deg]", phi, 0.0, 50.0);
    check_range(list, WarningCode::ATYPICAL_COHESION, "cohesion [kPa]", c, 0.0, 500.0);
    check_range(list, WarningCode::ATYPICAL_UNIT_WEIGHT, "unit weight [kN/m³]", gamma, 10.0, 25.0);
    check_range(list, WarningCode::ATYPICAL_VOID_RATIO, "void ratio", e, 0.1, 2.0);
    check_range(list, WarningCode::ATYPICAL_SPECIFIC_GRAVITY, "specific gravity", Gs, 2.5, 2.9);
    check_range(list, WarningCode::ATYPICAL_PERMEABILITY, "permeability [m/s]", k, 1e-10, 1e-2);
    return list;
}

double SoilProperties::porosity() const {
    return geotech::porosity(e);
}

double SoilProperties::critical_gradient() const {
    return critical_hydraulic_gradient(Gs, e);
}

} // namespace geotech
