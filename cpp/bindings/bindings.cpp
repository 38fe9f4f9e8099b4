#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include "geotech/numeric_utils.hpp"
#include "geotech/errors.hpp"
#include "geotech/warnings.hpp"
#include "geotech/earth_pressure.hpp"
#include "geotech/bearing_capacity.hpp"
#include "geotech/settlement.hpp"
#include "geotech/seepage.hpp"
#include "geotech/soil_phase.hpp"
#include "geotech/soil_properties.hpp"
#include "geotech/diagnostics.hpp"

namespace py = pybind11;

/**
 * Geotech C++ Python bindings module.
 * One function per formula, keyword arguments named as in the C++ headers.
 */
PYBIND11_MODULE(_geotech_cpp, m) {
    m.doc() = "Geotech C++ core module - closed-form geotechnical formulas";

    m.attr("__version__") = "1.0.0";
    m.attr("PI") = geotech::PI;
    m.attr("GAMMA_WATER") = geotech::GAMMA_WATER;

    // ========================================================================
    // Errors
    // ========================================================================

    py::enum_<geotech::ErrorCode>(m, "ErrorCode",
        "Error codes for Geotech formula failures")
        .value("OK", geotech::ErrorCode::OK, "No error")
        .value("INVALID_INPUT", geotech::ErrorCode::INVALID_INPUT,
               "Parameter violates its documented domain")
        .value("NON_FINITE_INPUT", geotech::ErrorCode::NON_FINITE_INPUT,
               "Parameter is NaN or infinite")
        .value("DOMAIN_ERROR", geotech::ErrorCode::DOMAIN_ERROR,
               "Operation evaluated outside its mathematical domain")
        .value("DIVISION_BY_ZERO", geotech::ErrorCode::DIVISION_BY_ZERO,
               "Intermediate denominator is zero")
        .value("RESULT_OVERFLOW", geotech::ErrorCode::RESULT_OVERFLOW,
               "Intermediate result is not representable")
        .export_values();

    py::class_<geotech::GeotechError>(m, "GeotechError",
        "Structured error information with machine-readable code and diagnostics")
        .def(py::init<>(), "Create OK (no error) status")
        .def(py::init<geotech::ErrorCode, const std::string&>(),
             py::arg("code"), py::arg("message"),
             "Create error with code and message")
        .def_readwrite("code", &geotech::GeotechError::code, "Error code")
        .def_readwrite("message", &geotech::GeotechError::message, "Error message")
        .def_readwrite("parameter", &geotech::GeotechError::parameter,
                       "Offending parameter name")
        .def_readwrite("value", &geotech::GeotechError::value, "Offending value")
        .def_readwrite("constraint", &geotech::GeotechError::constraint,
                       "Violated constraint")
        .def_readwrite("details", &geotech::GeotechError::details,
                       "Additional diagnostic details (key-value pairs)")
        .def_readwrite("suggestion", &geotech::GeotechError::suggestion,
                       "Suggested fix for the error")
        .def("is_ok", &geotech::GeotechError::is_ok, "Check if no error")
        .def("is_error", &geotech::GeotechError::is_error, "Check if error occurred")
        .def("code_string", &geotech::GeotechError::code_string,
             "Get string representation of error code")
        .def("to_string", &geotech::GeotechError::to_string,
             "Get formatted error string")
        .def("__repr__", [](const geotech::GeotechError &e) {
            if (e.is_ok()) return std::string("<GeotechError OK>");
            return "<GeotechError " + e.code_string() + ": " + e.message + ">";
        })
        .def("__str__", &geotech::GeotechError::to_string);

    // InvalidInput -> ValueError subclass, DomainError -> ArithmeticError subclass
    py::register_exception<geotech::InvalidInput>(m, "InvalidInput", PyExc_ValueError);
    py::register_exception<geotech::DomainError>(m, "DomainError", PyExc_ArithmeticError);

    // ========================================================================
    // Warnings
    // ========================================================================

    py::enum_<geotech::WarningCode>(m, "WarningCode",
        "Warning codes for questionable parameters and results")
        .value("ATYPICAL_FRICTION_ANGLE", geotech::WarningCode::ATYPICAL_FRICTION_ANGLE,
               "Friction angle outside 0-50 deg")
        .value("ATYPICAL_COHESION", geotech::WarningCode::ATYPICAL_COHESION,
               "Cohesion outside 0-500 kPa")
        .value("ATYPICAL_UNIT_WEIGHT", geotech::WarningCode::ATYPICAL_UNIT_WEIGHT,
               "Unit weight outside 10-25 kN/m³")
        .value("ATYPICAL_VOID_RATIO", geotech::WarningCode::ATYPICAL_VOID_RATIO,
               "Void ratio outside 0.1-2.0")
        .value("ATYPICAL_PERMEABILITY", geotech::WarningCode::ATYPICAL_PERMEABILITY,
               "Permeability outside 1e-10 to 1e-2 m/s")
        .value("ATYPICAL_SPECIFIC_GRAVITY", geotech::WarningCode::ATYPICAL_SPECIFIC_GRAVITY,
               "Specific gravity outside 2.5-2.9")
        .value("ATYPICAL_DEPTH", geotech::WarningCode::ATYPICAL_DEPTH,
               "Depth outside 0-50 m")
        .value("ATYPICAL_WIDTH", geotech::WarningCode::ATYPICAL_WIDTH,
               "Width outside 0.1-20 m")
        .value("LOW_SAFETY_FACTOR", geotech::WarningCode::LOW_SAFETY_FACTOR,
               "Safety factor below customary minimum")
        .value("NEAR_PIPING", geotech::WarningCode::NEAR_PIPING,
               "Exit gradient close to critical gradient")
        .export_values();

    py::enum_<geotech::WarningSeverity>(m, "WarningSeverity",
        "Warning severity levels")
        .value("Low", geotech::WarningSeverity::Low, "Just outside a typical range")
        .value("Medium", geotech::WarningSeverity::Medium, "Review recommended")
        .value("High", geotech::WarningSeverity::High, "Likely input or unit error")
        .export_values();

    py::class_<geotech::GeotechWarning>(m, "GeotechWarning",
        "Structured warning information for questionable parameters")
        .def(py::init<geotech::WarningCode, geotech::WarningSeverity, const std::string&>(),
             py::arg("code"), py::arg("severity"), py::arg("message"))
        .def_readwrite("code", &geotech::GeotechWarning::code, "Warning code")
        .def_readwrite("severity", &geotech::GeotechWarning::severity, "Severity level")
        .def_readwrite("message", &geotech::GeotechWarning::message, "Warning message")
        .def_readwrite("details", &geotech::GeotechWarning::details,
                       "Additional details (key-value pairs)")
        .def_readwrite("suggestion", &geotech::GeotechWarning::suggestion, "Suggested fix")
        .def("code_string", &geotech::GeotechWarning::code_string)
        .def("severity_string", &geotech::GeotechWarning::severity_string)
        .def("to_string", &geotech::GeotechWarning::to_string)
        .def("__repr__", [](const geotech::GeotechWarning &w) {
            return "<GeotechWarning [" + w.severity_string() + "] " +
                   w.code_string() + ": " + w.message + ">";
        })
        .def("__str__", &geotech::GeotechWarning::to_string);

    py::class_<geotech::WarningList>(m, "WarningList",
        "Collection of warnings from parameter checks")
        .def(py::init<>(), "Create empty warning list")
        .def_readwrite("warnings", &geotech::WarningList::warnings, "List of warnings")
        .def("add", py::overload_cast<const geotech::GeotechWarning&>(
                 &geotech::WarningList::add),
             py::arg("warning"), "Add a warning to the list")
        .def("merge", &geotech::WarningList::merge, py::arg("other"))
        .def("has_warnings", &geotech::WarningList::has_warnings)
        .def("count", &geotech::WarningList::count)
        .def("count_by_severity", &geotech::WarningList::count_by_severity,
             py::arg("severity"))
        .def("contains", &geotech::WarningList::contains, py::arg("code"))
        .def("get_by_min_severity", &geotech::WarningList::get_by_min_severity,
             py::arg("min_severity"))
        .def("clear", &geotech::WarningList::clear)
        .def("summary", &geotech::WarningList::summary)
        .def("__len__", &geotech::WarningList::count)
        .def("__bool__", &geotech::WarningList::has_warnings)
        .def("__iter__", [](const geotech::WarningList &wl) {
            return py::make_iterator(wl.warnings.begin(), wl.warnings.end());
        }, py::keep_alive<0, 1>())
        .def("__repr__", [](const geotech::WarningList &wl) {
            return "<WarningList: " + wl.summary() + ">";
        });

    m.def("check_geometry", &geotech::check_geometry,
          py::arg("depth"), py::arg("width"),
          "Check depth [m] and width [m] against typical ranges");
    m.def("check_safety_factor", &geotech::check_safety_factor,
          py::arg("Fs"), py::arg("minimum") = 2.0,
          "Warn when the safety factor is below the minimum");
    m.def("check_piping_margin", &geotech::check_piping_margin,
          py::arg("i"), py::arg("icr"), py::arg("ratio") = 0.8,
          "Warn when i/icr exceeds ratio without piping");

    // ========================================================================
    // Numeric utilities
    // ========================================================================

    m.def("deg_to_rad", &geotech::deg_to_rad, py::arg("deg"));
    m.def("rad_to_deg", &geotech::rad_to_deg, py::arg("rad"));
    m.def("approx_equal", &geotech::approx_equal,
          py::arg("a"), py::arg("b"), py::arg("tolerance") = 1e-9,
          "True iff |a - b| <= tolerance");
    m.def("safe_tan", &geotech::safe_tan, py::arg("rad"));
    m.def("safe_tan_deg", &geotech::safe_tan_deg, py::arg("deg"));
    m.def("safe_sqrt", &geotech::safe_sqrt, py::arg("x"));
    m.def("safe_exp", &geotech::safe_exp, py::arg("x"));
    m.def("safe_log", &geotech::safe_log, py::arg("x"));

    // ========================================================================
    // Soil properties
    // ========================================================================

    py::class_<geotech::SoilProperties>(m, "SoilProperties",
        "Properties of one soil stratum")
        .def(py::init<int, std::string, double, double, double, double, double, double>(),
             py::arg("id"), py::arg("name"), py::arg("phi"), py::arg("c"), py::arg("gamma"),
             py::arg("e") = 0.7, py::arg("Gs") = 2.65, py::arg("k") = 1e-6,
             "Construct with phi [deg], c [kPa], gamma [kN/m³], e, Gs, k [m/s]")
        .def_readwrite("id", &geotech::SoilProperties::id)
        .def_readwrite("name", &geotech::SoilProperties::name)
        .def_readwrite("phi", &geotech::SoilProperties::phi, "Friction angle [deg]")
        .def_readwrite("c", &geotech::SoilProperties::c, "Cohesion [kPa]")
        .def_readwrite("gamma", &geotech::SoilProperties::gamma, "Unit weight [kN/m³]")
        .def_readwrite("e", &geotech::SoilProperties::e, "Void ratio")
        .def_readwrite("Gs", &geotech::SoilProperties::Gs, "Specific gravity of solids")
        .def_readwrite("k", &geotech::SoilProperties::k, "Permeability [m/s]")
        .def("validate", &geotech::SoilProperties::validate)
        .def("check_typical_ranges", &geotech::SoilProperties::check_typical_ranges)
        .def("porosity", &geotech::SoilProperties::porosity)
        .def("critical_gradient", &geotech::SoilProperties::critical_gradient)
        .def("__repr__", [](const geotech::SoilProperties &s) {
            return "<SoilProperties '" + s.name + "' phi=" + std::to_string(s.phi) +
                   " c=" + std::to_string(s.c) + ">";
        });

    // ========================================================================
    // Earth pressure
    // ========================================================================

    py::class_<geotech::LateralThrust>(m, "LateralThrust",
        "Resultant lateral force and its height above the wall base")
        .def(py::init<>())
        .def_readwrite("force", &geotech::LateralThrust::force, "Force [kN/m]")
        .def_readwrite("height", &geotech::LateralThrust::height, "Height above base [m]");

    m.def("rankine_active_coefficient", &geotech::rankine_active_coefficient,
          py::arg("phi"), "Ka = tan²(45° - φ/2)");
    m.def("rankine_passive_coefficient", &geotech::rankine_passive_coefficient,
          py::arg("phi"), "Kp = tan²(45° + φ/2)");
    m.def("rankine_active_pressure", &geotech::rankine_active_pressure,
          py::arg("Ka"), py::arg("gamma"), py::arg("z"), "σa = Ka·γ·z [kPa]");
    m.def("rankine_passive_pressure", &geotech::rankine_passive_pressure,
          py::arg("Kp"), py::arg("gamma"), py::arg("z"), "σp = Kp·γ·z [kPa]");
    m.def("rankine_active_force", &geotech::rankine_active_force,
          py::arg("Ka"), py::arg("gamma"), py::arg("H"), "Pa = ½·Ka·γ·H² [kN/m]");
    m.def("rankine_passive_force", &geotech::rankine_passive_force,
          py::arg("Kp"), py::arg("gamma"), py::arg("H"), "Pp = ½·Kp·γ·H² [kN/m]");
    m.def("rankine_active_thrust", &geotech::rankine_active_thrust,
          py::arg("Ka"), py::arg("gamma"), py::arg("H"));
    m.def("rankine_active_pressure_cohesive", &geotech::rankine_active_pressure_cohesive,
          py::arg("Ka"), py::arg("gamma"), py::arg("z"), py::arg("c"));
    m.def("rankine_passive_pressure_cohesive", &geotech::rankine_passive_pressure_cohesive,
          py::arg("Kp"), py::arg("gamma"), py::arg("z"), py::arg("c"));
    m.def("tension_crack_depth", &geotech::tension_crack_depth,
          py::arg("Ka"), py::arg("gamma"), py::arg("c"));
    m.def("surcharge_active_pressure", &geotech::surcharge_active_pressure,
          py::arg("K"), py::arg("q"));
    m.def("active_pressure_profile", &geotech::active_pressure_profile,
          py::arg("Ka"), py::arg("gamma"), py::arg("depths"));
    m.def("coulomb_active_coefficient", &geotech::coulomb_active_coefficient,
          py::arg("phi"), py::arg("delta"), py::arg("theta") = 0.0, py::arg("beta") = 0.0);
    m.def("coulomb_passive_coefficient", &geotech::coulomb_passive_coefficient,
          py::arg("phi"), py::arg("delta"), py::arg("theta") = 0.0, py::arg("beta") = 0.0);
    m.def("at_rest_coefficient", &geotech::at_rest_coefficient, py::arg("phi"));
    m.def("at_rest_coefficient_overconsolidated",
          &geotech::at_rest_coefficient_overconsolidated, py::arg("phi"), py::arg("ocr"));
    m.def("at_rest_pressure", &geotech::at_rest_pressure,
          py::arg("K0"), py::arg("gamma"), py::arg("z"));

    // ========================================================================
    // Bearing capacity
    // ========================================================================

    py::enum_<geotech::NgammaMethod>(m, "NgammaMethod", "Closed-form fit for Nγ")
        .value("Hansen", geotech::NgammaMethod::Hansen)
        .value("Meyerhof", geotech::NgammaMethod::Meyerhof)
        .value("Vesic", geotech::NgammaMethod::Vesic)
        .export_values();

    py::enum_<geotech::FootingShape>(m, "FootingShape", "Footing plan shape")
        .value("Strip", geotech::FootingShape::Strip)
        .value("Square", geotech::FootingShape::Square)
        .value("Circular", geotech::FootingShape::Circular)
        .export_values();

    py::class_<geotech::BearingCapacityFactors>(m, "BearingCapacityFactors")
        .def(py::init<>())
        .def_readwrite("Nc", &geotech::BearingCapacityFactors::Nc)
        .def_readwrite("Nq", &geotech::BearingCapacityFactors::Nq)
        .def_readwrite("Ngamma", &geotech::BearingCapacityFactors::Ngamma)
        .def("__repr__", [](const geotech::BearingCapacityFactors &f) {
            return "<BearingCapacityFactors Nc=" + std::to_string(f.Nc) +
                   " Nq=" + std::to_string(f.Nq) +
                   " Ngamma=" + std::to_string(f.Ngamma) + ">";
        });

    py::class_<geotech::ShearStrength>(m, "ShearStrength")
        .def(py::init<>())
        .def_readwrite("c", &geotech::ShearStrength::c, "Cohesion [kPa]")
        .def_readwrite("phi", &geotech::ShearStrength::phi, "Friction angle [deg]");

    m.def("terzaghi_nq", &geotech::terzaghi_nq, py::arg("phi"));
    m.def("terzaghi_nc", &geotech::terzaghi_nc, py::arg("phi"));
    m.def("terzaghi_ngamma", &geotech::terzaghi_ngamma,
          py::arg("phi"), py::arg("method") = geotech::NgammaMethod::Hansen);
    m.def("terzaghi_factors", &geotech::terzaghi_factors,
          py::arg("phi"), py::arg("method") = geotech::NgammaMethod::Hansen);
    m.def("terzaghi_bearing_capacity", &geotech::terzaghi_bearing_capacity,
          py::arg("c"), py::arg("q"), py::arg("gamma"), py::arg("B"), py::arg("phi"),
          "qu = c·Nc + q·Nq + 0.5·γ·B·Nγ [kPa]");
    m.def("terzaghi_bearing_capacity_shaped", &geotech::terzaghi_bearing_capacity_shaped,
          py::arg("c"), py::arg("q"), py::arg("gamma"), py::arg("B"), py::arg("phi"),
          py::arg("shape"), py::arg("method") = geotech::NgammaMethod::Hansen);
    m.def("local_shear_parameters", &geotech::local_shear_parameters,
          py::arg("c"), py::arg("phi"));
    m.def("overburden_pressure", &geotech::overburden_pressure,
          py::arg("gamma"), py::arg("Df"));
    m.def("bearing_capacity_design", &geotech::bearing_capacity_design,
          py::arg("qu"), py::arg("Fs"), "qa = qu / Fs");

    // ========================================================================
    // Settlement & consolidation
    // ========================================================================

    py::class_<geotech::ConsolidationSettings>(m, "ConsolidationSettings",
        "Crossover between the square-root and exponential branches of U(Tv)")
        .def(py::init<>())
        .def_readwrite("crossover_tv", &geotech::ConsolidationSettings::crossover_tv)
        .def_readonly_static("MIN_CROSSOVER_TV",
                             &geotech::ConsolidationSettings::MIN_CROSSOVER_TV)
        .def_readonly_static("MAX_CROSSOVER_TV",
                             &geotech::ConsolidationSettings::MAX_CROSSOVER_TV);

    m.def("settlement_layer", &geotech::settlement_layer,
          py::arg("av"), py::arg("e0"), py::arg("sigma_z"), py::arg("Hi"),
          "av [1/MPa], sigma_z [kPa], Hi [m] -> settlement [m]");
    m.def("settlement_layer_es", &geotech::settlement_layer_es,
          py::arg("Es"), py::arg("sigma_z"), py::arg("Hi"),
          "Es [MPa], sigma_z [kPa], Hi [m] -> settlement [m]");
    m.def("settlement_compression_index", &geotech::settlement_compression_index,
          py::arg("Cc"), py::arg("e0"), py::arg("sigma0"), py::arg("delta_sigma"), py::arg("H"));
    m.def("elastic_settlement", &geotech::elastic_settlement,
          py::arg("q"), py::arg("B"), py::arg("nu"), py::arg("E"), py::arg("Iw"));
    m.def("total_settlement", &geotech::total_settlement,
          py::arg("av"), py::arg("e0"), py::arg("sigma_z"), py::arg("Hi"));
    m.def("time_factor", &geotech::time_factor,
          py::arg("Cv"), py::arg("t"), py::arg("H"), "Tv = Cv·t / H²");
    m.def("consolidation_degree", &geotech::consolidation_degree,
          py::arg("Tv"), py::arg("settings") = geotech::ConsolidationSettings());
    m.def("time_factor_for_degree", &geotech::time_factor_for_degree,
          py::arg("U"), py::arg("settings") = geotech::ConsolidationSettings());
    m.def("excess_pore_pressure_ratio", &geotech::excess_pore_pressure_ratio,
          py::arg("Z"), py::arg("Tv"), py::arg("terms") = 100);
    m.def("excess_pore_pressure_isochrone", &geotech::excess_pore_pressure_isochrone,
          py::arg("Z"), py::arg("Tv"), py::arg("terms") = 100);
    m.def("consolidation_settlement_final", &geotech::consolidation_settlement_final,
          py::arg("mv"), py::arg("sigma_z"), py::arg("H"),
          "mv [1/MPa], sigma_z [kPa], H [m] -> settlement [m]");
    m.def("consolidation_settlement_at_time", &geotech::consolidation_settlement_at_time,
          py::arg("s_final"), py::arg("Tv"),
          py::arg("settings") = geotech::ConsolidationSettings());

    // ========================================================================
    // Seepage
    // ========================================================================

    m.def("darcy_velocity", &geotech::darcy_velocity, py::arg("k"), py::arg("i"));
    m.def("darcy_flow_rate", &geotech::darcy_flow_rate,
          py::arg("k"), py::arg("i"), py::arg("A"));
    m.def("hydraulic_gradient", &geotech::hydraulic_gradient,
          py::arg("delta_h"), py::arg("L"));
    m.def("critical_hydraulic_gradient", &geotech::critical_hydraulic_gradient,
          py::arg("Gs"), py::arg("e"));
    m.def("is_piping", &geotech::is_piping, py::arg("i"), py::arg("icr"),
          "True iff i >= icr (exact comparison)");
    m.def("piping_safety_factor", &geotech::piping_safety_factor,
          py::arg("i"), py::arg("icr"));
    m.def("seepage_velocity", &geotech::seepage_velocity, py::arg("v"), py::arg("n"));
    m.def("flow_net_rate", &geotech::flow_net_rate,
          py::arg("k"), py::arg("delta_h"), py::arg("Nf"), py::arg("Nd"));
    m.def("seepage_force", &geotech::seepage_force,
          py::arg("i"), py::arg("gamma_w"), py::arg("V"));

    // ========================================================================
    // Soil phase relationships
    // ========================================================================

    m.def("void_ratio", &geotech::void_ratio, py::arg("n"));
    m.def("porosity", &geotech::porosity, py::arg("e"));
    m.def("degree_of_saturation", &geotech::degree_of_saturation,
          py::arg("Vw"), py::arg("Vv"), "S = Vw/Vv·100 [%]");
    m.def("dry_density", &geotech::dry_density, py::arg("rho"), py::arg("w"),
          "w in percent");
    m.def("saturated_unit_weight", &geotech::saturated_unit_weight,
          py::arg("Gs"), py::arg("e"), py::arg("gamma_w") = geotech::GAMMA_WATER);
    m.def("submerged_unit_weight", &geotech::submerged_unit_weight,
          py::arg("gamma_sat"), py::arg("gamma_w") = geotech::GAMMA_WATER);
    m.def("void_ratio_from_water_content", &geotech::void_ratio_from_water_content,
          py::arg("w"), py::arg("Gs"), py::arg("S"));
}
