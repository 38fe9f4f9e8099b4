/**
 * @file test_errors_warnings.cpp
 * @brief C++ tests for structured errors, warnings and parameter checks
 *
 * Tests include:
 * - Error records carried by InvalidInput and DomainError
 * - Distinguishing invalid arguments from domain failures
 * - Typical-range warnings for soil properties and geometry
 * - Safety factor and piping margin warnings
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "geotech/errors.hpp"
#include "geotech/warnings.hpp"
#include "geotech/soil_properties.hpp"
#include "geotech/diagnostics.hpp"
#include "geotech/earth_pressure.hpp"
#include "geotech/seepage.hpp"

#include <limits>
#include <stdexcept>
#include <string>

using namespace geotech;
using Catch::Matchers::WithinAbs;

// =============================================================================
// Error records
// =============================================================================

TEST_CASE("Default error is OK", "[Errors]") {
    GeotechError err;
    REQUIRE(err.is_ok());
    REQUIRE_FALSE(err.is_error());
    REQUIRE(err.to_string() == "OK");
}

TEST_CASE("Invalid input error records parameter and constraint", "[Errors]") {
    GeotechError err = GeotechError::invalid_input("time_factor", "H", -2.0, "> 0");
    REQUIRE(err.code == ErrorCode::INVALID_INPUT);
    REQUIRE(err.parameter == "H");
    REQUIRE(err.value == -2.0);
    REQUIRE(err.constraint == "> 0");
    REQUIRE(err.code_string() == "INVALID_INPUT");

    std::string text = err.to_string();
    REQUIRE(text.find("[INVALID_INPUT]") != std::string::npos);
    REQUIRE(text.find("time_factor") != std::string::npos);
    REQUIRE(text.find("H = -2") != std::string::npos);
}

TEST_CASE("Exceptions carry the structured error", "[Errors]") {
    try {
        rankine_active_coefficient(95.0);
        FAIL("Expected InvalidInput");
    } catch (const InvalidInput& e) {
        REQUIRE(e.error().code == ErrorCode::INVALID_INPUT);
        REQUIRE(e.error().parameter == "phi");
        REQUIRE(e.error().value == 95.0);
        REQUIRE(std::string(e.what()).find("rankine_active_coefficient") != std::string::npos);
    }

    try {
        coulomb_passive_coefficient(40.0, 40.0, 0.0, 40.0);
        FAIL("Expected DomainError");
    } catch (const DomainError& e) {
        REQUIRE(e.error().code == ErrorCode::DOMAIN_ERROR);
    }
}

TEST_CASE("NaN input is reported as non-finite", "[Errors]") {
    try {
        hydraulic_gradient(std::numeric_limits<double>::quiet_NaN(), 10.0);
        FAIL("Expected InvalidInput");
    } catch (const InvalidInput& e) {
        REQUIRE(e.error().code == ErrorCode::NON_FINITE_INPUT);
        REQUIRE(e.error().parameter == "delta_h");
    }
}

TEST_CASE("Error kinds map onto standard exception hierarchies", "[Errors]") {
    // Callers that only know the standard library can still tell them apart
    REQUIRE_THROWS_AS(hydraulic_gradient(1.0, 0.0), std::invalid_argument);
    REQUIRE_THROWS_AS(coulomb_passive_coefficient(40.0, 40.0, 0.0, 40.0), std::domain_error);
    REQUIRE_THROWS_AS(hydraulic_gradient(1.0, 0.0), std::logic_error);
}

// =============================================================================
// Warnings
// =============================================================================

TEST_CASE("Warning list counts by severity", "[Warnings]") {
    WarningList list;
    REQUIRE_FALSE(list.has_warnings());
    REQUIRE(list.summary() == "No warnings");

    list.add(GeotechWarning::low_safety_factor(1.5, 2.0));
    list.add(GeotechWarning::near_piping(0.85, 0.917));

    REQUIRE(list.count() == 2);
    REQUIRE(list.count_by_severity(WarningSeverity::High) == 1);
    REQUIRE(list.count_by_severity(WarningSeverity::Medium) == 1);
    REQUIRE(list.get_by_min_severity(WarningSeverity::High).size() == 1);
    REQUIRE(list.contains(WarningCode::NEAR_PIPING));
    REQUIRE_FALSE(list.contains(WarningCode::ATYPICAL_DEPTH));
    REQUIRE(list.summary() == "2 warning(s): 1 high, 1 medium, 0 low");

    WarningList other;
    other.add(GeotechWarning::low_safety_factor(1.2, 2.0));
    list.merge(other);
    REQUIRE(list.count() == 3);

    list.clear();
    REQUIRE(list.count() == 0);
}

TEST_CASE("Warning text includes code and details", "[Warnings]") {
    GeotechWarning warn = GeotechWarning::low_safety_factor(1.5, 2.0);
    std::string text = warn.to_string();
    REQUIRE(text.find("[HIGH] [LOW_SAFETY_FACTOR]") != std::string::npos);
    REQUIRE(text.find("safety_factor") != std::string::npos);
}

// =============================================================================
// Soil properties
// =============================================================================

TEST_CASE("Typical sand raises no range warnings", "[SoilProperties]") {
    SoilProperties sand(1, "Medium dense sand", 32.0, 0.0, 18.0, 0.65, 2.65, 1e-4);
    REQUIRE_NOTHROW(sand.validate());
    REQUIRE_FALSE(sand.check_typical_ranges().has_warnings());
    REQUIRE_THAT(sand.porosity(), WithinAbs(0.65 / 1.65, 1e-12));
    REQUIRE_THAT(sand.critical_gradient(), WithinAbs(1.65 / 1.65, 1e-12));
}

TEST_CASE("Atypical values raise graded warnings", "[SoilProperties]") {
    // phi just above 50 deg, gamma well above 25 kN/m³
    SoilProperties soil(2, "Suspicious", 52.0, 0.0, 30.0);
    WarningList list = soil.check_typical_ranges();
    REQUIRE(list.count() == 2);
    REQUIRE(list.contains(WarningCode::ATYPICAL_FRICTION_ANGLE));
    REQUIRE(list.contains(WarningCode::ATYPICAL_UNIT_WEIGHT));
    REQUIRE(list.count_by_severity(WarningSeverity::Low) == 1);
    REQUIRE(list.count_by_severity(WarningSeverity::Medium) == 1);
    REQUIRE(list.summary() == "2 warning(s): 0 high, 1 medium, 1 low");

    // Unit weight given in N/m³ instead of kN/m³
    soil.phi = 30.0;
    soil.gamma = 18000.0;
    list = soil.check_typical_ranges();
    REQUIRE(list.count() == 1);
    REQUIRE(list.count_by_severity(WarningSeverity::High) == 1);
}

TEST_CASE("Atypical value severity follows distance from the range", "[Warnings][severity]") {
    auto severity_of = [](double value) {
        return GeotechWarning::atypical_value(WarningCode::ATYPICAL_UNIT_WEIGHT,
                                              "unit weight [kN/m³]", value, 10.0, 25.0).severity;
    };

    // Within 10% of a bound
    REQUIRE(severity_of(26.0) == WarningSeverity::Low);
    REQUIRE(severity_of(9.5) == WarningSeverity::Low);

    REQUIRE(severity_of(30.0) == WarningSeverity::Medium);
    REQUIRE(severity_of(5.0) == WarningSeverity::Medium);
    REQUIRE(severity_of(250.0) == WarningSeverity::Medium);

    // An order of magnitude out
    REQUIRE(severity_of(251.0) == WarningSeverity::High);
    REQUIRE(severity_of(0.5) == WarningSeverity::High);
}

TEST_CASE("Soil properties validate hard limits", "[SoilProperties][errors]") {
    REQUIRE_THROWS_AS(SoilProperties(3, "Bad phi", 95.0, 0.0, 18.0).validate(), InvalidInput);
    REQUIRE_THROWS_AS(SoilProperties(4, "Bad c", 30.0, -5.0, 18.0).validate(), InvalidInput);
    REQUIRE_THROWS_AS(SoilProperties(5, "Bad Gs", 30.0, 0.0, 18.0, 0.7, 0.9).validate(), InvalidInput);
    REQUIRE_THROWS_AS(SoilProperties(6, "Bad k", 30.0, 0.0, 18.0, 0.7, 2.65, 0.0).validate(),
                      InvalidInput);
}

// =============================================================================
// Result checks
// =============================================================================

TEST_CASE("Geometry outside typical ranges", "[Diagnostics][geometry]") {
    REQUIRE_FALSE(check_geometry(5.0, 2.0).has_warnings());

    WarningList list = check_geometry(60.0, 0.05);
    REQUIRE(list.count() == 2);
    REQUIRE(list.contains(WarningCode::ATYPICAL_DEPTH));
    REQUIRE(list.contains(WarningCode::ATYPICAL_WIDTH));
}

TEST_CASE("Low safety factor warning", "[Diagnostics][safety_factor]") {
    REQUIRE(check_safety_factor(1.5).contains(WarningCode::LOW_SAFETY_FACTOR));
    REQUIRE_FALSE(check_safety_factor(3.0).has_warnings());
    REQUIRE_FALSE(check_safety_factor(2.0).has_warnings());
    REQUIRE(check_safety_factor(2.5, 3.0).has_warnings());
    REQUIRE_THROWS_AS(check_safety_factor(0.0), InvalidInput);
}

TEST_CASE("Piping margin warning", "[Diagnostics][piping]") {
    double icr = critical_hydraulic_gradient(2.65, 0.8);

    REQUIRE(check_piping_margin(0.85, icr).contains(WarningCode::NEAR_PIPING));
    REQUIRE_FALSE(check_piping_margin(0.5, icr).has_warnings());

    // Piping itself is reported by is_piping, not as a warning
    REQUIRE_FALSE(check_piping_margin(1.0, icr).has_warnings());
    REQUIRE(is_piping(1.0, icr));

    REQUIRE_THROWS_AS(check_piping_margin(0.85, icr, 1.5), InvalidInput);
}
