/**
 * @file test_numeric_utils.cpp
 * @brief C++ tests for angle conversion, comparison and guarded transcendentals
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "geotech/numeric_utils.hpp"
#include "geotech/errors.hpp"

#include <cmath>
#include <limits>

using namespace geotech;
using Catch::Matchers::WithinAbs;

// =============================================================================
// Angle conversion
// =============================================================================

TEST_CASE("Degrees convert to radians and back", "[NumericUtils][angles]") {
    REQUIRE_THAT(deg_to_rad(180.0), WithinAbs(PI, 1e-15));
    REQUIRE_THAT(deg_to_rad(45.0), WithinAbs(PI / 4.0, 1e-15));
    REQUIRE_THAT(deg_to_rad(0.0), WithinAbs(0.0, 1e-15));
    REQUIRE_THAT(rad_to_deg(PI / 2.0), WithinAbs(90.0, 1e-12));
    REQUIRE_THAT(rad_to_deg(deg_to_rad(33.7)), WithinAbs(33.7, 1e-12));
}

// =============================================================================
// Approximate equality
// =============================================================================

TEST_CASE("approx_equal is inclusive at the tolerance", "[NumericUtils][approx_equal]") {
    // 0.5 is exactly representable, so |1.5 - 1.0| == 0.5 exactly
    REQUIRE(approx_equal(1.0, 1.5, 0.5));
    REQUIRE_FALSE(approx_equal(1.0, 1.5, 0.25));
    REQUIRE(approx_equal(2.0, 2.0, 0.0));
    REQUIRE(approx_equal(0.1 + 0.2, 0.3));
}

TEST_CASE("approx_equal rejects a negative tolerance", "[NumericUtils][approx_equal]") {
    REQUIRE_THROWS_AS(approx_equal(1.0, 1.0, -1e-9), InvalidInput);
    REQUIRE_THROWS_AS(approx_equal(1.0, 1.0, std::numeric_limits<double>::quiet_NaN()),
                      InvalidInput);
}

// =============================================================================
// Guarded transcendentals
// =============================================================================

TEST_CASE("safe_tan matches std::tan away from the singularity", "[NumericUtils][tan]") {
    REQUIRE_THAT(safe_tan(PI / 4.0), WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(safe_tan_deg(60.0), WithinAbs(std::sqrt(3.0), 1e-12));
    REQUIRE_THAT(safe_tan_deg(-30.0), WithinAbs(-1.0 / std::sqrt(3.0), 1e-12));
}

TEST_CASE("safe_tan raises DomainError at 90 degrees", "[NumericUtils][tan]") {
    REQUIRE_THROWS_AS(safe_tan(PI / 2.0), DomainError);
    REQUIRE_THROWS_AS(safe_tan(-PI / 2.0), DomainError);
    REQUIRE_THROWS_AS(safe_tan_deg(90.0), DomainError);
    REQUIRE_THROWS_AS(safe_tan_deg(-90.0), DomainError);
    REQUIRE_THROWS_AS(safe_tan_deg(135.0), DomainError);
}

TEST_CASE("safe_sqrt, safe_exp and safe_log check their domains", "[NumericUtils][domain]") {
    REQUIRE_THAT(safe_sqrt(2.25), WithinAbs(1.5, 1e-15));
    REQUIRE_THAT(safe_sqrt(0.0), WithinAbs(0.0, 1e-15));
    REQUIRE_THROWS_AS(safe_sqrt(-1e-6), DomainError);

    REQUIRE_THAT(safe_exp(1.0), WithinAbs(std::exp(1.0), 1e-15));
    REQUIRE_THROWS_AS(safe_exp(1000.0), DomainError);

    REQUIRE_THAT(safe_log(std::exp(2.0)), WithinAbs(2.0, 1e-14));
    REQUIRE_THROWS_AS(safe_log(0.0), DomainError);
    REQUIRE_THROWS_AS(safe_log(-3.0), DomainError);
}

TEST_CASE("safe_divide reports a zero denominator", "[NumericUtils][divide]") {
    REQUIRE_THAT(safe_divide(3.0, 4.0), WithinAbs(0.75, 1e-15));

    try {
        safe_divide(1.0, 0.0, "unit test");
        FAIL("Expected DomainError");
    } catch (const DomainError& e) {
        REQUIRE(e.error().code == ErrorCode::DIVISION_BY_ZERO);
    }
}

TEST_CASE("require_finite rejects NaN and infinity", "[NumericUtils][finite]") {
    REQUIRE_NOTHROW(require_finite("test", "x", 1.0));
    REQUIRE_THROWS_AS(require_finite("test", "x", std::numeric_limits<double>::quiet_NaN()),
                      InvalidInput);
    REQUIRE_THROWS_AS(require_finite("test", "x", std::numeric_limits<double>::infinity()),
                      InvalidInput);
}
