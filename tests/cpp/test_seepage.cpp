/**
 * @file test_seepage.cpp
 * @brief C++ tests for Darcy flow, hydraulic gradients and piping checks
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "geotech/seepage.hpp"
#include "geotech/errors.hpp"

#include <cmath>
#include <limits>

using namespace geotech;
using Catch::Matchers::WithinAbs;

// =============================================================================
// Darcy flow
// =============================================================================

TEST_CASE("Darcy velocity and flow rate", "[Seepage][Darcy]") {
    REQUIRE_THAT(darcy_velocity(1.0e-4, 0.2), WithinAbs(2.0e-5, 1e-18));
    REQUIRE_THAT(darcy_flow_rate(1.0e-4, 0.2, 10.0), WithinAbs(0.0002, 1e-5));
    REQUIRE_THAT(darcy_flow_rate(1.0e-4, 0.2, 10.0), WithinAbs(2.0e-4, 1e-15));

    // Flow reverses with the gradient
    REQUIRE_THAT(darcy_velocity(1.0e-4, -0.2), WithinAbs(-2.0e-5, 1e-18));
}

TEST_CASE("Darcy flow rejects invalid arguments", "[Seepage][Darcy][errors]") {
    REQUIRE_THROWS_AS(darcy_velocity(0.0, 0.2), InvalidInput);
    REQUIRE_THROWS_AS(darcy_velocity(-1e-4, 0.2), InvalidInput);
    REQUIRE_THROWS_AS(darcy_velocity(1e-4, std::numeric_limits<double>::infinity()), InvalidInput);
    REQUIRE_THROWS_AS(darcy_flow_rate(1.0e-4, 0.2, 0.0), InvalidInput);
}

TEST_CASE("Hydraulic gradient over a flow path", "[Seepage][gradient]") {
    REQUIRE_THAT(hydraulic_gradient(2.0, 10.0), WithinAbs(0.2, 1e-15));
    REQUIRE_THROWS_AS(hydraulic_gradient(2.0, 0.0), InvalidInput);
    REQUIRE_THROWS_AS(hydraulic_gradient(2.0, -10.0), InvalidInput);
}

// =============================================================================
// Piping
// =============================================================================

TEST_CASE("Critical hydraulic gradient reference value", "[Seepage][piping]") {
    REQUIRE_THAT(critical_hydraulic_gradient(2.65, 0.8), WithinAbs(0.917, 0.01));
    REQUIRE_THAT(critical_hydraulic_gradient(2.65, 0.8), WithinAbs(1.65 / 1.8, 1e-15));
}

TEST_CASE("Critical gradient rejects invalid arguments", "[Seepage][piping][errors]") {
    REQUIRE_THROWS_AS(critical_hydraulic_gradient(1.0, 0.8), InvalidInput);
    REQUIRE_THROWS_AS(critical_hydraulic_gradient(0.9, 0.8), InvalidInput);
    REQUIRE_THROWS_AS(critical_hydraulic_gradient(2.65, -1.0), InvalidInput);
}

TEST_CASE("Piping check for reference gradients", "[Seepage][piping]") {
    REQUIRE(is_piping(1.0, 0.917));
    REQUIRE_FALSE(is_piping(0.5, 0.917));
}

TEST_CASE("Piping is an exact threshold", "[Seepage][piping]") {
    double icr = critical_hydraulic_gradient(2.65, 0.8);
    REQUIRE(is_piping(icr, icr));

    // Smallest representable step below the threshold
    double just_below = std::nextafter(icr, 0.0);
    REQUIRE_FALSE(is_piping(just_below, icr));

    for (double eps : {1e-12, 1e-6, 0.01, 0.5}) {
        INFO("eps = " << eps);
        REQUIRE_FALSE(is_piping(icr - eps, icr));
    }
}

TEST_CASE("Piping check rejects a non-positive critical gradient", "[Seepage][piping][errors]") {
    REQUIRE_THROWS_AS(is_piping(0.5, 0.0), InvalidInput);
    REQUIRE_THROWS_AS(is_piping(std::nan(""), 0.9), InvalidInput);
}

TEST_CASE("Safety factor against piping", "[Seepage][piping]") {
    REQUIRE_THAT(piping_safety_factor(0.3, 0.9), WithinAbs(3.0, 1e-12));
    REQUIRE_THROWS_AS(piping_safety_factor(0.0, 0.9), InvalidInput);
}

// =============================================================================
// Derived quantities
// =============================================================================

TEST_CASE("Seepage velocity exceeds the Darcy velocity", "[Seepage][velocity]") {
    double v = darcy_velocity(1.0e-4, 0.2);
    REQUIRE_THAT(seepage_velocity(v, 0.4), WithinAbs(5.0e-5, 1e-18));
    REQUIRE_THROWS_AS(seepage_velocity(v, 0.0), InvalidInput);
    REQUIRE_THROWS_AS(seepage_velocity(v, 1.2), InvalidInput);
}

TEST_CASE("Flow net seepage rate per metre run", "[Seepage][flow_net]") {
    // k = 1e-5 m/s, 6 m head, 4 flow channels, 12 drops
    REQUIRE_THAT(flow_net_rate(1.0e-5, 6.0, 4.0, 12.0), WithinAbs(2.0e-5, 1e-18));
    REQUIRE_THROWS_AS(flow_net_rate(1.0e-5, 6.0, 4.0, 0.0), InvalidInput);
}

TEST_CASE("Seepage force on a soil volume", "[Seepage][force]") {
    REQUIRE_THAT(seepage_force(0.5, GAMMA_WATER, 2.0), WithinAbs(9.81, 1e-12));
    REQUIRE_THROWS_AS(seepage_force(0.5, 0.0, 2.0), InvalidInput);
}
