#pragma once

#include <Eigen/Dense>

namespace geotech {

/**
 * @brief Resultant of a lateral pressure distribution on a wall
 *
 * - force: Resultant force per metre run of wall [kN/m]
 * - height: Height of the line of action above the wall base [m]
 */
struct LateralThrust {
    double force = 0.0;     ///< Resultant force [kN/m]
    double height = 0.0;    ///< Line of action above the base [m]
};

// =============================================================================
// Rankine theory
// =============================================================================

/**
 * @brief Rankine active earth pressure coefficient
 *
 * Formula: Ka = tan²(45° - φ/2)
 *
 * Valid for a smooth vertical wall retaining a horizontal backfill.
 *
 * @param phi Internal friction angle [deg], 0 <= phi < 90
 * @return double Ka (dimensionless, in (0, 1])
 * @throws InvalidInput if phi is outside [0, 90)
 */
double rankine_active_coefficient(double phi);

/**
 * @brief Rankine passive earth pressure coefficient
 *
 * Formula: Kp = tan²(45° + φ/2)
 *
 * @param phi Internal friction angle [deg], 0 <= phi < 90
 * @return double Kp (dimensionless, >= 1)
 * @throws InvalidInput if phi is outside [0, 90)
 * @throws DomainError if 45° + φ/2 reaches the tangent singularity
 */
double rankine_passive_coefficient(double phi);

/**
 * @brief Active lateral pressure at depth z
 *
 * Formula: σa = Ka·γ·z
 *
 * @param Ka Active coefficient (> 0)
 * @param gamma Unit weight [kN/m³] (> 0)
 * @param z Depth below the top of the backfill [m] (>= 0)
 * @return double Pressure [kPa]
 */
double rankine_active_pressure(double Ka, double gamma, double z);

/**
 * @brief Passive lateral pressure at depth z
 *
 * Formula: σp = Kp·γ·z
 */
double rankine_passive_pressure(double Kp, double gamma, double z);

/**
 * @brief Active resultant force on a wall of height H
 *
 * Formula: Pa = ½·Ka·γ·H² (triangular distribution)
 *
 * @param Ka Active coefficient (> 0)
 * @param gamma Unit weight [kN/m³] (> 0)
 * @param H Wall height [m] (>= 0)
 * @return double Force per metre run [kN/m]
 */
double rankine_active_force(double Ka, double gamma, double H);

/**
 * @brief Passive resultant force on a wall of height H
 *
 * Formula: Pp = ½·Kp·γ·H²
 */
double rankine_passive_force(double Kp, double gamma, double H);

/**
 * @brief Active thrust with its line of action
 *
 * The triangular distribution acts at H/3 above the base.
 */
LateralThrust rankine_active_thrust(double Ka, double gamma, double H);

/**
 * @brief Active pressure in a cohesive backfill
 *
 * Formula: σa = Ka·γ·z - 2c·√Ka, with zero pressure in the tension zone
 * above the tension crack depth.
 *
 * @param Ka Active coefficient (> 0)
 * @param gamma Unit weight [kN/m³] (> 0)
 * @param z Depth [m] (>= 0)
 * @param c Cohesion [kPa] (>= 0)
 * @return double Pressure [kPa] (>= 0)
 */
double rankine_active_pressure_cohesive(double Ka, double gamma, double z, double c);

/**
 * @brief Passive pressure in a cohesive backfill
 *
 * Formula: σp = Kp·γ·z + 2c·√Kp
 */
double rankine_passive_pressure_cohesive(double Kp, double gamma, double z, double c);

/**
 * @brief Depth of the tension crack in a cohesive backfill
 *
 * Formula: z0 = 2c / (γ·√Ka)
 *
 * @return double Depth [m]
 */
double tension_crack_depth(double Ka, double gamma, double c);

/**
 * @brief Lateral pressure from a uniform surcharge q on the backfill
 *
 * Formula: σq = K·q (constant with depth)
 *
 * @param K Earth pressure coefficient (> 0)
 * @param q Surcharge [kPa] (>= 0)
 * @return double Pressure [kPa]
 */
double surcharge_active_pressure(double K, double q);

/**
 * @brief Active pressure sampled at a set of depths
 *
 * @param Ka Active coefficient (> 0)
 * @param gamma Unit weight [kN/m³] (> 0)
 * @param depths Depths [m], each >= 0
 * @return Eigen::VectorXd Pressures [kPa], same size as depths
 */
Eigen::VectorXd active_pressure_profile(double Ka, double gamma,
                                        const Eigen::VectorXd& depths);

// =============================================================================
// Coulomb theory
// =============================================================================

/**
 * @brief Coulomb active earth pressure coefficient
 *
 * Formula:
 *   Ka = cos²(φ - θ) /
 *        { cos²θ · cos(δ + θ) · [1 + √( sin(φ + δ)·sin(φ - β) /
 *                                       (cos(δ + θ)·cos(θ - β)) )]² }
 *
 * Reduces to the Rankine value for δ = θ = β = 0.
 *
 * @param phi Internal friction angle [deg], 0 <= phi < 90
 * @param delta Wall friction angle [deg], 0 <= delta <= phi
 * @param theta Inclination of the wall back from vertical [deg], |theta| < 90
 * @param beta Backfill slope [deg], |beta| <= phi
 * @throws InvalidInput if an angle is outside its bound
 * @throws DomainError if the angle combination leaves the formula's domain
 */
double coulomb_active_coefficient(double phi, double delta,
                                  double theta = 0.0, double beta = 0.0);

/**
 * @brief Coulomb passive earth pressure coefficient
 *
 * Formula:
 *   Kp = cos²(φ + θ) /
 *        { cos²θ · cos(δ - θ) · [1 - √( sin(φ + δ)·sin(φ + β) /
 *                                       (cos(δ - θ)·cos(θ - β)) )]² }
 *
 * The root term must stay below 1; large wall friction on steep backfills
 * drives it to 1 and the coefficient to infinity.
 *
 * @throws InvalidInput if an angle is outside its bound
 * @throws DomainError if the root term reaches 1
 */
double coulomb_passive_coefficient(double phi, double delta,
                                   double theta = 0.0, double beta = 0.0);

// =============================================================================
// At-rest pressure
// =============================================================================

/**
 * @brief At-rest coefficient for normally consolidated soil (Jaky)
 *
 * Formula: K0 = 1 - sin φ
 *
 * @param phi Internal friction angle [deg], 0 <= phi < 90
 */
double at_rest_coefficient(double phi);

/**
 * @brief At-rest coefficient for overconsolidated soil (Mayne & Kulhawy)
 *
 * Formula: K0 = (1 - sin φ)·OCR^(sin φ)
 *
 * @param phi Internal friction angle [deg], 0 <= phi < 90
 * @param ocr Overconsolidation ratio (>= 1)
 */
double at_rest_coefficient_overconsolidated(double phi, double ocr);

/**
 * @brief At-rest lateral pressure at depth z
 *
 * Formula: σ0 = K0·γ·z
 */
double at_rest_pressure(double K0, double gamma, double z);

} // namespace geotech
