#pragma once

#include <Eigen/Dense>

namespace geotech {

/**
 * @brief Settings for the degree-of-consolidation approximation
 *
 * consolidation_degree() uses the two classical closed forms of
 * Terzaghi's series solution:
 * - Tv <= crossover_tv:  U = 2·√(Tv/π)
 * - Tv >  crossover_tv:  U = 1 - (8/π²)·exp(-π²·Tv/4)
 *
 * The two curves intersect at Tv ≈ 0.21303 (U ≈ 0.5208). For any crossover
 * at or below MAX_CROSSOVER_TV the second branch starts at or above the
 * first, so U stays non-decreasing. Below MIN_CROSSOVER_TV the one-term
 * exponential branch overstates U (it is 0.19 at Tv = 0), so the step at
 * the crossover grows large. Crossovers outside
 * [MIN_CROSSOVER_TV, MAX_CROSSOVER_TV] are rejected; inside, the step is
 * below 6e-4.
 */
struct ConsolidationSettings {
    /// Smallest crossover where both branches agree to within 6e-4
    static constexpr double MIN_CROSSOVER_TV = 0.2;

    /// Largest crossover that keeps U(Tv) non-decreasing
    static constexpr double MAX_CROSSOVER_TV = 0.2130;

    /// Time factor where the square-root branch hands over to the exponential branch
    double crossover_tv = MAX_CROSSOVER_TV;
};

// =============================================================================
// Layer settlement
// =============================================================================
//
// Unit convention for this family: coefficients of compressibility av and
// volume compressibility mv in MPa⁻¹, compression modulus Es in MPa,
// stresses in kPa. The factor 1/1000 converting kPa to MPa is part of each
// formula below.

/**
 * @brief Settlement of one layer from the coefficient of compressibility
 *
 * Formula: s = av·(σz/1000)·Hi / (1 + e0)
 *
 * @param av Coefficient of compressibility [MPa⁻¹] (>= 0)
 * @param e0 Initial void ratio (> -1, physically >= 0)
 * @param sigma_z Additional vertical stress at mid-layer [kPa] (>= 0)
 * @param Hi Layer thickness [m] (>= 0)
 * @return double Settlement [m]
 */
double settlement_layer(double av, double e0, double sigma_z, double Hi);

/**
 * @brief Settlement of one layer from the compression modulus
 *
 * Formula: s = (σz/1000)/Es·Hi
 *
 * @param Es Compression modulus [MPa] (> 0)
 * @param sigma_z Additional vertical stress [kPa] (>= 0)
 * @param Hi Layer thickness [m] (>= 0)
 * @return double Settlement [m]
 */
double settlement_layer_es(double Es, double sigma_z, double Hi);

/**
 * @brief Primary consolidation settlement of a normally consolidated clay
 *
 * Formula: s = Cc·H/(1 + e0)·log10((σ0 + Δσ)/σ0)
 *
 * @param Cc Compression index (>= 0)
 * @param e0 Initial void ratio (> -1)
 * @param sigma0 Initial effective stress at mid-layer [kPa] (> 0)
 * @param delta_sigma Stress increase [kPa] (>= 0)
 * @param H Layer thickness [m] (>= 0)
 * @return double Settlement [m]
 */
double settlement_compression_index(double Cc, double e0, double sigma0,
                                    double delta_sigma, double H);

/**
 * @brief Immediate (elastic) settlement of a footing
 *
 * Formula: s = q·B·(1 - ν²)·Iw / E
 *
 * @param q Net contact pressure [kPa] (>= 0)
 * @param B Footing width [m] (> 0)
 * @param nu Poisson's ratio, 0 <= nu < 0.5
 * @param E Young's modulus of the soil [kPa] (> 0)
 * @param Iw Influence factor for shape and rigidity (> 0)
 * @return double Settlement [m]
 */
double elastic_settlement(double q, double B, double nu, double E, double Iw);

/**
 * @brief Total settlement of a layered profile (layer-wise summation)
 *
 * Sums settlement_layer() over corresponding entries. All vectors must
 * have the same size.
 *
 * @return double Total settlement [m]
 * @throws InvalidInput on size mismatch or an invalid layer value
 */
double total_settlement(const Eigen::VectorXd& av, const Eigen::VectorXd& e0,
                        const Eigen::VectorXd& sigma_z, const Eigen::VectorXd& Hi);

// =============================================================================
// One-dimensional consolidation
// =============================================================================

/**
 * @brief Time factor
 *
 * Formula: Tv = Cv·t / H²
 *
 * H is the drainage path length: the full thickness for single drainage,
 * half of it for double drainage.
 *
 * @param Cv Coefficient of consolidation [m²/s] (> 0)
 * @param t Elapsed time [s] (>= 0)
 * @param H Drainage path length [m] (> 0)
 */
double time_factor(double Cv, double t, double H);

/**
 * @brief Average degree of consolidation
 *
 * Piecewise approximation, see ConsolidationSettings. U(0) = 0, U in [0, 1],
 * non-decreasing, U -> 1 as Tv -> infinity.
 *
 * @param Tv Time factor (>= 0)
 * @param settings Crossover configuration
 * @return double U as a fraction in [0, 1]
 * @throws InvalidInput if Tv < 0 or the crossover is outside [MIN_CROSSOVER_TV, MAX_CROSSOVER_TV]
 */
double consolidation_degree(double Tv,
                            const ConsolidationSettings& settings = ConsolidationSettings());

/**
 * @brief Time factor needed to reach a degree of consolidation
 *
 * Exact inverse of consolidation_degree() for the same settings.
 *
 * @param U Degree of consolidation, 0 <= U < 1
 */
double time_factor_for_degree(double U,
                              const ConsolidationSettings& settings = ConsolidationSettings());

/**
 * @brief Excess pore pressure ratio u/u0 from Terzaghi's series
 *
 * Formula: u/u0 = Σ (2/M)·sin(M·Z)·exp(-M²·Tv), M = π(2m + 1)/2
 *
 * @param Z Normalised depth z/H, 0 <= Z <= 2 (H = drainage path length)
 * @param Tv Time factor (>= 0)
 * @param terms Number of series terms (>= 1)
 * @return double u/u0, clamped to [0, 1]
 */
double excess_pore_pressure_ratio(double Z, double Tv, int terms = 100);

/**
 * @brief Isochrone u/u0 over a set of normalised depths
 */
Eigen::VectorXd excess_pore_pressure_isochrone(const Eigen::VectorXd& Z, double Tv,
                                               int terms = 100);

/**
 * @brief Final consolidation settlement
 *
 * Formula: s = mv·(σz/1000)·H
 *
 * @param mv Coefficient of volume compressibility [MPa⁻¹] (> 0)
 * @param sigma_z Stress increase [kPa] (>= 0)
 * @param H Layer thickness [m] (>= 0)
 * @return double Settlement [m]
 */
double consolidation_settlement_final(double mv, double sigma_z, double H);

/**
 * @brief Consolidation settlement reached at time factor Tv
 *
 * Formula: s(t) = U(Tv)·s_final
 */
double consolidation_settlement_at_time(double s_final, double Tv,
                                        const ConsolidationSettings& settings = ConsolidationSettings());

} // namespace geotech
