#pragma once

#include "geotech/warnings.hpp"
#include <string>

namespace geotech {

/**
 * @brief Properties of one soil stratum
 *
 * Stores soil properties in consistent units:
 * - phi: Internal friction angle [deg]
 * - c: Cohesion [kPa]
 * - gamma: Unit weight [kN/m³]
 * - e: Void ratio (dimensionless)
 * - Gs: Specific gravity of solids (dimensionless)
 * - k: Coefficient of permeability [m/s]
 *
 * The record is a convenience for callers that keep several quantities of
 * one stratum together; the formula functions take plain scalars.
 *
 * Typical sand: phi = 32, c = 0, gamma = 18, e = 0.65, Gs = 2.65, k = 1e-4
 */
class SoilProperties {
public:
    int id;             ///< Unique stratum identifier
    std::string name;   ///< Stratum name
    double phi;         ///< Internal friction angle [deg]
    double c;           ///< Cohesion [kPa]
    double gamma;       ///< Unit weight [kN/m³]
    double e;           ///< Void ratio
    double Gs;          ///< Specific gravity of solids
    double k;           ///< Coefficient of permeability [m/s]

    /**
     * @brief Construct a new SoilProperties record
     *
     * @param id Unique stratum identifier
     * @param name Stratum name
     * @param phi Internal friction angle [deg]
     * @param c Cohesion [kPa]
     * @param gamma Unit weight [kN/m³]
     * @param e Void ratio (default: 0.7)
     * @param Gs Specific gravity of solids (default: 2.65)
     * @param k Coefficient of permeability [m/s] (default: 1e-6)
     */
    SoilProperties(int id, std::string name, double phi, double c, double gamma,
                   double e = 0.7, double Gs = 2.65, double k = 1e-6);

    /**
     * @brief Check hard physical limits
     *
     * 0 <= phi < 90, c >= 0, gamma > 0, e > 0, Gs > 1, k > 0.
     *
     * @throws InvalidInput for the first violated limit
     */
    void validate() const;

    /**
     * @brief Compare against the typical ranges the formulas are calibrated for
     *
     * phi 0-50 deg, c 0-500 kPa, gamma 10-25 kN/m³, e 0.1-2.0,
     * Gs 2.5-2.9, k 1e-10 to 1e-2 m/s.
     *
     * @return WarningList One warning per atypical value
     */
    WarningList check_typical_ranges() const;

    /**
     * @brief Porosity n = e / (1 + e)
     */
    double porosity() const;

    /**
     * @brief Critical hydraulic gradient (Gs - 1) / (1 + e)
     */
    double critical_gradient() const;
};

} // namespace geotech
