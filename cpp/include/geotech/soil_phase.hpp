#pragma once

namespace geotech {

// Phase relationships. Water content and degree of saturation are
// percentages [%] throughout this family; porosity is a fraction.

/**
 * @brief Void ratio from porosity, e = n / (1 - n)
 * @param n Porosity, 0 <= n < 1
 */
double void_ratio(double n);

/**
 * @brief Porosity from void ratio, n = e / (1 + e)
 * @param e Void ratio (>= 0)
 */
double porosity(double e);

/**
 * @brief Degree of saturation, S = Vw / Vv · 100
 *
 * @param Vw Volume of water [m³], 0 <= Vw <= Vv
 * @param Vv Volume of voids [m³] (> 0)
 * @return double S [%]
 */
double degree_of_saturation(double Vw, double Vv);

/**
 * @brief Dry density, ρd = ρ / (1 + w/100)
 *
 * @param rho Bulk density [any density unit] (> 0)
 * @param w Water content [%] (>= 0)
 * @return double ρd in the unit of rho
 */
double dry_density(double rho, double w);

/**
 * @brief Saturated unit weight, γsat = (Gs + e)·γw / (1 + e)
 */
double saturated_unit_weight(double Gs, double e, double gamma_w);

/**
 * @brief Submerged (buoyant) unit weight, γ' = γsat - γw
 */
double submerged_unit_weight(double gamma_sat, double gamma_w);

/**
 * @brief Void ratio from water content, e = w·Gs / S
 *
 * @param w Water content [%] (>= 0)
 * @param Gs Specific gravity of solids (> 0)
 * @param S Degree of saturation [%], 0 < S <= 100
 */
double void_ratio_from_water_content(double w, double Gs, double S);

} // namespace geotech
