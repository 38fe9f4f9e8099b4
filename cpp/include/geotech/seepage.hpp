#pragma once

namespace geotech {

/// Unit weight of water [kN/m³]
constexpr double GAMMA_WATER = 9.81;

/**
 * @brief Darcy (discharge) velocity
 *
 * Formula: v = k·i
 *
 * @param k Coefficient of permeability [m/s] (> 0)
 * @param i Hydraulic gradient (dimensionless, sign gives flow direction)
 * @return double Velocity [m/s]
 */
double darcy_velocity(double k, double i);

/**
 * @brief Darcy flow rate through a cross-section
 *
 * Formula: Q = k·i·A
 *
 * @param k Coefficient of permeability [m/s] (> 0)
 * @param i Hydraulic gradient
 * @param A Gross cross-sectional area [m²] (> 0)
 * @return double Flow rate [m³/s]
 */
double darcy_flow_rate(double k, double i, double A);

/**
 * @brief Hydraulic gradient over a flow path
 *
 * Formula: i = Δh / L
 *
 * @param delta_h Head loss [m]
 * @param L Flow path length [m] (> 0)
 * @throws InvalidInput if L <= 0
 */
double hydraulic_gradient(double delta_h, double L);

/**
 * @brief Critical (floatation) hydraulic gradient
 *
 * Formula: icr = (Gs - 1) / (1 + e)
 *
 * @param Gs Specific gravity of solids (> 1)
 * @param e Void ratio (> -1)
 */
double critical_hydraulic_gradient(double Gs, double e);

/**
 * @brief Piping (heave) check for upward seepage
 *
 * Exact threshold comparison: true iff i >= icr. No tolerance is applied;
 * the gradient exactly at the critical value counts as piping.
 *
 * @param i Exit gradient
 * @param icr Critical gradient (> 0)
 */
bool is_piping(double i, double icr);

/**
 * @brief Factor of safety against piping
 *
 * Formula: Fs = icr / i
 *
 * @param i Exit gradient (> 0)
 * @param icr Critical gradient (> 0)
 */
double piping_safety_factor(double i, double icr);

/**
 * @brief Seepage (pore) velocity from the Darcy velocity
 *
 * Formula: vs = v / n
 *
 * @param v Darcy velocity [m/s]
 * @param n Porosity, 0 < n <= 1
 */
double seepage_velocity(double v, double n);

/**
 * @brief Seepage rate per metre run from a flow net
 *
 * Formula: q = k·Δh·Nf / Nd
 *
 * @param k Coefficient of permeability [m/s] (> 0)
 * @param delta_h Total head loss across the net [m] (>= 0)
 * @param Nf Number of flow channels (> 0)
 * @param Nd Number of equipotential drops (> 0)
 * @return double Flow rate [m³/s per m]
 */
double flow_net_rate(double k, double delta_h, double Nf, double Nd);

/**
 * @brief Seepage force on a soil volume
 *
 * Formula: J = i·γw·V
 *
 * @param i Hydraulic gradient (>= 0)
 * @param gamma_w Unit weight of water [kN/m³] (> 0)
 * @param V Soil volume [m³] (>= 0)
 * @return double Force [kN]
 */
double seepage_force(double i, double gamma_w, double V);

} // namespace geotech
