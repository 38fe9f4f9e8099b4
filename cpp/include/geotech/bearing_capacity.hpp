#pragma once

namespace geotech {

/**
 * @brief Terzaghi bearing capacity factors for one friction angle
 */
struct BearingCapacityFactors {
    double Nc = 0.0;        ///< Cohesion factor
    double Nq = 0.0;        ///< Surcharge factor
    double Ngamma = 0.0;    ///< Self-weight factor
};

/**
 * @brief Closed-form fit used for the self-weight factor Nγ
 *
 * Terzaghi published Nγ only as a chart; these are the usual fits:
 * - Hansen:   Nγ = 1.5·(Nq - 1)·tan φ (default, closest to Terzaghi's chart)
 * - Meyerhof: Nγ = (Nq - 1)·tan(1.4·φ)
 * - Vesic:    Nγ = 2·(Nq + 1)·tan φ
 */
enum class NgammaMethod {
    Hansen,
    Meyerhof,
    Vesic
};

/**
 * @brief Footing plan shape, selects Terzaghi's shape coefficients
 *
 * | Shape    | on c·Nc | on γ·B·Nγ |
 * |----------|---------|-----------|
 * | Strip    | 1.0     | 0.5       |
 * | Square   | 1.3     | 0.4       |
 * | Circular | 1.3     | 0.3       |
 *
 * For circular footings B is the diameter.
 */
enum class FootingShape {
    Strip,
    Square,
    Circular
};

/**
 * @brief Reduced strength parameters for local shear failure
 */
struct ShearStrength {
    double c = 0.0;     ///< Cohesion [kPa]
    double phi = 0.0;   ///< Friction angle [deg]
};

/**
 * @brief Terzaghi surcharge factor Nq
 *
 * Formula: Nq = a² / (2·cos²(45° + φ/2)), a = exp((3π/4 - φ/2)·tan φ)
 *
 * Nq(0°) = 1, strictly increasing in φ.
 *
 * @param phi Friction angle [deg], 0 <= phi <= 50
 * @throws InvalidInput if phi is outside [0, 50]
 */
double terzaghi_nq(double phi);

/**
 * @brief Terzaghi cohesion factor Nc
 *
 * Formula: Nc = (Nq - 1)·cot φ
 *
 * At φ = 0 the expression is 0/0; the limit 3π/2 + 1 = 5.71 is returned
 * (tabulated by Terzaghi as 5.7).
 *
 * @param phi Friction angle [deg], 0 <= phi <= 50
 */
double terzaghi_nc(double phi);

/**
 * @brief Terzaghi self-weight factor Nγ
 *
 * Zero at φ = 0 for every fit, strictly increasing over [0°, 50°].
 *
 * @param phi Friction angle [deg], 0 <= phi <= 50
 * @param method Closed-form fit (default Hansen)
 */
double terzaghi_ngamma(double phi, NgammaMethod method = NgammaMethod::Hansen);

/**
 * @brief All three factors at once
 */
BearingCapacityFactors terzaghi_factors(double phi,
                                        NgammaMethod method = NgammaMethod::Hansen);

/**
 * @brief Ultimate bearing capacity of a strip footing (general shear)
 *
 * Formula: qu = c·Nc + q·Nq + 0.5·γ·B·Nγ
 *
 * @param c Cohesion [kPa] (>= 0)
 * @param q Overburden pressure at footing level [kPa] (>= 0)
 * @param gamma Unit weight below the footing [kN/m³] (> 0)
 * @param B Footing width [m] (> 0)
 * @param phi Friction angle [deg], 0 <= phi <= 50
 * @return double Ultimate bearing capacity [kPa]
 */
double terzaghi_bearing_capacity(double c, double q, double gamma, double B, double phi);

/**
 * @brief Ultimate bearing capacity with Terzaghi's shape coefficients
 *
 * Formula: qu = sc·c·Nc + q·Nq + sγ·γ·B·Nγ, see FootingShape for sc, sγ.
 */
double terzaghi_bearing_capacity_shaped(double c, double q, double gamma, double B,
                                        double phi, FootingShape shape,
                                        NgammaMethod method = NgammaMethod::Hansen);

/**
 * @brief Reduced parameters for local shear failure
 *
 * Formula: c* = 2/3·c, φ* = atan(2/3·tan φ)
 *
 * Feed the result back into terzaghi_bearing_capacity for loose or soft
 * soils that fail in local shear.
 */
ShearStrength local_shear_parameters(double c, double phi);

/**
 * @brief Overburden pressure at foundation level
 *
 * Formula: q = γ·Df
 *
 * @param gamma Unit weight above the footing [kN/m³] (> 0)
 * @param Df Embedment depth [m] (>= 0)
 * @return double q [kPa]
 */
double overburden_pressure(double gamma, double Df);

/**
 * @brief Allowable (design) bearing capacity
 *
 * Formula: qa = qu / Fs
 *
 * Besides Fs > 0, qu must be non-negative: an ultimate capacity below zero
 * has no physical meaning and is rejected rather than divided through.
 * For every accepted pair the result is exactly qu / Fs.
 *
 * @param qu Ultimate bearing capacity [kPa] (>= 0)
 * @param Fs Factor of safety (> 0)
 * @throws InvalidInput if Fs <= 0 or qu < 0
 */
double bearing_capacity_design(double qu, double Fs);

} // namespace geotech
