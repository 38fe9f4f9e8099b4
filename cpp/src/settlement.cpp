#include "geotech/settlement.hpp"
#include "geotech/numeric_utils.hpp"
#include "geotech/validation.hpp"
#include <algorithm>
#include <cmath>

namespace geotech {

using namespace validation;

namespace {

/// kPa per MPa
constexpr double KPA_PER_MPA = 1000.0;

void check_settings(const char* function, const ConsolidationSettings& settings) {
    double tc = settings.crossover_tv;
    require_finite(function, "crossover_tv", tc);
    if (!(tc >= ConsolidationSettings::MIN_CROSSOVER_TV &&
          tc <= ConsolidationSettings::MAX_CROSSOVER_TV)) {
        throw InvalidInput(GeotechError::invalid_input(function, "crossover_tv", tc,
            "in [0.2, 0.2130]"));
    }
}

// Square-root branch, exact for small Tv
double degree_small(double Tv) {
    return 2.0 * std::sqrt(Tv / PI);
}

// First term of the series, accurate once higher modes have decayed
double degree_large(double Tv) {
    return 1.0 - 8.0 / (PI * PI) * std::exp(-PI * PI * Tv / 4.0);
}

} // namespace

double settlement_layer(double av, double e0, double sigma_z, double Hi) {
    const char* fn = "settlement_layer";
    require_non_negative(fn, "av", av);
    require_greater(fn, "e0", e0, -1.0);
    require_non_negative(fn, "sigma_z", sigma_z);
    require_non_negative(fn, "Hi", Hi);
    return av * (sigma_z / KPA_PER_MPA) * Hi / (1.0 + e0);
}

double settlement_layer_es(double Es, double sigma_z, double Hi) {
    const char* fn = "settlement_layer_es";
    require_positive(fn, "Es", Es);
    require_non_negative(fn, "sigma_z", sigma_z);
    require_non_negative(fn, "Hi", Hi);
    return (sigma_z / KPA_PER_MPA) / Es * Hi;
}

double settlement_compression_index(double Cc, double e0, double sigma0,
                                    double delta_sigma, double H) {
    const char* fn = "settlement_compression_index";
    require_non_negative(fn, "Cc", Cc);
    require_greater(fn, "e0", e0, -1.0);
    require_positive(fn, "sigma0", sigma0);
    require_non_negative(fn, "delta_sigma", delta_sigma);
    require_non_negative(fn, "H", H);
    return Cc * H / (1.0 + e0) * std::log10((sigma0 + delta_sigma) / sigma0);
}

double elastic_settlement(double q, double B, double nu, double E, double Iw) {
    const char* fn = "elastic_settlement";
    require_non_negative(fn, "q", q);
    require_positive(fn, "B", B);
    require_half_open(fn, "nu", nu, 0.0, 0.5);
    require_positive(fn, "E", E);
    require_positive(fn, "Iw", Iw);
    return q * B * (1.0 - nu * nu) * Iw / E;
}

double total_settlement(const Eigen::VectorXd& av, const Eigen::VectorXd& e0,
                        const Eigen::VectorXd& sigma_z, const Eigen::VectorXd& Hi) {
    Eigen::Index n = av.size();
    if (e0.size() != n || sigma_z.size() != n || Hi.size() != n) {
        throw InvalidInput(GeotechError::invalid_input("total_settlement", "layer vectors",
            static_cast<double>(n), "equal sizes"));
    }

    double total = 0.0;
    for (Eigen::Index i = 0; i < n; ++i) {
        total += settlement_layer(av(i), e0(i), sigma_z(i), Hi(i));
    }
    return total;
}

double time_factor(double Cv, double t, double H) {
    require_positive("time_factor", "Cv", Cv);
    require_non_negative("time_factor", "t", t);
    require_positive("time_factor", "H", H);
    return Cv * t / (H * H);
}

double consolidation_degree(double Tv, const ConsolidationSettings& settings) {
    require_non_negative("consolidation_degree", "Tv", Tv);
    check_settings("consolidation_degree", settings);

    double U = (Tv <= settings.crossover_tv) ? degree_small(Tv) : degree_large(Tv);
    return std::min(1.0, std::max(0.0, U));
}

double time_factor_for_degree(double U, const ConsolidationSettings& settings) {
    require_half_open("time_factor_for_degree", "U", U, 0.0, 1.0);
    check_settings("time_factor_for_degree", settings);

    double tc = settings.crossover_tv;
    if (U <= degree_small(tc)) {
        return PI * U * U / 4.0;
    }
    if (U <= degree_large(tc)) {
        // U falls in the step between the two branches at the crossover
        return tc;
    }
    return -4.0 / (PI * PI) * safe_log((1.0 - U) * PI * PI / 8.0);
}

double excess_pore_pressure_ratio(double Z, double Tv, int terms) {
    const char* fn = "excess_pore_pressure_ratio";
    require_closed(fn, "Z", Z, 0.0, 2.0);
    require_non_negative(fn, "Tv", Tv);
    if (terms < 1) {
        throw InvalidInput(GeotechError::invalid_input(fn, "terms",
            static_cast<double>(terms), ">= 1"));
    }

    double sum = 0.0;
    for (int m = 0; m < terms; ++m) {
        double M = PI * (2.0 * m + 1.0) / 2.0;
        sum += 2.0 / M * std::sin(M * Z) * std::exp(-M * M * Tv);
    }
    // Truncated series overshoots near the boundaries at small Tv
    return std::min(1.0, std::max(0.0, sum));
}

Eigen::VectorXd excess_pore_pressure_isochrone(const Eigen::VectorXd& Z, double Tv, int terms) {
    Eigen::VectorXd ratio(Z.size());
    for (Eigen::Index i = 0; i < Z.size(); ++i) {
        ratio(i) = excess_pore_pressure_ratio(Z(i), Tv, terms);
    }
    return ratio;
}

double consolidation_settlement_final(double mv, double sigma_z, double H) {
    require_positive("consolidation_settlement_final", "mv", mv);
    require_non_negative("consolidation_settlement_final", "sigma_z", sigma_z);
    require_non_negative("consolidation_settlement_final", "H", H);
    return mv * (sigma_z / KPA_PER_MPA) * H;
}

double consolidation_settlement_at_time(double s_final, double Tv,
                                        const ConsolidationSettings& settings) {
    require_non_negative("consolidation_settlement_at_time", "s_final", s_final);
    return consolidation_degree(Tv, settings) * s_final;
}

} // namespace geotech
