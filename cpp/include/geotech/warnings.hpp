/**
 * @file warnings.hpp
 * @brief Warning system for questionable soil parameters and results.
 *
 * Warnings indicate values that are physically admissible but outside
 * the ranges the empirical formulas were calibrated for, or results that
 * sit close to a failure threshold. They never block a calculation.
 */

#ifndef GEOTECH_WARNINGS_HPP
#define GEOTECH_WARNINGS_HPP

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace geotech {

/**
 * @brief Warning codes for questionable parameters and results.
 */
enum class WarningCode {
    // === Strength Parameter Warnings (100-199) ===

    /// Friction angle outside 0-50 degrees
    ATYPICAL_FRICTION_ANGLE = 100,

    /// Cohesion outside 0-500 kPa
    ATYPICAL_COHESION = 101,

    // === Physical Property Warnings (200-299) ===

    /// Unit weight outside 10-25 kN/m³
    ATYPICAL_UNIT_WEIGHT = 200,

    /// Void ratio outside 0.1-2.0
    ATYPICAL_VOID_RATIO = 201,

    /// Permeability outside 1e-10 to 1e-2 m/s
    ATYPICAL_PERMEABILITY = 202,

    /// Specific gravity of solids outside 2.5-2.9
    ATYPICAL_SPECIFIC_GRAVITY = 203,

    // === Geometry Warnings (300-399) ===

    /// Depth or height outside 0-50 m
    ATYPICAL_DEPTH = 300,

    /// Footing width outside 0.1-20 m
    ATYPICAL_WIDTH = 301,

    // === Result Warnings (400-499) ===

    /// Safety factor below the customary minimum
    LOW_SAFETY_FACTOR = 400,

    /// Hydraulic gradient close to the critical gradient
    NEAR_PIPING = 401
};

/**
 * @brief Warning severity levels.
 */
enum class WarningSeverity {
    /// Just outside a typical range, likely acceptable
    Low = 0,

    /// Potentially problematic, review recommended
    Medium = 1,

    /// Likely indicates an input or unit error
    High = 2
};

/**
 * @brief Convert warning code to string representation.
 */
inline std::string warning_code_to_string(WarningCode code) {
    switch (code) {
        case WarningCode::ATYPICAL_FRICTION_ANGLE: return "ATYPICAL_FRICTION_ANGLE";
        case WarningCode::ATYPICAL_COHESION: return "ATYPICAL_COHESION";
        case WarningCode::ATYPICAL_UNIT_WEIGHT: return "ATYPICAL_UNIT_WEIGHT";
        case WarningCode::ATYPICAL_VOID_RATIO: return "ATYPICAL_VOID_RATIO";
        case WarningCode::ATYPICAL_PERMEABILITY: return "ATYPICAL_PERMEABILITY";
        case WarningCode::ATYPICAL_SPECIFIC_GRAVITY: return "ATYPICAL_SPECIFIC_GRAVITY";
        case WarningCode::ATYPICAL_DEPTH: return "ATYPICAL_DEPTH";
        case WarningCode::ATYPICAL_WIDTH: return "ATYPICAL_WIDTH";
        case WarningCode::LOW_SAFETY_FACTOR: return "LOW_SAFETY_FACTOR";
        case WarningCode::NEAR_PIPING: return "NEAR_PIPING";
        default: return "UNKNOWN_WARNING";
    }
}

/**
 * @brief Convert severity to string representation.
 */
inline std::string severity_to_string(WarningSeverity severity) {
    switch (severity) {
        case WarningSeverity::Low: return "LOW";
        case WarningSeverity::Medium: return "MEDIUM";
        case WarningSeverity::High: return "HIGH";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Structured warning information for Geotech.
 */
struct GeotechWarning {
    /// Machine-readable warning code
    WarningCode code;

    /// Warning severity level
    WarningSeverity severity;

    /// Human-readable warning message
    std::string message;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the warning
    std::string suggestion;

    GeotechWarning(WarningCode code, WarningSeverity severity, const std::string& message)
        : code(code), severity(severity), message(message) {}

    std::string code_string() const { return warning_code_to_string(code); }

    std::string severity_string() const { return severity_to_string(severity); }

    /**
     * @brief Get formatted warning string for display.
     */
    std::string to_string() const {
        std::string result = "[" + severity_string() + "] [" + code_string() + "] " + message;

        for (const auto& kv : details) {
            result += "\n  " + kv.first + ": " + kv.second;
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods for common warnings ===

    /**
     * @brief Create warning for a value outside its typical range.
     *
     * @param code Warning code identifying the quantity
     * @param quantity Quantity name with unit, e.g. "unit weight [kN/m³]"
     * @param value Checked value
     * @param low Lower end of the typical range
     * @param high Upper end of the typical range
     *
     * Severity grows with the distance from the range:
     * - Low: within 10% of a bound (low/1.1 to high·1.1)
     * - High: more than a factor 10 outside (below low/10 or above high·10)
     * - Medium: everything in between
     */
    static GeotechWarning atypical_value(WarningCode code, const std::string& quantity,
                                         double value, double low, double high) {
        // Far outside the range usually means a unit error
        bool far = (value < low / 10.0) || (value > high * 10.0);
        bool slight = (value >= low / 1.1) && (value <= high * 1.1);

        WarningSeverity severity = WarningSeverity::Medium;
        std::string suggestion = "Empirical formulas may be outside their calibration range";
        if (far) {
            severity = WarningSeverity::High;
            suggestion = "Check units - the value is an order of magnitude outside the typical range";
        } else if (slight) {
            severity = WarningSeverity::Low;
            suggestion = "Value is close to the typical range; results are likely still usable";
        }

        GeotechWarning warn(code, severity,
            "Value of " + quantity + " is outside its typical range");
        warn.details["value"] = std::to_string(value);
        warn.details["typical_range"] = std::to_string(low) + " - " + std::to_string(high);
        warn.suggestion = suggestion;
        return warn;
    }

    /**
     * @brief Create warning for a low safety factor.
     */
    static GeotechWarning low_safety_factor(double fs, double minimum) {
        GeotechWarning warn(WarningCode::LOW_SAFETY_FACTOR, WarningSeverity::High,
            "Safety factor is below the customary minimum");
        warn.details["safety_factor"] = std::to_string(fs);
        warn.details["minimum"] = std::to_string(minimum);
        warn.suggestion = "Bearing capacity design customarily uses Fs = 2.0 to 3.0";
        return warn;
    }

    /**
     * @brief Create warning for a gradient close to the piping threshold.
     */
    static GeotechWarning near_piping(double i, double icr) {
        GeotechWarning warn(WarningCode::NEAR_PIPING, WarningSeverity::Medium,
            "Exit gradient is close to the critical hydraulic gradient");
        warn.details["gradient"] = std::to_string(i);
        warn.details["critical_gradient"] = std::to_string(icr);
        warn.suggestion = "Consider a longer seepage path or a filter layer";
        return warn;
    }
};

/**
 * @brief Collection of warnings from parameter checks.
 */
class WarningList {
public:
    /// List of warnings
    std::vector<GeotechWarning> warnings;

    void add(const GeotechWarning& warning) {
        warnings.push_back(warning);
    }

    void add(GeotechWarning&& warning) {
        warnings.push_back(std::move(warning));
    }

    /**
     * @brief Append all warnings of another list.
     */
    void merge(const WarningList& other) {
        warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
    }

    bool has_warnings() const { return !warnings.empty(); }

    size_t count() const { return warnings.size(); }

    /**
     * @brief Get count of warnings by severity.
     */
    size_t count_by_severity(WarningSeverity severity) const {
        size_t count = 0;
        for (const auto& w : warnings) {
            if (w.severity == severity) ++count;
        }
        return count;
    }

    /**
     * @brief Check whether a warning with the given code is present.
     */
    bool contains(WarningCode code) const {
        for (const auto& w : warnings) {
            if (w.code == code) return true;
        }
        return false;
    }

    /**
     * @brief Get all warnings with given severity or higher.
     */
    std::vector<GeotechWarning> get_by_min_severity(WarningSeverity min_severity) const {
        std::vector<GeotechWarning> result;
        for (const auto& w : warnings) {
            if (static_cast<int>(w.severity) >= static_cast<int>(min_severity)) {
                result.push_back(w);
            }
        }
        return result;
    }

    void clear() { warnings.clear(); }

    /**
     * @brief Get formatted summary string.
     */
    std::string summary() const {
        if (warnings.empty()) return "No warnings";

        std::string result = std::to_string(warnings.size()) + " warning(s): ";
        result += std::to_string(count_by_severity(WarningSeverity::High)) + " high, ";
        result += std::to_string(count_by_severity(WarningSeverity::Medium)) + " medium, ";
        result += std::to_string(count_by_severity(WarningSeverity::Low)) + " low";
        return result;
    }
};

}  // namespace geotech

#endif  // GEOTECH_WARNINGS_HPP
