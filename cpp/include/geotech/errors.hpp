/**
 * @file errors.hpp
 * @brief Structured error handling for Geotech.
 *
 * This file defines error codes, a structured error record and the two
 * exception types raised by the formula functions. The record is
 * machine-readable so that callers can tell an invalid argument apart
 * from an intermediate operation that left its mathematical domain.
 */

#ifndef GEOTECH_ERRORS_HPP
#define GEOTECH_ERRORS_HPP

#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace geotech {

/**
 * @brief Error codes for Geotech formula failures.
 */
enum class ErrorCode {
    /// No error
    OK = 0,

    // === Input Errors (100-199) ===

    /// A parameter violates its documented domain
    INVALID_INPUT = 100,

    /// A parameter is NaN or infinite
    NON_FINITE_INPUT = 101,

    // === Domain Errors (200-299) ===

    /// Transcendental operation evaluated outside its domain
    DOMAIN_ERROR = 200,

    /// Intermediate denominator evaluated to zero
    DIVISION_BY_ZERO = 201,

    /// Intermediate result is not representable as a finite double
    RESULT_OVERFLOW = 202
};

/**
 * @brief Convert error code to string representation.
 */
inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_INPUT: return "INVALID_INPUT";
        case ErrorCode::NON_FINITE_INPUT: return "NON_FINITE_INPUT";
        case ErrorCode::DOMAIN_ERROR: return "DOMAIN_ERROR";
        case ErrorCode::DIVISION_BY_ZERO: return "DIVISION_BY_ZERO";
        case ErrorCode::RESULT_OVERFLOW: return "RESULT_OVERFLOW";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Structured error information for Geotech.
 *
 * Contains machine-readable error code, human-readable message and the
 * offending parameter with its value and the constraint it violated.
 */
struct GeotechError {
    /// Machine-readable error code
    ErrorCode code;

    /// Human-readable error message
    std::string message;

    /// Name of the offending parameter (empty for intermediate values)
    std::string parameter;

    /// Offending value
    double value = 0.0;

    /// Constraint that was violated, e.g. "> 0"
    std::string constraint;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the error
    std::string suggestion;

    /**
     * @brief Default constructor creates OK status.
     */
    GeotechError()
        : code(ErrorCode::OK), message("OK") {}

    /**
     * @brief Construct error with code and message.
     */
    GeotechError(ErrorCode code, const std::string& message)
        : code(code), message(message) {}

    bool is_ok() const { return code == ErrorCode::OK; }

    bool is_error() const { return code != ErrorCode::OK; }

    /**
     * @brief Get string representation of the error code.
     */
    std::string code_string() const { return error_code_to_string(code); }

    /**
     * @brief Get formatted error string for display.
     */
    std::string to_string() const {
        if (is_ok()) return "OK";

        std::string result = "[" + code_string() + "] " + message;

        if (!parameter.empty()) {
            std::ostringstream oss;
            oss << value;
            result += "\n  Parameter: " + parameter + " = " + oss.str();
            if (!constraint.empty()) {
                result += " (required " + constraint + ")";
            }
        }

        for (const auto& kv : details) {
            result += "\n  " + kv.first + ": " + kv.second;
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods for common errors ===

    /**
     * @brief Create error for a parameter outside its documented domain.
     *
     * @param function Name of the formula function raising the error
     * @param parameter Parameter name as documented
     * @param value Offending value
     * @param constraint Constraint text, e.g. ">= 0" or "in [0, 90)"
     */
    static GeotechError invalid_input(const std::string& function,
                                      const std::string& parameter,
                                      double value,
                                      const std::string& constraint) {
        GeotechError err(ErrorCode::INVALID_INPUT,
            function + ": parameter '" + parameter + "' is out of range");
        err.parameter = parameter;
        err.value = value;
        err.constraint = constraint;
        err.suggestion = "Check the value and units of '" + parameter + "'";
        return err;
    }

    /**
     * @brief Create error for a NaN or infinite parameter.
     */
    static GeotechError non_finite(const std::string& function,
                                   const std::string& parameter,
                                   double value) {
        GeotechError err(ErrorCode::NON_FINITE_INPUT,
            function + ": parameter '" + parameter + "' is not finite");
        err.parameter = parameter;
        err.value = value;
        err.constraint = "finite";
        return err;
    }

    /**
     * @brief Create error for an operation evaluated outside its domain.
     *
     * @param operation Operation name, e.g. "tan" or "sqrt"
     * @param argument Argument the operation was evaluated at
     * @param reason Why the argument is outside the domain
     */
    static GeotechError domain(const std::string& operation,
                               double argument,
                               const std::string& reason) {
        GeotechError err(ErrorCode::DOMAIN_ERROR,
            operation + " evaluated outside its domain: " + reason);
        std::ostringstream oss;
        oss << argument;
        err.details["argument"] = oss.str();
        err.suggestion = "Inputs are individually valid but their combination is not; "
                         "check angle sums and slope or wall inclinations";
        return err;
    }

    /**
     * @brief Create error for a zero denominator.
     */
    static GeotechError division_by_zero(const std::string& context) {
        GeotechError err(ErrorCode::DIVISION_BY_ZERO,
            "Division by zero in " + context);
        return err;
    }

    /**
     * @brief Create error for a non-representable intermediate result.
     */
    static GeotechError overflow(const std::string& operation, double argument) {
        GeotechError err(ErrorCode::RESULT_OVERFLOW,
            operation + " result is not representable");
        std::ostringstream oss;
        oss << argument;
        err.details["argument"] = oss.str();
        return err;
    }
};

/**
 * @brief Raised when a parameter violates its documented domain.
 *
 * Raised synchronously at function entry; inputs are never clamped.
 */
class InvalidInput : public std::invalid_argument {
public:
    explicit InvalidInput(GeotechError error)
        : std::invalid_argument(error.to_string()), error_(std::move(error)) {}

    /**
     * @brief Get the structured error record.
     */
    const GeotechError& error() const { return error_; }

private:
    GeotechError error_;
};

/**
 * @brief Raised when an intermediate transcendental operation leaves its
 * mathematical domain although each input is individually valid.
 */
class DomainError : public std::domain_error {
public:
    explicit DomainError(GeotechError error)
        : std::domain_error(error.to_string()), error_(std::move(error)) {}

    const GeotechError& error() const { return error_; }

private:
    GeotechError error_;
};

}  // namespace geotech

#endif  // GEOTECH_ERRORS_HPP
