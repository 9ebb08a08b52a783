/**
 * @file TargetingError.hpp
 * @brief Failures of a differential correction run
 */

#ifndef ORBTARGET_TARGETING_TARGETING_ERROR_HPP
#define ORBTARGET_TARGETING_TARGETING_ERROR_HPP

#include <limits>
#include <stdexcept>
#include <string>

namespace orbtarget::targeting {

enum class TargetingErrorKind {
    UnderdeterminedProblem,   ///< No objectives
    InvalidVariable,          ///< Bad bounds or perturbation, or a position variable in a local frame
    NoThrusterAvailable,      ///< Finite-burn target on a spacecraft without thruster
    FrameError,               ///< Correction frame undefined for the requested component
    SingularJacobian,         ///< Pseudo-inverse could not be computed
    CorrectionIneffective,    ///< Error norm stopped changing
    MaxIterationsReached      ///< Iteration budget exhausted
};

std::string to_string(TargetingErrorKind kind);

/**
 * @brief Terminal failure of a targeting run
 *
 * None of these are retried automatically.
 */
class TargetingError : public std::runtime_error {
public:
    TargetingError(TargetingErrorKind kind, const std::string& message);

    /// MaxIterationsReached, with the norm of the last error vector
    static TargetingError max_iterations(int iterations, double last_error_norm);

    TargetingErrorKind kind() const { return kind_; }

    /// Norm of the last error vector (NaN unless kind() is MaxIterationsReached)
    double last_error_norm() const { return last_error_norm_; }

private:
    TargetingErrorKind kind_;
    double last_error_norm_ = std::numeric_limits<double>::quiet_NaN();
};

} // namespace orbtarget::targeting

#endif // ORBTARGET_TARGETING_TARGETING_ERROR_HPP
