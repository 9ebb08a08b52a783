/**
 * @file TargetingError.cpp
 */

#include "orbtarget/targeting/TargetingError.hpp"
#include <sstream>

namespace orbtarget::targeting {

std::string to_string(TargetingErrorKind kind) {
    switch (kind) {
        case TargetingErrorKind::UnderdeterminedProblem: return "UnderdeterminedProblem";
        case TargetingErrorKind::InvalidVariable: return "InvalidVariable";
        case TargetingErrorKind::NoThrusterAvailable: return "NoThrusterAvailable";
        case TargetingErrorKind::FrameError: return "FrameError";
        case TargetingErrorKind::SingularJacobian: return "SingularJacobian";
        case TargetingErrorKind::CorrectionIneffective: return "CorrectionIneffective";
        case TargetingErrorKind::MaxIterationsReached: return "MaxIterationsReached";
    }
    return "Unknown";
}

TargetingError::TargetingError(TargetingErrorKind kind, const std::string& message)
    : std::runtime_error(to_string(kind) + ": " + message), kind_(kind) {}

TargetingError TargetingError::max_iterations(int iterations, double last_error_norm) {
    std::ostringstream oss;
    oss << "failed after " << iterations << " iterations, last error norm " << last_error_norm;
    TargetingError error(TargetingErrorKind::MaxIterationsReached, oss.str());
    error.last_error_norm_ = last_error_norm;
    return error;
}

} // namespace orbtarget::targeting
