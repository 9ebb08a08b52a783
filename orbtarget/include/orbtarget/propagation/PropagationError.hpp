/**
 * @file PropagationError.hpp
 * @brief Exception raised on numerical propagation failures
 */

#ifndef ORBTARGET_PROPAGATION_PROPAGATION_ERROR_HPP
#define ORBTARGET_PROPAGATION_PROPAGATION_ERROR_HPP

#include <stdexcept>
#include <string>

namespace orbtarget::propagation {

/**
 * @brief Step size underflow, non-finite state, fuel exhaustion or an
 *        interpolation request outside a recorded trajectory
 */
class PropagationError : public std::runtime_error {
public:
    explicit PropagationError(const std::string& message)
        : std::runtime_error("Propagation failed: " + message) {}
};

} // namespace orbtarget::propagation

#endif // ORBTARGET_PROPAGATION_PROPAGATION_ERROR_HPP
