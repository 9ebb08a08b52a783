/**
 * @file Objective.hpp
 * @brief Desired terminal values and their assessment
 */

#ifndef ORBTARGET_TARGETING_OBJECTIVE_HPP
#define ORBTARGET_TARGETING_OBJECTIVE_HPP

#include "orbtarget/coordinates/CartesianState.hpp"
#include "orbtarget/coordinates/StateParameter.hpp"
#include "orbtarget/math/Dual.hpp"
#include <ostream>
#include <utility>
#include <vector>

namespace orbtarget::targeting {

struct Objective {
    coordinates::StateParameter parameter = coordinates::StateParameter::X;
    double desired_value = 0.0;
    double tolerance = 0.1;
    double multiplicative_factor = 1.0;
    double additive_factor = 0.0;

    Objective() = default;

    /// @throws std::invalid_argument if @p tolerance is not positive
    Objective(coordinates::StateParameter parameter, double desired_value, double tolerance = 0.1);

    /// Achieved value after scaling: m * x + a
    double scaled(double achieved) const {
        return multiplicative_factor * achieved + additive_factor;
    }

    /**
     * @brief Compare an achieved value with the desired one
     *
     * @return (|error| <= tolerance, error) with error = desired - scaled(achieved),
     *         wrapped to (-180, 180] for angular parameters
     */
    std::pair<bool, double> assess_raw(double achieved) const;

    /// Difference of two values of this parameter, wrapped for angles
    double difference(double a, double b) const;
};

std::ostream& operator<<(std::ostream& os, const Objective& objective);

/// Wrap an angle difference in degrees to (-180, 180]
double wrap_angle_deg(double angle);

/**
 * @brief Value and Cartesian partials of every objective parameter at @p state
 *
 * The dual orbit and the B-plane are each built once. Values are unscaled.
 *
 * @throws std::invalid_argument if a parameter is undefined at this state
 *         (e.g. B-plane of a closed orbit)
 */
std::vector<math::Dual> evaluate_partials(const std::vector<Objective>& objectives,
                                          const coordinates::CartesianState& state);

} // namespace orbtarget::targeting

#endif // ORBTARGET_TARGETING_OBJECTIVE_HPP
