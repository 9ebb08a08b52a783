/**
 * @file Objective.cpp
 */

#include "orbtarget/targeting/Objective.hpp"
#include "orbtarget/coordinates/BPlane.hpp"
#include "orbtarget/coordinates/OrbitDual.hpp"
#include <cmath>
#include <optional>
#include <stdexcept>

namespace orbtarget::targeting {

using coordinates::StateParameter;

Objective::Objective(StateParameter parameter, double desired_value, double tolerance)
    : parameter(parameter), desired_value(desired_value), tolerance(tolerance) {
    if (!(tolerance > 0.0)) {
        throw std::invalid_argument("Objective tolerance must be positive");
    }
}

double wrap_angle_deg(double angle) {
    double wrapped = std::fmod(angle, 360.0);
    if (wrapped > 180.0) {
        wrapped -= 360.0;
    } else if (wrapped <= -180.0) {
        wrapped += 360.0;
    }
    return wrapped;
}

double Objective::difference(double a, double b) const {
    double d = a - b;
    return coordinates::is_angle(parameter) ? wrap_angle_deg(d) : d;
}

std::pair<bool, double> Objective::assess_raw(double achieved) const {
    double error = difference(desired_value, scaled(achieved));
    return {std::abs(error) <= tolerance, error};
}

std::ostream& operator<<(std::ostream& os, const Objective& objective) {
    os << coordinates::to_string(objective.parameter) << " = " << objective.desired_value
       << " " << coordinates::info(objective.parameter).unit
       << " (tol " << objective.tolerance << ")";
    if (objective.multiplicative_factor != 1.0 || objective.additive_factor != 0.0) {
        os << " scaled by " << objective.multiplicative_factor << " x + " << objective.additive_factor;
    }
    return os;
}

std::vector<math::Dual> evaluate_partials(const std::vector<Objective>& objectives,
                                          const coordinates::CartesianState& state) {
    coordinates::OrbitDual orbit(state);
    std::optional<coordinates::BPlane> b_plane;

    std::vector<math::Dual> out;
    out.reserve(objectives.size());
    for (const auto& obj : objectives) {
        if (coordinates::is_b_plane(obj.parameter)) {
            if (!b_plane) {
                b_plane = coordinates::BPlane::from_dual(orbit);
            }
            out.push_back(b_plane->value_for(obj.parameter));
        } else {
            out.push_back(orbit.partial_for(obj.parameter));
        }
    }
    return out;
}

} // namespace orbtarget::targeting
