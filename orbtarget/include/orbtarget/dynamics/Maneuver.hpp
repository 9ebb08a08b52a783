/**
 * @file Maneuver.hpp
 * @brief Finite-burn maneuver: time window, throttle and steering profile
 *
 * The thrust direction is given by two steering angles, each a quadratic
 * polynomial of the time elapsed since the maneuver start:
 *
 *   u = [cos(alpha) cos(beta), sin(alpha) cos(beta), sin(beta)]
 *
 * where alpha is the in-plane angle and beta the out-of-plane angle, both in
 * radians, expressed in the maneuver frame.
 */

#ifndef ORBTARGET_DYNAMICS_MANEUVER_HPP
#define ORBTARGET_DYNAMICS_MANEUVER_HPP

#include "orbtarget/core/Types.hpp"
#include "orbtarget/coordinates/CartesianState.hpp"
#include "orbtarget/coordinates/LocalFrame.hpp"
#include "orbtarget/time/Epoch.hpp"
#include <ostream>
#include <utility>

namespace orbtarget::dynamics {

/**
 * @brief p(t) = a t² + b t + c
 */
struct QuadraticPolynomial {
    double a = 0.0;   ///< Curvature coefficient
    double b = 0.0;   ///< Rate coefficient
    double c = 0.0;   ///< Value at t = 0

    QuadraticPolynomial() = default;
    QuadraticPolynomial(double a, double b, double c) : a(a), b(b), c(c) {}

    double eval(double t) const { return (a * t + b) * t + c; }
    double deriv(double t) const { return 2.0 * a * t + b; }

    /**
     * @brief Copy with @p value added to one coefficient
     * @param order 0 = value (c), 1 = rate (b), 2 = curvature (a)
     * @throws std::out_of_range for any other order
     */
    QuadraticPolynomial add_val_in_order(double value, int order) const;

    /// Coefficient by order (0 = value, 1 = rate, 2 = curvature)
    double coefficient(int order) const;

    bool operator==(const QuadraticPolynomial& o) const { return a == o.a && b == o.b && c == o.c; }
};

std::ostream& operator<<(std::ostream& os, const QuadraticPolynomial& poly);

struct Maneuver {
    time::Epoch start;
    time::Epoch end;
    double thrust_level = 1.0;                                  ///< Throttle in [0, 1]
    QuadraticPolynomial alpha;                                  ///< In-plane angle [rad]
    QuadraticPolynomial beta;                                   ///< Out-of-plane angle [rad]
    coordinates::LocalFrame frame = coordinates::LocalFrame::RCN;

    Maneuver() = default;
    Maneuver(const time::Epoch& start, const time::Epoch& end, double thrust_level,
             const QuadraticPolynomial& alpha, const QuadraticPolynomial& beta,
             coordinates::LocalFrame frame);

    /**
     * @brief Constant-direction burn along @p direction (unit vector in @p frame)
     */
    static Maneuver from_direction(const time::Epoch& start, double duration_s,
                                   const Vector3d& direction,
                                   coordinates::LocalFrame frame,
                                   double thrust_level = 1.0);

    /// Burn duration [s]
    double duration() const { return end - start; }

    /// Set end = start + duration, with the duration floored at zero
    void set_duration(double duration_s);

    /// Start and end bracket the epoch (inclusive)
    bool is_active(const time::Epoch& epoch) const { return epoch >= start && epoch <= end; }

    /// Unit thrust direction in the maneuver frame at @p epoch
    Vector3d direction(const time::Epoch& epoch) const;

    /// Unit thrust direction in the inertial frame for the spacecraft @p state
    Vector3d inertial_direction(const coordinates::CartesianState& state) const;

    /// @throws std::invalid_argument if end < start or the throttle is outside [0, 1]
    void validate() const;
};

std::ostream& operator<<(std::ostream& os, const Maneuver& maneuver);

/**
 * @brief Steering angles (alpha, beta) in radians of a unit vector
 */
std::pair<double, double> plane_angles_from_unit_vector(const Vector3d& u);

Vector3d unit_vector_from_plane_angles(double alpha, double beta);

} // namespace orbtarget::dynamics

#endif // ORBTARGET_DYNAMICS_MANEUVER_HPP
