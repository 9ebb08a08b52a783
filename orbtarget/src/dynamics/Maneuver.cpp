/**
 * @file Maneuver.cpp
 * @brief Implementation of the finite-burn maneuver model
 */

#include "orbtarget/dynamics/Maneuver.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <stdexcept>

namespace orbtarget::dynamics {

// ============================================================================
// QuadraticPolynomial
// ============================================================================

QuadraticPolynomial QuadraticPolynomial::add_val_in_order(double value, int order) const {
    QuadraticPolynomial out = *this;
    switch (order) {
        case 0: out.c += value; break;
        case 1: out.b += value; break;
        case 2: out.a += value; break;
        default:
            throw std::out_of_range("Quadratic polynomial has no coefficient of order " +
                                    std::to_string(order));
    }
    return out;
}

double QuadraticPolynomial::coefficient(int order) const {
    switch (order) {
        case 0: return c;
        case 1: return b;
        case 2: return a;
        default:
            throw std::out_of_range("Quadratic polynomial has no coefficient of order " +
                                    std::to_string(order));
    }
}

std::ostream& operator<<(std::ostream& os, const QuadraticPolynomial& poly) {
    os << poly.a << " t² + " << poly.b << " t + " << poly.c;
    return os;
}

// ============================================================================
// Maneuver
// ============================================================================

Maneuver::Maneuver(const time::Epoch& start, const time::Epoch& end, double thrust_level,
                   const QuadraticPolynomial& alpha, const QuadraticPolynomial& beta,
                   coordinates::LocalFrame frame)
    : start(start), end(end), thrust_level(thrust_level),
      alpha(alpha), beta(beta), frame(frame) {
    validate();
}

Maneuver Maneuver::from_direction(const time::Epoch& start, double duration_s,
                                  const Vector3d& direction,
                                  coordinates::LocalFrame frame,
                                  double thrust_level) {
    auto [a, b] = plane_angles_from_unit_vector(direction);
    return Maneuver(start, start + std::max(duration_s, 0.0), thrust_level,
                    QuadraticPolynomial(0.0, 0.0, a), QuadraticPolynomial(0.0, 0.0, b),
                    frame);
}

void Maneuver::set_duration(double duration_s) {
    end = start + std::max(duration_s, 0.0);
}

Vector3d Maneuver::direction(const time::Epoch& epoch) const {
    const double t = epoch - start;
    return unit_vector_from_plane_angles(alpha.eval(t), beta.eval(t));
}

Vector3d Maneuver::inertial_direction(const coordinates::CartesianState& state) const {
    Vector3d u = direction(state.epoch);
    if (!coordinates::is_local(frame)) {
        return u;
    }
    return state.dcm_from_frame(frame) * u;
}

void Maneuver::validate() const {
    if (end < start) {
        throw std::invalid_argument("Maneuver ends before it starts");
    }
    if (!(thrust_level >= 0.0 && thrust_level <= 1.0)) {
        throw std::invalid_argument("Maneuver thrust level must be in [0, 1]");
    }
}

std::ostream& operator<<(std::ostream& os, const Maneuver& maneuver) {
    std::ios_base::fmtflags flags = os.flags();
    os << "Maneuver @ " << maneuver.start << " for " << std::fixed << std::setprecision(3)
       << maneuver.duration() << " s  thrust " << std::setprecision(1)
       << maneuver.thrust_level * 100.0 << "%  [" << coordinates::to_string(maneuver.frame) << "]"
       << std::scientific << std::setprecision(6)
       << "  alpha = " << maneuver.alpha << "  beta = " << maneuver.beta;
    os.flags(flags);
    return os;
}

// ============================================================================
// Steering angles
// ============================================================================

std::pair<double, double> plane_angles_from_unit_vector(const Vector3d& u) {
    const double n = u.norm();
    if (n == 0.0) {
        throw std::invalid_argument("Cannot compute steering angles of a zero vector");
    }
    Vector3d v = u / n;
    const double alpha = std::atan2(v(1), v(0));
    const double beta = std::asin(std::clamp(v(2), -1.0, 1.0));
    return {alpha, beta};
}

Vector3d unit_vector_from_plane_angles(double alpha, double beta) {
    return Vector3d(std::cos(alpha) * std::cos(beta),
                    std::sin(alpha) * std::cos(beta),
                    std::sin(beta));
}

} // namespace orbtarget::dynamics
