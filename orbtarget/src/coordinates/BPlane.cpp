/**
 * @file BPlane.cpp
 * @brief B-plane targeting parameters from a hyperbolic state
 */

#include "orbtarget/coordinates/BPlane.hpp"
#include "orbtarget/core/Constants.hpp"
#include <cmath>
#include <stdexcept>

namespace orbtarget::coordinates {

using math::Dual;
using math::DualVector3;

BPlane BPlane::from_dual(const OrbitDual& orbit) {
    Dual e = orbit.ecc();
    if (e.real() <= 1.0) {
        throw std::invalid_argument("B-plane undefined: orbit is not hyperbolic (e = " +
                                    std::to_string(e.real()) + ")");
    }

    DualVector3 e_hat = orbit.evec() / e;
    DualVector3 h = orbit.hvec();
    DualVector3 h_hat = h / h.norm();
    DualVector3 n_hat = h_hat.cross(e_hat);

    Dual root = math::sqrt(1.0 - 1.0 / (e * e));

    // Incoming asymptote
    DualVector3 s = e_hat / e + n_hat * root;

    // Impact parameter b = -a sqrt(e² - 1) (a < 0 on a hyperbola)
    Dual a = orbit.sma();
    Dual b = -a * math::sqrt(e * e - 1.0);
    DualVector3 b_vec = (e_hat * root - n_hat / e) * b;

    // T = S x K, normalized; R = S x T
    DualVector3 t{s.y, -s.x, Dual(0.0)};
    Dual t_norm = t.norm();
    if (t_norm.real() < 1e-12) {
        throw std::invalid_argument("B-plane undefined: incoming asymptote is parallel to the pole");
    }
    DualVector3 t_hat = t / t_norm;
    DualVector3 r_hat = s.cross(t_hat);

    // Time of flight to periapsis from hyperbolic anomaly
    Dual nu = orbit.ta();
    Dual f = 2.0 * math::atanh(math::sqrt((e - 1.0) / (e + 1.0)) * math::tan(nu / 2.0));
    Dual mean_anomaly = e * math::sinh(f) - f;
    Dual mean_motion = math::sqrt(orbit.mu() / math::pow(-a, 3.0));

    BPlane plane;
    plane.b_r = b_vec.dot(r_hat);
    plane.b_t = b_vec.dot(t_hat);
    plane.ltof_s = -mean_anomaly / mean_motion;
    return plane;
}

double BPlane::b_mag() const {
    return std::hypot(b_r.real(), b_t.real());
}

double BPlane::b_theta_deg() const {
    return std::atan2(b_r.real(), b_t.real()) * constants::RAD_TO_DEG;
}

Dual BPlane::value_for(StateParameter parameter) const {
    switch (parameter) {
        case StateParameter::BdotR: return b_r;
        case StateParameter::BdotT: return b_t;
        case StateParameter::BLTOF: return ltof_s;
        default:
            break;
    }
    throw std::invalid_argument("Parameter " + to_string(parameter) + " is not a B-plane quantity");
}

} // namespace orbtarget::coordinates
