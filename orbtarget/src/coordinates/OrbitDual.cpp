/**
 * @file OrbitDual.cpp
 * @brief Orbital parameters with exact first-order partials
 */

#include "orbtarget/coordinates/OrbitDual.hpp"
#include "orbtarget/core/Constants.hpp"
#include <stdexcept>

namespace orbtarget::coordinates {

using math::Dual;
using math::DualVector3;
using constants::RAD_TO_DEG;

namespace {

constexpr double SINGULAR_TOL = 1e-12;

/// Shift an angle in degrees into [0, 360) without touching its partials
Dual wrap_positive_deg(const Dual& angle_deg) {
    if (angle_deg.real() < 0.0) {
        return angle_deg + 360.0;
    }
    return angle_deg;
}

} // anonymous namespace

OrbitDual::OrbitDual(const CartesianState& state)
    : r_{Dual::variable(state.position(0), 0),
         Dual::variable(state.position(1), 1),
         Dual::variable(state.position(2), 2)},
      v_{Dual::variable(state.velocity(0), 3),
         Dual::variable(state.velocity(1), 4),
         Dual::variable(state.velocity(2), 5)},
      mu_(state.mu) {}

Dual OrbitDual::rmag() const { return r_.norm(); }

Dual OrbitDual::vmag() const { return v_.norm(); }

DualVector3 OrbitDual::hvec() const { return r_.cross(v_); }

Dual OrbitDual::hmag() const { return hvec().norm(); }

Dual OrbitDual::energy() const {
    return v_.dot(v_) * 0.5 - mu_ / rmag();
}

Dual OrbitDual::c3() const { return 2.0 * energy(); }

Dual OrbitDual::sma() const {
    Dual e = energy();
    if (std::abs(e.real()) < SINGULAR_TOL) {
        throw std::invalid_argument("Semi-major axis undefined for a parabolic orbit");
    }
    return -mu_ / (2.0 * e);
}

DualVector3 OrbitDual::evec() const {
    Dual r = rmag();
    Dual v2 = v_.dot(v_);
    Dual rv = r_.dot(v_);
    return (r_ * (v2 - mu_ / r) - v_ * rv) / Dual(mu_);
}

Dual OrbitDual::ecc() const { return evec().norm(); }

Dual OrbitDual::inc() const {
    DualVector3 h = hvec();
    Dual h_xy = math::sqrt(h.x * h.x + h.y * h.y);
    return math::atan2(h_xy, h.z);
}

Dual OrbitDual::raan() const {
    DualVector3 h = hvec();
    if (std::hypot(h.x.real(), h.y.real()) < SINGULAR_TOL) {
        // Equatorial: node line undefined, reference from the X axis
        return Dual(0.0);
    }
    return math::atan2(h.x, -h.y);
}

Dual OrbitDual::aop() const {
    DualVector3 h = hvec();
    DualVector3 e = evec();
    if (e.norm().real() < SINGULAR_TOL) {
        // Circular: periapsis undefined, true anomaly carries the argument of latitude
        return Dual(0.0);
    }

    Dual hm = h.norm();
    DualVector3 h_hat = h / hm;

    if (std::hypot(h.x.real(), h.y.real()) < SINGULAR_TOL) {
        // Equatorial: longitude of periapsis, sense given by the orbit normal
        Dual lon = math::atan2(e.y, e.x);
        return h.z.real() < 0.0 ? -lon : lon;
    }

    // Node vector n = K x h
    DualVector3 n{-h.y, h.x, Dual(0.0)};
    return math::atan2(h_hat.dot(n.cross(e)), n.dot(e));
}

Dual OrbitDual::ta() const {
    DualVector3 e = evec();
    if (e.norm().real() < SINGULAR_TOL) {
        // Circular: argument of latitude (or true longitude if equatorial)
        DualVector3 h = hvec();
        DualVector3 h_hat = h / h.norm();
        if (std::hypot(h.x.real(), h.y.real()) < SINGULAR_TOL) {
            Dual lon = math::atan2(r_.y, r_.x);
            return h.z.real() < 0.0 ? -lon : lon;
        }
        DualVector3 n{-h.y, h.x, Dual(0.0)};
        return math::atan2(h_hat.dot(n.cross(r_)), n.dot(r_));
    }

    DualVector3 h = hvec();
    DualVector3 h_hat = h / h.norm();
    return math::atan2(h_hat.dot(e.cross(r_)), e.dot(r_));
}

Dual OrbitDual::fpa() const {
    return math::atan2(r_.dot(v_), hmag());
}

Dual OrbitDual::declination() const {
    return math::asin(r_.z / rmag());
}

Dual OrbitDual::right_ascension() const {
    return math::atan2(r_.y, r_.x);
}

Dual OrbitDual::periapsis() const {
    return sma() * (1.0 - ecc());
}

Dual OrbitDual::apoapsis() const {
    Dual e = ecc();
    if (e.real() >= 1.0) {
        throw std::invalid_argument("Apoapsis undefined for an open orbit");
    }
    return sma() * (1.0 + e);
}

Dual OrbitDual::partial_for(StateParameter parameter) const {
    switch (parameter) {
        case StateParameter::X: return r_.x;
        case StateParameter::Y: return r_.y;
        case StateParameter::Z: return r_.z;
        case StateParameter::VX: return v_.x;
        case StateParameter::VY: return v_.y;
        case StateParameter::VZ: return v_.z;
        case StateParameter::Rmag: return rmag();
        case StateParameter::Vmag: return vmag();
        case StateParameter::Hmag: return hmag();
        case StateParameter::Energy: return energy();
        case StateParameter::C3: return c3();
        case StateParameter::SMA: return sma();
        case StateParameter::Eccentricity: return ecc();
        case StateParameter::Inclination: return inc() * RAD_TO_DEG;
        case StateParameter::RAAN: return wrap_positive_deg(raan() * RAD_TO_DEG);
        case StateParameter::AoP: return wrap_positive_deg(aop() * RAD_TO_DEG);
        case StateParameter::TrueAnomaly: return wrap_positive_deg(ta() * RAD_TO_DEG);
        case StateParameter::FlightPathAngle: return fpa() * RAD_TO_DEG;
        case StateParameter::Periapsis: return periapsis();
        case StateParameter::Apoapsis: return apoapsis();
        case StateParameter::Declination: return declination() * RAD_TO_DEG;
        case StateParameter::RightAscension: return wrap_positive_deg(right_ascension() * RAD_TO_DEG);
        case StateParameter::BdotR:
        case StateParameter::BdotT:
        case StateParameter::BLTOF:
            break;
    }
    throw std::invalid_argument("Parameter " + to_string(parameter) +
                                " is a B-plane quantity and must be read through BPlane");
}

} // namespace orbtarget::coordinates
