/**
 * @file CartesianState.cpp
 * @brief Implementation of the Cartesian orbit state
 */

#include "orbtarget/coordinates/CartesianState.hpp"
#include "orbtarget/coordinates/OrbitDual.hpp"
#include "orbtarget/coordinates/BPlane.hpp"
#include <cmath>
#include <iomanip>
#include <stdexcept>

namespace orbtarget::coordinates {

using constants::DEG_TO_RAD;

CartesianState::CartesianState(const time::Epoch& epoch, const Vector3d& position,
                               const Vector3d& velocity, double mu)
    : epoch(epoch), position(position), velocity(velocity), mu(mu) {}

CartesianState CartesianState::from_keplerian(const KeplerianElements& elements,
                                              const time::Epoch& epoch,
                                              double mu) {
    const double a = elements.sma_km;
    const double e = elements.ecc;

    if (e < 0.0) {
        throw std::invalid_argument("Eccentricity must be non-negative");
    }
    if (std::abs(1.0 - e) < 1e-12) {
        throw std::invalid_argument("Parabolic orbits cannot be built from a semi-major axis");
    }
    if ((e < 1.0 && a <= 0.0) || (e > 1.0 && a >= 0.0)) {
        throw std::invalid_argument("Semi-major axis sign inconsistent with eccentricity");
    }

    const double i = elements.inc_deg * DEG_TO_RAD;
    const double raan = elements.raan_deg * DEG_TO_RAD;
    const double aop = elements.aop_deg * DEG_TO_RAD;
    const double nu = elements.ta_deg * DEG_TO_RAD;

    // Semi-latus rectum and radius
    const double p = a * (1.0 - e * e);
    const double r = p / (1.0 + e * std::cos(nu));

    // Perifocal frame
    Vector3d r_pf(r * std::cos(nu), r * std::sin(nu), 0.0);
    const double sqrt_mu_p = std::sqrt(mu / p);
    Vector3d v_pf(-sqrt_mu_p * std::sin(nu), sqrt_mu_p * (e + std::cos(nu)), 0.0);

    // Perifocal -> inertial: R3(-raan) * R1(-i) * R3(-aop)
    Matrix3d rot = (Eigen::AngleAxisd(raan, Vector3d::UnitZ())
                  * Eigen::AngleAxisd(i, Vector3d::UnitX())
                  * Eigen::AngleAxisd(aop, Vector3d::UnitZ())).toRotationMatrix();

    return CartesianState(epoch, rot * r_pf, rot * v_pf, mu);
}

double CartesianState::component(int index) const {
    if (index < 0 || index > 5) {
        throw std::out_of_range("Cartesian component index must be in [0, 5]");
    }
    return index < 3 ? position(index) : velocity(index - 3);
}

void CartesianState::set_component(int index, double value) {
    if (index < 0 || index > 5) {
        throw std::out_of_range("Cartesian component index must be in [0, 5]");
    }
    if (index < 3) {
        position(index) = value;
    } else {
        velocity(index - 3) = value;
    }
}

Vector6d CartesianState::to_vector() const {
    Vector6d state;
    state.head<3>() = position;
    state.tail<3>() = velocity;
    return state;
}

void CartesianState::set_vector(const Vector6d& state) {
    position = state.head<3>();
    velocity = state.tail<3>();
}

void CartesianState::apply_dv(const Vector3d& dv) {
    velocity += dv;
}

double CartesianState::energy() const {
    return 0.5 * velocity.squaredNorm() - mu / position.norm();
}

KeplerianElements CartesianState::to_keplerian() const {
    KeplerianElements elements;
    elements.sma_km = value(StateParameter::SMA);
    elements.ecc = value(StateParameter::Eccentricity);
    elements.inc_deg = value(StateParameter::Inclination);
    elements.raan_deg = value(StateParameter::RAAN);
    elements.aop_deg = value(StateParameter::AoP);
    elements.ta_deg = value(StateParameter::TrueAnomaly);
    return elements;
}

Matrix3d CartesianState::dcm_from_frame(LocalFrame frame) const {
    if (!is_local(frame)) {
        throw std::invalid_argument("Frame " + to_string(frame) + " is not a local frame");
    }

    Vector3d h = hvec();
    if (h.norm() < 1e-12 || position.norm() < 1e-12) {
        throw std::invalid_argument("Local frame undefined for a rectilinear state");
    }
    Vector3d h_hat = h.normalized();

    Matrix3d dcm;
    switch (frame) {
        case LocalFrame::VNC: {
            Vector3d v_hat = velocity.normalized();
            Vector3d c_hat = v_hat.cross(h_hat);
            dcm.col(0) = v_hat;
            dcm.col(1) = h_hat;
            dcm.col(2) = c_hat;
            break;
        }
        case LocalFrame::RIC: {
            Vector3d r_hat = position.normalized();
            Vector3d i_hat = h_hat.cross(r_hat);
            dcm.col(0) = r_hat;
            dcm.col(1) = i_hat;
            dcm.col(2) = h_hat;
            break;
        }
        case LocalFrame::RCN: {
            // Same triad as RIC
            Vector3d r_hat = position.normalized();
            Vector3d c_hat = h_hat.cross(r_hat);
            dcm.col(0) = r_hat;
            dcm.col(1) = c_hat;
            dcm.col(2) = h_hat;
            break;
        }
        case LocalFrame::Inertial:
            break;
    }
    return dcm;
}

double CartesianState::value(StateParameter parameter) const {
    OrbitDual dual(*this);
    if (is_b_plane(parameter)) {
        return BPlane::from_dual(dual).value_for(parameter).real();
    }
    return dual.partial_for(parameter).real();
}

void CartesianState::set_value(StateParameter parameter, double value) {
    const int index = cartesian_index(parameter);
    if (index >= 0) {
        set_component(index, value);
        return;
    }

    KeplerianElements elements = to_keplerian();
    switch (parameter) {
        case StateParameter::SMA: elements.sma_km = value; break;
        case StateParameter::Eccentricity: elements.ecc = value; break;
        case StateParameter::Inclination: elements.inc_deg = value; break;
        case StateParameter::RAAN: elements.raan_deg = value; break;
        case StateParameter::AoP: elements.aop_deg = value; break;
        case StateParameter::TrueAnomaly: elements.ta_deg = value; break;
        default:
            throw std::invalid_argument("Cannot set state parameter " + to_string(parameter));
    }
    *this = from_keplerian(elements, epoch, mu);
}

CartesianState CartesianState::operator+(const Vector6d& delta) const {
    CartesianState out = *this;
    out.position += delta.head<3>();
    out.velocity += delta.tail<3>();
    return out;
}

std::ostream& operator<<(std::ostream& os, const CartesianState& state) {
    std::ios_base::fmtflags flags = os.flags();
    os << std::fixed << std::setprecision(6)
       << "[" << state.epoch << "] position = ["
       << state.position(0) << ", " << state.position(1) << ", " << state.position(2)
       << "] km  velocity = ["
       << state.velocity(0) << ", " << state.velocity(1) << ", " << state.velocity(2)
       << "] km/s";
    os.flags(flags);
    return os;
}

} // namespace orbtarget::coordinates
