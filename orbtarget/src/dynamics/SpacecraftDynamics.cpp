/**
 * @file SpacecraftDynamics.cpp
 */

#include "orbtarget/dynamics/SpacecraftDynamics.hpp"
#include "orbtarget/propagation/PropagationError.hpp"
#include <stdexcept>

namespace orbtarget::dynamics {

SpacecraftDynamics::SpacecraftDynamics(ForceModelList force_models)
    : force_models_(std::move(force_models)) {
    for (const auto& model : force_models_) {
        if (!model) {
            throw std::invalid_argument("Null force model in dynamics configuration");
        }
    }
}

SpacecraftDynamics SpacecraftDynamics::two_body(double mu) {
    return SpacecraftDynamics({std::make_shared<PointMassGravity>(mu)});
}

SpacecraftDynamics SpacecraftDynamics::with_control(std::shared_ptr<const Maneuver> maneuver) const {
    SpacecraftDynamics out = *this;
    out.control_ = std::move(maneuver);
    return out;
}

SpacecraftDynamics SpacecraftDynamics::without_control() const {
    SpacecraftDynamics out = *this;
    out.control_.reset();
    return out;
}

bool SpacecraftDynamics::is_thrusting(const Spacecraft& spacecraft, const time::Epoch& epoch) const {
    return control_ && spacecraft.thruster && spacecraft.mode == GuidanceMode::Thrust &&
           control_->is_active(epoch);
}

Vector3d SpacecraftDynamics::gravity_acceleration(const time::Epoch& epoch,
                                                  const Vector3d& position,
                                                  const Vector3d& velocity) const {
    Vector3d acc = Vector3d::Zero();
    for (const auto& model : force_models_) {
        acc += model->acceleration(epoch, position, velocity);
    }
    return acc;
}

Matrix3d SpacecraftDynamics::gravity_gradient(const time::Epoch& epoch,
                                              const Vector3d& position,
                                              const Vector3d& velocity) const {
    Matrix3d grad = Matrix3d::Zero();
    for (const auto& model : force_models_) {
        grad += model->gradient(epoch, position, velocity);
    }
    return grad;
}

Vector7d SpacecraftDynamics::derivatives(const time::Epoch& epoch, const Vector7d& state,
                                         const Spacecraft& spacecraft) const {
    const Vector3d position = state.head<3>();
    const Vector3d velocity = state.segment<3>(3);

    Vector7d dy = Vector7d::Zero();
    dy.head<3>() = velocity;
    dy.segment<3>(3) = gravity_acceleration(epoch, position, velocity);

    if (is_thrusting(spacecraft, epoch) && control_->thrust_level > 0.0) {
        const double fuel = state(6);
        if (fuel <= 0.0) {
            throw propagation::PropagationError("fuel exhausted at " + epoch.to_string());
        }
        const Thruster& thruster = *spacecraft.thruster;
        const double mass = spacecraft.dry_mass_kg + fuel;
        const double thrust = control_->thrust_level * thruster.thrust_N;

        coordinates::CartesianState osc(epoch, position, velocity, spacecraft.orbit.mu);
        Vector3d u = control_->inertial_direction(osc);

        // N / kg = m/s², convert to km/s²
        dy.segment<3>(3) += (thrust / mass) * 1e-3 * u;
        dy(6) = -thrust / thruster.exhaust_velocity();
    }

    return dy;
}

} // namespace orbtarget::dynamics
