/**
 * @file CowellPropagator.cpp
 * @brief Implementation of the Cowell propagator and its variational equations
 */

#include "orbtarget/propagation/CowellPropagator.hpp"
#include <stdexcept>

namespace orbtarget::propagation {

CowellPropagator::CowellPropagator(dynamics::SpacecraftDynamics dynamics,
                                   const PropagatorOptions& options,
                                   std::unique_ptr<Integrator> integrator)
    : Propagator(std::move(dynamics), options),
      integrator_(integrator ? std::move(integrator) : std::make_unique<RKF78Integrator>()) {}

CowellPropagator::CowellPropagator(const CowellPropagator& other)
    : Propagator(other.dynamics_, other.options_),
      integrator_(other.integrator_->clone()) {}

CowellPropagator& CowellPropagator::operator=(const CowellPropagator& other) {
    if (this != &other) {
        dynamics_ = other.dynamics_;
        options_ = other.options_;
        integrator_ = other.integrator_->clone();
    }
    return *this;
}

std::unique_ptr<Propagator> CowellPropagator::clone() const {
    return std::make_unique<CowellPropagator>(*this);
}

dynamics::Spacecraft CowellPropagator::propagate(const dynamics::Spacecraft& state,
                                                 const time::Epoch& until) {
    return run(state, until, nullptr);
}

dynamics::Spacecraft CowellPropagator::propagate(const dynamics::Spacecraft& state,
                                                 const time::Epoch& until,
                                                 Trajectory& trajectory) {
    return run(state, until, &trajectory);
}

dynamics::Spacecraft CowellPropagator::run(const dynamics::Spacecraft& state,
                                           const time::Epoch& until,
                                           Trajectory* trajectory) {
    const time::Epoch epoch0 = state.epoch();
    const double tf = until - epoch0;

    // Copy the dynamics so the derivative function stays valid if the caller
    // swaps configurations while integrating
    const dynamics::SpacecraftDynamics dyn = dynamics_;

    DerivativeFunction f = [&dyn, &state, epoch0](double t, const Eigen::VectorXd& y) {
        Vector7d y7 = y;
        Vector7d dy = dyn.derivatives(epoch0 + t, y7, state);
        return Eigen::VectorXd(dy);
    };

    StepObserver observer;
    if (trajectory) {
        observer = [trajectory, &state, epoch0](double t, const Eigen::VectorXd& y,
                                                const Eigen::VectorXd& dy) {
            dynamics::Spacecraft sample = state;
            sample.set_vector(epoch0 + t, Vector7d(y));
            trajectory->add(sample, Vector7d(dy));
        };
    }

    Eigen::VectorXd y0 = state.to_vector();
    Eigen::VectorXd yf = integrator_->integrate(f, y0, 0.0, tf, options_, observer);

    dynamics::Spacecraft final_state = state;
    final_state.set_vector(until, Vector7d(yf));
    return final_state;
}

StmResult CowellPropagator::propagate_with_stm(const dynamics::Spacecraft& state,
                                               const time::Epoch& until) {
    const dynamics::SpacecraftDynamics dyn = dynamics_;
    if (dyn.control() && state.thruster && state.mode == dynamics::GuidanceMode::Thrust) {
        throw std::logic_error("State transition matrix is only available on coast arcs");
    }

    const time::Epoch epoch0 = state.epoch();
    const double tf = until - epoch0;

    // [r, v, Phi (column-major 6x6)]
    DerivativeFunction f = [&dyn, epoch0](double t, const Eigen::VectorXd& y) {
        const time::Epoch epoch = epoch0 + t;
        const Vector3d r = y.segment<3>(0);
        const Vector3d v = y.segment<3>(3);

        Eigen::VectorXd dy(42);
        dy.segment<3>(0) = v;
        dy.segment<3>(3) = dyn.gravity_acceleration(epoch, r, v);

        Matrix6d a = Matrix6d::Zero();
        a.block<3, 3>(0, 3) = Matrix3d::Identity();
        a.block<3, 3>(3, 0) = dyn.gravity_gradient(epoch, r, v);

        Eigen::Map<const Matrix6d> phi(y.data() + 6);
        Eigen::Map<Matrix6d> dphi(dy.data() + 6);
        dphi = a * phi;
        return dy;
    };

    Eigen::VectorXd y0(42);
    y0.head<6>() = state.orbit.to_vector();
    Eigen::Map<Matrix6d>(y0.data() + 6) = Matrix6d::Identity();

    Eigen::VectorXd yf = integrator_->integrate(f, y0, 0.0, tf, options_);

    StmResult result;
    result.state = state;
    result.state.orbit.epoch = until;
    result.state.orbit.set_vector(yf.head<6>());
    result.stm = Eigen::Map<const Matrix6d>(yf.data() + 6);
    return result;
}

} // namespace orbtarget::propagation
