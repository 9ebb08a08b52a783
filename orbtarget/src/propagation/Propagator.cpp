/**
 * @file Propagator.cpp
 */

#include "orbtarget/propagation/Propagator.hpp"
#include <stdexcept>

namespace orbtarget::propagation {

Propagator::Propagator(dynamics::SpacecraftDynamics dynamics, const PropagatorOptions& options)
    : dynamics_(std::move(dynamics)), options_(options) {}

dynamics::Spacecraft Propagator::propagate(const dynamics::Spacecraft& state,
                                           const time::Epoch& until,
                                           Trajectory& trajectory) {
    dynamics::Spacecraft final_state = propagate(state, until);
    trajectory.add(state, dynamics_.derivatives(state.epoch(), state.to_vector(), state));
    trajectory.add(final_state, dynamics_.derivatives(final_state.epoch(), final_state.to_vector(), final_state));
    return final_state;
}

StmResult Propagator::propagate_with_stm(const dynamics::Spacecraft& /*state*/,
                                         const time::Epoch& /*until*/) {
    throw std::logic_error("This propagator does not provide a state transition matrix");
}

void Propagator::set_max_step(double max_step_s) {
    if (!(max_step_s > 0.0)) {
        throw std::invalid_argument("Maximum step must be positive");
    }
    options_.max_step_s = max_step_s;
}

ScopedMaxStep::ScopedMaxStep(Propagator& propagator, double max_step_s)
    : propagator_(propagator), saved_max_step_(propagator.max_step()) {
    propagator_.set_max_step(max_step_s);
}

ScopedMaxStep::~ScopedMaxStep() {
    PropagatorOptions options = propagator_.options();
    options.max_step_s = saved_max_step_;
    propagator_.set_options(options);
}

} // namespace orbtarget::propagation
