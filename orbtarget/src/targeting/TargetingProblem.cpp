/**
 * @file TargetingProblem.cpp
 * @brief Variable application rules and the trial propagation procedure
 */

#include "orbtarget/targeting/TargetingProblem.hpp"
#include "orbtarget/targeting/TargetingError.hpp"
#include <cmath>
#include <memory>
#include <stdexcept>

namespace orbtarget::targeting {

namespace {

/// Sum of the state-variable entries of @p deltas, by Cartesian index
Vector6d gather_state_delta(const TargetingProblem& problem, const Eigen::VectorXd& deltas,
                            bool& any_state) {
    Vector6d dx = Vector6d::Zero();
    any_state = false;
    for (std::size_t i = 0; i < problem.variables.size(); ++i) {
        const Vary c = problem.variables[i].component;
        if (is_state(c)) {
            dx(info(c).index) += deltas(static_cast<Eigen::Index>(i));
            any_state = true;
        }
    }
    return dx;
}

void apply_state_vector(const TargetingProblem& problem, const Vector6d& dx,
                        dynamics::Spacecraft& spacecraft) {
    if (!problem.correction_frame) {
        spacecraft.orbit = spacecraft.orbit + dx;
        return;
    }

    Matrix3d dcm;
    try {
        dcm = spacecraft.orbit.dcm_from_frame(*problem.correction_frame);
    } catch (const std::invalid_argument& e) {
        throw TargetingError(TargetingErrorKind::FrameError, e.what());
    }
    spacecraft.orbit.apply_dv(dcm * dx.tail<3>());
}

/// @return The change actually made to the maneuver
double apply_maneuver_change(const TargetingProblem& problem, Vary component, double delta,
                             dynamics::Maneuver& maneuver) {
    const VaryInfo& vi = info(component);
    switch (vi.target) {
        case VariableTarget::BurnTiming: {
            if (std::abs(delta) < problem.epoch_noop_threshold_s) {
                return 0.0;
            }
            const double duration = maneuver.duration();
            if (component == Vary::StartEpoch) {
                maneuver.start += delta;
                maneuver.set_duration(duration);
                return delta;
            }
            // EndEpoch and Duration both move the end; the end is always start + duration
            maneuver.set_duration(duration + delta);
            return maneuver.duration() - duration;
        }
        case VariableTarget::SteeringAlpha:
            maneuver.alpha = maneuver.alpha.add_val_in_order(delta, vi.index);
            return delta;
        case VariableTarget::SteeringBeta:
            maneuver.beta = maneuver.beta.add_val_in_order(delta, vi.index);
            return delta;
        case VariableTarget::StatePosition:
        case VariableTarget::StateVelocity:
            break;
    }
    return 0.0;
}

} // anonymous namespace

ObjectiveAssessment assess(const std::vector<Objective>& objectives,
                           const coordinates::CartesianState& final_state) {
    const std::vector<math::Dual> partials = evaluate_partials(objectives, final_state);

    ObjectiveAssessment out;
    const auto n = static_cast<Eigen::Index>(objectives.size());
    out.achieved.resize(n);
    out.errors.resize(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const Objective& obj = objectives[static_cast<std::size_t>(i)];
        const double raw = partials[static_cast<std::size_t>(i)].real();
        auto [ok, error] = obj.assess_raw(raw);
        out.achieved(i) = obj.scaled(raw);
        out.errors(i) = error;
        if (!ok) {
            out.converged = false;
        }
    }
    return out;
}

Eigen::VectorXd TrialState::apply(const TargetingProblem& problem, const Eigen::VectorXd& deltas) {
    Eigen::VectorXd applied = deltas;
    for (std::size_t i = 0; i < problem.variables.size(); ++i) {
        const Vary c = problem.variables[i].component;
        if (is_finite_burn(c)) {
            const auto idx = static_cast<Eigen::Index>(i);
            applied(idx) = apply_maneuver_change(problem, c, deltas(idx), maneuver);
        }
    }

    bool any_state = false;
    Vector6d dx = gather_state_delta(problem, deltas, any_state);
    if (any_state) {
        apply_state_vector(problem, dx, state);
    }
    return applied;
}

Eigen::VectorXd TrialState::apply_initial_guesses(const TargetingProblem& problem) {
    const auto n = static_cast<Eigen::Index>(problem.variables.size());

    // Duration first, so an EndEpoch guess extends the guessed duration
    Eigen::VectorXd offsets(n);
    Eigen::VectorXd durations = Eigen::VectorXd::Zero(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const Variable& var = problem.variables[static_cast<std::size_t>(i)];
        if (var.component == Vary::Duration) {
            maneuver.set_duration(var.initial_guess);
            durations(i) = maneuver.duration();
            offsets(i) = 0.0;
        } else {
            offsets(i) = var.initial_guess;
        }
    }

    Eigen::VectorXd applied = apply(problem, offsets);
    for (Eigen::Index i = 0; i < n; ++i) {
        if (problem.variables[static_cast<std::size_t>(i)].component == Vary::Duration) {
            applied(i) = durations(i);
        }
    }
    return applied;
}

void TrialState::apply_one(const TargetingProblem& problem, std::size_t index, double delta) {
    Eigen::VectorXd deltas = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(problem.variables.size()));
    deltas(static_cast<Eigen::Index>(index)) = delta;
    apply(problem, deltas);
}

dynamics::Spacecraft TrialState::propagate(const TargetingProblem& problem,
                                           propagation::Propagator& propagator) const {
    if (!problem.finite_burn) {
        return propagator.propagate(state, problem.achievement_epoch);
    }

    const dynamics::SpacecraftDynamics coast = propagator.dynamics();

    dynamics::Spacecraft pre_burn =
        propagator.propagate(state.with_guidance_mode(dynamics::GuidanceMode::Coast), maneuver.start);

    propagator.set_dynamics(coast.with_control(std::make_shared<const dynamics::Maneuver>(maneuver)));
    dynamics::Spacecraft post_burn = pre_burn;
    const double duration = maneuver.duration();
    if (duration > 0.0) {
        // No single step may straddle ignition or cutoff
        propagation::ScopedMaxStep clamp(propagator, duration);
        post_burn = propagator.propagate(pre_burn.with_guidance_mode(dynamics::GuidanceMode::Thrust),
                                         maneuver.end);
    }
    propagator.set_dynamics(coast);

    return propagator.propagate(post_burn.with_guidance_mode(dynamics::GuidanceMode::Coast),
                                problem.achievement_epoch);
}

void apply_state_corrections(const TargetingProblem& problem, const Eigen::VectorXd& deltas,
                             dynamics::Spacecraft& spacecraft) {
    bool any_state = false;
    Vector6d dx = gather_state_delta(problem, deltas, any_state);
    if (any_state) {
        apply_state_vector(problem, dx, spacecraft);
    }
}

dynamics::Maneuver default_maneuver(const time::Epoch& correction_epoch) {
    return dynamics::Maneuver(correction_epoch, correction_epoch + DEFAULT_BURN_DURATION_S, 1.0,
                              dynamics::QuadraticPolynomial(), dynamics::QuadraticPolynomial(),
                              coordinates::LocalFrame::RCN);
}

} // namespace orbtarget::targeting
