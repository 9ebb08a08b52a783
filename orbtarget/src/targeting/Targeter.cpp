/**
 * @file Targeter.cpp
 * @brief Implementation of the differential corrector
 */

#include "orbtarget/targeting/Targeter.hpp"
#include "orbtarget/math/LinearAlgebra.hpp"
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace orbtarget::targeting {

namespace {

std::vector<Variable> variables_for(std::initializer_list<Vary> components) {
    std::vector<Variable> vars;
    vars.reserve(components.size());
    for (Vary c : components) {
        vars.push_back(Variable::from(c));
    }
    return vars;
}

void print_objectives(const std::vector<Objective>& objectives, const ObjectiveAssessment& assessment) {
    for (std::size_t i = 0; i < objectives.size(); ++i) {
        const auto idx = static_cast<Eigen::Index>(i);
        std::cout << "    " << std::left << std::setw(16) << coordinates::to_string(objectives[i].parameter)
                  << std::right << std::fixed << std::setprecision(6)
                  << " achieved = " << std::setw(18) << assessment.achieved(idx)
                  << "  desired = " << std::setw(18) << objectives[i].desired_value
                  << "  scaled error = " << std::scientific << std::setprecision(3)
                  << std::setw(11) << assessment.errors(idx) << "\n";
    }
    std::cout << std::defaultfloat;
}

} // anonymous namespace

Targeter::Targeter(std::shared_ptr<const propagation::Propagator> propagator,
                   std::vector<Variable> variables,
                   std::vector<Objective> objectives,
                   const TargeterSettings& settings)
    : propagator_(std::move(propagator)),
      variables_(std::move(variables)),
      objectives_(std::move(objectives)),
      estimator_(std::make_shared<FiniteDifferenceJacobian>(settings.num_threads)),
      settings_(settings) {
    if (!propagator_) {
        throw std::invalid_argument("Targeter requires a propagator");
    }
}

Targeter Targeter::delta_v(std::shared_ptr<const propagation::Propagator> propagator,
                           std::vector<Objective> objectives,
                           const TargeterSettings& settings) {
    return Targeter(std::move(propagator),
                    variables_for({Vary::VelocityX, Vary::VelocityY, Vary::VelocityZ}),
                    std::move(objectives), settings);
}

Targeter Targeter::delta_r(std::shared_ptr<const propagation::Propagator> propagator,
                           std::vector<Objective> objectives,
                           const TargeterSettings& settings) {
    return Targeter(std::move(propagator),
                    variables_for({Vary::PositionX, Vary::PositionY, Vary::PositionZ}),
                    std::move(objectives), settings);
}

Targeter Targeter::vnc(std::shared_ptr<const propagation::Propagator> propagator,
                       std::vector<Objective> objectives,
                       const TargeterSettings& settings) {
    return in_frame(std::move(propagator), coordinates::LocalFrame::VNC, std::move(objectives), settings);
}

Targeter Targeter::in_frame(std::shared_ptr<const propagation::Propagator> propagator,
                            coordinates::LocalFrame frame,
                            std::vector<Objective> objectives,
                            const TargeterSettings& settings) {
    Targeter targeter = delta_v(std::move(propagator), std::move(objectives), settings);
    targeter.set_correction_frame(frame);
    return targeter;
}

Targeter Targeter::finite_burn(std::shared_ptr<const propagation::Propagator> propagator,
                               std::vector<Objective> objectives,
                               const TargeterSettings& settings) {
    return Targeter(std::move(propagator),
                    variables_for({Vary::MnvrAlpha, Vary::MnvrAlphaDot, Vary::MnvrAlphaDDot,
                                   Vary::MnvrBeta, Vary::MnvrBetaDot, Vary::MnvrBetaDDot,
                                   Vary::StartEpoch, Vary::Duration}),
                    std::move(objectives), settings);
}

void Targeter::set_jacobian_estimator(std::shared_ptr<JacobianEstimator> estimator) {
    if (!estimator) {
        throw std::invalid_argument("Jacobian estimator must not be null");
    }
    estimator_ = std::move(estimator);
}

TargeterSolution Targeter::run(const dynamics::Spacecraft& initial,
                               const time::Epoch& correction_epoch,
                               const time::Epoch& achievement_epoch) const {
    return run_impl(initial, correction_epoch, achievement_epoch, correction_frame_);
}

TargeterSolution Targeter::run(const dynamics::Spacecraft& initial,
                               const time::Epoch& correction_epoch,
                               const time::Epoch& achievement_epoch,
                               coordinates::LocalFrame correction_frame) const {
    return run_impl(initial, correction_epoch, achievement_epoch, correction_frame);
}

TargetingProblem Targeter::validate(const dynamics::Spacecraft& initial,
                                    const time::Epoch& correction_epoch,
                                    const time::Epoch& achievement_epoch,
                                    const std::optional<coordinates::LocalFrame>& frame) const {
    if (objectives_.empty()) {
        throw TargetingError(TargetingErrorKind::UnderdeterminedProblem, "no objectives to achieve");
    }
    for (const auto& obj : objectives_) {
        if (!(obj.tolerance > 0.0)) {
            throw std::invalid_argument("Objective tolerance must be positive (" +
                                        coordinates::to_string(obj.parameter) + ")");
        }
    }
    if (variables_.empty()) {
        throw TargetingError(TargetingErrorKind::InvalidVariable, "no variables to adjust");
    }
    if (frame && !coordinates::is_local(*frame)) {
        throw TargetingError(TargetingErrorKind::FrameError,
                             coordinates::to_string(*frame) + " is not a local correction frame");
    }

    TargetingProblem problem;
    problem.variables = variables_;
    problem.objectives = objectives_;
    problem.correction_frame = frame;
    problem.correction_epoch = correction_epoch;
    problem.achievement_epoch = achievement_epoch;
    problem.epoch_noop_threshold_s = settings_.epoch_noop_threshold_s;

    for (const auto& var : variables_) {
        var.validate();
        if (frame && is_position(var.component)) {
            throw TargetingError(TargetingErrorKind::InvalidVariable,
                                 "variable " + to_string(var.component) + " is in frame " +
                                 coordinates::to_string(*frame) +
                                 " but that frame cannot be used for a position correction");
        }
        if (is_finite_burn(var.component)) {
            if (!initial.has_thruster()) {
                throw TargetingError(TargetingErrorKind::NoThrusterAvailable,
                                     "variable " + to_string(var.component) +
                                     " targets a finite burn but the spacecraft has no thruster");
            }
            problem.finite_burn = true;
        }
    }
    return problem;
}

TargeterSolution Targeter::run_impl(const dynamics::Spacecraft& initial,
                                    const time::Epoch& correction_epoch,
                                    const time::Epoch& achievement_epoch,
                                    const std::optional<coordinates::LocalFrame>& frame) const {
    const TargetingProblem problem = validate(initial, correction_epoch, achievement_epoch, frame);
    const auto n_var = static_cast<Eigen::Index>(problem.variables.size());

    // Validated: propagate to the epoch where the correction applies
    const dynamics::Spacecraft xi_start = propagator_->clone()->propagate(initial, correction_epoch);

    TrialState trial{xi_start, default_maneuver(correction_epoch)};

    Eigen::VectorXd total_correction = trial.apply_initial_guesses(problem);

    if (settings_.verbose && problem.finite_burn) {
        std::cout << "Targeter -- initial maneuver guess: " << trial.maneuver << "\n";
    }

    double prev_err_norm = std::numeric_limits<double>::infinity();
    const auto start_time = std::chrono::steady_clock::now();

    for (int it = 0; it <= settings_.max_iterations; ++it) {
        if (settings_.verbose && problem.finite_burn) {
            std::cout << "Targeter -- #" << it << " " << trial.maneuver << "\n";
        }

        std::unique_ptr<propagation::Propagator> propagator = propagator_->clone();
        const dynamics::Spacecraft xf = trial.propagate(problem, *propagator);
        const ObjectiveAssessment assessment = assess(problem.objectives, xf.orbit);

        if (assessment.converged) {
            TargeterSolution sol;
            sol.corrected_state = xi_start;
            apply_state_corrections(problem, total_correction, sol.corrected_state);
            sol.achieved_state = xf;
            sol.variables = problem.variables;
            sol.objectives = problem.objectives;
            sol.correction = total_correction;
            sol.achieved_values = assessment.achieved;
            sol.achieved_errors = assessment.errors;
            sol.iterations = it;
            sol.computation_time_s =
                std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
            sol.correction_frame = problem.correction_frame;
            if (problem.finite_burn) {
                sol.maneuver = trial.maneuver;
            }

            if (settings_.verbose) {
                std::cout << "Targeter -- CONVERGED in " << it
                          << (it == 1 ? " iteration" : " iterations") << "\n";
                print_objectives(problem.objectives, assessment);
            }
            return sol;
        }

        const double err_norm = assessment.errors.norm();
        if (std::abs(err_norm - prev_err_norm) < settings_.stagnation_threshold) {
            if (settings_.verbose) {
                std::cerr << "Targeter -- error norm stagnated at " << err_norm
                          << " after " << it << " iterations\n";
            }
            throw TargetingError(TargetingErrorKind::CorrectionIneffective,
                                 "no change in objective errors (norm " + std::to_string(err_norm) + ")");
        }
        prev_err_norm = err_norm;

        if (it == settings_.max_iterations) {
            break;
        }

        const Eigen::MatrixXd jac = estimator_->estimate(
            JacobianRequest{problem, trial, assessment, *propagator_});

        auto jac_inv = math::pseudo_inverse(jac);
        if (!jac_inv) {
            throw TargetingError(TargetingErrorKind::SingularJacobian,
                                 "pseudo-inverse of the " + std::to_string(jac.rows()) + "x" +
                                 std::to_string(jac.cols()) + " Jacobian failed");
        }

        Eigen::VectorXd delta = (*jac_inv) * assessment.errors;
        for (Eigen::Index i = 0; i < n_var; ++i) {
            delta(i) = problem.variables[static_cast<std::size_t>(i)].clamp(delta(i));
        }

        total_correction += trial.apply(problem, delta);

        if (settings_.verbose) {
            std::cout << "Targeter -- Iteration #" << it << " -- " << achievement_epoch << "\n";
            print_objectives(problem.objectives, assessment);
            for (Eigen::Index i = 0; i < n_var; ++i) {
                std::cout << "    correction " << std::left << std::setw(14)
                          << to_string(problem.variables[static_cast<std::size_t>(i)].component)
                          << std::right;
                if (problem.correction_frame) {
                    std::cout << " in " << coordinates::to_string(*problem.correction_frame);
                }
                std::cout << " = " << std::scientific << std::setprecision(6) << delta(i)
                          << std::defaultfloat << "\n";
            }
        }
    }

    if (settings_.verbose) {
        std::cerr << "Targeter -- FAILED after " << settings_.max_iterations
                  << " iterations, error norm " << prev_err_norm << "\n";
    }
    throw TargetingError::max_iterations(settings_.max_iterations, prev_err_norm);
}

std::ostream& operator<<(std::ostream& os, const Targeter& targeter) {
    os << "Targeter (" << targeter.jacobian_estimator().name() << " Jacobian";
    if (targeter.correction_frame()) {
        os << ", corrections in " << coordinates::to_string(*targeter.correction_frame());
    }
    os << ")\n";
    for (const auto& obj : targeter.objectives()) {
        os << "  objective " << obj << "\n";
    }
    for (const auto& var : targeter.variables()) {
        os << "  variable  " << var << "\n";
    }
    return os;
}

} // namespace orbtarget::targeting
