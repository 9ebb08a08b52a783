/**
 * @file TargetingProblem.hpp
 * @brief Shared definition of a targeting run and the state of one trial
 *
 * The same rules are used to apply an initial guess, a finite-difference
 * perturbation and a Newton correction, and the same three-phase procedure
 * propagates every trial to the achievement epoch.
 */

#ifndef ORBTARGET_TARGETING_TARGETING_PROBLEM_HPP
#define ORBTARGET_TARGETING_TARGETING_PROBLEM_HPP

#include "orbtarget/dynamics/Maneuver.hpp"
#include "orbtarget/dynamics/Spacecraft.hpp"
#include "orbtarget/propagation/Propagator.hpp"
#include "orbtarget/targeting/Objective.hpp"
#include "orbtarget/targeting/Variable.hpp"
#include <Eigen/Dense>
#include <optional>
#include <vector>

namespace orbtarget::targeting {

/**
 * @brief Read-only description of one run
 */
struct TargetingProblem {
    std::vector<Variable> variables;
    std::vector<Objective> objectives;
    std::optional<coordinates::LocalFrame> correction_frame;
    time::Epoch correction_epoch;
    time::Epoch achievement_epoch;
    bool finite_burn = false;               ///< Any variable acts on the maneuver
    double epoch_noop_threshold_s = 1e-3;   ///< Smaller epoch changes are ignored
};

/**
 * @brief Achieved values and errors of all objectives for one terminal state
 */
struct ObjectiveAssessment {
    Eigen::VectorXd achieved;   ///< Scaled achieved values
    Eigen::VectorXd errors;     ///< desired - achieved (wrapped for angles)
    bool converged = true;
};

ObjectiveAssessment assess(const std::vector<Objective>& objectives,
                           const coordinates::CartesianState& final_state);

/**
 * @brief Spacecraft at the correction epoch plus the maneuver being shaped
 *
 * Each trial owns its copy; trials never share mutable state.
 */
struct TrialState {
    dynamics::Spacecraft state;
    dynamics::Maneuver maneuver;

    /**
     * @brief Apply one change per variable
     *
     * Maneuver variables edit the window or a steering coefficient. State
     * variables are gathered into one 6-vector applied once: rotated from the
     * correction frame into an inertial velocity change when a frame is set,
     * added to the Cartesian components otherwise.
     *
     * @return The changes actually made: timing changes below the no-op
     *         threshold count as zero and a duration floored at zero counts
     *         only the part that was flown
     * @throws TargetingError (FrameError) if the frame rotation is undefined
     */
    Eigen::VectorXd apply(const TargetingProblem& problem, const Eigen::VectorXd& deltas);

    /**
     * @brief Apply the initial guesses of all variables
     *
     * Same as apply() except for Duration, whose guess is the burn duration
     * itself rather than a change to it.
     *
     * @return The corrections as applied, with the Duration entry holding the
     *         resulting duration
     */
    Eigen::VectorXd apply_initial_guesses(const TargetingProblem& problem);

    /// Apply @p delta to variable @p index only
    void apply_one(const TargetingProblem& problem, std::size_t index, double delta);

    /**
     * @brief Propagate to the achievement epoch
     *
     * Coast targets propagate in one arc. Finite-burn targets coast to the
     * maneuver start, thrust across the window with the maximum step clamped
     * to the burn duration, then coast to the achievement epoch.
     *
     * @param propagator Trial-local propagator (its dynamics are changed)
     */
    dynamics::Spacecraft propagate(const TargetingProblem& problem,
                                   propagation::Propagator& propagator) const;
};

/**
 * @brief Apply the state part of @p deltas to @p spacecraft
 *
 * Used for the corrected initial state, which uses the same rule as trials.
 */
void apply_state_corrections(const TargetingProblem& problem, const Eigen::VectorXd& deltas,
                             dynamics::Spacecraft& spacecraft);

/// Default maneuver: starts at the correction epoch, DEFAULT_BURN_DURATION_S at full thrust, zero steering, RCN
dynamics::Maneuver default_maneuver(const time::Epoch& correction_epoch);

} // namespace orbtarget::targeting

#endif // ORBTARGET_TARGETING_TARGETING_PROBLEM_HPP
