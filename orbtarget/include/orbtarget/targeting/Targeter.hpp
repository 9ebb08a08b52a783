/**
 * @file Targeter.hpp
 * @brief Differential corrector driving a propagator to satisfy terminal objectives
 *
 * Newton iteration on the variables:
 *
 *   1. Validate the problem (no propagation happens before this passes)
 *   2. Propagate the initial state to the correction epoch and apply the
 *      initial guesses
 *   3. Propagate to the achievement epoch and assess the objectives
 *   4. If every |error| <= tolerance, return the solution
 *   5. Stop if the error norm no longer changes
 *   6. Estimate the Jacobian, solve delta = pinv(J) * error, clamp each
 *      component to its step limit then its bounds, apply and repeat
 */

#ifndef ORBTARGET_TARGETING_TARGETER_HPP
#define ORBTARGET_TARGETING_TARGETER_HPP

#include "orbtarget/propagation/Propagator.hpp"
#include "orbtarget/targeting/JacobianEstimator.hpp"
#include "orbtarget/targeting/Objective.hpp"
#include "orbtarget/targeting/TargeterSolution.hpp"
#include "orbtarget/targeting/TargetingError.hpp"
#include "orbtarget/targeting/Variable.hpp"
#include <memory>
#include <optional>
#include <ostream>
#include <vector>

namespace orbtarget::targeting {

/**
 * @brief Settings for the differential corrector
 */
struct TargeterSettings {
    int max_iterations = 25;                ///< Corrections allowed before giving up
    double stagnation_threshold = 1e-10;    ///< Minimum change of the error norm between iterations
    double epoch_noop_threshold_s = 1e-3;   ///< Epoch changes below this are ignored [s]
    std::size_t num_threads = 0;            ///< Perturbation workers (0 = hardware concurrency)
    bool verbose = false;                   ///< Print iteration progress
};

class Targeter {
public:
    /**
     * @param propagator Prototype propagator, cloned for every propagation
     * @param variables Free parameters
     * @param objectives Terminal conditions
     * @param settings Corrector settings
     */
    Targeter(std::shared_ptr<const propagation::Propagator> propagator,
             std::vector<Variable> variables,
             std::vector<Objective> objectives,
             const TargeterSettings& settings = TargeterSettings());

    /// Inertial velocity change (VelocityX, VelocityY, VelocityZ)
    static Targeter delta_v(std::shared_ptr<const propagation::Propagator> propagator,
                            std::vector<Objective> objectives,
                            const TargeterSettings& settings = TargeterSettings());

    /// Inertial position change (PositionX, PositionY, PositionZ)
    static Targeter delta_r(std::shared_ptr<const propagation::Propagator> propagator,
                            std::vector<Objective> objectives,
                            const TargeterSettings& settings = TargeterSettings());

    /// Velocity change expressed in the VNC frame
    static Targeter vnc(std::shared_ptr<const propagation::Propagator> propagator,
                        std::vector<Objective> objectives,
                        const TargeterSettings& settings = TargeterSettings());

    /// Velocity change expressed in a local frame
    static Targeter in_frame(std::shared_ptr<const propagation::Propagator> propagator,
                             coordinates::LocalFrame frame,
                             std::vector<Objective> objectives,
                             const TargeterSettings& settings = TargeterSettings());

    /// Finite burn: steering coefficients, start epoch and duration
    static Targeter finite_burn(std::shared_ptr<const propagation::Propagator> propagator,
                                std::vector<Objective> objectives,
                                const TargeterSettings& settings = TargeterSettings());

    /**
     * @brief Correct @p initial so that the objectives hold at @p achievement_epoch
     *
     * @param initial Spacecraft state (any epoch; propagated to the correction epoch)
     * @param correction_epoch Epoch at which state corrections are applied
     * @param achievement_epoch Epoch at which the objectives are evaluated
     * @throws TargetingError for every targeting failure
     * @throws propagation::PropagationError if a propagation fails
     */
    TargeterSolution run(const dynamics::Spacecraft& initial,
                         const time::Epoch& correction_epoch,
                         const time::Epoch& achievement_epoch) const;

    /// Same, with the state variables expressed in @p correction_frame
    TargeterSolution run(const dynamics::Spacecraft& initial,
                         const time::Epoch& correction_epoch,
                         const time::Epoch& achievement_epoch,
                         coordinates::LocalFrame correction_frame) const;

    void set_correction_frame(coordinates::LocalFrame frame) { correction_frame_ = frame; }
    void clear_correction_frame() { correction_frame_.reset(); }
    const std::optional<coordinates::LocalFrame>& correction_frame() const { return correction_frame_; }

    /// Replace the sensitivity strategy (finite differences by default)
    void set_jacobian_estimator(std::shared_ptr<JacobianEstimator> estimator);
    const JacobianEstimator& jacobian_estimator() const { return *estimator_; }

    const std::vector<Variable>& variables() const { return variables_; }
    const std::vector<Objective>& objectives() const { return objectives_; }
    const TargeterSettings& settings() const { return settings_; }
    TargeterSettings& settings() { return settings_; }

private:
    TargeterSolution run_impl(const dynamics::Spacecraft& initial,
                              const time::Epoch& correction_epoch,
                              const time::Epoch& achievement_epoch,
                              const std::optional<coordinates::LocalFrame>& frame) const;

    /// All checks that must pass before the first propagation
    TargetingProblem validate(const dynamics::Spacecraft& initial,
                              const time::Epoch& correction_epoch,
                              const time::Epoch& achievement_epoch,
                              const std::optional<coordinates::LocalFrame>& frame) const;

    std::shared_ptr<const propagation::Propagator> propagator_;
    std::vector<Variable> variables_;
    std::vector<Objective> objectives_;
    std::optional<coordinates::LocalFrame> correction_frame_;
    std::shared_ptr<JacobianEstimator> estimator_;
    TargeterSettings settings_;
};

std::ostream& operator<<(std::ostream& os, const Targeter& targeter);

} // namespace orbtarget::targeting

#endif // ORBTARGET_TARGETING_TARGETER_HPP
