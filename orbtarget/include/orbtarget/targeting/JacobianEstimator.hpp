/**
 * @file JacobianEstimator.hpp
 * @brief Sensitivity of the objectives to the variables
 */

#ifndef ORBTARGET_TARGETING_JACOBIAN_ESTIMATOR_HPP
#define ORBTARGET_TARGETING_JACOBIAN_ESTIMATOR_HPP

#include "orbtarget/core/WorkerPool.hpp"
#include "orbtarget/targeting/TargetingProblem.hpp"
#include <Eigen/Dense>
#include <memory>
#include <string>

namespace orbtarget::targeting {

/**
 * @brief Read-only snapshot of one corrector iteration
 */
struct JacobianRequest {
    const TargetingProblem& problem;
    const TrialState& trial;                       ///< Current state and maneuver at the correction epoch
    const ObjectiveAssessment& baseline;           ///< Unperturbed achieved values
    const propagation::Propagator& propagator;     ///< Prototype; cloned for every trial
};

class JacobianEstimator {
public:
    virtual ~JacobianEstimator() = default;

    /**
     * @brief Objectives x variables sensitivity matrix
     * @throws PropagationError if a trial propagation fails
     */
    virtual Eigen::MatrixXd estimate(const JacobianRequest& request) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Finite differences over independent perturbation trials
 *
 * Each variable is perturbed by its configured perturbation on a clone of
 * the trial state and maneuver, propagated with its own propagator clone,
 * and compared with the baseline:
 *
 *   J(i, j) = (achieved_i(perturbed_j) - achieved_i) / perturbation_j
 *
 * Trials run concurrently on a worker pool and are all joined before the
 * matrix is returned. A failing trial aborts the estimate with its exception.
 */
class FiniteDifferenceJacobian : public JacobianEstimator {
public:
    /// @param num_threads Worker threads (0 = hardware concurrency)
    explicit FiniteDifferenceJacobian(std::size_t num_threads = 0);

    Eigen::MatrixXd estimate(const JacobianRequest& request) override;

    std::string name() const override { return "FiniteDifference"; }

private:
    WorkerPool pool_;
};

/**
 * @brief Dual-number partials chained with the state transition matrix
 *
 *   J = d(objective)/d(x_f) * Phi(t_f, t_c) * d(x_c)/d(variable)
 *
 * Only valid for coast targets whose variables are all state components,
 * and only with propagators that provide an STM.
 */
class AnalyticJacobian : public JacobianEstimator {
public:
    /**
     * @throws TargetingError (InvalidVariable) for maneuver variables
     * @throws std::logic_error if the propagator has no STM
     */
    Eigen::MatrixXd estimate(const JacobianRequest& request) override;

    std::string name() const override { return "Analytic"; }
};

} // namespace orbtarget::targeting

#endif // ORBTARGET_TARGETING_JACOBIAN_ESTIMATOR_HPP
