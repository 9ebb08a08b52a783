/**
 * @file JacobianEstimator.cpp
 * @brief Finite-difference and analytic sensitivity strategies
 */

#include "orbtarget/targeting/JacobianEstimator.hpp"
#include "orbtarget/targeting/TargetingError.hpp"
#include <stdexcept>

namespace orbtarget::targeting {

// ============================================================================
// FiniteDifferenceJacobian
// ============================================================================

FiniteDifferenceJacobian::FiniteDifferenceJacobian(std::size_t num_threads)
    : pool_(num_threads) {}

Eigen::MatrixXd FiniteDifferenceJacobian::estimate(const JacobianRequest& request) {
    const TargetingProblem& problem = request.problem;
    const auto n_obj = static_cast<Eigen::Index>(problem.objectives.size());
    const auto n_var = static_cast<Eigen::Index>(problem.variables.size());

    Eigen::MatrixXd jac = Eigen::MatrixXd::Zero(n_obj, n_var);

    // Each trial writes only its own column
    pool_.parallel_for(problem.variables.size(), [&](std::size_t j) {
        const Variable& var = problem.variables[j];

        TrialState trial = request.trial;
        trial.apply_one(problem, j, var.perturbation);

        std::unique_ptr<propagation::Propagator> propagator = request.propagator.clone();
        dynamics::Spacecraft final_state = trial.propagate(problem, *propagator);

        const std::vector<math::Dual> partials = evaluate_partials(problem.objectives, final_state.orbit);
        for (Eigen::Index i = 0; i < n_obj; ++i) {
            const Objective& obj = problem.objectives[static_cast<std::size_t>(i)];
            const double perturbed = obj.scaled(partials[static_cast<std::size_t>(i)].real());
            jac(i, static_cast<Eigen::Index>(j)) =
                obj.difference(perturbed, request.baseline.achieved(i)) / var.perturbation;
        }
    });

    return jac;
}

// ============================================================================
// AnalyticJacobian
// ============================================================================

Eigen::MatrixXd AnalyticJacobian::estimate(const JacobianRequest& request) {
    const TargetingProblem& problem = request.problem;

    if (problem.finite_burn) {
        throw TargetingError(TargetingErrorKind::InvalidVariable,
                             "analytic Jacobian only supports state variables");
    }

    std::unique_ptr<propagation::Propagator> propagator = request.propagator.clone();
    if (!propagator->supports_stm()) {
        throw std::logic_error("Analytic Jacobian requires a propagator with a state transition matrix");
    }

    propagation::StmResult arc = propagator->propagate_with_stm(request.trial.state,
                                                                problem.achievement_epoch);
    const std::vector<math::Dual> partials = evaluate_partials(problem.objectives, arc.state.orbit);

    // d(x_c)/d(variable): unit vector, or a column of the frame rotation for
    // velocity variables expressed in a local frame
    Eigen::MatrixXd mapping = Eigen::MatrixXd::Zero(6, static_cast<Eigen::Index>(problem.variables.size()));
    Matrix3d dcm = Matrix3d::Identity();
    if (problem.correction_frame) {
        try {
            dcm = request.trial.state.orbit.dcm_from_frame(*problem.correction_frame);
        } catch (const std::invalid_argument& e) {
            throw TargetingError(TargetingErrorKind::FrameError, e.what());
        }
    }
    for (std::size_t j = 0; j < problem.variables.size(); ++j) {
        const int k = info(problem.variables[j].component).index;
        const auto col = static_cast<Eigen::Index>(j);
        if (problem.correction_frame) {
            mapping.block<3, 1>(3, col) = dcm.col(k - 3);
        } else {
            mapping(k, col) = 1.0;
        }
    }

    const auto n_obj = static_cast<Eigen::Index>(problem.objectives.size());
    Eigen::MatrixXd grad(n_obj, 6);
    for (Eigen::Index i = 0; i < n_obj; ++i) {
        const Objective& obj = problem.objectives[static_cast<std::size_t>(i)];
        grad.row(i) = obj.multiplicative_factor * partials[static_cast<std::size_t>(i)].grad();
    }

    return grad * arc.stm * mapping;
}

} // namespace orbtarget::targeting
