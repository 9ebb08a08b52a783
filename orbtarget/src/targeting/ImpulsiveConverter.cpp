/**
 * @file ImpulsiveConverter.cpp
 * @brief Newton iteration shaping a finite burn onto the post-impulse trajectory
 */

#include "orbtarget/targeting/ImpulsiveConverter.hpp"
#include "orbtarget/math/LinearAlgebra.hpp"
#include "orbtarget/targeting/TargetingError.hpp"
#include "orbtarget/propagation/Trajectory.hpp"
#include "orbtarget/targeting/TargetingProblem.hpp"
#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <limits>
#include <memory>
#include <stdexcept>

namespace orbtarget::targeting {

namespace {

constexpr std::array<Vary, 8> CONVERSION_VARIABLES = {
    Vary::MnvrAlpha, Vary::MnvrAlphaDot, Vary::MnvrAlphaDDot,
    Vary::MnvrBeta, Vary::MnvrBetaDot, Vary::MnvrBetaDDot,
    Vary::StartEpoch, Vary::Duration};

/// Reference arcs with and without the impulse, both spanning the padded window
struct ReferenceArcs {
    propagation::Trajectory pre;
    propagation::Trajectory post;
};

/**
 * @brief Thrust from the no-burn trajectory at the maneuver start to its end
 * @return achieved - desired at the maneuver end
 */
Vector6d burn_residual(const dynamics::Maneuver& maneuver, const ReferenceArcs& arcs,
                       propagation::Propagator& propagator,
                       const dynamics::SpacecraftDynamics& coast,
                       dynamics::Spacecraft* achieved) {
    dynamics::Spacecraft x0 = arcs.pre.at(maneuver.start);
    dynamics::Spacecraft xf = x0;

    propagator.set_dynamics(coast.with_control(std::make_shared<const dynamics::Maneuver>(maneuver)));
    const double duration = maneuver.duration();
    if (duration > 0.0) {
        propagation::ScopedMaxStep clamp(propagator, duration);
        xf = propagator.propagate(x0.with_guidance_mode(dynamics::GuidanceMode::Thrust), maneuver.end);
    }
    propagator.set_dynamics(coast);

    const dynamics::Spacecraft desired = arcs.post.at(maneuver.end);
    if (achieved) {
        *achieved = xf.with_guidance_mode(dynamics::GuidanceMode::Coast);
    }
    return xf.orbit.to_vector() - desired.orbit.to_vector();
}

} // anonymous namespace

void ImpulsiveConversion::print_summary(std::ostream& os) const {
    std::ios_base::fmtflags flags = os.flags();
    os << "\n=== Impulsive to Finite Burn ===\n";
    os << "Converged in " << iterations << (iterations == 1 ? " iteration" : " iterations")
       << " (" << std::fixed << std::setprecision(3) << computation_time_s << " s)\n";
    os << maneuver << "\n";
    os << "Errors [km, km/s]: " << std::scientific << std::setprecision(3)
       << achieved_errors.transpose() << "\n";
    os << "================================\n";
    os.flags(flags);
}

ImpulsiveConverter::ImpulsiveConverter(const ImpulsiveConversionSettings& settings)
    : settings_(settings), pool_(settings.num_threads) {}

dynamics::Maneuver ImpulsiveConverter::initial_guess(const dynamics::Spacecraft& spacecraft,
                                                     const Vector3d& dv) {
    if (!spacecraft.thruster) {
        throw TargetingError(TargetingErrorKind::NoThrusterAvailable,
                             "cannot convert an impulsive maneuver without a thruster");
    }
    const double dv_mag = dv.norm();
    if (dv_mag == 0.0) {
        throw std::invalid_argument("Cannot convert a zero velocity change");
    }

    const coordinates::CartesianState& orbit = spacecraft.orbit;
    const Vector3d u = dv / dv_mag;
    const Vector3d r = orbit.position;
    const double rmag = r.norm();
    const double ru = r.dot(u);
    const Vector3d u_ddot = (3.0 * orbit.mu / std::pow(rmag, 5)) * (ru * r - ru * ru * u);

    // Burn duration from the rocket equation (SI units on the thruster side)
    const dynamics::Thruster& thruster = *spacecraft.thruster;
    const double ve = thruster.exhaust_velocity();
    const double duration = (ve * spacecraft.mass_kg() / thruster.thrust_N) *
                            (1.0 - std::exp(-dv_mag * 1e3 / ve));

    // Steering angles and their curvature in the maneuver frame
    const coordinates::LocalFrame frame = coordinates::LocalFrame::RCN;
    const Matrix3d dcm = orbit.dcm_from_frame(frame);
    const Vector3d u_local = dcm.transpose() * u;
    const Vector3d u_ddot_local = dcm.transpose() * u_ddot;

    auto [alpha0, beta0] = dynamics::plane_angles_from_unit_vector(u_local);
    const double rho2 = u_local(0) * u_local(0) + u_local(1) * u_local(1);
    const double alpha_ddot = rho2 > 0.0
        ? (u_local(0) * u_ddot_local(1) - u_local(1) * u_ddot_local(0)) / rho2 : 0.0;
    const double beta_ddot = rho2 > 0.0 ? u_ddot_local(2) / std::sqrt(rho2) : 0.0;

    // Polynomials in time since the burn start, centered on the impulse epoch
    const double tc = 0.5 * duration;
    dynamics::QuadraticPolynomial alpha(0.5 * alpha_ddot, -alpha_ddot * tc, alpha0 + 0.5 * alpha_ddot * tc * tc);
    dynamics::QuadraticPolynomial beta(0.5 * beta_ddot, -beta_ddot * tc, beta0 + 0.5 * beta_ddot * tc * tc);

    const time::Epoch impulse_epoch = spacecraft.epoch();
    return dynamics::Maneuver(impulse_epoch - tc, impulse_epoch + tc, 1.0, alpha, beta, frame);
}

ImpulsiveConversion ImpulsiveConverter::convert(const dynamics::Spacecraft& spacecraft,
                                                const Vector3d& dv,
                                                const propagation::Propagator& propagator) {
    const dynamics::Maneuver guess = initial_guess(spacecraft, dv);
    const auto start_time = std::chrono::steady_clock::now();

    if (settings_.verbose) {
        std::cout << "ImpulsiveConverter -- initial guess: " << guess << "\n";
    }

    // Reference trajectories without and with the impulse
    const time::Epoch impulse_epoch = spacecraft.epoch();
    const double span = 2.0 * guess.duration() + settings_.trajectory_padding_s;
    const dynamics::Spacecraft coast_sc = spacecraft.with_guidance_mode(dynamics::GuidanceMode::Coast);

    ReferenceArcs arcs;
    {
        std::unique_ptr<propagation::Propagator> prop = propagator.clone();
        const dynamics::SpacecraftDynamics coast = prop->dynamics().without_control();
        prop->set_dynamics(coast);
        // Dense samples keep the Hermite interpolation error below the tolerances
        propagation::ScopedMaxStep dense(*prop, std::min(prop->max_step(), settings_.trajectory_max_step_s));

        dynamics::Spacecraft pre_start = prop->propagate(coast_sc, impulse_epoch - span);
        prop->propagate(pre_start, impulse_epoch + span, arcs.pre);

        dynamics::Spacecraft post_start = prop->propagate(coast_sc.with_dv(dv), impulse_epoch - span);
        prop->propagate(post_start, impulse_epoch + span, arcs.post);
    }

    TargetingProblem problem;
    for (Vary c : CONVERSION_VARIABLES) {
        problem.variables.push_back(Variable::from(c));
    }
    problem.finite_burn = true;
    problem.correction_epoch = guess.start;
    problem.achievement_epoch = guess.end;

    TrialState trial{spacecraft, guess};
    const std::size_t n_var = problem.variables.size();

    std::unique_ptr<propagation::Propagator> prop = propagator.clone();
    const dynamics::SpacecraftDynamics coast = prop->dynamics().without_control();

    double prev_err_norm = std::numeric_limits<double>::infinity();

    for (int it = 0; it <= settings_.max_iterations; ++it) {
        dynamics::Spacecraft achieved;
        const Vector6d residual = burn_residual(trial.maneuver, arcs, *prop, coast, &achieved);
        const Vector6d errors = -residual;

        bool converged = true;
        for (int i = 0; i < 6; ++i) {
            const double tol = i < 3 ? settings_.position_tolerance_km : settings_.velocity_tolerance_km_s;
            if (std::abs(errors(i)) > tol) {
                converged = false;
            }
        }

        if (settings_.verbose) {
            std::cout << "ImpulsiveConverter -- #" << it << " " << trial.maneuver << "\n"
                      << "    errors [km, km/s]: " << std::scientific << std::setprecision(3)
                      << errors.transpose() << std::defaultfloat << "\n";
        }

        if (converged) {
            ImpulsiveConversion result;
            result.maneuver = trial.maneuver;
            result.achieved_state = achieved;
            result.achieved_errors = errors;
            result.iterations = it;
            result.computation_time_s =
                std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
            if (settings_.verbose) {
                std::cout << "ImpulsiveConverter -- CONVERGED in " << it
                          << (it == 1 ? " iteration" : " iterations") << "\n";
            }
            return result;
        }

        const double err_norm = errors.norm();
        if (std::abs(err_norm - prev_err_norm) < settings_.stagnation_threshold) {
            throw TargetingError(TargetingErrorKind::CorrectionIneffective,
                                 "no change in burn errors (norm " + std::to_string(err_norm) + ")");
        }
        prev_err_norm = err_norm;

        if (it == settings_.max_iterations) {
            break;
        }

        // d(residual)/d(variable), one trial per variable
        Eigen::MatrixXd jac = Eigen::MatrixXd::Zero(6, static_cast<Eigen::Index>(n_var));
        pool_.parallel_for(n_var, [&](std::size_t j) {
            const Variable& var = problem.variables[j];
            TrialState perturbed = trial;
            perturbed.apply_one(problem, j, var.perturbation);

            std::unique_ptr<propagation::Propagator> trial_prop = propagator.clone();
            const Vector6d trial_residual = burn_residual(perturbed.maneuver, arcs, *trial_prop, coast, nullptr);
            jac.col(static_cast<Eigen::Index>(j)) = (trial_residual - residual) / var.perturbation;
        });

        auto jac_inv = math::pseudo_inverse(jac);
        if (!jac_inv) {
            throw TargetingError(TargetingErrorKind::SingularJacobian,
                                 "pseudo-inverse of the burn sensitivity matrix failed");
        }

        Eigen::VectorXd delta = (*jac_inv) * Eigen::VectorXd(errors);
        for (std::size_t i = 0; i < n_var; ++i) {
            const auto idx = static_cast<Eigen::Index>(i);
            delta(idx) = problem.variables[i].clamp(delta(idx));
        }
        trial.apply(problem, delta);
    }

    throw TargetingError::max_iterations(settings_.max_iterations, prev_err_norm);
}

} // namespace orbtarget::targeting
