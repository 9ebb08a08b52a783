/**
 * @file ImpulsiveConverter.hpp
 * @brief Conversion of an impulsive velocity change into an equivalent finite burn
 *
 * The finite burn is shaped so that, starting from the no-burn trajectory at
 * the maneuver start, thrusting until the maneuver end lands on the
 * post-impulse trajectory at that same epoch (all six Cartesian components).
 *
 * Initial guess (Δv direction u, primer vector dynamics under two-body
 * gravity, u̇ = 0):
 *
 *   ü = 3 mu / r^5 ((r·u) r - (r·u)² u)
 *   Δt = (ve m / T) (1 - exp(-|Δv| / ve))       (rocket equation)
 *
 * The burn is centered on the impulse epoch.
 */

#ifndef ORBTARGET_TARGETING_IMPULSIVE_CONVERTER_HPP
#define ORBTARGET_TARGETING_IMPULSIVE_CONVERTER_HPP

#include "orbtarget/core/WorkerPool.hpp"
#include "orbtarget/dynamics/Maneuver.hpp"
#include "orbtarget/dynamics/Spacecraft.hpp"
#include "orbtarget/propagation/Propagator.hpp"
#include <Eigen/Dense>
#include <iostream>

namespace orbtarget::targeting {

struct ImpulsiveConversionSettings {
    int max_iterations = 10;
    double position_tolerance_km = 1e-3;
    double velocity_tolerance_km_s = 1e-5;
    double stagnation_threshold = 1e-10;
    double trajectory_padding_s = 600.0;    ///< Extra span of the reference trajectories [s]
    double trajectory_max_step_s = 30.0;    ///< Sample spacing ceiling of the reference trajectories [s]
    std::size_t num_threads = 0;            ///< Perturbation workers (0 = hardware concurrency)
    bool verbose = false;
};

struct ImpulsiveConversion {
    dynamics::Maneuver maneuver;            ///< Converged finite burn
    dynamics::Spacecraft achieved_state;    ///< State at the end of the burn
    Eigen::VectorXd achieved_errors;        ///< Desired - achieved [x, y, z, vx, vy, vz]
    int iterations = 0;
    double computation_time_s = 0.0;

    void print_summary(std::ostream& os = std::cout) const;
};

class ImpulsiveConverter {
public:
    explicit ImpulsiveConverter(const ImpulsiveConversionSettings& settings = ImpulsiveConversionSettings());

    /**
     * @brief Find the finite burn equivalent to applying @p dv to @p spacecraft
     *
     * @param spacecraft State at the impulse epoch, before the Δv
     * @param dv Inertial velocity change [km/s]
     * @param propagator Prototype propagator (cloned)
     * @throws TargetingError NoThrusterAvailable, SingularJacobian,
     *         CorrectionIneffective or MaxIterationsReached
     * @throws std::invalid_argument if @p dv is zero
     */
    ImpulsiveConversion convert(const dynamics::Spacecraft& spacecraft,
                                const Vector3d& dv,
                                const propagation::Propagator& propagator);

    /// Initial burn estimate, before any correction
    static dynamics::Maneuver initial_guess(const dynamics::Spacecraft& spacecraft, const Vector3d& dv);

    const ImpulsiveConversionSettings& settings() const { return settings_; }

private:
    ImpulsiveConversionSettings settings_;
    WorkerPool pool_;
};

} // namespace orbtarget::targeting

#endif // ORBTARGET_TARGETING_IMPULSIVE_CONVERTER_HPP
