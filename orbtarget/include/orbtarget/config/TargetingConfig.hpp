/**
 * @file TargetingConfig.hpp
 * @brief JSON description of a targeting scenario
 *
 * Example:
 * @code{.json}
 * {
 *   "spacecraft": {
 *     "epoch": { "mjd_tdb": 60000.0 },
 *     "position_km": [7000.0, 0.0, 0.0],
 *     "velocity_km_s": [0.0, 7.546, 0.0],
 *     "dry_mass_kg": 500.0,
 *     "fuel_mass_kg": 100.0,
 *     "thruster": { "thrust_N": 50.0, "isp_s": 300.0 }
 *   },
 *   "gravity": { "mu": 398600.4415, "j2": 1.08262668e-3, "radius_km": 6378.137 },
 *   "propagator": { "tolerance": 1e-12, "max_step_s": 600.0 },
 *   "correction_epoch": { "offset_s": 0.0 },
 *   "achievement_epoch": { "offset_s": 3600.0 },
 *   "correction_frame": "VNC",
 *   "variables": [ { "component": "VelocityX" } ],
 *   "objectives": [ { "parameter": "SMA", "desired_value": 8100.0, "tolerance": 0.1 } ],
 *   "targeter": { "max_iterations": 25, "jacobian": "finite_difference", "verbose": true }
 * }
 * @endcode
 *
 * Epochs are given as "seconds_j2000", "mjd_tdb" or "offset_s" (seconds from
 * the spacecraft epoch). The spacecraft orbit is either Cartesian or a
 * "keplerian" block (sma_km, ecc, inc_deg, raan_deg, aop_deg, ta_deg).
 */

#ifndef ORBTARGET_CONFIG_TARGETING_CONFIG_HPP
#define ORBTARGET_CONFIG_TARGETING_CONFIG_HPP

#include "orbtarget/dynamics/Spacecraft.hpp"
#include "orbtarget/dynamics/SpacecraftDynamics.hpp"
#include "orbtarget/propagation/Integrator.hpp"
#include "orbtarget/propagation/Propagator.hpp"
#include "orbtarget/targeting/Targeter.hpp"
#include "orbtarget/targeting/TargeterSolution.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace orbtarget::config {

/// Central body gravity
struct GravityConfig {
    double mu = constants::GM_EARTH;        ///< [km³/s²]
    double radius_km = constants::R_EARTH;  ///< Reference radius of the zonal terms [km]
    double j2 = 0.0;
    double j3 = 0.0;
    double j4 = 0.0;

    bool has_zonal_terms() const { return j2 != 0.0 || j3 != 0.0 || j4 != 0.0; }
};

enum class JacobianMethod {
    FiniteDifference,
    Analytic
};

struct TargetingScenario {
    dynamics::Spacecraft spacecraft;
    GravityConfig gravity;
    propagation::PropagatorOptions propagator;

    time::Epoch correction_epoch;
    time::Epoch achievement_epoch;
    std::optional<coordinates::LocalFrame> correction_frame;

    std::vector<targeting::Variable> variables;
    std::vector<targeting::Objective> objectives;
    targeting::TargeterSettings settings;
    JacobianMethod jacobian = JacobianMethod::FiniteDifference;

    std::string output_file;               ///< Optional JSON report path
};

/**
 * @brief Load a targeting scenario from a JSON file
 * @throws std::runtime_error if the file cannot be opened
 * @throws std::invalid_argument on unknown tags or missing required entries
 * @throws nlohmann::json::exception on malformed JSON
 */
TargetingScenario loadTargetingConfig(const std::string& config_file);

/// Same as loadTargetingConfig() for an already parsed document
TargetingScenario parseTargetingConfig(const nlohmann::json& j);

/// Point-mass gravity plus the configured zonal terms
dynamics::SpacecraftDynamics make_dynamics(const GravityConfig& gravity);

/// RKF78 Cowell propagator for the scenario
std::shared_ptr<const propagation::Propagator> make_propagator(const TargetingScenario& scenario);

/// Targeter with the scenario variables, objectives, settings and Jacobian method
targeting::Targeter make_targeter(const TargetingScenario& scenario);

/**
 * @brief Run the scenario targeter from the spacecraft state
 * @throws targeting::TargetingError or propagation::PropagationError
 */
targeting::TargeterSolution run_scenario(const TargetingScenario& scenario);

nlohmann::json to_json(const dynamics::Spacecraft& spacecraft);
nlohmann::json to_json(const dynamics::Maneuver& maneuver);
nlohmann::json to_json(const targeting::TargeterSolution& solution);

} // namespace orbtarget::config

#endif // ORBTARGET_CONFIG_TARGETING_CONFIG_HPP
