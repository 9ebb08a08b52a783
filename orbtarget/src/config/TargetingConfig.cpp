/**
 * @file TargetingConfig.cpp
 * @brief JSON scenario loader and solution report
 */

#include "orbtarget/config/TargetingConfig.hpp"
#include "orbtarget/dynamics/ForceModel.hpp"
#include "orbtarget/propagation/CowellPropagator.hpp"
#include "orbtarget/targeting/JacobianEstimator.hpp"
#include <fstream>
#include <stdexcept>

namespace orbtarget::config {

namespace {

Vector3d read_vector3(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) {
        throw std::invalid_argument(std::string("Missing entry: ") + key);
    }
    auto values = j.at(key).get<std::vector<double>>();
    if (values.size() != 3) {
        throw std::invalid_argument(std::string(key) + " needs 3 components");
    }
    return Vector3d(values[0], values[1], values[2]);
}

std::vector<double> to_array(const Vector3d& v) {
    return {v.x(), v.y(), v.z()};
}

/// Absolute epoch, or an offset from @p reference
time::Epoch read_epoch(const nlohmann::json& j, const time::Epoch& reference) {
    if (j.is_number()) {
        return reference + j.get<double>();
    }
    if (j.contains("seconds_j2000")) return time::Epoch::from_seconds_j2000(j["seconds_j2000"].get<double>());
    if (j.contains("mjd_tdb")) return time::Epoch::from_mjd_tdb(j["mjd_tdb"].get<double>());
    if (j.contains("jd_tdb")) return time::Epoch::from_jd_tdb(j["jd_tdb"].get<double>());
    if (j.contains("offset_s")) return reference + j["offset_s"].get<double>();
    throw std::invalid_argument("Epoch needs seconds_j2000, mjd_tdb, jd_tdb or offset_s");
}

dynamics::Spacecraft read_spacecraft(const nlohmann::json& sc, double mu) {
    if (!sc.contains("epoch")) {
        throw std::invalid_argument("Missing entry: spacecraft.epoch");
    }
    const time::Epoch epoch = read_epoch(sc["epoch"], time::Epoch());

    coordinates::CartesianState orbit;
    if (sc.contains("keplerian")) {
        auto& kep = sc["keplerian"];
        coordinates::KeplerianElements elements;
        elements.sma_km = kep.at("sma_km").get<double>();
        elements.ecc = kep.value("ecc", 0.0);
        elements.inc_deg = kep.value("inc_deg", 0.0);
        elements.raan_deg = kep.value("raan_deg", 0.0);
        elements.aop_deg = kep.value("aop_deg", 0.0);
        elements.ta_deg = kep.value("ta_deg", 0.0);
        orbit = coordinates::CartesianState::from_keplerian(elements, epoch, mu);
    } else {
        orbit = coordinates::CartesianState(epoch, read_vector3(sc, "position_km"),
                                            read_vector3(sc, "velocity_km_s"), mu);
    }

    dynamics::Spacecraft spacecraft(orbit, sc.value("dry_mass_kg", 0.0), sc.value("fuel_mass_kg", 0.0));
    if (sc.contains("thruster")) {
        auto& th = sc["thruster"];
        dynamics::Thruster thruster;
        thruster.thrust_N = th.at("thrust_N").get<double>();
        thruster.isp_s = th.at("isp_s").get<double>();
        spacecraft = spacecraft.with_thruster(thruster);
    }
    return spacecraft;
}

targeting::Variable read_variable(const nlohmann::json& v) {
    if (!v.contains("component")) {
        throw std::invalid_argument("Variable without component");
    }
    auto var = targeting::Variable::from(targeting::vary_from_string(v["component"].get<std::string>()));
    if (v.contains("initial_guess")) var.with_initial_guess(v["initial_guess"].get<double>());
    if (v.contains("perturbation")) var.with_perturbation(v["perturbation"].get<double>());
    if (v.contains("max_step")) var.with_max_step(v["max_step"].get<double>());
    var.with_bounds(v.value("min_value", var.min_value), v.value("max_value", var.max_value));
    return var;
}

targeting::Objective read_objective(const nlohmann::json& o) {
    if (!o.contains("parameter") || !o.contains("desired_value")) {
        throw std::invalid_argument("Objective needs parameter and desired_value");
    }
    targeting::Objective obj(coordinates::state_parameter_from_string(o["parameter"].get<std::string>()),
                             o["desired_value"].get<double>(),
                             o.value("tolerance", 0.1));
    obj.multiplicative_factor = o.value("multiplicative_factor", 1.0);
    obj.additive_factor = o.value("additive_factor", 0.0);
    return obj;
}

JacobianMethod jacobian_method_from_string(const std::string& name) {
    if (name == "finite_difference") return JacobianMethod::FiniteDifference;
    if (name == "analytic") return JacobianMethod::Analytic;
    throw std::invalid_argument("Unknown Jacobian method: " + name);
}

} // anonymous namespace

TargetingScenario loadTargetingConfig(const std::string& config_file) {
    std::ifstream f(config_file);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + config_file);
    }

    nlohmann::json j;
    f >> j;
    return parseTargetingConfig(j);
}

TargetingScenario parseTargetingConfig(const nlohmann::json& j) {
    TargetingScenario scenario;

    // Gravity first: the spacecraft orbit carries mu
    if (j.contains("gravity")) {
        auto& g = j["gravity"];
        if (g.value("earth_zonal", false)) {
            const auto earth = dynamics::ZonalCoefficients::earth();
            scenario.gravity.mu = earth.mu;
            scenario.gravity.radius_km = earth.radius_km;
            scenario.gravity.j2 = earth.j2;
            scenario.gravity.j3 = earth.j3;
            scenario.gravity.j4 = earth.j4;
        }
        scenario.gravity.mu = g.value("mu", scenario.gravity.mu);
        scenario.gravity.radius_km = g.value("radius_km", scenario.gravity.radius_km);
        scenario.gravity.j2 = g.value("j2", scenario.gravity.j2);
        scenario.gravity.j3 = g.value("j3", scenario.gravity.j3);
        scenario.gravity.j4 = g.value("j4", scenario.gravity.j4);
        if (!(scenario.gravity.mu > 0.0)) {
            throw std::invalid_argument("gravity.mu must be positive");
        }
    }

    if (!j.contains("spacecraft")) {
        throw std::invalid_argument("Missing entry: spacecraft");
    }
    scenario.spacecraft = read_spacecraft(j["spacecraft"], scenario.gravity.mu);
    const time::Epoch& reference = scenario.spacecraft.epoch();

    if (j.contains("propagator")) {
        auto& p = j["propagator"];
        auto& opts = scenario.propagator;
        opts.initial_step_s = p.value("initial_step_s", opts.initial_step_s);
        opts.min_step_s = p.value("min_step_s", opts.min_step_s);
        opts.max_step_s = p.value("max_step_s", opts.max_step_s);
        opts.tolerance = p.value("tolerance", opts.tolerance);
        opts.max_steps = p.value("max_steps", opts.max_steps);
    }

    scenario.correction_epoch = j.contains("correction_epoch")
        ? read_epoch(j["correction_epoch"], reference) : reference;
    if (!j.contains("achievement_epoch")) {
        throw std::invalid_argument("Missing entry: achievement_epoch");
    }
    scenario.achievement_epoch = read_epoch(j["achievement_epoch"], reference);

    if (j.contains("correction_frame") && !j["correction_frame"].is_null()) {
        scenario.correction_frame =
            coordinates::local_frame_from_string(j["correction_frame"].get<std::string>());
    }

    if (j.contains("variables")) {
        for (const auto& v : j["variables"]) {
            scenario.variables.push_back(read_variable(v));
        }
    }
    if (j.contains("objectives")) {
        for (const auto& o : j["objectives"]) {
            scenario.objectives.push_back(read_objective(o));
        }
    }

    if (j.contains("targeter")) {
        auto& t = j["targeter"];
        auto& s = scenario.settings;
        s.max_iterations = t.value("max_iterations", s.max_iterations);
        s.stagnation_threshold = t.value("stagnation_threshold", s.stagnation_threshold);
        s.epoch_noop_threshold_s = t.value("epoch_noop_threshold_s", s.epoch_noop_threshold_s);
        s.num_threads = t.value("num_threads", s.num_threads);
        s.verbose = t.value("verbose", s.verbose);
        if (t.contains("jacobian")) {
            scenario.jacobian = jacobian_method_from_string(t["jacobian"].get<std::string>());
        }
    }

    scenario.output_file = j.value("output_file", "");
    return scenario;
}

dynamics::SpacecraftDynamics make_dynamics(const GravityConfig& gravity) {
    dynamics::SpacecraftDynamics::ForceModelList models;
    models.push_back(std::make_shared<const dynamics::PointMassGravity>(gravity.mu));
    if (gravity.has_zonal_terms()) {
        auto coefficients = std::make_shared<const dynamics::ZonalCoefficients>(
            dynamics::ZonalCoefficients{gravity.mu, gravity.radius_km, gravity.j2, gravity.j3, gravity.j4});
        models.push_back(std::make_shared<const dynamics::ZonalGravity>(coefficients));
    }
    return dynamics::SpacecraftDynamics(std::move(models));
}

std::shared_ptr<const propagation::Propagator> make_propagator(const TargetingScenario& scenario) {
    return std::make_shared<const propagation::CowellPropagator>(make_dynamics(scenario.gravity),
                                                                 scenario.propagator);
}

targeting::Targeter make_targeter(const TargetingScenario& scenario) {
    targeting::Targeter targeter(make_propagator(scenario), scenario.variables,
                                 scenario.objectives, scenario.settings);
    if (scenario.jacobian == JacobianMethod::Analytic) {
        targeter.set_jacobian_estimator(std::make_shared<targeting::AnalyticJacobian>());
    }
    if (scenario.correction_frame) {
        targeter.set_correction_frame(*scenario.correction_frame);
    }
    return targeter;
}

targeting::TargeterSolution run_scenario(const TargetingScenario& scenario) {
    return make_targeter(scenario).run(scenario.spacecraft, scenario.correction_epoch,
                                       scenario.achievement_epoch);
}

nlohmann::json to_json(const dynamics::Spacecraft& spacecraft) {
    nlohmann::json j;
    j["epoch"] = {{"seconds_j2000", spacecraft.epoch().seconds_j2000()},
                  {"mjd_tdb", spacecraft.epoch().mjd_tdb()}};
    j["position_km"] = to_array(spacecraft.orbit.position);
    j["velocity_km_s"] = to_array(spacecraft.orbit.velocity);
    j["dry_mass_kg"] = spacecraft.dry_mass_kg;
    j["fuel_mass_kg"] = spacecraft.fuel_mass_kg;
    return j;
}

nlohmann::json to_json(const dynamics::Maneuver& maneuver) {
    auto poly = [](const dynamics::QuadraticPolynomial& p) {
        return nlohmann::json{{"a", p.a}, {"b", p.b}, {"c", p.c}};
    };
    nlohmann::json j;
    j["start"] = {{"seconds_j2000", maneuver.start.seconds_j2000()}};
    j["end"] = {{"seconds_j2000", maneuver.end.seconds_j2000()}};
    j["duration_s"] = maneuver.duration();
    j["thrust_level"] = maneuver.thrust_level;
    j["alpha"] = poly(maneuver.alpha);
    j["beta"] = poly(maneuver.beta);
    j["frame"] = coordinates::to_string(maneuver.frame);
    return j;
}

nlohmann::json to_json(const targeting::TargeterSolution& solution) {
    nlohmann::json j;
    j["iterations"] = solution.iterations;
    j["computation_time_s"] = solution.computation_time_s;
    if (solution.correction_frame) {
        j["correction_frame"] = coordinates::to_string(*solution.correction_frame);
    } else {
        j["correction_frame"] = nullptr;
    }

    j["variables"] = nlohmann::json::array();
    for (std::size_t i = 0; i < solution.variables.size(); ++i) {
        j["variables"].push_back({
            {"component", targeting::to_string(solution.variables[i].component)},
            {"correction", solution.correction(static_cast<Eigen::Index>(i))}});
    }

    j["objectives"] = nlohmann::json::array();
    for (std::size_t i = 0; i < solution.objectives.size(); ++i) {
        const auto& obj = solution.objectives[i];
        const auto idx = static_cast<Eigen::Index>(i);
        j["objectives"].push_back({
            {"parameter", coordinates::to_string(obj.parameter)},
            {"desired_value", obj.desired_value},
            {"achieved_value", solution.achieved_values(idx)},
            {"error", solution.achieved_errors(idx)},
            {"tolerance", obj.tolerance}});
    }

    j["corrected_state"] = to_json(solution.corrected_state);
    j["achieved_state"] = to_json(solution.achieved_state);
    if (solution.maneuver) {
        j["maneuver"] = to_json(*solution.maneuver);
    }
    return j;
}

} // namespace orbtarget::config
