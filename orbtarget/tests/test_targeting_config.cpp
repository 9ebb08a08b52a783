/**
 * @file test_targeting_config.cpp
 * @brief Scenario loading from JSON and the JSON solution report
 */

#include <gtest/gtest.h>
#include <orbtarget/config/TargetingConfig.hpp>
#include <orbtarget/core/Constants.hpp>
#include <orbtarget/targeting/JacobianEstimator.hpp>

#include <cmath>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace orbtarget;
using namespace orbtarget::config;
using nlohmann::json;

class TargetingConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        base = json::parse(R"({
            "spacecraft": {
                "epoch": { "mjd_tdb": 60000.0 },
                "keplerian": { "sma_km": 7000.0, "ecc": 0.001, "inc_deg": 30.0 },
                "dry_mass_kg": 500.0,
                "fuel_mass_kg": 80.0,
                "thruster": { "thrust_N": 20.0, "isp_s": 310.0 }
            },
            "propagator": { "max_step_s": 300.0 },
            "correction_epoch": { "offset_s": 0.0 },
            "achievement_epoch": 1800.0,
            "correction_frame": "VNC",
            "variables": [ { "component": "VelocityX", "max_step": 0.2 } ],
            "objectives": [ { "parameter": "SMA", "desired_value": 7100.0, "tolerance": 0.1 } ],
            "targeter": { "max_iterations": 20, "num_threads": 2 }
        })");
        config_path = ::testing::TempDir() + "orbtarget_scenario_test.json";
    }

    void TearDown() override {
        std::remove(config_path.c_str());
    }

    void write(const json& j) {
        std::ofstream out(config_path);
        out << j.dump(2);
    }

    json base;
    std::string config_path;
};

TEST_F(TargetingConfigTest, LoadsScenarioFromFile) {
    write(base);
    TargetingScenario scenario = loadTargetingConfig(config_path);

    EXPECT_EQ(scenario.spacecraft.epoch(), time::Epoch::from_mjd_tdb(60000.0));
    EXPECT_NEAR(scenario.spacecraft.orbit.value(coordinates::StateParameter::SMA), 7000.0, 1e-6);
    EXPECT_DOUBLE_EQ(scenario.spacecraft.dry_mass_kg, 500.0);
    EXPECT_DOUBLE_EQ(scenario.spacecraft.fuel_mass_kg, 80.0);
    ASSERT_TRUE(scenario.spacecraft.thruster.has_value());
    EXPECT_DOUBLE_EQ(scenario.spacecraft.thruster->isp_s, 310.0);

    EXPECT_EQ(scenario.correction_epoch, scenario.spacecraft.epoch());
    EXPECT_EQ(scenario.achievement_epoch, scenario.spacecraft.epoch() + 1800.0);
    ASSERT_TRUE(scenario.correction_frame.has_value());
    EXPECT_EQ(*scenario.correction_frame, coordinates::LocalFrame::VNC);

    ASSERT_EQ(scenario.variables.size(), 1u);
    EXPECT_EQ(scenario.variables[0].component, targeting::Vary::VelocityX);
    EXPECT_DOUBLE_EQ(scenario.variables[0].max_step, 0.2);
    ASSERT_EQ(scenario.objectives.size(), 1u);
    EXPECT_EQ(scenario.objectives[0].parameter, coordinates::StateParameter::SMA);
    EXPECT_DOUBLE_EQ(scenario.objectives[0].desired_value, 7100.0);

    EXPECT_EQ(scenario.settings.max_iterations, 20);
    EXPECT_EQ(scenario.settings.num_threads, 2u);
    EXPECT_DOUBLE_EQ(scenario.propagator.max_step_s, 300.0);
    EXPECT_EQ(scenario.jacobian, JacobianMethod::FiniteDifference);
    EXPECT_FALSE(scenario.gravity.has_zonal_terms());
    EXPECT_TRUE(scenario.output_file.empty());
}

TEST_F(TargetingConfigTest, MissingFileThrows) {
    EXPECT_THROW(loadTargetingConfig(config_path + ".missing"), std::runtime_error);
}

TEST_F(TargetingConfigTest, MalformedJsonThrows) {
    {
        std::ofstream out(config_path);
        out << "{ \"spacecraft\": ";
    }
    EXPECT_THROW(loadTargetingConfig(config_path), json::exception);
}

TEST_F(TargetingConfigTest, UnknownTagsAreRejected) {
    json bad = base;
    bad["variables"][0]["component"] = "Throttle";
    EXPECT_THROW(parseTargetingConfig(bad), std::invalid_argument);

    bad = base;
    bad["correction_frame"] = "LVLH";
    EXPECT_THROW(parseTargetingConfig(bad), std::invalid_argument);

    bad = base;
    bad["objectives"][0]["parameter"] = "Apogee";
    EXPECT_THROW(parseTargetingConfig(bad), std::invalid_argument);

    bad = base;
    bad["targeter"]["jacobian"] = "broyden";
    EXPECT_THROW(parseTargetingConfig(bad), std::invalid_argument);
}

TEST_F(TargetingConfigTest, MissingEntriesAreRejected) {
    json bad = base;
    bad.erase("achievement_epoch");
    EXPECT_THROW(parseTargetingConfig(bad), std::invalid_argument);

    bad = base;
    bad["spacecraft"].erase("epoch");
    EXPECT_THROW(parseTargetingConfig(bad), std::invalid_argument);

    bad = base;
    bad["objectives"][0].erase("desired_value");
    EXPECT_THROW(parseTargetingConfig(bad), std::invalid_argument);

    bad = base;
    bad["achievement_epoch"] = json::object();
    EXPECT_THROW(parseTargetingConfig(bad), std::invalid_argument);
}

TEST_F(TargetingConfigTest, CartesianStateAndAbsoluteEpochs) {
    json j = base;
    j["spacecraft"].erase("keplerian");
    j["spacecraft"]["epoch"] = {{"seconds_j2000", 1000.0}};
    j["spacecraft"]["position_km"] = {7000.0, 0.0, 0.0};
    j["spacecraft"]["velocity_km_s"] = {0.0, 7.5, 0.0};
    j["correction_epoch"] = {{"seconds_j2000", 1100.0}};
    j["achievement_epoch"] = {{"jd_tdb", 2451545.0}};

    TargetingScenario scenario = parseTargetingConfig(j);
    EXPECT_DOUBLE_EQ(scenario.spacecraft.orbit.position.x(), 7000.0);
    EXPECT_DOUBLE_EQ(scenario.spacecraft.orbit.velocity.y(), 7.5);
    EXPECT_DOUBLE_EQ(scenario.correction_epoch.seconds_j2000(), 1100.0);
    EXPECT_NEAR(scenario.achievement_epoch.seconds_j2000(), 0.0, 1e-6);

    j["spacecraft"]["position_km"] = {7000.0, 0.0};
    EXPECT_THROW(parseTargetingConfig(j), std::invalid_argument);
}

TEST_F(TargetingConfigTest, GravityOptions) {
    json j = base;
    j["gravity"] = {{"earth_zonal", true}, {"j4", 0.0}};
    TargetingScenario scenario = parseTargetingConfig(j);
    EXPECT_TRUE(scenario.gravity.has_zonal_terms());
    EXPECT_DOUBLE_EQ(scenario.gravity.j2, constants::J2_EARTH);
    EXPECT_DOUBLE_EQ(scenario.gravity.j4, 0.0);
    EXPECT_EQ(make_dynamics(scenario.gravity).force_models().size(), 2u);

    j["gravity"] = {{"mu", -1.0}};
    EXPECT_THROW(parseTargetingConfig(j), std::invalid_argument);
}

TEST_F(TargetingConfigTest, MakeTargeterHonoursJacobianAndFrame) {
    json j = base;
    j["targeter"]["jacobian"] = "analytic";
    TargetingScenario scenario = parseTargetingConfig(j);
    EXPECT_EQ(scenario.jacobian, JacobianMethod::Analytic);

    targeting::Targeter targeter = make_targeter(scenario);
    EXPECT_EQ(targeter.jacobian_estimator().name(), "Analytic");
    ASSERT_TRUE(targeter.correction_frame().has_value());
    EXPECT_EQ(*targeter.correction_frame(), coordinates::LocalFrame::VNC);
    EXPECT_EQ(targeter.settings().max_iterations, 20);

    j.erase("correction_frame");
    j["targeter"].erase("jacobian");
    targeting::Targeter plain = make_targeter(parseTargetingConfig(j));
    EXPECT_EQ(plain.jacobian_estimator().name(), "FiniteDifference");
    EXPECT_FALSE(plain.correction_frame().has_value());
}

TEST_F(TargetingConfigTest, RunScenarioAndReport) {
    TargetingScenario scenario = parseTargetingConfig(base);
    targeting::TargeterSolution solution = run_scenario(scenario);

    EXPECT_LE(std::abs(solution.achieved_errors(0)), 0.1);
    EXPECT_NEAR(solution.achieved_values(0), 7100.0, 0.1);
    EXPECT_FALSE(solution.is_finite_burn());
    EXPECT_GT(solution.correction(0), 0.0);

    json report = to_json(solution);
    EXPECT_EQ(report["iterations"].get<int>(), solution.iterations);
    EXPECT_EQ(report["correction_frame"].get<std::string>(), "VNC");
    ASSERT_EQ(report["variables"].size(), 1u);
    EXPECT_EQ(report["variables"][0]["component"].get<std::string>(), "VelocityX");
    EXPECT_DOUBLE_EQ(report["variables"][0]["correction"].get<double>(), solution.correction(0));
    ASSERT_EQ(report["objectives"].size(), 1u);
    EXPECT_EQ(report["objectives"][0]["parameter"].get<std::string>(), "SMA");
    EXPECT_DOUBLE_EQ(report["objectives"][0]["desired_value"].get<double>(), 7100.0);
    EXPECT_EQ(report["corrected_state"]["position_km"].size(), 3u);
    EXPECT_DOUBLE_EQ(report["achieved_state"]["epoch"]["seconds_j2000"].get<double>(),
                     scenario.achievement_epoch.seconds_j2000());
    EXPECT_FALSE(report.contains("maneuver"));
}

TEST_F(TargetingConfigTest, ManeuverReport) {
    dynamics::Maneuver mnvr = dynamics::Maneuver::from_direction(
        time::Epoch::from_seconds_j2000(0.0), 120.0, Vector3d::UnitY(), coordinates::LocalFrame::RCN);
    json j = to_json(mnvr);
    EXPECT_DOUBLE_EQ(j["duration_s"].get<double>(), 120.0);
    EXPECT_EQ(j["frame"].get<std::string>(), "RCN");
    EXPECT_DOUBLE_EQ(j["thrust_level"].get<double>(), 1.0);
    EXPECT_NEAR(j["alpha"]["c"].get<double>(), constants::PI / 2.0, 1e-12);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
