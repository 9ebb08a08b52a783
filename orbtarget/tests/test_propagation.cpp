/**
 * @file test_propagation.cpp
 * @brief Integrators, Cowell propagator, trajectories and the max-step guard
 */

#include <gtest/gtest.h>
#include <orbtarget/core/Constants.hpp>
#include <orbtarget/dynamics/ForceModel.hpp>
#include <orbtarget/propagation/CowellPropagator.hpp>
#include <orbtarget/propagation/PropagationError.hpp>
#include <orbtarget/propagation/Trajectory.hpp>

#include <cmath>
#include <memory>
#include <stdexcept>

using namespace orbtarget;
using namespace orbtarget::propagation;
using orbtarget::coordinates::CartesianState;
using orbtarget::coordinates::KeplerianElements;
using orbtarget::coordinates::LocalFrame;
using orbtarget::coordinates::StateParameter;

class PropagationTest : public ::testing::Test {
protected:
    void SetUp() override {
        t0 = time::Epoch::from_mjd_tdb(60000.0);
        KeplerianElements k;
        k.sma_km = 7000.0;
        k.ecc = 0.01;
        k.inc_deg = 28.5;
        k.raan_deg = 100.0;
        k.aop_deg = 45.0;
        k.ta_deg = 10.0;
        spacecraft = dynamics::Spacecraft(CartesianState::from_keplerian(k, t0), 400.0, 100.0);
        period = constants::TWO_PI * std::sqrt(std::pow(7000.0, 3) / constants::GM_EARTH);
    }

    time::Epoch t0;
    dynamics::Spacecraft spacecraft;
    double period = 0.0;
};

TEST_F(PropagationTest, KeplerOrbitClosesAfterOnePeriod) {
    CowellPropagator prop(dynamics::SpacecraftDynamics::two_body());
    dynamics::Spacecraft final_state = prop.propagate(spacecraft, t0 + period);

    EXPECT_LT((final_state.orbit.position - spacecraft.orbit.position).norm(), 1e-4);
    EXPECT_LT((final_state.orbit.velocity - spacecraft.orbit.velocity).norm(), 1e-7);
    EXPECT_NEAR(final_state.orbit.energy(), spacecraft.orbit.energy(), 1e-10);
    EXPECT_EQ(final_state.epoch(), t0 + period);
    EXPECT_DOUBLE_EQ(final_state.fuel_mass_kg, 100.0);
    EXPECT_EQ(prop.integrator().name(), "RKF78");
    EXPECT_GT(prop.integrator().statistics().num_steps, 0);
}

TEST_F(PropagationTest, BackwardPropagationRetracesForward) {
    CowellPropagator prop(dynamics::SpacecraftDynamics::two_body());
    dynamics::Spacecraft fwd = prop.propagate(spacecraft, t0 + 5000.0);
    dynamics::Spacecraft back = prop.propagate(fwd, t0);
    EXPECT_LT((back.orbit.position - spacecraft.orbit.position).norm(), 1e-5);
    EXPECT_EQ(back.epoch(), t0);
}

TEST_F(PropagationTest, Rk4AgreesWithRkf78) {
    PropagatorOptions opts;
    opts.initial_step_s = 10.0;
    CowellPropagator rk4(dynamics::SpacecraftDynamics::two_body(), opts, std::make_unique<RK4Integrator>());
    CowellPropagator rkf(dynamics::SpacecraftDynamics::two_body());

    dynamics::Spacecraft a = rk4.propagate(spacecraft, t0 + 3000.0);
    dynamics::Spacecraft b = rkf.propagate(spacecraft, t0 + 3000.0);
    EXPECT_LT((a.orbit.position - b.orbit.position).norm(), 1e-3);
    EXPECT_EQ(rk4.integrator().name(), "RK4");
}

TEST_F(PropagationTest, StepLimitRaisesPropagationError) {
    PropagatorOptions opts;
    opts.max_steps = 2;
    opts.max_step_s = 60.0;
    CowellPropagator prop(dynamics::SpacecraftDynamics::two_body(), opts);
    EXPECT_THROW(prop.propagate(spacecraft, t0 + 3600.0), PropagationError);
}

TEST_F(PropagationTest, ZeroLengthPropagationIsIdentity) {
    CowellPropagator prop(dynamics::SpacecraftDynamics::two_body());
    dynamics::Spacecraft same = prop.propagate(spacecraft, t0);
    EXPECT_EQ(same.orbit.position, spacecraft.orbit.position);
}

TEST_F(PropagationTest, StmMatchesFiniteDifferences) {
    CowellPropagator prop(dynamics::SpacecraftDynamics::two_body());
    ASSERT_TRUE(prop.supports_stm());
    const time::Epoch tf = t0 + 1800.0;
    StmResult arc = prop.propagate_with_stm(spacecraft, tf);

    dynamics::Spacecraft plain = prop.propagate(spacecraft, tf);
    EXPECT_LT((arc.state.orbit.position - plain.orbit.position).norm(), 1e-6);

    for (int j = 0; j < 6; ++j) {
        const double h = j < 3 ? 1e-3 : 1e-6;
        dynamics::Spacecraft plus = spacecraft;
        dynamics::Spacecraft minus = spacecraft;
        plus.orbit.set_component(j, spacecraft.orbit.component(j) + h);
        minus.orbit.set_component(j, spacecraft.orbit.component(j) - h);
        Vector6d col = (prop.propagate(plus, tf).orbit.to_vector() -
                        prop.propagate(minus, tf).orbit.to_vector()) / (2.0 * h);
        for (int i = 0; i < 6; ++i) {
            EXPECT_NEAR(arc.stm(i, j), col(i), 1e-5 * std::max(1.0, std::abs(col(i))))
                << "stm(" << i << ", " << j << ")";
        }
    }
}

TEST_F(PropagationTest, StmRefusedOnThrustArc) {
    dynamics::Thruster thruster;
    thruster.thrust_N = 10.0;
    thruster.isp_s = 300.0;
    auto burn = std::make_shared<const dynamics::Maneuver>(
        dynamics::Maneuver::from_direction(t0, 60.0, Vector3d::UnitY(), LocalFrame::RCN));
    CowellPropagator prop(dynamics::SpacecraftDynamics::two_body().with_control(burn));
    dynamics::Spacecraft sc = spacecraft.with_thruster(thruster)
        .with_guidance_mode(dynamics::GuidanceMode::Thrust);
    EXPECT_THROW(prop.propagate_with_stm(sc, t0 + 60.0), std::logic_error);
}

TEST_F(PropagationTest, ThrustArcBurnsFuelAndRaisesOrbit) {
    dynamics::Thruster thruster;
    thruster.thrust_N = 10.0;
    thruster.isp_s = 300.0;
    auto burn = std::make_shared<const dynamics::Maneuver>(
        dynamics::Maneuver::from_direction(t0, 100.0, Vector3d::UnitY(), LocalFrame::RCN));

    PropagatorOptions opts;
    opts.max_step_s = 100.0;
    CowellPropagator prop(dynamics::SpacecraftDynamics::two_body().with_control(burn), opts);
    dynamics::Spacecraft sc = spacecraft.with_thruster(thruster)
        .with_guidance_mode(dynamics::GuidanceMode::Thrust);
    dynamics::Spacecraft after = prop.propagate(sc, t0 + 100.0);

    const double ve = thruster.exhaust_velocity();
    EXPECT_NEAR(sc.fuel_mass_kg - after.fuel_mass_kg, 10.0 / ve * 100.0, 1e-6);
    EXPECT_GT(after.orbit.value(StateParameter::SMA), sc.orbit.value(StateParameter::SMA));

    // Coasting spacecraft ignores the control
    dynamics::Spacecraft coast = prop.propagate(spacecraft, t0 + 100.0);
    EXPECT_DOUBLE_EQ(coast.fuel_mass_kg, spacecraft.fuel_mass_kg);
}

TEST_F(PropagationTest, J2RegressesTheNode) {
    dynamics::SpacecraftDynamics::ForceModelList models = {
        std::make_shared<const dynamics::PointMassGravity>(),
        std::make_shared<const dynamics::ZonalGravity>(
            std::make_shared<const dynamics::ZonalCoefficients>(dynamics::ZonalCoefficients::earth()))};
    CowellPropagator prop{dynamics::SpacecraftDynamics(models)};

    const double day = constants::SECONDS_PER_DAY;
    dynamics::Spacecraft after = prop.propagate(spacecraft, t0 + day);

    const double a = 7000.0;
    const double p = a * (1.0 - 0.01 * 0.01);
    const double n = std::sqrt(constants::GM_EARTH / (a * a * a));
    const double rate = -1.5 * n * constants::J2_EARTH * std::pow(constants::R_EARTH / p, 2) *
                        std::cos(28.5 * constants::DEG_TO_RAD);
    const double expected_deg = rate * day * constants::RAD_TO_DEG;

    const double drift = after.orbit.value(StateParameter::RAAN) - 100.0;
    EXPECT_NEAR(drift, expected_deg, 0.1 * std::abs(expected_deg));
}

// ============================================================================
// Trajectory
// ============================================================================

TEST_F(PropagationTest, TrajectoryInterpolatesBetweenSteps) {
    PropagatorOptions opts;
    opts.max_step_s = 60.0;
    CowellPropagator prop(dynamics::SpacecraftDynamics::two_body(), opts);

    Trajectory traj;
    prop.propagate(spacecraft, t0 + 3000.0, traj);
    ASSERT_GT(traj.size(), 10u);
    EXPECT_EQ(traj.first_epoch(), t0);
    EXPECT_EQ(traj.last_epoch(), t0 + 3000.0);

    for (double dt : {17.0, 1234.5, 2999.0}) {
        dynamics::Spacecraft direct = prop.propagate(spacecraft, t0 + dt);
        dynamics::Spacecraft interp = traj.at(t0 + dt);
        EXPECT_LT((direct.orbit.position - interp.orbit.position).norm(), 1e-3) << dt;
        EXPECT_LT((direct.orbit.velocity - interp.orbit.velocity).norm(), 1e-6) << dt;
        EXPECT_EQ(interp.epoch(), t0 + dt);
    }

    EXPECT_THROW(traj.at(t0 - 1.0), PropagationError);
    EXPECT_THROW(traj.at(t0 + 3001.0), PropagationError);
}

TEST_F(PropagationTest, BackwardTrajectoryIsSorted) {
    PropagatorOptions opts;
    opts.max_step_s = 60.0;
    CowellPropagator prop(dynamics::SpacecraftDynamics::two_body(), opts);

    Trajectory traj;
    prop.propagate(spacecraft, t0 - 600.0, traj);
    EXPECT_EQ(traj.first_epoch(), t0 - 600.0);
    EXPECT_EQ(traj.last_epoch(), t0);
    for (std::size_t i = 1; i < traj.size(); ++i) {
        EXPECT_LT(traj.samples()[i - 1].state.epoch(), traj.samples()[i].state.epoch());
    }
    EXPECT_LT((traj.at(t0).orbit.position - spacecraft.orbit.position).norm(), 1e-9);
}

TEST_F(PropagationTest, TrajectoryReplacesDuplicateEpochs) {
    Trajectory traj;
    EXPECT_TRUE(traj.empty());
    Vector7d zero = Vector7d::Zero();
    traj.add(spacecraft, zero);
    dynamics::Spacecraft moved = spacecraft;
    moved.orbit.position.x() += 1.0;
    traj.add(moved, zero);
    EXPECT_EQ(traj.size(), 1u);
    EXPECT_DOUBLE_EQ(traj.at(t0).orbit.position.x(), moved.orbit.position.x());
}

// ============================================================================
// ScopedMaxStep
// ============================================================================

TEST_F(PropagationTest, ScopedMaxStepRestoresOnExit) {
    CowellPropagator prop(dynamics::SpacecraftDynamics::two_body());
    const double saved_step = prop.max_step();
    {
        ScopedMaxStep guard(prop, 5.0);
        EXPECT_DOUBLE_EQ(prop.max_step(), 5.0);
    }
    EXPECT_DOUBLE_EQ(prop.max_step(), saved_step);

    try {
        ScopedMaxStep guard(prop, 7.0);
        throw std::runtime_error("leaving scope");
    } catch (const std::runtime_error&) {
        EXPECT_DOUBLE_EQ(prop.max_step(), saved_step);
    }

    EXPECT_THROW((ScopedMaxStep{prop, 0.0}), std::invalid_argument);
    EXPECT_DOUBLE_EQ(prop.max_step(), saved_step);
}

TEST_F(PropagationTest, ClonesAreIndependent) {
    CowellPropagator prop(dynamics::SpacecraftDynamics::two_body());
    std::unique_ptr<Propagator> copy = prop.clone();
    copy->set_max_step(1.0);
    EXPECT_DOUBLE_EQ(copy->max_step(), 1.0);
    EXPECT_DOUBLE_EQ(prop.max_step(), PropagatorOptions().max_step_s);

    // Force models are shared
    EXPECT_EQ(copy->dynamics().force_models()[0], prop.dynamics().force_models()[0]);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
