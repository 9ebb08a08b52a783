/**
 * @file test_problem_definition.cpp
 * @brief Variables, objectives and the rules applying corrections to a trial
 */

#include <gtest/gtest.h>
#include <orbtarget/targeting/Objective.hpp>
#include <orbtarget/targeting/TargetingError.hpp>
#include <orbtarget/targeting/TargetingProblem.hpp>
#include <orbtarget/targeting/Variable.hpp>
#include <orbtarget/core/Constants.hpp>

#include <cmath>
#include <limits>

using namespace orbtarget;
using namespace orbtarget::coordinates;
using namespace orbtarget::targeting;

// ============================================================================
// Variable
// ============================================================================

TEST(VariableTest, DefaultsFromTable) {
    Variable pos = Variable::from(Vary::PositionY);
    EXPECT_DOUBLE_EQ(pos.perturbation, 1e-4);
    EXPECT_DOUBLE_EQ(pos.max_step, 3.0);
    EXPECT_DOUBLE_EQ(pos.min_value, -5.0);
    EXPECT_DOUBLE_EQ(pos.max_value, 5.0);
    EXPECT_DOUBLE_EQ(pos.initial_guess, 0.0);

    Variable vel = Variable::from(Vary::VelocityZ);
    EXPECT_DOUBLE_EQ(vel.max_step, 0.5);

    Variable dur = Variable::from(Vary::Duration);
    EXPECT_DOUBLE_EQ(dur.perturbation, 1.0);
    EXPECT_DOUBLE_EQ(dur.max_step, 60.0);
    EXPECT_DOUBLE_EQ(dur.initial_guess, DEFAULT_BURN_DURATION_S);

    Variable alpha = Variable::from(Vary::MnvrAlphaDDot);
    EXPECT_DOUBLE_EQ(alpha.perturbation, 1e-4);
    EXPECT_DOUBLE_EQ(alpha.max_value, constants::PI);

    Variable def;
    EXPECT_EQ(def.component, Vary::VelocityX);
    EXPECT_TRUE(def.valid());
}

TEST(VariableTest, Classification) {
    EXPECT_TRUE(is_state(Vary::PositionX));
    EXPECT_TRUE(is_position(Vary::PositionZ));
    EXPECT_FALSE(is_position(Vary::VelocityX));
    EXPECT_TRUE(is_finite_burn(Vary::StartEpoch));
    EXPECT_TRUE(is_finite_burn(Vary::MnvrBetaDot));
    EXPECT_FALSE(is_finite_burn(Vary::VelocityY));
}

TEST(VariableTest, NamesRoundTrip) {
    EXPECT_EQ(to_string(Vary::MnvrAlphaDot), "MnvrAlphaDot");
    EXPECT_EQ(vary_from_string("duration"), Vary::Duration);
    EXPECT_EQ(vary_from_string("VELOCITYX"), Vary::VelocityX);
    EXPECT_THROW(vary_from_string("Thrust"), std::invalid_argument);
}

TEST(VariableTest, Validity) {
    std::string reason;
    EXPECT_FALSE(Variable::from(Vary::VelocityX).with_perturbation(0.0).valid(&reason));
    EXPECT_NE(reason.find("perturbation"), std::string::npos);

    EXPECT_FALSE(Variable::from(Vary::VelocityX).with_bounds(2.0, 1.0).valid());
    EXPECT_FALSE(Variable::from(Vary::VelocityX).with_max_step(0.0).valid());
    EXPECT_FALSE(Variable::from(Vary::VelocityX)
                     .with_initial_guess(std::numeric_limits<double>::quiet_NaN()).valid());
    EXPECT_TRUE(Variable::from(Vary::VelocityX).with_bounds(-1.0, -1.0).valid());
    EXPECT_TRUE(Variable::from(Vary::VelocityX).with_perturbation(-1e-3).valid());

    try {
        Variable::from(Vary::Duration).with_bounds(10.0, 0.0).validate();
        FAIL() << "expected InvalidVariable";
    } catch (const TargetingError& e) {
        EXPECT_EQ(e.kind(), TargetingErrorKind::InvalidVariable);
    }
}

TEST(VariableTest, ClampAppliesStepThenBounds) {
    Variable v = Variable::from(Vary::VelocityX);   // step 0.5, bounds [-5, 5]
    EXPECT_DOUBLE_EQ(v.clamp(0.2), 0.2);
    EXPECT_DOUBLE_EQ(v.clamp(2.0), 0.5);
    EXPECT_DOUBLE_EQ(v.clamp(-2.0), -0.5);

    v.with_bounds(-0.2, 0.2);
    EXPECT_DOUBLE_EQ(v.clamp(2.0), 0.2);
    EXPECT_DOUBLE_EQ(v.clamp(-0.3), -0.2);

    // Both limits apply, not one or the other
    v.with_bounds(0.3, 1.0);
    EXPECT_DOUBLE_EQ(v.clamp(0.1), 0.3);
    EXPECT_DOUBLE_EQ(v.clamp(3.0), 0.5);
}

// ============================================================================
// Objective
// ============================================================================

TEST(ObjectiveTest, AssessRaw) {
    Objective obj(StateParameter::SMA, 8000.0, 0.5);
    auto [ok, err] = obj.assess_raw(7999.7);
    EXPECT_TRUE(ok);
    EXPECT_NEAR(err, 0.3, 1e-9);

    auto [ok2, err2] = obj.assess_raw(8001.0);
    EXPECT_FALSE(ok2);
    EXPECT_NEAR(err2, -1.0, 1e-9);
}

TEST(ObjectiveTest, ScalingAppliesToAchievedValue) {
    Objective obj(StateParameter::Eccentricity, 20.0, 0.01);
    obj.multiplicative_factor = 100.0;
    obj.additive_factor = 5.0;
    EXPECT_DOUBLE_EQ(obj.scaled(0.15), 20.0);
    auto [ok, err] = obj.assess_raw(0.15);
    EXPECT_TRUE(ok);
    EXPECT_NEAR(err, 0.0, 1e-12);
}

TEST(ObjectiveTest, AngleErrorsWrap) {
    Objective raan(StateParameter::RAAN, 359.0, 0.5);
    auto [ok, err] = raan.assess_raw(1.0);
    EXPECT_FALSE(ok);
    EXPECT_NEAR(err, -2.0, 1e-12);

    Objective sma(StateParameter::SMA, 359.0, 0.5);
    EXPECT_NEAR(sma.assess_raw(1.0).second, 358.0, 1e-12);
}

TEST(ObjectiveTest, WrapAngle) {
    EXPECT_DOUBLE_EQ(wrap_angle_deg(0.0), 0.0);
    EXPECT_DOUBLE_EQ(wrap_angle_deg(180.0), 180.0);
    EXPECT_DOUBLE_EQ(wrap_angle_deg(-180.0), 180.0);
    EXPECT_DOUBLE_EQ(wrap_angle_deg(190.0), -170.0);
    EXPECT_DOUBLE_EQ(wrap_angle_deg(-190.0), 170.0);
    EXPECT_DOUBLE_EQ(wrap_angle_deg(725.0), 5.0);
}

TEST(ObjectiveTest, ToleranceMustBePositive) {
    EXPECT_THROW(Objective(StateParameter::SMA, 7000.0, 0.0), std::invalid_argument);
    EXPECT_THROW(Objective(StateParameter::SMA, 7000.0, -1.0), std::invalid_argument);
    EXPECT_DOUBLE_EQ(Objective(StateParameter::SMA, 7000.0).tolerance, 0.1);
}

TEST(ObjectiveTest, AssessAllObjectives) {
    const time::Epoch t = time::Epoch::from_mjd_tdb(60000.0);
    CartesianState state(t, Vector3d(7000.0, 0.0, 0.0), Vector3d(0.0, 7.5, 0.0));

    std::vector<Objective> objectives = {Objective(StateParameter::X, 7000.0),
                                         Objective(StateParameter::Rmag, 7100.0)};
    ObjectiveAssessment a = assess(objectives, state);
    EXPECT_FALSE(a.converged);
    EXPECT_NEAR(a.achieved(0), 7000.0, 1e-12);
    EXPECT_NEAR(a.errors(1), 100.0, 1e-9);

    std::vector<math::Dual> partials = evaluate_partials(objectives, state);
    ASSERT_EQ(partials.size(), 2u);
    EXPECT_DOUBLE_EQ(partials[0].partial(0), 1.0);
    EXPECT_DOUBLE_EQ(partials[1].partial(0), 1.0);
}

// ============================================================================
// TrialState
// ============================================================================

class TrialStateTest : public ::testing::Test {
protected:
    void SetUp() override {
        t0 = time::Epoch::from_mjd_tdb(60000.0);
        CartesianState orbit(t0, Vector3d(7000.0, 0.0, 0.0), Vector3d(0.0, 7.5, 0.0));
        trial = TrialState{dynamics::Spacecraft(orbit, 500.0, 100.0), default_maneuver(t0)};
    }

    TargetingProblem problem_with(std::vector<Vary> components) const {
        TargetingProblem p;
        for (Vary c : components) {
            p.variables.push_back(Variable::from(c));
        }
        p.correction_epoch = t0;
        p.achievement_epoch = t0 + 3600.0;
        return p;
    }

    static Eigen::VectorXd deltas(std::initializer_list<double> values) {
        Eigen::VectorXd d(static_cast<Eigen::Index>(values.size()));
        Eigen::Index i = 0;
        for (double v : values) {
            d(i++) = v;
        }
        return d;
    }

    time::Epoch t0;
    TrialState trial;
};

TEST_F(TrialStateTest, DefaultManeuver) {
    EXPECT_EQ(trial.maneuver.start, t0);
    EXPECT_DOUBLE_EQ(trial.maneuver.duration(), 5.0);
    EXPECT_DOUBLE_EQ(trial.maneuver.thrust_level, 1.0);
    EXPECT_EQ(trial.maneuver.frame, LocalFrame::RCN);
    EXPECT_EQ(trial.maneuver.alpha, dynamics::QuadraticPolynomial());
}

TEST_F(TrialStateTest, StartEpochShiftsWindow) {
    trial.apply(problem_with({Vary::StartEpoch}), deltas({10.0}));
    EXPECT_DOUBLE_EQ(trial.maneuver.start - t0, 10.0);
    EXPECT_DOUBLE_EQ(trial.maneuver.duration(), 5.0);
}

TEST_F(TrialStateTest, DurationAndEndEpochMoveTheEnd) {
    trial.apply(problem_with({Vary::Duration}), deltas({3.0}));
    EXPECT_EQ(trial.maneuver.start, t0);
    EXPECT_DOUBLE_EQ(trial.maneuver.duration(), 8.0);

    trial.apply(problem_with({Vary::EndEpoch}), deltas({-2.0}));
    EXPECT_DOUBLE_EQ(trial.maneuver.duration(), 6.0);
    EXPECT_DOUBLE_EQ(trial.maneuver.end - trial.maneuver.start, trial.maneuver.duration());
}

TEST_F(TrialStateTest, DurationNeverNegative) {
    trial.apply(problem_with({Vary::Duration}), deltas({-20.0}));
    EXPECT_DOUBLE_EQ(trial.maneuver.duration(), 0.0);
    EXPECT_EQ(trial.maneuver.end, trial.maneuver.start);
}

TEST_F(TrialStateTest, TinyEpochChangesAreIgnored) {
    TargetingProblem p = problem_with({Vary::StartEpoch, Vary::Duration});
    Eigen::VectorXd applied = trial.apply(p, deltas({5e-4, -9e-4}));
    EXPECT_EQ(trial.maneuver.start, t0);
    EXPECT_DOUBLE_EQ(trial.maneuver.duration(), 5.0);
    EXPECT_DOUBLE_EQ(applied(0), 0.0);
    EXPECT_DOUBLE_EQ(applied(1), 0.0);

    p.epoch_noop_threshold_s = 1e-5;
    trial.apply(p, deltas({5e-4, 0.0}));
    EXPECT_NEAR(trial.maneuver.start - t0, 5e-4, 1e-9);
}

TEST_F(TrialStateTest, DurationGuessSetsTheBurnLength) {
    TargetingProblem p = problem_with({Vary::Duration});
    p.variables[0].with_initial_guess(30.0);

    Eigen::VectorXd total = trial.apply_initial_guesses(p);
    EXPECT_EQ(trial.maneuver.start, t0);
    EXPECT_DOUBLE_EQ(trial.maneuver.duration(), 30.0);
    EXPECT_DOUBLE_EQ(total(0), 30.0);

    // The floor at zero keeps only the part of the step that was flown
    Eigen::VectorXd applied = trial.apply(p, deltas({-50.0}));
    EXPECT_DOUBLE_EQ(applied(0), -30.0);
    EXPECT_DOUBLE_EQ(trial.maneuver.duration(), 0.0);
    total += applied;

    total += trial.apply(p, deltas({10.0}));
    EXPECT_DOUBLE_EQ(trial.maneuver.duration(), 10.0);
    EXPECT_DOUBLE_EQ(total(0), trial.maneuver.duration());
}

TEST_F(TrialStateTest, DefaultDurationGuessKeepsDefaultWindow) {
    Eigen::VectorXd total = trial.apply_initial_guesses(problem_with({Vary::Duration}));
    EXPECT_DOUBLE_EQ(trial.maneuver.duration(), DEFAULT_BURN_DURATION_S);
    EXPECT_DOUBLE_EQ(total(0), DEFAULT_BURN_DURATION_S);
}

TEST_F(TrialStateTest, InitialGuessesOfOtherTimingVariablesAreOffsets) {
    TargetingProblem p = problem_with({Vary::StartEpoch, Vary::EndEpoch, Vary::Duration});
    p.variables[0].with_initial_guess(20.0);
    p.variables[1].with_initial_guess(4.0);
    p.variables[2].with_initial_guess(60.0);

    Eigen::VectorXd total = trial.apply_initial_guesses(p);
    EXPECT_DOUBLE_EQ(trial.maneuver.start - t0, 20.0);
    EXPECT_DOUBLE_EQ(trial.maneuver.duration(), 64.0);
    EXPECT_DOUBLE_EQ(total(0), 20.0);
    EXPECT_DOUBLE_EQ(total(1), 4.0);
    EXPECT_DOUBLE_EQ(total(2), 60.0);
}

TEST_F(TrialStateTest, SteeringCoefficients) {
    TargetingProblem p = problem_with({Vary::MnvrAlpha, Vary::MnvrAlphaDot, Vary::MnvrAlphaDDot,
                                       Vary::MnvrBeta, Vary::MnvrBetaDot, Vary::MnvrBetaDDot});
    trial.apply(p, deltas({0.1, 0.2, 0.3, 0.4, 0.5, 0.6}));
    EXPECT_DOUBLE_EQ(trial.maneuver.alpha.c, 0.1);
    EXPECT_DOUBLE_EQ(trial.maneuver.alpha.b, 0.2);
    EXPECT_DOUBLE_EQ(trial.maneuver.alpha.a, 0.3);
    EXPECT_DOUBLE_EQ(trial.maneuver.beta.c, 0.4);
    EXPECT_DOUBLE_EQ(trial.maneuver.beta.b, 0.5);
    EXPECT_DOUBLE_EQ(trial.maneuver.beta.a, 0.6);

    // Steering changes never touch the state
    EXPECT_DOUBLE_EQ(trial.state.orbit.velocity.y(), 7.5);
}

TEST_F(TrialStateTest, InertialStateCorrections) {
    trial.apply(problem_with({Vary::PositionX, Vary::VelocityY, Vary::VelocityZ}),
                deltas({1.0, 0.1, -0.2}));
    EXPECT_DOUBLE_EQ(trial.state.orbit.position.x(), 7001.0);
    EXPECT_DOUBLE_EQ(trial.state.orbit.velocity.y(), 7.6);
    EXPECT_DOUBLE_EQ(trial.state.orbit.velocity.z(), -0.2);
}

TEST_F(TrialStateTest, FrameVelocityCorrections) {
    TargetingProblem p = problem_with({Vary::VelocityX, Vary::VelocityY, Vary::VelocityZ});
    p.correction_frame = LocalFrame::RIC;
    // RIC here: R = +X, I = +Y, C = +Z
    trial.apply(p, deltas({0.01, 0.02, 0.03}));
    EXPECT_NEAR(trial.state.orbit.velocity.x(), 0.01, 1e-12);
    EXPECT_NEAR(trial.state.orbit.velocity.y(), 7.52, 1e-12);
    EXPECT_NEAR(trial.state.orbit.velocity.z(), 0.03, 1e-12);
}

TEST_F(TrialStateTest, ApplyOneTouchesOnlyThatVariable) {
    TargetingProblem p = problem_with({Vary::VelocityX, Vary::Duration});
    trial.apply_one(p, 1, 2.0);
    EXPECT_DOUBLE_EQ(trial.maneuver.duration(), 7.0);
    EXPECT_DOUBLE_EQ(trial.state.orbit.velocity.x(), 0.0);
}

TEST_F(TrialStateTest, CorrectedStateUsesSameRule) {
    TargetingProblem p = problem_with({Vary::VelocityX});
    p.correction_frame = LocalFrame::VNC;
    dynamics::Spacecraft sc = trial.state;
    apply_state_corrections(p, deltas({0.1}), sc);
    trial.apply(p, deltas({0.1}));
    EXPECT_TRUE(sc.orbit.velocity.isApprox(trial.state.orbit.velocity));
    EXPECT_NEAR(sc.orbit.velocity.y(), 7.6, 1e-12);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
