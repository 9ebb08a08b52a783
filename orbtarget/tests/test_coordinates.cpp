/**
 * @file test_coordinates.cpp
 * @brief Epochs, Cartesian states, local frames, dual partials and the B-plane
 */

#include <gtest/gtest.h>
#include <orbtarget/coordinates/BPlane.hpp>
#include <orbtarget/coordinates/CartesianState.hpp>
#include <orbtarget/coordinates/LocalFrame.hpp>
#include <orbtarget/coordinates/OrbitDual.hpp>
#include <orbtarget/coordinates/StateParameter.hpp>
#include <orbtarget/math/LinearAlgebra.hpp>
#include <orbtarget/time/Epoch.hpp>
#include <orbtarget/core/Constants.hpp>

#include <cmath>

using namespace orbtarget;
using namespace orbtarget::coordinates;

namespace {

const time::Epoch T0 = time::Epoch::from_mjd_tdb(60000.0);

CartesianState inclined_ellipse() {
    KeplerianElements k;
    k.sma_km = 9000.0;
    k.ecc = 0.2;
    k.inc_deg = 35.0;
    k.raan_deg = 40.0;
    k.aop_deg = 70.0;
    k.ta_deg = 100.0;
    return CartesianState::from_keplerian(k, T0);
}

CartesianState inclined_hyperbola() {
    KeplerianElements k;
    k.sma_km = -15000.0;
    k.ecc = 1.6;
    k.inc_deg = 25.0;
    k.raan_deg = 60.0;
    k.aop_deg = 30.0;
    k.ta_deg = -50.0;
    return CartesianState::from_keplerian(k, T0);
}

/// Central-difference gradient of value(parameter) with respect to [r, v]
RowVector6d numeric_gradient(const CartesianState& state, StateParameter parameter) {
    RowVector6d g;
    for (int i = 0; i < 6; ++i) {
        const double h = i < 3 ? 1e-3 : 1e-6;
        CartesianState plus = state;
        CartesianState minus = state;
        plus.set_component(i, state.component(i) + h);
        minus.set_component(i, state.component(i) - h);
        g(i) = (plus.value(parameter) - minus.value(parameter)) / (2.0 * h);
    }
    return g;
}

void expect_dual_matches_numeric(const CartesianState& state, StateParameter parameter) {
    OrbitDual orbit(state);
    math::Dual d = is_b_plane(parameter) ? BPlane::from_dual(orbit).value_for(parameter)
                                         : orbit.partial_for(parameter);
    EXPECT_NEAR(d.real(), state.value(parameter), 1e-9 * std::max(1.0, std::abs(d.real())))
        << to_string(parameter);

    RowVector6d numeric = numeric_gradient(state, parameter);
    for (int i = 0; i < 6; ++i) {
        EXPECT_NEAR(d.partial(i), numeric(i), 1e-4 * std::max(1.0, std::abs(numeric(i))))
            << to_string(parameter) << " d/dx" << i;
    }
}

} // anonymous namespace

// ============================================================================
// Epoch
// ============================================================================

TEST(EpochTest, J2000Reference) {
    time::Epoch j2000 = time::Epoch::from_gregorian_tdb(2000, 1, 1, 12, 0, 0.0);
    EXPECT_DOUBLE_EQ(j2000.seconds_j2000(), 0.0);
    EXPECT_DOUBLE_EQ(j2000.mjd_tdb(), 51544.5);
    EXPECT_DOUBLE_EQ(j2000.jd_tdb(), 2451545.0);
    EXPECT_EQ(j2000.to_string(), "2000-01-01T12:00:00.000 TDB");
}

TEST(EpochTest, Arithmetic) {
    time::Epoch a = time::Epoch::from_mjd_tdb(60000.0);
    time::Epoch b = a + 90.0;
    EXPECT_DOUBLE_EQ(b - a, 90.0);
    EXPECT_TRUE(a < b);
    EXPECT_EQ(b - 90.0, a);
    b -= 30.0;
    EXPECT_DOUBLE_EQ(b - a, 60.0);
    EXPECT_DOUBLE_EQ(time::Epoch::from_jd_tdb(2460000.5).mjd_tdb(), 60000.0);
}

// ============================================================================
// CartesianState
// ============================================================================

TEST(CartesianStateTest, KeplerianRoundTrip) {
    CartesianState s = inclined_ellipse();
    KeplerianElements k = s.to_keplerian();
    EXPECT_NEAR(k.sma_km, 9000.0, 1e-6);
    EXPECT_NEAR(k.ecc, 0.2, 1e-12);
    EXPECT_NEAR(k.inc_deg, 35.0, 1e-10);
    EXPECT_NEAR(k.raan_deg, 40.0, 1e-10);
    EXPECT_NEAR(k.aop_deg, 70.0, 1e-9);
    EXPECT_NEAR(k.ta_deg, 100.0, 1e-9);

    EXPECT_NEAR(s.value(StateParameter::Periapsis), 9000.0 * 0.8, 1e-6);
    EXPECT_NEAR(s.value(StateParameter::Apoapsis), 9000.0 * 1.2, 1e-6);
    EXPECT_NEAR(s.value(StateParameter::Energy), -constants::GM_EARTH / 18000.0, 1e-9);
}

TEST(CartesianStateTest, InvalidElements) {
    KeplerianElements parabolic;
    parabolic.sma_km = 7000.0;
    parabolic.ecc = 1.0;
    EXPECT_THROW(CartesianState::from_keplerian(parabolic, T0), std::invalid_argument);

    KeplerianElements wrong_sign;
    wrong_sign.sma_km = 7000.0;
    wrong_sign.ecc = 1.5;
    EXPECT_THROW(CartesianState::from_keplerian(wrong_sign, T0), std::invalid_argument);
}

TEST(CartesianStateTest, ComponentsAndSetValue) {
    CartesianState s = inclined_ellipse();
    EXPECT_DOUBLE_EQ(s.component(4), s.velocity.y());
    EXPECT_THROW(s.component(6), std::out_of_range);

    s.set_value(StateParameter::VZ, 1.25);
    EXPECT_DOUBLE_EQ(s.velocity.z(), 1.25);

    CartesianState k = inclined_ellipse();
    k.set_value(StateParameter::SMA, 9500.0);
    EXPECT_NEAR(k.value(StateParameter::SMA), 9500.0, 1e-6);
    EXPECT_NEAR(k.value(StateParameter::Eccentricity), 0.2, 1e-12);
    EXPECT_NEAR(k.value(StateParameter::Inclination), 35.0, 1e-10);

    EXPECT_THROW(k.set_value(StateParameter::C3, 1.0), std::invalid_argument);
}

TEST(CartesianStateTest, LocalFramesAreRotations) {
    CartesianState s = inclined_ellipse();
    for (LocalFrame f : {LocalFrame::VNC, LocalFrame::RIC, LocalFrame::RCN}) {
        Matrix3d dcm = s.dcm_from_frame(f);
        EXPECT_TRUE((dcm.transpose() * dcm).isApprox(Matrix3d::Identity(), 1e-12)) << to_string(f);
        EXPECT_NEAR(dcm.determinant(), 1.0, 1e-12) << to_string(f);
    }

    // First VNC axis is the velocity direction
    EXPECT_TRUE(s.dcm_from_frame(LocalFrame::VNC).col(0).isApprox(s.velocity.normalized(), 1e-14));
    EXPECT_TRUE(s.dcm_from_frame(LocalFrame::RIC).col(0).isApprox(s.position.normalized(), 1e-14));

    EXPECT_THROW(s.dcm_from_frame(LocalFrame::Inertial), std::invalid_argument);

    CartesianState rectilinear(T0, Vector3d(7000.0, 0.0, 0.0), Vector3d(1.0, 0.0, 0.0));
    EXPECT_THROW(rectilinear.dcm_from_frame(LocalFrame::VNC), std::invalid_argument);
}

TEST(CartesianStateTest, FrameNames) {
    EXPECT_EQ(local_frame_from_string("vnc"), LocalFrame::VNC);
    EXPECT_EQ(local_frame_from_string("RCN"), LocalFrame::RCN);
    EXPECT_EQ(to_string(LocalFrame::RIC), "RIC");
    EXPECT_THROW(local_frame_from_string("LVLH"), std::invalid_argument);

    EXPECT_EQ(state_parameter_from_string("sma"), StateParameter::SMA);
    EXPECT_EQ(state_parameter_from_string("BdotR"), StateParameter::BdotR);
    EXPECT_THROW(state_parameter_from_string("Altitude"), std::invalid_argument);
    EXPECT_TRUE(is_angle(StateParameter::AoP));
    EXPECT_FALSE(is_angle(StateParameter::SMA));
    EXPECT_EQ(cartesian_index(StateParameter::VY), 4);
}

// ============================================================================
// Dual partials
// ============================================================================

TEST(OrbitDualTest, PartialsMatchFiniteDifferences) {
    const CartesianState s = inclined_ellipse();
    for (StateParameter p : {StateParameter::X, StateParameter::VZ, StateParameter::Rmag,
                             StateParameter::Vmag, StateParameter::Hmag, StateParameter::Energy,
                             StateParameter::C3, StateParameter::SMA, StateParameter::Eccentricity,
                             StateParameter::Inclination, StateParameter::RAAN, StateParameter::AoP,
                             StateParameter::TrueAnomaly, StateParameter::FlightPathAngle,
                             StateParameter::Periapsis, StateParameter::Apoapsis,
                             StateParameter::Declination, StateParameter::RightAscension}) {
        expect_dual_matches_numeric(s, p);
    }
}

TEST(OrbitDualTest, BPlanePartialsMatchFiniteDifferences) {
    const CartesianState s = inclined_hyperbola();
    for (StateParameter p : {StateParameter::BdotR, StateParameter::BdotT, StateParameter::BLTOF}) {
        expect_dual_matches_numeric(s, p);
    }
}

// ============================================================================
// B-plane
// ============================================================================

TEST(BPlaneTest, PlanarFlybyAtPeriapsis) {
    // Hyperbolic periapsis passage in the XY plane
    CartesianState s(T0, Vector3d(7000.0, 0.0, 0.0), Vector3d(0.0, 12.0, 0.0));
    const double a = s.value(StateParameter::SMA);
    const double e = s.value(StateParameter::Eccentricity);
    ASSERT_LT(a, 0.0);
    ASSERT_GT(e, 1.0);
    const double b_expected = std::abs(a) * std::sqrt(e * e - 1.0);

    BPlane bp = BPlane::from_dual(OrbitDual(s));
    EXPECT_NEAR(bp.b_r.real(), 0.0, 1e-6);
    EXPECT_NEAR(std::abs(bp.b_t.real()), b_expected, 1e-6 * b_expected);
    EXPECT_NEAR(bp.b_mag(), b_expected, 1e-6 * b_expected);
    EXPECT_NEAR(bp.ltof_s.real(), 0.0, 1e-6);
    EXPECT_NEAR(s.value(StateParameter::BLTOF), 0.0, 1e-6);
}

TEST(BPlaneTest, IncomingLegHasPositiveTimeToPeriapsis) {
    const CartesianState s = inclined_hyperbola();
    EXPECT_GT(s.value(StateParameter::BLTOF), 0.0);
    const double bt = s.value(StateParameter::BdotT);
    const double br = s.value(StateParameter::BdotR);
    BPlane bp = BPlane::from_dual(OrbitDual(s));
    EXPECT_NEAR(bp.b_mag(), std::hypot(bt, br), 1e-9 * bp.b_mag());
    EXPECT_NEAR(bp.b_theta_deg(), std::atan2(br, bt) * constants::RAD_TO_DEG, 1e-9);
}

TEST(BPlaneTest, UndefinedForEllipse) {
    EXPECT_THROW(BPlane::from_dual(OrbitDual(inclined_ellipse())), std::invalid_argument);
    EXPECT_THROW(inclined_ellipse().value(StateParameter::BdotT), std::invalid_argument);
}

// ============================================================================
// Pseudo-inverse
// ============================================================================

TEST(PseudoInverseTest, SquareRectangularAndSingular) {
    Eigen::MatrixXd square(2, 2);
    square << 4.0, 1.0, 2.0, 3.0;
    auto inv = math::pseudo_inverse(square);
    ASSERT_TRUE(inv.has_value());
    EXPECT_TRUE((square * (*inv)).isApprox(Eigen::MatrixXd::Identity(2, 2), 1e-12));

    // Wide: minimum-norm right inverse
    Eigen::MatrixXd wide(1, 3);
    wide << 1.0, 2.0, 2.0;
    auto winv = math::pseudo_inverse(wide);
    ASSERT_TRUE(winv.has_value());
    EXPECT_NEAR((wide * (*winv))(0, 0), 1.0, 1e-12);
    EXPECT_NEAR((*winv)(1, 0), 2.0 / 9.0, 1e-12);

    // Rank deficient: Moore-Penrose conditions still hold
    Eigen::MatrixXd rank1(2, 2);
    rank1 << 1.0, 2.0, 2.0, 4.0;
    auto rinv = math::pseudo_inverse(rank1);
    ASSERT_TRUE(rinv.has_value());
    EXPECT_TRUE((rank1 * (*rinv) * rank1).isApprox(rank1, 1e-12));

    Eigen::MatrixXd zero = Eigen::MatrixXd::Zero(2, 3);
    auto zinv = math::pseudo_inverse(zero);
    ASSERT_TRUE(zinv.has_value());
    EXPECT_TRUE(zinv->isZero());
    EXPECT_EQ(zinv->rows(), 3);

    Eigen::MatrixXd bad(1, 1);
    bad << std::nan("");
    EXPECT_FALSE(math::pseudo_inverse(bad).has_value());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
