/**
 * @file example_finite_burn.cpp
 * @brief Turn an impulsive LEO burn into a finite burn, then retarget it
 *
 * 1. Convert a 5 m/s prograde impulse into a steered 20 N burn that reaches
 *    the post-impulse trajectory.
 * 2. Target the semi-major axis the impulse would have produced by varying
 *    the steering, start epoch and duration of a finite burn.
 */

#include <orbtarget/Orbtarget.hpp>
#include <iomanip>
#include <iostream>
#include <memory>

using namespace orbtarget;
using namespace orbtarget::coordinates;
using namespace orbtarget::targeting;

int main() {
    std::cout << std::setprecision(9);

    const time::Epoch epoch = time::Epoch::from_mjd_tdb(60676.0);
    KeplerianElements elements;
    elements.sma_km = 7000.0;
    elements.ecc = 1e-3;
    elements.inc_deg = 51.6;
    elements.raan_deg = 30.0;
    const CartesianState orbit = CartesianState::from_keplerian(elements, epoch);

    dynamics::Thruster thruster;
    thruster.thrust_N = 20.0;
    thruster.isp_s = 300.0;
    const dynamics::Spacecraft spacecraft =
        dynamics::Spacecraft(orbit, 500.0, 100.0).with_thruster(thruster);

    propagation::PropagatorOptions options;
    options.max_step_s = 300.0;
    auto propagator = std::make_shared<const propagation::CowellPropagator>(
        dynamics::SpacecraftDynamics::two_body(), options);

    const Vector3d dv = 0.005 * orbit.velocity.normalized();

    // 1. Impulsive to finite
    ImpulsiveConversionSettings conv_settings;
    conv_settings.verbose = true;
    ImpulsiveConverter converter(conv_settings);
    try {
        ImpulsiveConversion conversion = converter.convert(spacecraft, dv, *propagator);
        conversion.print_summary();
    } catch (const TargetingError& e) {
        std::cerr << "Conversion failed: " << e.what() << "\n";
        return 1;
    }

    // 2. Finite-burn targeting of the impulsive SMA
    const double desired_sma = spacecraft.with_dv(dv).orbit.value(StateParameter::SMA);
    std::vector<Objective> objectives = {Objective(StateParameter::SMA, desired_sma, 0.1)};

    TargeterSettings settings;
    settings.verbose = true;
    Targeter targeter = Targeter::finite_burn(propagator, objectives, settings);
    try {
        TargeterSolution sol = targeter.run(spacecraft, epoch, epoch + 1800.0);
        sol.print_summary();
    } catch (const TargetingError& e) {
        std::cerr << "Finite burn targeting failed: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
