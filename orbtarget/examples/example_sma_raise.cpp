/**
 * @file example_sma_raise.cpp
 * @brief Raise the semi-major axis of a LEO with a prograde VNC burn
 *
 * A circular 7000 km orbit is targeted to SMA = 8100 km with a single
 * impulsive velocity change, first in the VNC frame with finite-difference
 * sensitivities, then inertially with the analytic STM sensitivities.
 */

#include <orbtarget/Orbtarget.hpp>
#include <iomanip>
#include <iostream>
#include <memory>

using namespace orbtarget;
using namespace orbtarget::coordinates;
using namespace orbtarget::targeting;

int main() {
    std::cout << std::fixed << std::setprecision(6);

    const time::Epoch epoch = time::Epoch::from_gregorian_tdb(2025, 1, 1, 0, 0, 0.0);
    KeplerianElements elements;
    elements.sma_km = 7000.0;
    elements.ecc = 1e-3;
    elements.inc_deg = 28.5;
    const CartesianState orbit = CartesianState::from_keplerian(elements, epoch);
    const dynamics::Spacecraft spacecraft(orbit, 500.0, 100.0);

    auto propagator = std::make_shared<const propagation::CowellPropagator>(
        dynamics::SpacecraftDynamics::two_body());

    std::vector<Objective> objectives = {Objective(StateParameter::SMA, 8100.0, 0.1)};

    TargeterSettings settings;
    settings.verbose = true;

    std::cout << "=== VNC, finite differences ===\n";
    Targeter vnc = Targeter::vnc(propagator, objectives, settings);
    TargeterSolution sol = vnc.run(spacecraft, epoch, epoch + 3600.0);
    sol.print_summary();
    std::cout << "Prograde Δv: " << sol.correction_for(Vary::VelocityX) * 1e3 << " m/s\n";

    std::cout << "\n=== Inertial, analytic STM ===\n";
    Targeter inertial = Targeter::delta_v(propagator, objectives, settings);
    inertial.set_jacobian_estimator(std::make_shared<AnalyticJacobian>());
    TargeterSolution sol_stm = inertial.run(spacecraft, epoch, epoch + 3600.0);
    sol_stm.print_summary();

    std::cout << "\nJSON report:\n" << config::to_json(sol).dump(2) << "\n";
    return 0;
}
