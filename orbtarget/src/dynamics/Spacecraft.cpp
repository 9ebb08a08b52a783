/**
 * @file Spacecraft.cpp
 */

#include "orbtarget/dynamics/Spacecraft.hpp"
#include <iomanip>
#include <stdexcept>

namespace orbtarget::dynamics {

std::string to_string(GuidanceMode mode) {
    switch (mode) {
        case GuidanceMode::Coast: return "Coast";
        case GuidanceMode::Thrust: return "Thrust";
        case GuidanceMode::Inhibit: return "Inhibit";
    }
    return "Unknown";
}

Spacecraft::Spacecraft(const coordinates::CartesianState& orbit, double dry_mass_kg,
                       double fuel_mass_kg)
    : orbit(orbit), dry_mass_kg(dry_mass_kg), fuel_mass_kg(fuel_mass_kg) {
    if (dry_mass_kg < 0.0 || fuel_mass_kg < 0.0) {
        throw std::invalid_argument("Spacecraft masses must be non-negative");
    }
}

Spacecraft Spacecraft::with_dv(const Vector3d& dv) const {
    Spacecraft out = *this;
    out.orbit.apply_dv(dv);
    return out;
}

Spacecraft Spacecraft::with_guidance_mode(GuidanceMode new_mode) const {
    Spacecraft out = *this;
    out.mode = new_mode;
    return out;
}

Spacecraft Spacecraft::with_thruster(const Thruster& new_thruster) const {
    if (new_thruster.thrust_N <= 0.0 || new_thruster.isp_s <= 0.0) {
        throw std::invalid_argument("Thruster requires positive thrust and Isp");
    }
    Spacecraft out = *this;
    out.thruster = new_thruster;
    return out;
}

Vector7d Spacecraft::to_vector() const {
    Vector7d state;
    state.head<6>() = orbit.to_vector();
    state(6) = fuel_mass_kg;
    return state;
}

void Spacecraft::set_vector(const time::Epoch& epoch, const Vector7d& state) {
    orbit.epoch = epoch;
    orbit.set_vector(state.head<6>());
    fuel_mass_kg = state(6);
}

std::ostream& operator<<(std::ostream& os, const Spacecraft& spacecraft) {
    std::ios_base::fmtflags flags = os.flags();
    os << spacecraft.orbit << "  mass = " << std::fixed << std::setprecision(3)
       << spacecraft.mass_kg() << " kg (fuel " << spacecraft.fuel_mass_kg << " kg)  "
       << to_string(spacecraft.mode);
    os.flags(flags);
    return os;
}

} // namespace orbtarget::dynamics
