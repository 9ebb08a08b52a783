/**
 * @file Spacecraft.hpp
 * @brief Spacecraft state: orbit, masses, thruster and guidance mode
 */

#ifndef ORBTARGET_DYNAMICS_SPACECRAFT_HPP
#define ORBTARGET_DYNAMICS_SPACECRAFT_HPP

#include "orbtarget/coordinates/CartesianState.hpp"
#include <optional>
#include <ostream>
#include <string>

namespace orbtarget::dynamics {

/**
 * @brief Chemical or electric thruster
 */
struct Thruster {
    double thrust_N = 0.0;   ///< Thrust at full throttle [N]
    double isp_s = 0.0;      ///< Specific impulse [s]

    /// Exhaust velocity [m/s]
    double exhaust_velocity() const { return isp_s * constants::STANDARD_GRAVITY; }
};

/**
 * @brief Whether the dynamics apply the thruster inside a maneuver window
 */
enum class GuidanceMode {
    Coast,      ///< Thruster off
    Thrust,     ///< Thruster follows the maneuver profile
    Inhibit     ///< Thruster disabled until re-enabled explicitly
};

std::string to_string(GuidanceMode mode);

struct Spacecraft {
    coordinates::CartesianState orbit;
    double dry_mass_kg = 0.0;
    double fuel_mass_kg = 0.0;
    std::optional<Thruster> thruster;
    GuidanceMode mode = GuidanceMode::Coast;

    Spacecraft() = default;
    Spacecraft(const coordinates::CartesianState& orbit, double dry_mass_kg,
               double fuel_mass_kg = 0.0);

    double mass_kg() const { return dry_mass_kg + fuel_mass_kg; }
    const time::Epoch& epoch() const { return orbit.epoch; }
    bool has_thruster() const { return thruster.has_value(); }

    /// Copy with an inertial velocity increment applied [km/s]
    Spacecraft with_dv(const Vector3d& dv) const;

    Spacecraft with_guidance_mode(GuidanceMode new_mode) const;

    Spacecraft with_thruster(const Thruster& new_thruster) const;

    /// Pack [x, y, z, vx, vy, vz, fuel] for integration
    Vector7d to_vector() const;

    /// Unpack a 7-state vector at @p epoch
    void set_vector(const time::Epoch& epoch, const Vector7d& state);
};

std::ostream& operator<<(std::ostream& os, const Spacecraft& spacecraft);

} // namespace orbtarget::dynamics

#endif // ORBTARGET_DYNAMICS_SPACECRAFT_HPP
