/**
 * @file StateParameter.hpp
 * @brief Closed set of readable orbit parameters and their properties
 *
 * Each parameter is described once in a table (name, unit, angle flag,
 * B-plane flag, Cartesian index). All lookups go through that table.
 */

#ifndef ORBTARGET_COORDINATES_STATE_PARAMETER_HPP
#define ORBTARGET_COORDINATES_STATE_PARAMETER_HPP

#include <string>

namespace orbtarget::coordinates {

enum class StateParameter {
    X,                  ///< Position X [km]
    Y,                  ///< Position Y [km]
    Z,                  ///< Position Z [km]
    VX,                 ///< Velocity X [km/s]
    VY,                 ///< Velocity Y [km/s]
    VZ,                 ///< Velocity Z [km/s]
    Rmag,               ///< Radius magnitude [km]
    Vmag,               ///< Velocity magnitude [km/s]
    Hmag,               ///< Specific angular momentum magnitude [km²/s]
    Energy,             ///< Specific orbital energy [km²/s²]
    C3,                 ///< Characteristic energy [km²/s²]
    SMA,                ///< Semi-major axis [km]
    Eccentricity,       ///< Eccentricity [-]
    Inclination,        ///< Inclination [deg]
    RAAN,               ///< Right ascension of the ascending node [deg]
    AoP,                ///< Argument of periapsis [deg]
    TrueAnomaly,        ///< True anomaly [deg]
    FlightPathAngle,    ///< Flight path angle [deg]
    Periapsis,          ///< Periapsis radius [km]
    Apoapsis,           ///< Apoapsis radius [km]
    Declination,        ///< Declination of the position vector [deg]
    RightAscension,     ///< Right ascension of the position vector [deg]
    BdotR,              ///< B-plane B·R [km]
    BdotT,              ///< B-plane B·T [km]
    BLTOF               ///< Time of flight to periapsis on the hyperbola [s]
};

/**
 * @brief Static description of a StateParameter
 */
struct StateParameterInfo {
    StateParameter parameter;
    const char* name;
    const char* unit;
    bool is_angle;          ///< Value is an angle in degrees (errors wrap)
    bool is_b_plane;        ///< Requires a hyperbolic B-plane
    int cartesian_index;    ///< 0..5 for raw Cartesian components, -1 otherwise
};

const StateParameterInfo& info(StateParameter parameter);

inline bool is_b_plane(StateParameter parameter) { return info(parameter).is_b_plane; }
inline bool is_angle(StateParameter parameter) { return info(parameter).is_angle; }
inline int cartesian_index(StateParameter parameter) { return info(parameter).cartesian_index; }

std::string to_string(StateParameter parameter);

/**
 * @brief Parse a parameter name as written in the table (case-insensitive)
 * @throws std::invalid_argument on unknown names
 */
StateParameter state_parameter_from_string(const std::string& name);

} // namespace orbtarget::coordinates

#endif // ORBTARGET_COORDINATES_STATE_PARAMETER_HPP
