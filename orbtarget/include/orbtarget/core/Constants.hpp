/**
 * @file Constants.hpp
 * @brief Physical and numerical constants
 *
 * Units are kilometers, seconds and kilograms unless stated otherwise.
 */

#ifndef ORBTARGET_CORE_CONSTANTS_HPP
#define ORBTARGET_CORE_CONSTANTS_HPP

namespace orbtarget::constants {

constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;
constexpr double DEG_TO_RAD = PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / PI;

// Earth (EGM2008 / WGS84)
constexpr double GM_EARTH = 398600.4415;      ///< [km³/s²]
constexpr double R_EARTH = 6378.1363;         ///< Equatorial radius [km]
constexpr double J2_EARTH = 1.0826261738e-3;
constexpr double J3_EARTH = -2.5324105186e-6;
constexpr double J4_EARTH = -1.6198975999e-6;

// Other bodies
constexpr double GM_MOON = 4902.800066;       ///< [km³/s²]
constexpr double GM_SUN = 132712440041.9394;  ///< [km³/s²]
constexpr double GM_MARS = 42828.37;          ///< [km³/s²]

constexpr double STANDARD_GRAVITY = 9.80665;  ///< g0 [m/s²]

// Time
constexpr double SECONDS_PER_DAY = 86400.0;
constexpr double MJD_J2000 = 51544.5;         ///< MJD of J2000.0 epoch

} // namespace orbtarget::constants

#endif // ORBTARGET_CORE_CONSTANTS_HPP
