/**
 * @file StateParameter.cpp
 * @brief StateParameter lookup table
 */

#include "orbtarget/coordinates/StateParameter.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace orbtarget::coordinates {

namespace {

using P = StateParameter;

// Order must follow the enum declaration
constexpr std::array<StateParameterInfo, 25> kParameterTable = {{
    {P::X,               "X",               "km",     false, false, 0},
    {P::Y,               "Y",               "km",     false, false, 1},
    {P::Z,               "Z",               "km",     false, false, 2},
    {P::VX,              "VX",              "km/s",   false, false, 3},
    {P::VY,              "VY",              "km/s",   false, false, 4},
    {P::VZ,              "VZ",              "km/s",   false, false, 5},
    {P::Rmag,            "Rmag",            "km",     false, false, -1},
    {P::Vmag,            "Vmag",            "km/s",   false, false, -1},
    {P::Hmag,            "Hmag",            "km2/s",  false, false, -1},
    {P::Energy,          "Energy",          "km2/s2", false, false, -1},
    {P::C3,              "C3",              "km2/s2", false, false, -1},
    {P::SMA,             "SMA",             "km",     false, false, -1},
    {P::Eccentricity,    "Eccentricity",    "",       false, false, -1},
    {P::Inclination,     "Inclination",     "deg",    true,  false, -1},
    {P::RAAN,            "RAAN",            "deg",    true,  false, -1},
    {P::AoP,             "AoP",             "deg",    true,  false, -1},
    {P::TrueAnomaly,     "TrueAnomaly",     "deg",    true,  false, -1},
    {P::FlightPathAngle, "FlightPathAngle", "deg",    true,  false, -1},
    {P::Periapsis,       "Periapsis",       "km",     false, false, -1},
    {P::Apoapsis,        "Apoapsis",        "km",     false, false, -1},
    {P::Declination,     "Declination",     "deg",    true,  false, -1},
    {P::RightAscension,  "RightAscension",  "deg",    true,  false, -1},
    {P::BdotR,           "BdotR",           "km",     false, true,  -1},
    {P::BdotT,           "BdotT",           "km",     false, true,  -1},
    {P::BLTOF,           "BLTOF",           "s",      false, true,  -1},
}};

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

const StateParameterInfo& info(StateParameter parameter) {
    return kParameterTable[static_cast<std::size_t>(parameter)];
}

std::string to_string(StateParameter parameter) {
    return info(parameter).name;
}

StateParameter state_parameter_from_string(const std::string& name) {
    const std::string wanted = lowercase(name);
    for (const auto& entry : kParameterTable) {
        if (lowercase(entry.name) == wanted) {
            return entry.parameter;
        }
    }
    throw std::invalid_argument("Unknown state parameter: " + name);
}

} // namespace orbtarget::coordinates
