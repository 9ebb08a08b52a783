/**
 * @file LocalFrame.cpp
 */

#include "orbtarget/coordinates/LocalFrame.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace orbtarget::coordinates {

std::string to_string(LocalFrame frame) {
    switch (frame) {
        case LocalFrame::Inertial: return "Inertial";
        case LocalFrame::VNC: return "VNC";
        case LocalFrame::RIC: return "RIC";
        case LocalFrame::RCN: return "RCN";
    }
    return "Unknown";
}

LocalFrame local_frame_from_string(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "INERTIAL") return LocalFrame::Inertial;
    if (upper == "VNC") return LocalFrame::VNC;
    if (upper == "RIC") return LocalFrame::RIC;
    if (upper == "RCN") return LocalFrame::RCN;

    throw std::invalid_argument("Unknown local frame: " + name);
}

} // namespace orbtarget::coordinates
