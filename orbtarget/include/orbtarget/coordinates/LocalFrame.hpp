/**
 * @file LocalFrame.hpp
 * @brief Trajectory-relative reference frames used to express corrections
 */

#ifndef ORBTARGET_COORDINATES_LOCAL_FRAME_HPP
#define ORBTARGET_COORDINATES_LOCAL_FRAME_HPP

#include <string>

namespace orbtarget::coordinates {

/**
 * @brief Frames in which a velocity correction or a thrust direction can be expressed
 *
 * - Inertial: the propagation frame itself (not a local frame)
 * - VNC: Velocity, Normal (angular momentum), Co-normal (V x N)
 * - RIC: Radial, In-track (N x R), Cross-track (angular momentum)
 * - RCN: Radial, Cross-track (N x R), Normal (angular momentum)
 */
enum class LocalFrame {
    Inertial,
    VNC,
    RIC,
    RCN
};

/// True for the trajectory-relative frames
inline bool is_local(LocalFrame frame) { return frame != LocalFrame::Inertial; }

std::string to_string(LocalFrame frame);

/**
 * @brief Parse a frame name ("Inertial", "VNC", "RIC", "RCN", case-insensitive)
 * @throws std::invalid_argument on unknown names
 */
LocalFrame local_frame_from_string(const std::string& name);

} // namespace orbtarget::coordinates

#endif // ORBTARGET_COORDINATES_LOCAL_FRAME_HPP
