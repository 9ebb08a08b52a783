/**
 * @file Version.hpp
 * @brief Library version
 */

#ifndef ORBTARGET_VERSION_HPP
#define ORBTARGET_VERSION_HPP

#define ORBTARGET_VERSION_MAJOR 1
#define ORBTARGET_VERSION_MINOR 0
#define ORBTARGET_VERSION_PATCH 0
#define ORBTARGET_VERSION_STRING "1.0.0"

namespace orbtarget {

inline const char* version() { return ORBTARGET_VERSION_STRING; }

} // namespace orbtarget

#endif // ORBTARGET_VERSION_HPP
