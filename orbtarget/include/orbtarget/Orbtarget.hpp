/**
 * @file Orbtarget.hpp
 * @brief Main include file for the orbtarget library
 *
 * Include this file to access the differential corrector and the
 * dynamics and propagation layer it drives.
 */

#ifndef ORBTARGET_HPP
#define ORBTARGET_HPP

#include "orbtarget/Version.hpp"

// Core types and constants
#include "orbtarget/core/Types.hpp"
#include "orbtarget/core/Constants.hpp"

// Time
#include "orbtarget/time/Epoch.hpp"

// Coordinates and derived parameters
#include "orbtarget/coordinates/CartesianState.hpp"
#include "orbtarget/coordinates/LocalFrame.hpp"
#include "orbtarget/coordinates/StateParameter.hpp"
#include "orbtarget/coordinates/BPlane.hpp"

// Dynamics
#include "orbtarget/dynamics/Spacecraft.hpp"
#include "orbtarget/dynamics/Maneuver.hpp"
#include "orbtarget/dynamics/SpacecraftDynamics.hpp"

// Propagation
#include "orbtarget/propagation/CowellPropagator.hpp"
#include "orbtarget/propagation/Trajectory.hpp"

// Targeting
#include "orbtarget/targeting/Targeter.hpp"
#include "orbtarget/targeting/ImpulsiveConverter.hpp"

// Configuration
#include "orbtarget/config/TargetingConfig.hpp"

#endif // ORBTARGET_HPP
