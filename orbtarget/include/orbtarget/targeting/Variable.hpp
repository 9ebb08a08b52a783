/**
 * @file Variable.hpp
 * @brief Free parameters adjusted by the differential corrector
 *
 * Every Vary tag is described once in a table: where it acts (state
 * component, burn timing or steering coefficient), its index there, and its
 * default perturbation, step limit and bounds.
 */

#ifndef ORBTARGET_TARGETING_VARIABLE_HPP
#define ORBTARGET_TARGETING_VARIABLE_HPP

#include <ostream>
#include <string>

namespace orbtarget::targeting {

enum class Vary {
    PositionX,          ///< Inertial position X [km]
    PositionY,          ///< Inertial position Y [km]
    PositionZ,          ///< Inertial position Z [km]
    VelocityX,          ///< Velocity X, or first axis of the correction frame [km/s]
    VelocityY,          ///< Velocity Y, or second axis of the correction frame [km/s]
    VelocityZ,          ///< Velocity Z, or third axis of the correction frame [km/s]
    StartEpoch,         ///< Shift of the maneuver window [s]
    EndEpoch,           ///< Shift of the maneuver end [s]
    Duration,           ///< Maneuver duration [s]: the initial guess sets it, corrections change it
    MnvrAlpha,          ///< In-plane angle value [rad]
    MnvrAlphaDot,       ///< In-plane angle rate [rad/s]
    MnvrAlphaDDot,      ///< In-plane angle curvature [rad/s²]
    MnvrBeta,           ///< Out-of-plane angle value [rad]
    MnvrBetaDot,        ///< Out-of-plane angle rate [rad/s]
    MnvrBetaDDot        ///< Out-of-plane angle curvature [rad/s²]
};

/// Where a variable acts
enum class VariableTarget {
    StatePosition,
    StateVelocity,
    BurnTiming,
    SteeringAlpha,
    SteeringBeta
};

struct VaryInfo {
    Vary component;
    const char* name;
    VariableTarget target;
    int index;              ///< State index (0..5), polynomial order (0..2), or -1 for timing
    double perturbation;    ///< Default finite-difference step
    double max_step;        ///< Default per-iteration step limit
    double min_value;       ///< Default lower bound of a correction
    double max_value;       ///< Default upper bound of a correction
};

const VaryInfo& info(Vary component);

std::string to_string(Vary component);

/// @throws std::invalid_argument on unknown names
Vary vary_from_string(const std::string& name);

inline bool is_state(Vary c) {
    VariableTarget t = info(c).target;
    return t == VariableTarget::StatePosition || t == VariableTarget::StateVelocity;
}
inline bool is_position(Vary c) { return info(c).target == VariableTarget::StatePosition; }
inline bool is_finite_burn(Vary c) { return !is_state(c); }

/// Burn duration of the default maneuver, and the default Duration guess [s]
constexpr double DEFAULT_BURN_DURATION_S = 5.0;

/**
 * @brief A bounded free parameter
 */
struct Variable {
    Vary component = Vary::VelocityX;
    double initial_guess = 0.0;
    double perturbation = 0.0;
    double max_step = 0.0;
    double min_value = 0.0;
    double max_value = 0.0;

    Variable() : Variable(Vary::VelocityX) {}

    /// Variable with the table defaults for @p component
    explicit Variable(Vary component);

    static Variable from(Vary component) { return Variable(component); }

    Variable& with_initial_guess(double guess) { initial_guess = guess; return *this; }
    Variable& with_perturbation(double pert) { perturbation = pert; return *this; }
    Variable& with_max_step(double step) { max_step = step; return *this; }
    Variable& with_bounds(double min_v, double max_v) { min_value = min_v; max_value = max_v; return *this; }

    /**
     * @brief Check bounds ordering, perturbation, step limit and finiteness
     * @param reason Receives the failure description when not valid
     */
    bool valid(std::string* reason = nullptr) const;

    /// @throws TargetingError (InvalidVariable) if not valid()
    void validate() const;

    /// Apply the per-iteration step limit, then the bounds
    double clamp(double correction) const;
};

std::ostream& operator<<(std::ostream& os, const Variable& variable);

} // namespace orbtarget::targeting

#endif // ORBTARGET_TARGETING_VARIABLE_HPP
