/**
 * @file Variable.cpp
 */

#include "orbtarget/targeting/Variable.hpp"
#include "orbtarget/targeting/TargetingError.hpp"
#include "orbtarget/core/Constants.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace orbtarget::targeting {

namespace {

using constants::PI;
using T = VariableTarget;

constexpr std::array<VaryInfo, 15> VARY_TABLE = {{
    {Vary::PositionX,     "PositionX",     T::StatePosition, 0,  1e-4, 3.0,  -5.0,   5.0},
    {Vary::PositionY,     "PositionY",     T::StatePosition, 1,  1e-4, 3.0,  -5.0,   5.0},
    {Vary::PositionZ,     "PositionZ",     T::StatePosition, 2,  1e-4, 3.0,  -5.0,   5.0},
    {Vary::VelocityX,     "VelocityX",     T::StateVelocity, 3,  1e-4, 0.5,  -5.0,   5.0},
    {Vary::VelocityY,     "VelocityY",     T::StateVelocity, 4,  1e-4, 0.5,  -5.0,   5.0},
    {Vary::VelocityZ,     "VelocityZ",     T::StateVelocity, 5,  1e-4, 0.5,  -5.0,   5.0},
    {Vary::StartEpoch,    "StartEpoch",    T::BurnTiming,   -1,  1.0,  60.0, -600.0, 600.0},
    {Vary::EndEpoch,      "EndEpoch",      T::BurnTiming,   -1,  1.0,  60.0, -600.0, 600.0},
    {Vary::Duration,      "Duration",      T::BurnTiming,   -1,  1.0,  60.0, -600.0, 600.0},
    {Vary::MnvrAlpha,     "MnvrAlpha",     T::SteeringAlpha, 0,  1e-4, 0.5,  -PI,    PI},
    {Vary::MnvrAlphaDot,  "MnvrAlphaDot",  T::SteeringAlpha, 1,  1e-4, 0.5,  -PI,    PI},
    {Vary::MnvrAlphaDDot, "MnvrAlphaDDot", T::SteeringAlpha, 2,  1e-4, 0.5,  -PI,    PI},
    {Vary::MnvrBeta,      "MnvrBeta",      T::SteeringBeta,  0,  1e-4, 0.5,  -PI,    PI},
    {Vary::MnvrBetaDot,   "MnvrBetaDot",   T::SteeringBeta,  1,  1e-4, 0.5,  -PI,    PI},
    {Vary::MnvrBetaDDot,  "MnvrBetaDDot",  T::SteeringBeta,  2,  1e-4, 0.5,  -PI,    PI},
}};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

const VaryInfo& info(Vary component) {
    return VARY_TABLE[static_cast<std::size_t>(component)];
}

std::string to_string(Vary component) {
    return info(component).name;
}

Vary vary_from_string(const std::string& name) {
    const std::string key = lower(name);
    for (const auto& entry : VARY_TABLE) {
        if (lower(entry.name) == key) {
            return entry.component;
        }
    }
    throw std::invalid_argument("Unknown variable component: " + name);
}

Variable::Variable(Vary c) {
    const VaryInfo& i = info(c);
    component = c;
    perturbation = i.perturbation;
    max_step = i.max_step;
    min_value = i.min_value;
    max_value = i.max_value;
    if (c == Vary::Duration) {
        initial_guess = DEFAULT_BURN_DURATION_S;
    }
}

bool Variable::valid(std::string* reason) const {
    auto fail = [&](const std::string& msg) {
        if (reason) {
            *reason = to_string(component) + ": " + msg;
        }
        return false;
    };

    if (!std::isfinite(initial_guess) || !std::isfinite(perturbation) ||
        !std::isfinite(max_step) || std::isnan(min_value) || std::isnan(max_value)) {
        return fail("non-finite field");
    }
    if (perturbation == 0.0) {
        return fail("perturbation must be non-zero");
    }
    if (max_step == 0.0) {
        return fail("max step must be non-zero");
    }
    if (min_value > max_value) {
        return fail("min value " + std::to_string(min_value) + " exceeds max value " +
                    std::to_string(max_value));
    }
    return true;
}

void Variable::validate() const {
    std::string reason;
    if (!valid(&reason)) {
        throw TargetingError(TargetingErrorKind::InvalidVariable, reason);
    }
}

double Variable::clamp(double correction) const {
    const double step = std::abs(max_step);
    if (std::abs(correction) > step) {
        correction = std::copysign(step, correction);
    }
    return std::clamp(correction, min_value, max_value);
}

std::ostream& operator<<(std::ostream& os, const Variable& variable) {
    os << to_string(variable.component)
       << " (guess " << variable.initial_guess
       << ", pert " << variable.perturbation
       << ", max step " << variable.max_step
       << ", bounds [" << variable.min_value << ", " << variable.max_value << "])";
    return os;
}

} // namespace orbtarget::targeting
