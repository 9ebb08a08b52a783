/**
 * @file Trajectory.hpp
 * @brief Spacecraft states recorded along a propagation arc
 */

#ifndef ORBTARGET_PROPAGATION_TRAJECTORY_HPP
#define ORBTARGET_PROPAGATION_TRAJECTORY_HPP

#include "orbtarget/dynamics/Spacecraft.hpp"
#include <vector>

namespace orbtarget::propagation {

/**
 * @brief Ordered samples with their time derivatives
 *
 * Samples are appended in propagation order (forward or backward) and kept
 * sorted by epoch. States between samples are obtained by cubic Hermite
 * interpolation of [r, v, fuel].
 */
class Trajectory {
public:
    struct Sample {
        dynamics::Spacecraft state;
        Vector7d derivative;   ///< d/dt [r, v, fuel]
    };

    void clear() { samples_.clear(); }

    /// Append a sample; a sample at an already recorded epoch replaces it
    void add(const dynamics::Spacecraft& state, const Vector7d& derivative);

    bool empty() const { return samples_.empty(); }
    std::size_t size() const { return samples_.size(); }

    const time::Epoch& first_epoch() const;
    const time::Epoch& last_epoch() const;

    const std::vector<Sample>& samples() const { return samples_; }

    /**
     * @brief Interpolated state at @p epoch
     * @throws PropagationError if the epoch is outside the recorded span
     */
    dynamics::Spacecraft at(const time::Epoch& epoch) const;

private:
    std::vector<Sample> samples_;
};

} // namespace orbtarget::propagation

#endif // ORBTARGET_PROPAGATION_TRAJECTORY_HPP
