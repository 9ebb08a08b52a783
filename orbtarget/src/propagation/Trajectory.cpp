/**
 * @file Trajectory.cpp
 * @brief Cubic Hermite interpolation over recorded propagation samples
 */

#include "orbtarget/propagation/Trajectory.hpp"
#include "orbtarget/propagation/PropagationError.hpp"
#include <algorithm>

namespace orbtarget::propagation {

void Trajectory::add(const dynamics::Spacecraft& state, const Vector7d& derivative) {
    auto it = std::lower_bound(samples_.begin(), samples_.end(), state.epoch(),
                               [](const Sample& s, const time::Epoch& e) { return s.state.epoch() < e; });
    if (it != samples_.end() && it->state.epoch() == state.epoch()) {
        it->state = state;
        it->derivative = derivative;
        return;
    }
    samples_.insert(it, Sample{state, derivative});
}

const time::Epoch& Trajectory::first_epoch() const {
    if (samples_.empty()) {
        throw PropagationError("trajectory is empty");
    }
    return samples_.front().state.epoch();
}

const time::Epoch& Trajectory::last_epoch() const {
    if (samples_.empty()) {
        throw PropagationError("trajectory is empty");
    }
    return samples_.back().state.epoch();
}

dynamics::Spacecraft Trajectory::at(const time::Epoch& epoch) const {
    if (samples_.empty() || epoch < first_epoch() || epoch > last_epoch()) {
        throw PropagationError("epoch " + epoch.to_string() + " outside the recorded trajectory");
    }

    auto upper = std::lower_bound(samples_.begin(), samples_.end(), epoch,
                                  [](const Sample& s, const time::Epoch& e) { return s.state.epoch() < e; });
    if (upper->state.epoch() == epoch) {
        return upper->state;
    }
    auto lower = upper - 1;

    const double h = upper->state.epoch() - lower->state.epoch();
    const double s = (epoch - lower->state.epoch()) / h;
    const double s2 = s * s;
    const double s3 = s2 * s;

    // Hermite basis
    const double h00 = 2.0 * s3 - 3.0 * s2 + 1.0;
    const double h10 = s3 - 2.0 * s2 + s;
    const double h01 = -2.0 * s3 + 3.0 * s2;
    const double h11 = s3 - s2;

    Vector7d y0 = lower->state.to_vector();
    Vector7d y1 = upper->state.to_vector();
    Vector7d y = h00 * y0 + h10 * h * lower->derivative + h01 * y1 + h11 * h * upper->derivative;

    dynamics::Spacecraft out = lower->state;
    out.set_vector(epoch, y);
    return out;
}

} // namespace orbtarget::propagation
