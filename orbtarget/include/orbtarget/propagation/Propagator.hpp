/**
 * @file Propagator.hpp
 * @brief Propagator interface consumed by the targeting engine
 *
 * A propagator owns a dynamics configuration (force models and optional
 * maneuver control) and mutable step-size options. Instances are not shared
 * between threads: callers clone() one per concurrent use. Clones share the
 * immutable force-model tables.
 */

#ifndef ORBTARGET_PROPAGATION_PROPAGATOR_HPP
#define ORBTARGET_PROPAGATION_PROPAGATOR_HPP

#include "orbtarget/dynamics/SpacecraftDynamics.hpp"
#include "orbtarget/propagation/Integrator.hpp"
#include "orbtarget/propagation/PropagationError.hpp"
#include "orbtarget/propagation/Trajectory.hpp"
#include <memory>

namespace orbtarget::propagation {

/**
 * @brief Final state and 6x6 state transition matrix of a coast arc
 */
struct StmResult {
    dynamics::Spacecraft state;
    Matrix6d stm = Matrix6d::Identity();   ///< d(x_final) / d(x_initial)
};

class Propagator {
public:
    explicit Propagator(dynamics::SpacecraftDynamics dynamics,
                        const PropagatorOptions& options = PropagatorOptions());
    virtual ~Propagator() = default;

    /// Independent copy; force models are shared, options and integrator are not
    virtual std::unique_ptr<Propagator> clone() const = 0;

    /**
     * @brief Propagate @p state to @p until (forward or backward)
     * @throws PropagationError on numerical failure
     */
    virtual dynamics::Spacecraft propagate(const dynamics::Spacecraft& state,
                                           const time::Epoch& until) = 0;

    /**
     * @brief Propagate and record the arc into @p trajectory
     *
     * The default implementation records only the two end points.
     */
    virtual dynamics::Spacecraft propagate(const dynamics::Spacecraft& state,
                                           const time::Epoch& until,
                                           Trajectory& trajectory);

    /// Whether propagate_with_stm() is available
    virtual bool supports_stm() const { return false; }

    /**
     * @brief Propagate a coast arc together with its state transition matrix
     * @throws std::logic_error if the propagator has no variational equations
     */
    virtual StmResult propagate_with_stm(const dynamics::Spacecraft& state,
                                         const time::Epoch& until);

    const dynamics::SpacecraftDynamics& dynamics() const { return dynamics_; }
    void set_dynamics(dynamics::SpacecraftDynamics dynamics) { dynamics_ = std::move(dynamics); }

    const PropagatorOptions& options() const { return options_; }
    void set_options(const PropagatorOptions& options) { options_ = options; }

    double max_step() const { return options_.max_step_s; }

    /// @throws std::invalid_argument if @p max_step_s is not positive
    void set_max_step(double max_step_s);

protected:
    dynamics::SpacecraftDynamics dynamics_;
    PropagatorOptions options_;
};

/**
 * @brief Temporarily override the maximum step of a propagator
 *
 * The previous value is restored when the guard leaves scope, including on
 * exceptions.
 */
class ScopedMaxStep {
public:
    ScopedMaxStep(Propagator& propagator, double max_step_s);
    ~ScopedMaxStep();

    ScopedMaxStep(const ScopedMaxStep&) = delete;
    ScopedMaxStep& operator=(const ScopedMaxStep&) = delete;

private:
    Propagator& propagator_;
    double saved_max_step_;
};

} // namespace orbtarget::propagation

#endif // ORBTARGET_PROPAGATION_PROPAGATOR_HPP
