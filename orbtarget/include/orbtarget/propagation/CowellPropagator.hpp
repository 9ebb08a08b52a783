/**
 * @file CowellPropagator.hpp
 * @brief Numerical propagation of the spacecraft equations of motion
 */

#ifndef ORBTARGET_PROPAGATION_COWELL_PROPAGATOR_HPP
#define ORBTARGET_PROPAGATION_COWELL_PROPAGATOR_HPP

#include "orbtarget/propagation/Propagator.hpp"

namespace orbtarget::propagation {

/**
 * @brief Cowell propagator: direct integration of [r, v, fuel]
 *
 * Uses RKF78 unless another integrator is supplied. The state transition
 * matrix is obtained by integrating the variational equations
 * dPhi/dt = A(t) Phi alongside the coast trajectory, with
 * A = [[0, I], [da/dr, 0]].
 */
class CowellPropagator : public Propagator {
public:
    explicit CowellPropagator(dynamics::SpacecraftDynamics dynamics,
                              const PropagatorOptions& options = PropagatorOptions(),
                              std::unique_ptr<Integrator> integrator = nullptr);

    CowellPropagator(const CowellPropagator& other);
    CowellPropagator& operator=(const CowellPropagator& other);

    std::unique_ptr<Propagator> clone() const override;

    dynamics::Spacecraft propagate(const dynamics::Spacecraft& state,
                                   const time::Epoch& until) override;

    dynamics::Spacecraft propagate(const dynamics::Spacecraft& state,
                                   const time::Epoch& until,
                                   Trajectory& trajectory) override;

    bool supports_stm() const override { return true; }

    /// @throws std::logic_error if the spacecraft would thrust during the arc
    StmResult propagate_with_stm(const dynamics::Spacecraft& state,
                                 const time::Epoch& until) override;

    const Integrator& integrator() const { return *integrator_; }

private:
    dynamics::Spacecraft run(const dynamics::Spacecraft& state, const time::Epoch& until,
                             Trajectory* trajectory);

    std::unique_ptr<Integrator> integrator_;
};

} // namespace orbtarget::propagation

#endif // ORBTARGET_PROPAGATION_COWELL_PROPAGATOR_HPP
