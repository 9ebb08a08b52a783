/**
 * @file SpacecraftDynamics.hpp
 * @brief Equations of motion of a spacecraft under gravity and finite burns
 *
 * The integrated state is [x, y, z, vx, vy, vz, fuel_kg]. While the
 * spacecraft is in Thrust mode inside the window of the attached maneuver,
 * the thruster adds thrust_level * thrust / mass along the maneuver direction
 * and fuel flows out at thrust_level * thrust / (Isp * g0).
 */

#ifndef ORBTARGET_DYNAMICS_SPACECRAFT_DYNAMICS_HPP
#define ORBTARGET_DYNAMICS_SPACECRAFT_DYNAMICS_HPP

#include "orbtarget/dynamics/ForceModel.hpp"
#include "orbtarget/dynamics/Maneuver.hpp"
#include "orbtarget/dynamics/Spacecraft.hpp"
#include <memory>
#include <vector>

namespace orbtarget::dynamics {

class SpacecraftDynamics {
public:
    using ForceModelList = std::vector<std::shared_ptr<const ForceModel>>;

    SpacecraftDynamics() = default;
    explicit SpacecraftDynamics(ForceModelList force_models);

    /// Point-mass gravity only
    static SpacecraftDynamics two_body(double mu = constants::GM_EARTH);

    /**
     * @brief Copy of this configuration steered by @p maneuver
     *
     * Force models and the maneuver are shared, never copied.
     */
    SpacecraftDynamics with_control(std::shared_ptr<const Maneuver> maneuver) const;

    SpacecraftDynamics without_control() const;

    const std::shared_ptr<const Maneuver>& control() const { return control_; }
    const ForceModelList& force_models() const { return force_models_; }

    /// Whether the thruster fires for @p spacecraft at @p epoch
    bool is_thrusting(const Spacecraft& spacecraft, const time::Epoch& epoch) const;

    /// Sum of the force model accelerations [km/s²]
    Vector3d gravity_acceleration(const time::Epoch& epoch,
                                  const Vector3d& position,
                                  const Vector3d& velocity) const;

    /// Sum of the force model gradients d(a)/d(r)
    Matrix3d gravity_gradient(const time::Epoch& epoch,
                              const Vector3d& position,
                              const Vector3d& velocity) const;

    /**
     * @brief Time derivative of [r, v, fuel]
     *
     * @param epoch Current epoch
     * @param state Current [r, v, fuel]
     * @param spacecraft Constant properties (dry mass, thruster, mode, mu)
     * @throws propagation::PropagationError when the thruster fires with no fuel left
     */
    Vector7d derivatives(const time::Epoch& epoch, const Vector7d& state,
                         const Spacecraft& spacecraft) const;

private:
    ForceModelList force_models_;
    std::shared_ptr<const Maneuver> control_;
};

} // namespace orbtarget::dynamics

#endif // ORBTARGET_DYNAMICS_SPACECRAFT_DYNAMICS_HPP
