/**
 * @file ForceModel.hpp
 * @brief Gravitational force models acting on the spacecraft
 */

#ifndef ORBTARGET_DYNAMICS_FORCE_MODEL_HPP
#define ORBTARGET_DYNAMICS_FORCE_MODEL_HPP

#include "orbtarget/core/Types.hpp"
#include "orbtarget/core/Constants.hpp"
#include "orbtarget/time/Epoch.hpp"
#include <memory>
#include <string>

namespace orbtarget::dynamics {

/**
 * @brief Acceleration contribution [km/s²] at a given state
 */
class ForceModel {
public:
    virtual ~ForceModel() = default;

    virtual Vector3d acceleration(const time::Epoch& epoch,
                                  const Vector3d& position,
                                  const Vector3d& velocity) const = 0;

    /**
     * @brief Partial derivatives of the acceleration w.r.t. position
     *
     * Default implementation uses central differences with a 1 m step.
     */
    virtual Matrix3d gradient(const time::Epoch& epoch,
                              const Vector3d& position,
                              const Vector3d& velocity) const;

    virtual std::string name() const = 0;
};

/**
 * @brief Central body point-mass gravity
 */
class PointMassGravity : public ForceModel {
public:
    explicit PointMassGravity(double mu = constants::GM_EARTH);

    Vector3d acceleration(const time::Epoch& epoch,
                          const Vector3d& position,
                          const Vector3d& velocity) const override;

    Matrix3d gradient(const time::Epoch& epoch,
                      const Vector3d& position,
                      const Vector3d& velocity) const override;

    std::string name() const override { return "PointMassGravity"; }

    double mu() const { return mu_; }

private:
    double mu_;
};

/**
 * @brief Zonal harmonic coefficients of a central body (unnormalized)
 */
struct ZonalCoefficients {
    double mu = constants::GM_EARTH;        ///< [km³/s²]
    double radius_km = constants::R_EARTH;  ///< Reference radius [km]
    double j2 = 0.0;
    double j3 = 0.0;
    double j4 = 0.0;

    static ZonalCoefficients earth() {
        return {constants::GM_EARTH, constants::R_EARTH,
                constants::J2_EARTH, constants::J3_EARTH, constants::J4_EARTH};
    }
};

/**
 * @brief J2, J3 and J4 zonal perturbations (central term excluded)
 *
 * The coefficient table is immutable and held by shared pointer, so every
 * copy of a dynamics configuration reads the same table.
 */
class ZonalGravity : public ForceModel {
public:
    explicit ZonalGravity(std::shared_ptr<const ZonalCoefficients> coefficients);

    Vector3d acceleration(const time::Epoch& epoch,
                          const Vector3d& position,
                          const Vector3d& velocity) const override;

    std::string name() const override { return "ZonalGravity"; }

    const std::shared_ptr<const ZonalCoefficients>& coefficients() const { return coefficients_; }

private:
    std::shared_ptr<const ZonalCoefficients> coefficients_;
};

} // namespace orbtarget::dynamics

#endif // ORBTARGET_DYNAMICS_FORCE_MODEL_HPP
