/**
 * @file OrbitDual.hpp
 * @brief Orbit state in dual numbers, seeded on the six Cartesian components
 *
 * Every parameter computed from an OrbitDual carries its exact partials
 * with respect to [x, y, z, vx, vy, vz]. The real part is what the
 * corrector reads; the gradient feeds the analytic Jacobian strategy.
 */

#ifndef ORBTARGET_COORDINATES_ORBIT_DUAL_HPP
#define ORBTARGET_COORDINATES_ORBIT_DUAL_HPP

#include "orbtarget/math/Dual.hpp"
#include "orbtarget/coordinates/CartesianState.hpp"
#include "orbtarget/coordinates/StateParameter.hpp"

namespace orbtarget::coordinates {

class OrbitDual {
public:
    explicit OrbitDual(const CartesianState& state);

    const math::DualVector3& radius() const { return r_; }
    const math::DualVector3& velocity() const { return v_; }
    double mu() const { return mu_; }

    math::Dual rmag() const;
    math::Dual vmag() const;
    math::DualVector3 hvec() const;
    math::Dual hmag() const;
    math::Dual energy() const;
    math::Dual c3() const;
    math::Dual sma() const;
    math::DualVector3 evec() const;
    math::Dual ecc() const;

    // Angles in radians
    math::Dual inc() const;
    math::Dual raan() const;
    math::Dual aop() const;
    math::Dual ta() const;          ///< True anomaly in (-pi, pi]
    math::Dual fpa() const;
    math::Dual declination() const;
    math::Dual right_ascension() const;

    math::Dual periapsis() const;
    math::Dual apoapsis() const;

    /**
     * @brief Value and partials of a parameter (angles in degrees)
     *
     * B-plane parameters are computed through BPlane.
     *
     * @throws std::invalid_argument if the parameter is undefined for this orbit
     */
    math::Dual partial_for(StateParameter parameter) const;

private:
    math::DualVector3 r_;
    math::DualVector3 v_;
    double mu_;
};

} // namespace orbtarget::coordinates

#endif // ORBTARGET_COORDINATES_ORBIT_DUAL_HPP
