/**
 * @file BPlane.hpp
 * @brief B-plane coordinates of a hyperbolic approach
 *
 * The B-plane is normal to the incoming asymptote S. The T axis lies in the
 * reference XY plane (T = S x K normalized) and R = S x T.
 *
 * Reference: Kizner, "A method of describing miss distances for lunar and
 * interplanetary trajectories" (1961); Vallado, "Fundamentals of
 * Astrodynamics and Applications", 4th ed.
 */

#ifndef ORBTARGET_COORDINATES_BPLANE_HPP
#define ORBTARGET_COORDINATES_BPLANE_HPP

#include "orbtarget/coordinates/OrbitDual.hpp"

namespace orbtarget::coordinates {

struct BPlane {
    math::Dual b_r;      ///< B·R [km]
    math::Dual b_t;      ///< B·T [km]
    math::Dual ltof_s;   ///< Time of flight to periapsis [s]

    /**
     * @brief Compute the B-plane of a hyperbolic orbit
     * @throws std::invalid_argument if the orbit is not hyperbolic
     */
    static BPlane from_dual(const OrbitDual& orbit);

    /// Magnitude of the B vector [km]
    double b_mag() const;

    /// Angle of B from the T axis towards R [deg]
    double b_theta_deg() const;

    math::Dual value_for(StateParameter parameter) const;
};

} // namespace orbtarget::coordinates

#endif // ORBTARGET_COORDINATES_BPLANE_HPP
