/**
 * @file CartesianState.hpp
 * @brief Inertial Cartesian orbit state with element and frame accessors
 */

#ifndef ORBTARGET_COORDINATES_CARTESIAN_STATE_HPP
#define ORBTARGET_COORDINATES_CARTESIAN_STATE_HPP

#include "orbtarget/core/Types.hpp"
#include "orbtarget/core/Constants.hpp"
#include "orbtarget/coordinates/LocalFrame.hpp"
#include "orbtarget/coordinates/StateParameter.hpp"
#include "orbtarget/time/Epoch.hpp"
#include <ostream>

namespace orbtarget::coordinates {

/**
 * @brief Osculating Keplerian elements (angles in degrees)
 */
struct KeplerianElements {
    double sma_km = 0.0;
    double ecc = 0.0;
    double inc_deg = 0.0;
    double raan_deg = 0.0;
    double aop_deg = 0.0;
    double ta_deg = 0.0;
};

/**
 * @brief Cartesian state in the inertial propagation frame
 *
 * Components are indexed [x, y, z, vx, vy, vz] in km and km/s.
 */
struct CartesianState {
    time::Epoch epoch;
    Vector3d position = Vector3d::Zero();   ///< [km]
    Vector3d velocity = Vector3d::Zero();   ///< [km/s]
    double mu = constants::GM_EARTH;        ///< Central body GM [km³/s²]

    CartesianState() = default;
    CartesianState(const time::Epoch& epoch, const Vector3d& position,
                   const Vector3d& velocity, double mu = constants::GM_EARTH);

    /**
     * @brief Build a state from Keplerian elements
     * @throws std::invalid_argument for parabolic or inconsistent elements
     */
    static CartesianState from_keplerian(const KeplerianElements& elements,
                                         const time::Epoch& epoch,
                                         double mu = constants::GM_EARTH);

    double component(int index) const;
    void set_component(int index, double value);

    Vector6d to_vector() const;
    void set_vector(const Vector6d& state);

    /// Add an inertial velocity increment [km/s]
    void apply_dv(const Vector3d& dv);

    double rmag() const { return position.norm(); }
    double vmag() const { return velocity.norm(); }
    Vector3d hvec() const { return position.cross(velocity); }
    double energy() const;

    KeplerianElements to_keplerian() const;

    /**
     * @brief Direction cosine matrix from a local frame to the inertial frame
     *
     * Columns are the local basis vectors expressed in the inertial frame,
     * so that v_inertial = dcm * v_local.
     *
     * @throws std::invalid_argument if @p frame is not local or the state is
     *         rectilinear (zero angular momentum)
     */
    Matrix3d dcm_from_frame(LocalFrame frame) const;

    /**
     * @brief Read any StateParameter, including derived and B-plane values
     * @throws std::invalid_argument if the parameter is undefined for this state
     */
    double value(StateParameter parameter) const;

    /**
     * @brief Set a Cartesian component or a Keplerian element
     *
     * Keplerian elements are changed one at a time, keeping the others fixed.
     *
     * @throws std::invalid_argument for parameters that cannot be set
     */
    void set_value(StateParameter parameter, double value);

    CartesianState operator+(const Vector6d& delta) const;
};

std::ostream& operator<<(std::ostream& os, const CartesianState& state);

} // namespace orbtarget::coordinates

#endif // ORBTARGET_COORDINATES_CARTESIAN_STATE_HPP
