/**
 * @file Types.hpp
 * @brief Common linear algebra types used across orbtarget
 */

#ifndef ORBTARGET_CORE_TYPES_HPP
#define ORBTARGET_CORE_TYPES_HPP

#include <Eigen/Dense>

namespace orbtarget {

using Vector3d = Eigen::Vector3d;
using Vector6d = Eigen::Vector<double, 6>;
using Vector7d = Eigen::Vector<double, 7>;
using Matrix3d = Eigen::Matrix3d;
using Matrix6d = Eigen::Matrix<double, 6, 6>;
using RowVector6d = Eigen::Matrix<double, 1, 6>;

} // namespace orbtarget

#endif // ORBTARGET_CORE_TYPES_HPP
