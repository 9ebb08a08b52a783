/**
 * @file LinearAlgebra.hpp
 * @brief Moore-Penrose pseudo-inverse and related helpers
 */

#ifndef ORBTARGET_MATH_LINEAR_ALGEBRA_HPP
#define ORBTARGET_MATH_LINEAR_ALGEBRA_HPP

#include <Eigen/Dense>
#include <optional>

namespace orbtarget::math {

/**
 * @brief Result of a singular value analysis of a sensitivity matrix
 */
struct SingularValueInfo {
    int rank = 0;                    ///< Numerical rank after truncation
    double largest = 0.0;            ///< Largest singular value
    double smallest_kept = 0.0;      ///< Smallest singular value kept in the inverse
    double threshold = 0.0;          ///< Truncation threshold applied
};

/**
 * @brief Moore-Penrose pseudo-inverse computed from a thin SVD
 *
 * Singular values below @p rcond * sigma_max are treated as zero, which
 * regularizes rank-deficient and non-square matrices. When @p rcond is not
 * positive the threshold is eps * max(rows, cols) * sigma_max.
 *
 * @param m Matrix to invert (rows x cols)
 * @param rcond Relative truncation threshold
 * @param info Optional singular value diagnostics
 * @return cols x rows pseudo-inverse, or std::nullopt if the matrix is empty,
 *         contains non-finite entries, or the inverse is not finite
 */
std::optional<Eigen::MatrixXd> pseudo_inverse(const Eigen::MatrixXd& m,
                                              double rcond = -1.0,
                                              SingularValueInfo* info = nullptr);

} // namespace orbtarget::math

#endif // ORBTARGET_MATH_LINEAR_ALGEBRA_HPP
