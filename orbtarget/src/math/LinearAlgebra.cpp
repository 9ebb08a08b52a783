/**
 * @file LinearAlgebra.cpp
 * @brief Implementation of the SVD pseudo-inverse
 */

#include "orbtarget/math/LinearAlgebra.hpp"
#include <algorithm>
#include <limits>

namespace orbtarget::math {

std::optional<Eigen::MatrixXd> pseudo_inverse(const Eigen::MatrixXd& m,
                                              double rcond,
                                              SingularValueInfo* info) {
    if (m.size() == 0 || !m.allFinite()) {
        return std::nullopt;
    }

    Eigen::JacobiSVD<Eigen::MatrixXd> svd(m, Eigen::ComputeThinU | Eigen::ComputeThinV);
    const Eigen::VectorXd& sigma = svd.singularValues();

    // Singular values are sorted in decreasing order
    double sigma_max = sigma.size() > 0 ? sigma(0) : 0.0;
    double threshold;
    if (rcond > 0.0) {
        threshold = rcond * sigma_max;
    } else {
        threshold = std::numeric_limits<double>::epsilon()
                  * static_cast<double>(std::max(m.rows(), m.cols())) * sigma_max;
    }
    threshold = std::max(threshold, std::numeric_limits<double>::min());

    Eigen::VectorXd sigma_inv = Eigen::VectorXd::Zero(sigma.size());
    int rank = 0;
    double smallest_kept = 0.0;
    for (Eigen::Index i = 0; i < sigma.size(); ++i) {
        if (sigma(i) > threshold) {
            sigma_inv(i) = 1.0 / sigma(i);
            smallest_kept = sigma(i);
            ++rank;
        }
    }

    Eigen::MatrixXd pinv = svd.matrixV() * sigma_inv.asDiagonal() * svd.matrixU().transpose();

    if (info) {
        info->rank = rank;
        info->largest = sigma_max;
        info->smallest_kept = smallest_kept;
        info->threshold = threshold;
    }

    if (!pinv.allFinite()) {
        return std::nullopt;
    }
    return pinv;
}

} // namespace orbtarget::math
