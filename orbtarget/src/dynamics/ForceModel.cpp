/**
 * @file ForceModel.cpp
 * @brief Point-mass and zonal gravity accelerations
 */

#include "orbtarget/dynamics/ForceModel.hpp"
#include <cmath>
#include <stdexcept>

namespace orbtarget::dynamics {

Matrix3d ForceModel::gradient(const time::Epoch& epoch,
                              const Vector3d& position,
                              const Vector3d& velocity) const {
    constexpr double h = 1e-3;  // 1 m
    Matrix3d grad;
    for (int j = 0; j < 3; ++j) {
        Vector3d rp = position;
        Vector3d rm = position;
        rp(j) += h;
        rm(j) -= h;
        grad.col(j) = (acceleration(epoch, rp, velocity) - acceleration(epoch, rm, velocity)) / (2.0 * h);
    }
    return grad;
}

// ============================================================================
// PointMassGravity
// ============================================================================

PointMassGravity::PointMassGravity(double mu) : mu_(mu) {
    if (mu <= 0.0) {
        throw std::invalid_argument("Gravitational parameter must be positive");
    }
}

Vector3d PointMassGravity::acceleration(const time::Epoch& /*epoch*/,
                                        const Vector3d& position,
                                        const Vector3d& /*velocity*/) const {
    double r = position.norm();
    double r3 = r * r * r;
    return -mu_ * position / r3;
}

Matrix3d PointMassGravity::gradient(const time::Epoch& /*epoch*/,
                                    const Vector3d& position,
                                    const Vector3d& /*velocity*/) const {
    double r = position.norm();
    double r2 = r * r;
    double r3 = r2 * r;
    double r5 = r3 * r2;
    return -mu_ / r3 * Matrix3d::Identity() + 3.0 * mu_ / r5 * (position * position.transpose());
}

// ============================================================================
// ZonalGravity
// ============================================================================

ZonalGravity::ZonalGravity(std::shared_ptr<const ZonalCoefficients> coefficients)
    : coefficients_(std::move(coefficients)) {
    if (!coefficients_) {
        throw std::invalid_argument("ZonalGravity requires a coefficient table");
    }
}

Vector3d ZonalGravity::acceleration(const time::Epoch& /*epoch*/,
                                    const Vector3d& position,
                                    const Vector3d& /*velocity*/) const {
    const ZonalCoefficients& k = *coefficients_;
    const double x = position(0);
    const double y = position(1);
    const double z = position(2);
    const double r = position.norm();
    const double r2 = r * r;
    const double z2_r2 = z * z / r2;
    const double mu = k.mu;
    const double R = k.radius_km;

    Vector3d acc = Vector3d::Zero();

    if (k.j2 != 0.0) {
        double f = -1.5 * k.j2 * mu * R * R / std::pow(r, 5);
        acc(0) += f * x * (1.0 - 5.0 * z2_r2);
        acc(1) += f * y * (1.0 - 5.0 * z2_r2);
        acc(2) += f * z * (3.0 - 5.0 * z2_r2);
    }

    if (k.j3 != 0.0) {
        double f = -2.5 * k.j3 * mu * R * R * R / std::pow(r, 7);
        double xy = 3.0 * z - 7.0 * z * z2_r2;
        acc(0) += f * x * xy;
        acc(1) += f * y * xy;
        acc(2) += f * (6.0 * z * z - 7.0 * z * z * z2_r2 - 0.6 * r2);
    }

    if (k.j4 != 0.0) {
        double f = 1.875 * k.j4 * mu * std::pow(R, 4) / std::pow(r, 7);
        double xy = 1.0 - 14.0 * z2_r2 + 21.0 * z2_r2 * z2_r2;
        acc(0) += f * x * xy;
        acc(1) += f * y * xy;
        acc(2) += f * z * (5.0 - 70.0 / 3.0 * z2_r2 + 21.0 * z2_r2 * z2_r2);
    }

    return acc;
}

} // namespace orbtarget::dynamics
