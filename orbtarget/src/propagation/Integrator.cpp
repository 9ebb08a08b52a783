/**
 * @file Integrator.cpp
 * @brief RK4 and RKF78 integrators
 */

#include "orbtarget/propagation/Integrator.hpp"
#include "orbtarget/propagation/PropagationError.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace orbtarget::propagation {

namespace {

bool all_finite(const Eigen::VectorXd& v) {
    return v.allFinite();
}

/// Largest allowed step magnitude; non-positive means unbounded
double step_ceiling(const PropagatorOptions& options) {
    return options.max_step_s > 0.0 ? options.max_step_s
                                    : std::numeric_limits<double>::infinity();
}

// Fehlberg 7(8) coefficients
constexpr double C[13] = {
    0.0, 2.0 / 27.0, 1.0 / 9.0, 1.0 / 6.0, 5.0 / 12.0, 1.0 / 2.0, 5.0 / 6.0,
    1.0 / 6.0, 2.0 / 3.0, 1.0 / 3.0, 1.0, 0.0, 1.0};

constexpr double A[13][12] = {
    {0.0},
    {2.0 / 27.0},
    {1.0 / 36.0, 3.0 / 36.0},
    {1.0 / 24.0, 0.0, 3.0 / 24.0},
    {20.0 / 48.0, 0.0, -75.0 / 48.0, 75.0 / 48.0},
    {1.0 / 20.0, 0.0, 0.0, 5.0 / 20.0, 4.0 / 20.0},
    {-25.0 / 108.0, 0.0, 0.0, 125.0 / 108.0, -260.0 / 108.0, 250.0 / 108.0},
    {31.0 / 300.0, 0.0, 0.0, 0.0, 61.0 / 225.0, -2.0 / 9.0, 13.0 / 900.0},
    {2.0, 0.0, 0.0, -53.0 / 6.0, 704.0 / 45.0, -107.0 / 9.0, 67.0 / 90.0, 3.0},
    {-91.0 / 108.0, 0.0, 0.0, 23.0 / 108.0, -976.0 / 135.0, 311.0 / 54.0, -19.0 / 60.0,
     17.0 / 6.0, -1.0 / 12.0},
    {2383.0 / 4100.0, 0.0, 0.0, -341.0 / 164.0, 4496.0 / 1025.0, -301.0 / 82.0,
     2133.0 / 4100.0, 45.0 / 82.0, 45.0 / 164.0, 18.0 / 41.0},
    {3.0 / 205.0, 0.0, 0.0, 0.0, 0.0, -6.0 / 41.0, -3.0 / 205.0, -3.0 / 41.0, 3.0 / 41.0,
     6.0 / 41.0, 0.0},
    {-1777.0 / 4100.0, 0.0, 0.0, -341.0 / 164.0, 4496.0 / 1025.0, -289.0 / 82.0,
     2193.0 / 4100.0, 51.0 / 82.0, 33.0 / 164.0, 12.0 / 41.0, 0.0, 1.0}};

constexpr double B8[13] = {
    0.0, 0.0, 0.0, 0.0, 0.0, 34.0 / 105.0, 9.0 / 35.0, 9.0 / 35.0,
    9.0 / 280.0, 9.0 / 280.0, 0.0, 41.0 / 840.0, 41.0 / 840.0};

constexpr double ERR_COEFF = 41.0 / 840.0;

constexpr double SAFETY = 0.9;
constexpr double MIN_SCALE = 0.1;
constexpr double MAX_SCALE = 4.0;

} // anonymous namespace

// ============================================================================
// RK4
// ============================================================================

Eigen::VectorXd RK4Integrator::integrate(const DerivativeFunction& f,
                                         const Eigen::VectorXd& y0,
                                         double t0, double tf,
                                         const PropagatorOptions& options,
                                         const StepObserver& observer) {
    stats_ = IntegrationStatistics{};
    Eigen::VectorXd y = y0;
    if (tf == t0) {
        return y;
    }

    const double direction = tf > t0 ? 1.0 : -1.0;
    const double h_nominal = std::min(options.initial_step_s, step_ceiling(options));
    if (!(h_nominal > 0.0)) {
        throw PropagationError("RK4 requires a positive step size");
    }

    double t = t0;
    Eigen::VectorXd k1 = f(t, y);
    ++stats_.num_evaluations;
    if (observer) {
        observer(t, y, k1);
    }

    while (direction * (tf - t) > 0.0) {
        if (stats_.num_steps >= options.max_steps) {
            throw PropagationError("RK4 exceeded the maximum number of steps");
        }
        double h = direction * std::min(h_nominal, std::abs(tf - t));

        Eigen::VectorXd k2 = f(t + 0.5 * h, y + 0.5 * h * k1);
        Eigen::VectorXd k3 = f(t + 0.5 * h, y + 0.5 * h * k2);
        Eigen::VectorXd k4 = f(t + h, y + h * k3);
        stats_.num_evaluations += 3;

        y += h / 6.0 * (k1 + 2.0 * k2 + 2.0 * k3 + k4);
        t = (std::abs(tf - (t + h)) < 1e-12 * std::max(1.0, std::abs(tf))) ? tf : t + h;
        ++stats_.num_steps;

        if (!all_finite(y)) {
            throw PropagationError("non-finite state after RK4 step at t = " + std::to_string(t) + " s");
        }

        k1 = f(t, y);
        ++stats_.num_evaluations;
        if (observer) {
            observer(t, y, k1);
        }
    }
    return y;
}

std::unique_ptr<Integrator> RK4Integrator::clone() const {
    return std::make_unique<RK4Integrator>(*this);
}

// ============================================================================
// RKF78
// ============================================================================

Eigen::VectorXd RKF78Integrator::step(const DerivativeFunction& f, double t,
                                      const Eigen::VectorXd& y, const Eigen::VectorXd& dydt,
                                      double h, double& error) {
    Eigen::VectorXd k[13];
    k[0] = dydt;

    for (int s = 1; s < 13; ++s) {
        Eigen::VectorXd ys = y;
        for (int j = 0; j < s; ++j) {
            if (A[s][j] != 0.0) {
                ys += (h * A[s][j]) * k[j];
            }
        }
        k[s] = f(t + C[s] * h, ys);
    }
    stats_.num_evaluations += 12;

    Eigen::VectorXd y_new = y;
    for (int s = 0; s < 13; ++s) {
        if (B8[s] != 0.0) {
            y_new += (h * B8[s]) * k[s];
        }
    }

    Eigen::VectorXd err = (ERR_COEFF * h) * (k[0] + k[10] - k[11] - k[12]);
    error = 0.0;
    for (Eigen::Index i = 0; i < err.size(); ++i) {
        error = std::max(error, std::abs(err(i)) / (1.0 + std::abs(y_new(i))));
    }
    if (!std::isfinite(error) || !all_finite(y_new)) {
        error = std::numeric_limits<double>::infinity();
    }
    return y_new;
}

Eigen::VectorXd RKF78Integrator::integrate(const DerivativeFunction& f,
                                           const Eigen::VectorXd& y0,
                                           double t0, double tf,
                                           const PropagatorOptions& options,
                                           const StepObserver& observer) {
    stats_ = IntegrationStatistics{};
    Eigen::VectorXd y = y0;
    if (tf == t0) {
        return y;
    }

    const double direction = tf > t0 ? 1.0 : -1.0;
    const double h_max = step_ceiling(options);
    const double h_floor = std::min(options.min_step_s, h_max);
    const double tol = options.tolerance;

    double t = t0;
    double h = std::min({std::abs(options.initial_step_s), h_max, std::abs(tf - t0)});
    if (!(h > 0.0)) {
        h = std::min(h_max, std::abs(tf - t0));
    }

    Eigen::VectorXd dydt = f(t, y);
    ++stats_.num_evaluations;
    if (observer) {
        observer(t, y, dydt);
    }

    while (direction * (tf - t) > 0.0) {
        if (stats_.num_steps >= options.max_steps) {
            throw PropagationError("RKF78 exceeded the maximum number of steps");
        }

        const double remaining = std::abs(tf - t);
        bool last_step = false;
        if (h >= remaining) {
            h = remaining;
            last_step = true;
        }

        double error = 0.0;
        Eigen::VectorXd y_new = step(f, t, y, dydt, direction * h, error);

        if (error <= tol) {
            t = last_step ? tf : t + direction * h;
            y = y_new;
            ++stats_.num_steps;

            dydt = f(t, y);
            ++stats_.num_evaluations;
            if (observer) {
                observer(t, y, dydt);
            }

            double scale = (error > 0.0) ? SAFETY * std::pow(tol / error, 1.0 / 8.0) : MAX_SCALE;
            scale = std::clamp(scale, MIN_SCALE, MAX_SCALE);
            if (!last_step) {
                h = std::min(h * scale, h_max);
            }
        } else {
            ++stats_.num_rejected;
            double scale = std::isfinite(error) ? SAFETY * std::pow(tol / error, 1.0 / 8.0) : MIN_SCALE;
            h *= std::clamp(scale, MIN_SCALE, SAFETY);
            if (h < h_floor && h < remaining) {
                throw PropagationError("step size underflow (h = " + std::to_string(h) +
                                       " s) at t = " + std::to_string(t) + " s");
            }
        }
    }
    return y;
}

std::unique_ptr<Integrator> RKF78Integrator::clone() const {
    return std::make_unique<RKF78Integrator>(*this);
}

} // namespace orbtarget::propagation
