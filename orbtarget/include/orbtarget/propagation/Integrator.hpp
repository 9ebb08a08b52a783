/**
 * @file Integrator.hpp
 * @brief Numerical integrators for first-order ODE systems
 *
 * The independent variable is time in seconds, counted from the start of the
 * propagation arc. Both integrators run forward or backward in time.
 */

#ifndef ORBTARGET_PROPAGATION_INTEGRATOR_HPP
#define ORBTARGET_PROPAGATION_INTEGRATOR_HPP

#include <Eigen/Dense>
#include <functional>
#include <memory>
#include <string>

namespace orbtarget::propagation {

/// dy/dt = f(t, y)
using DerivativeFunction = std::function<Eigen::VectorXd(double, const Eigen::VectorXd&)>;

/// Called on the initial point and after every accepted step with (t, y, dy/dt)
using StepObserver = std::function<void(double, const Eigen::VectorXd&, const Eigen::VectorXd&)>;

/**
 * @brief Step-size control shared by the integrators and the propagators
 */
struct PropagatorOptions {
    double initial_step_s = 60.0;   ///< First trial step [s]
    double min_step_s = 1e-3;       ///< Smallest step before failing [s]
    double max_step_s = 2700.0;     ///< Largest step [s]
    double tolerance = 1e-12;       ///< Local error tolerance (RKF78)
    long max_steps = 5000000;       ///< Hard limit on accepted steps per call
};

struct IntegrationStatistics {
    long num_steps = 0;          ///< Accepted steps
    long num_rejected = 0;       ///< Rejected steps
    long num_evaluations = 0;    ///< Calls to the derivative function
};

class Integrator {
public:
    virtual ~Integrator() = default;

    /**
     * @brief Integrate from t0 to tf
     *
     * @param f Derivative function
     * @param y0 Initial state
     * @param t0 Initial time [s]
     * @param tf Final time [s], before or after t0
     * @param options Step-size control
     * @param observer Optional callback for accepted steps
     * @return State at tf
     * @throws PropagationError on step size underflow, non-finite state or step limit
     */
    virtual Eigen::VectorXd integrate(const DerivativeFunction& f,
                                      const Eigen::VectorXd& y0,
                                      double t0, double tf,
                                      const PropagatorOptions& options,
                                      const StepObserver& observer = nullptr) = 0;

    virtual std::unique_ptr<Integrator> clone() const = 0;

    virtual std::string name() const = 0;

    const IntegrationStatistics& statistics() const { return stats_; }

protected:
    IntegrationStatistics stats_;
};

/**
 * @brief Classical fixed-step Runge-Kutta 4
 *
 * Uses min(initial_step_s, max_step_s) as the step and shortens the last
 * step to land on tf.
 */
class RK4Integrator : public Integrator {
public:
    Eigen::VectorXd integrate(const DerivativeFunction& f,
                              const Eigen::VectorXd& y0,
                              double t0, double tf,
                              const PropagatorOptions& options,
                              const StepObserver& observer = nullptr) override;

    std::unique_ptr<Integrator> clone() const override;

    std::string name() const override { return "RK4"; }
};

/**
 * @brief Runge-Kutta-Fehlberg 7(8) with adaptive step size
 *
 * Propagates the 8th-order solution; the difference with the embedded
 * 7th-order solution, 41/840 (k0 + k10 - k11 - k12) h, is the local error
 * estimate. Errors are measured component-wise relative to 1 + |y|.
 *
 * Reference: Fehlberg, NASA TR R-287 (1968)
 */
class RKF78Integrator : public Integrator {
public:
    Eigen::VectorXd integrate(const DerivativeFunction& f,
                              const Eigen::VectorXd& y0,
                              double t0, double tf,
                              const PropagatorOptions& options,
                              const StepObserver& observer = nullptr) override;

    std::unique_ptr<Integrator> clone() const override;

    std::string name() const override { return "RKF78"; }

private:
    /// One trial step; returns the 8th-order state and writes the error estimate
    Eigen::VectorXd step(const DerivativeFunction& f, double t, const Eigen::VectorXd& y,
                         const Eigen::VectorXd& dydt, double h, double& error);
};

} // namespace orbtarget::propagation

#endif // ORBTARGET_PROPAGATION_INTEGRATOR_HPP
