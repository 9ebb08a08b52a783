/**
 * @file Dual.hpp
 * @brief Forward-mode dual numbers carrying partials with respect to a Cartesian state
 *
 * A Dual holds a real value and its gradient with respect to the six
 * Cartesian components [x, y, z, vx, vy, vz] of the state it was seeded
 * from. Every operation propagates the gradient exactly (first order).
 */

#ifndef ORBTARGET_MATH_DUAL_HPP
#define ORBTARGET_MATH_DUAL_HPP

#include "orbtarget/core/Types.hpp"
#include <cmath>

namespace orbtarget::math {

class Dual {
public:
    Dual() : value_(0.0), grad_(RowVector6d::Zero()) {}
    Dual(double value) : value_(value), grad_(RowVector6d::Zero()) {}  // NOLINT: implicit by intent
    Dual(double value, const RowVector6d& grad) : value_(value), grad_(grad) {}

    /// Independent variable number @p index (0..5) with unit partial
    static Dual variable(double value, int index) {
        RowVector6d g = RowVector6d::Zero();
        g(index) = 1.0;
        return Dual(value, g);
    }

    double real() const { return value_; }
    const RowVector6d& grad() const { return grad_; }
    double partial(int index) const { return grad_(index); }

    Dual operator-() const { return Dual(-value_, -grad_); }

    Dual& operator+=(const Dual& o) { value_ += o.value_; grad_ += o.grad_; return *this; }
    Dual& operator-=(const Dual& o) { value_ -= o.value_; grad_ -= o.grad_; return *this; }
    Dual& operator*=(const Dual& o) {
        grad_ = grad_ * o.value_ + value_ * o.grad_;
        value_ *= o.value_;
        return *this;
    }
    Dual& operator/=(const Dual& o) {
        grad_ = (grad_ * o.value_ - value_ * o.grad_) / (o.value_ * o.value_);
        value_ /= o.value_;
        return *this;
    }

private:
    double value_;
    RowVector6d grad_;
};

inline Dual operator+(Dual a, const Dual& b) { return a += b; }
inline Dual operator-(Dual a, const Dual& b) { return a -= b; }
inline Dual operator*(Dual a, const Dual& b) { return a *= b; }
inline Dual operator/(Dual a, const Dual& b) { return a /= b; }

inline Dual operator+(Dual a, double b) { return Dual(a.real() + b, a.grad()); }
inline Dual operator+(double a, const Dual& b) { return Dual(a + b.real(), b.grad()); }
inline Dual operator-(const Dual& a, double b) { return Dual(a.real() - b, a.grad()); }
inline Dual operator-(double a, const Dual& b) { return Dual(a - b.real(), -b.grad()); }
inline Dual operator*(const Dual& a, double b) { return Dual(a.real() * b, a.grad() * b); }
inline Dual operator*(double a, const Dual& b) { return Dual(a * b.real(), a * b.grad()); }
inline Dual operator/(const Dual& a, double b) { return Dual(a.real() / b, a.grad() / b); }
inline Dual operator/(double a, const Dual& b) {
    return Dual(a / b.real(), (-a / (b.real() * b.real())) * b.grad());
}

inline bool operator<(const Dual& a, double b) { return a.real() < b; }
inline bool operator>(const Dual& a, double b) { return a.real() > b; }

// ----------------------------------------------------------------------------
// Elementary functions
// ----------------------------------------------------------------------------

inline Dual sqrt(const Dual& a) {
    double s = std::sqrt(a.real());
    if (s == 0.0) {
        // Derivative undefined at zero; report a flat partial
        return Dual(0.0);
    }
    return Dual(s, a.grad() / (2.0 * s));
}

inline Dual abs(const Dual& a) {
    return a.real() < 0.0 ? -a : a;
}

inline Dual pow(const Dual& a, double n) {
    double p = std::pow(a.real(), n);
    return Dual(p, n * std::pow(a.real(), n - 1.0) * a.grad());
}

inline Dual sin(const Dual& a) { return Dual(std::sin(a.real()), std::cos(a.real()) * a.grad()); }
inline Dual cos(const Dual& a) { return Dual(std::cos(a.real()), -std::sin(a.real()) * a.grad()); }

inline Dual tan(const Dual& a) {
    double c = std::cos(a.real());
    return Dual(std::tan(a.real()), a.grad() / (c * c));
}

inline Dual acos(const Dual& a) {
    return Dual(std::acos(a.real()), -a.grad() / std::sqrt(1.0 - a.real() * a.real()));
}

inline Dual asin(const Dual& a) {
    return Dual(std::asin(a.real()), a.grad() / std::sqrt(1.0 - a.real() * a.real()));
}

inline Dual atan2(const Dual& y, const Dual& x) {
    double d = x.real() * x.real() + y.real() * y.real();
    return Dual(std::atan2(y.real(), x.real()),
                (x.real() * y.grad() - y.real() * x.grad()) / d);
}

inline Dual sinh(const Dual& a) { return Dual(std::sinh(a.real()), std::cosh(a.real()) * a.grad()); }
inline Dual cosh(const Dual& a) { return Dual(std::cosh(a.real()), std::sinh(a.real()) * a.grad()); }

inline Dual atanh(const Dual& a) {
    return Dual(std::atanh(a.real()), a.grad() / (1.0 - a.real() * a.real()));
}

inline Dual acosh(const Dual& a) {
    return Dual(std::acosh(a.real()), a.grad() / std::sqrt(a.real() * a.real() - 1.0));
}

inline Dual log(const Dual& a) { return Dual(std::log(a.real()), a.grad() / a.real()); }

// ----------------------------------------------------------------------------
// Three-vectors of duals
// ----------------------------------------------------------------------------

struct DualVector3 {
    Dual x, y, z;

    Dual dot(const DualVector3& o) const { return x * o.x + y * o.y + z * o.z; }

    DualVector3 cross(const DualVector3& o) const {
        return {y * o.z - z * o.y, z * o.x - x * o.z, x * o.y - y * o.x};
    }

    Dual norm() const { return sqrt(dot(*this)); }

    DualVector3 operator*(const Dual& s) const { return {x * s, y * s, z * s}; }
    DualVector3 operator/(const Dual& s) const { return {x / s, y / s, z / s}; }
    DualVector3 operator+(const DualVector3& o) const { return {x + o.x, y + o.y, z + o.z}; }
    DualVector3 operator-(const DualVector3& o) const { return {x - o.x, y - o.y, z - o.z}; }

    Vector3d real() const { return Vector3d(x.real(), y.real(), z.real()); }
};

inline DualVector3 operator*(const Dual& s, const DualVector3& v) { return v * s; }

} // namespace orbtarget::math

#endif // ORBTARGET_MATH_DUAL_HPP
