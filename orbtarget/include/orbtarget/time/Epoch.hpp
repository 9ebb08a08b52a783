/**
 * @file Epoch.hpp
 * @brief TDB epoch represented as seconds past J2000
 *
 * Maneuver windows and finite-difference perturbations of epochs are
 * expressed in seconds, so the epoch keeps seconds past J2000 TDB rather
 * than a fractional MJD.
 */

#ifndef ORBTARGET_TIME_EPOCH_HPP
#define ORBTARGET_TIME_EPOCH_HPP

#include <ostream>
#include <string>

namespace orbtarget::time {

class Epoch {
public:
    Epoch() = default;

    static Epoch from_seconds_j2000(double seconds) { return Epoch(seconds); }
    static Epoch from_mjd_tdb(double mjd_tdb);
    static Epoch from_jd_tdb(double jd_tdb);

    /**
     * @brief Build an epoch from a TDB calendar date
     *
     * Valid for dates after 1582-10-15 (Gregorian calendar).
     */
    static Epoch from_gregorian_tdb(int year, int month, int day,
                                    int hour = 0, int minute = 0, double second = 0.0);

    double seconds_j2000() const { return seconds_; }
    double mjd_tdb() const;
    double jd_tdb() const;

    Epoch operator+(double seconds) const { return Epoch(seconds_ + seconds); }
    Epoch operator-(double seconds) const { return Epoch(seconds_ - seconds); }
    Epoch& operator+=(double seconds) { seconds_ += seconds; return *this; }
    Epoch& operator-=(double seconds) { seconds_ -= seconds; return *this; }

    /// Elapsed seconds between two epochs
    double operator-(const Epoch& other) const { return seconds_ - other.seconds_; }

    bool operator==(const Epoch& other) const { return seconds_ == other.seconds_; }
    bool operator!=(const Epoch& other) const { return seconds_ != other.seconds_; }
    bool operator<(const Epoch& other) const { return seconds_ < other.seconds_; }
    bool operator<=(const Epoch& other) const { return seconds_ <= other.seconds_; }
    bool operator>(const Epoch& other) const { return seconds_ > other.seconds_; }
    bool operator>=(const Epoch& other) const { return seconds_ >= other.seconds_; }

    /// ISO-like representation, e.g. "2024-01-01T12:00:00.000 TDB"
    std::string to_string() const;

private:
    explicit Epoch(double seconds) : seconds_(seconds) {}

    double seconds_ = 0.0;
};

std::ostream& operator<<(std::ostream& os, const Epoch& epoch);

} // namespace orbtarget::time

#endif // ORBTARGET_TIME_EPOCH_HPP
