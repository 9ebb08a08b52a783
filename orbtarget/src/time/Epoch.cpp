/**
 * @file Epoch.cpp
 * @brief Implementation of the TDB epoch
 */

#include "orbtarget/time/Epoch.hpp"
#include "orbtarget/core/Constants.hpp"
#include <cmath>
#include <cstdio>

namespace orbtarget::time {

using constants::MJD_J2000;
using constants::SECONDS_PER_DAY;

Epoch Epoch::from_mjd_tdb(double mjd_tdb) {
    return Epoch((mjd_tdb - MJD_J2000) * SECONDS_PER_DAY);
}

Epoch Epoch::from_jd_tdb(double jd_tdb) {
    return from_mjd_tdb(jd_tdb - 2400000.5);
}

Epoch Epoch::from_gregorian_tdb(int year, int month, int day,
                                int hour, int minute, double second) {
    // Fliegel & Van Flandern day number
    int a = (14 - month) / 12;
    int y = year + 4800 - a;
    int m = month + 12 * a - 3;
    long jdn = day + (153 * m + 2) / 5 + 365L * y + y / 4 - y / 100 + y / 400 - 32045;

    double mjd = static_cast<double>(jdn) - 2400001.0;
    double day_seconds = hour * 3600.0 + minute * 60.0 + second;
    return Epoch((mjd - MJD_J2000) * SECONDS_PER_DAY + day_seconds);
}

double Epoch::mjd_tdb() const {
    return MJD_J2000 + seconds_ / SECONDS_PER_DAY;
}

double Epoch::jd_tdb() const {
    return mjd_tdb() + 2400000.5;
}

std::string Epoch::to_string() const {
    double mjd = mjd_tdb();
    double mjd_day = std::floor(mjd);
    double sod = (mjd - mjd_day) * SECONDS_PER_DAY;

    // Inverse of the day number conversion
    long jdn = static_cast<long>(mjd_day) + 2400001L;
    long l = jdn + 68569;
    long n = 4 * l / 146097;
    l = l - (146097 * n + 3) / 4;
    long i = 4000 * (l + 1) / 1461001;
    l = l - 1461 * i / 4 + 31;
    long j = 80 * l / 2447;
    long day = l - 2447 * j / 80;
    l = j / 11;
    long month = j + 2 - 12 * l;
    long year = 100 * (n - 49) + i + l;

    int hour = static_cast<int>(sod / 3600.0);
    int minute = static_cast<int>((sod - hour * 3600.0) / 60.0);
    double second = sod - hour * 3600.0 - minute * 60.0;

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%04ld-%02ld-%02ldT%02d:%02d:%06.3f TDB",
                  year, month, day, hour, minute, second);
    return std::string(buffer);
}

std::ostream& operator<<(std::ostream& os, const Epoch& epoch) {
    return os << epoch.to_string();
}

} // namespace orbtarget::time
