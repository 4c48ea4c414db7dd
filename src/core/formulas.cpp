#include "geocell/formulas.hpp"
#include "geocell/error.hpp"
#include <cmath>
#include <sstream>

namespace geocell {

namespace {

void check_radius(double radius, const char* func) {
    if (!std::isfinite(radius) || radius <= 0.0) {
        std::ostringstream ss;
        ss << "invalid earth radius " << radius;
        throw InvalidArgumentError(ss.str(), func, "radius must be a positive number of meters");
    }
}

// sin²(x/2)
inline double hav(double x) noexcept {
    double s = std::sin(x * 0.5);
    return s * s;
}

} // anonymous namespace

Coordinate Formulas::validate_coordinate(double lat, double lon) {
    if (!std::isfinite(lat) || lat < -90.0 || lat > 90.0) {
        std::ostringstream ss;
        ss << "latitude " << lat << " outside [-90, 90]";
        throw InvalidCoordinateError(ss.str(), __func__);
    }
    if (!std::isfinite(lon) || lon < -180.0 || lon > 180.0) {
        std::ostringstream ss;
        ss << "longitude " << lon << " outside [-180, 180]";
        throw InvalidCoordinateError(ss.str(), __func__);
    }
    return Coordinate(lat, lon);
}

double Formulas::unroll180(double dlon) noexcept {
    double d = std::fmod(dlon + 180.0, 360.0);
    if (d < 0.0) d += 360.0;
    return d - 180.0;
}

double Formulas::equirectangular_squared(const Coordinate& a, const Coordinate& b,
                                         bool adjust, bool wrap) noexcept {
    double dlat = b.lat - a.lat;
    double dlon = b.lon - a.lon;
    if (wrap) {
        dlon = unroll180(dlon);
    }
    if (adjust) {
        dlon *= std::cos(radians((a.lat + b.lat) * 0.5));
    }
    return dlat * dlat + dlon * dlon;
}

double Formulas::equirectangular(const Coordinate& a, const Coordinate& b,
                                 double radius, bool adjust, bool wrap) {
    check_radius(radius, __func__);
    return radius * radians(std::sqrt(equirectangular_squared(a, b, adjust, wrap)));
}

double Formulas::haversine(const Coordinate& a, const Coordinate& b,
                           double radius, bool wrap) {
    check_radius(radius, __func__);

    double dlon = b.lon - a.lon;
    if (wrap) {
        dlon = unroll180(dlon);
    }

    double phi1 = radians(a.lat);
    double phi2 = radians(b.lat);
    double h = hav(phi2 - phi1) + std::cos(phi1) * std::cos(phi2) * hav(radians(dlon));
    // Rounding can push h a hair past 1 for antipodal points
    if (h > 1.0) h = 1.0;

    return 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h)) * radius;
}

} // namespace geocell
