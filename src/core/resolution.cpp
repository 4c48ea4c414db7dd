#include "geocell/resolution.hpp"
#include "geocell/error.hpp"
#include <cmath>
#include <sstream>

namespace geocell {

namespace {

void check_precision(int precision, const char* name) {
    if (precision < 1 || precision > MAX_PRECISION) {
        throw InvalidPrecisionError(std::string(name) + " " + std::to_string(precision) +
                                    " outside [1, " + std::to_string(MAX_PRECISION) + "]",
                                    "resolution_for");
    }
}

void check_resolution(double res, const char* name) {
    if (!std::isfinite(res) || res < 0.0) {
        std::ostringstream ss;
        ss << name << " " << res << " is not a non-negative number of degrees";
        throw InvalidResolutionError(ss.str(), "precision_for");
    }
}

} // anonymous namespace

Resolutions resolution_for(int prec_lon, int prec_lat) {
    check_precision(prec_lon, "prec_lon");
    check_precision(prec_lat, "prec_lat");

    const int lon_bits = (5 * prec_lon + 1) / 2;
    const int lat_bits = (5 * prec_lat) / 2;
    return Resolutions(std::ldexp(360.0, -lon_bits), std::ldexp(180.0, -lat_bits));
}

int precision_for(double res_lon, double res_lat) {
    check_resolution(res_lon, "res_lon");
    check_resolution(res_lat, "res_lat");

    for (int p = 1; p <= MAX_PRECISION; ++p) {
        Resolutions r = resolution_for(p, p);
        if (r.lon <= res_lon && r.lat <= res_lat) {
            return p;
        }
    }
    return MAX_PRECISION;
}

} // namespace geocell
