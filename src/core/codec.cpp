#include "geocell/codec.hpp"
#include "geocell/alphabet.hpp"
#include "geocell/error.hpp"
#include "geocell/formulas.hpp"
#include "geocell/logging.hpp"
#include <cfloat>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace geocell {

namespace {

inline double mid(double lo, double hi) noexcept {
    return (lo + hi) * 0.5;
}

void check_precision(int precision, const char* func) {
    if (precision < 1 || precision > MAX_PRECISION) {
        throw InvalidPrecisionError("precision " + std::to_string(precision) + " outside [1, " +
                                    std::to_string(MAX_PRECISION) + "]", func);
    }
}

// Bisection on validated input
std::string encode_bits(double lat, double lon, int precision) {
    std::string out;
    out.reserve(static_cast<size_t>(precision));

    double s = -90.0, w = -180.0, n = 90.0, e = 180.0;
    bool is_lon = true;
    int bits = 0;
    int value = 0;

    while (static_cast<int>(out.size()) < precision) {
        value <<= 1;
        if (is_lon) {
            double m = mid(w, e);
            if (lon < m) {
                e = m;
            } else {
                w = m;
                value |= 1;
            }
        } else {
            double m = mid(s, n);
            if (lat < m) {
                n = m;
            } else {
                s = m;
                value |= 1;
            }
        }
        is_lon = !is_lon;

        if (++bits == Alphabet::BITS_PER_SYMBOL) {
            out.push_back(Alphabet::symbol_at(value));
            bits = 0;
            value = 0;
        }
    }
    return out;
}

} // anonymous namespace

std::string Codec::encode(double lat, double lon, int precision) {
    Coordinate c = Formulas::validate_coordinate(lat, lon);
    check_precision(precision, __func__);
    return encode_bits(c.lat, c.lon, precision);
}

std::string Codec::encode(double lat, double lon) {
    Coordinate c = Formulas::validate_coordinate(lat, lon);

    // Refine until the readable decode matches the input as given
    for (int p = 1; p <= MAX_PRECISION; ++p) {
        std::string gh = encode_bits(c.lat, c.lon, p);
        Coordinate r = decode_rounded(gh);
        if (std::fabs(c.lat - r.lat) < DBL_EPSILON && std::fabs(c.lon - r.lon) < DBL_EPSILON) {
            LOG_DEBUG("inferred precision ", p, " for (", c.lat, ", ", c.lon, ")");
            return gh;
        }
    }
    return encode_bits(c.lat, c.lon, MAX_PRECISION);
}

BoundingBox Codec::bounds_unchecked(std::string_view geohash) noexcept {
    double s = -90.0, w = -180.0, n = 90.0, e = 180.0;
    bool is_lon = true;

    for (char ch : geohash) {
        int value = Alphabet::value_of(ch);
        for (int mask = 1 << (Alphabet::BITS_PER_SYMBOL - 1); mask != 0; mask >>= 1) {
            if (is_lon) {
                if (value & mask) {
                    w = mid(w, e);
                } else {
                    e = mid(w, e);
                }
            } else {
                if (value & mask) {
                    s = mid(s, n);
                } else {
                    n = mid(s, n);
                }
            }
            is_lon = !is_lon;
        }
    }
    return BoundingBox(s, w, n, e);
}

BoundingBox Codec::bounds(std::string_view geohash) {
    return bounds_unchecked(Alphabet::normalize(geohash));
}

Coordinate Codec::decode_exact(std::string_view geohash) {
    return bounds(geohash).center();
}

std::string Codec::format_axis(double value, double extent) {
    int decimals = static_cast<int>(std::floor(2.0 - std::log10(extent)));
    if (decimals < 0) decimals = 0;

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    std::string text(buf);

    if (text.find('.') != std::string::npos) {
        size_t end = text.find_last_not_of('0');
        if (text[end] == '.') --end;
        text.erase(end + 1);
    }
    return text;
}

DecodedText Codec::decode(std::string_view geohash) {
    BoundingBox box = bounds(geohash);
    Coordinate c = box.center();
    return DecodedText{format_axis(c.lat, box.height()), format_axis(c.lon, box.width())};
}

Coordinate Codec::decode_rounded(std::string_view geohash) {
    DecodedText text = decode(geohash);
    return Coordinate(std::strtod(text.lat.c_str(), nullptr),
                      std::strtod(text.lon.c_str(), nullptr));
}

LatLonDelta Codec::decode_error(std::string_view geohash) {
    BoundingBox box = bounds(geohash);
    return LatLonDelta(box.height() * 0.5, box.width() * 0.5);
}

} // namespace geocell
