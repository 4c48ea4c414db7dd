#pragma once

#include "geocell/types.hpp"
#include <string>
#include <string_view>

namespace geocell {

/**
 * Geohash bisection codec
 *
 * Encodes a latitude/longitude into a base-32 string by bisecting the
 * [-180, 180] x [-90, 90] domain one bit at a time, most significant bit
 * first, alternating axes starting with longitude. Five bits make one
 * character, so precision 12 carries 60 bits (30 per axis).
 *
 * Decoding replays the same bisection to recover the cell's bounding box.
 * Odd-length hashes resolve longitude with one more bit than latitude.
 *
 * Geohash is a public domain scheme by G. Niemeyer (2008).
 */
class Codec {
public:
    /**
     * Encode a position at a fixed precision
     * @param precision Geohash length, 1..MAX_PRECISION
     * @throws InvalidCoordinateError, InvalidPrecisionError
     */
    static std::string encode(double lat, double lon, int precision);

    /**
     * Encode a position at the shortest precision whose readable decode
     * reproduces lat and lon exactly, falling back to MAX_PRECISION
     * @throws InvalidCoordinateError
     */
    static std::string encode(double lat, double lon);

    /**
     * Bounding box (south, west, north, east) of a geohash
     * @throws InvalidGeohashError
     */
    static BoundingBox bounds(std::string_view geohash);

    /**
     * Center of the cell at full double precision
     */
    static Coordinate decode_exact(std::string_view geohash);

    /**
     * Center of the cell rounded per axis to floor(2 - log10(cell size))
     * decimals, trailing zeros stripped
     */
    static DecodedText decode(std::string_view geohash);

    /**
     * decode() parsed back to doubles
     */
    static Coordinate decode_rounded(std::string_view geohash);

    /**
     * Half the cell height and half its width, in degrees
     */
    static LatLonDelta decode_error(std::string_view geohash);

    /**
     * Bisect without validation; geohash must already be normalized
     */
    static BoundingBox bounds_unchecked(std::string_view geohash) noexcept;

    /**
     * Format a center coordinate to the readable precision of an extent
     */
    static std::string format_axis(double value, double extent);
};

} // namespace geocell
