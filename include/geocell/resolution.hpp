#pragma once

#include "geocell/types.hpp"

namespace geocell {

/**
 * Geographic resolution of geohash precisions.
 * Longitude receives ceil(5p/2) bits and latitude floor(5p/2) bits of a
 * p-character hash, since bisection starts with longitude.
 *
 * @throws InvalidPrecisionError for precisions outside 1..MAX_PRECISION
 */
Resolutions resolution_for(int prec_lon, int prec_lat);

inline Resolutions resolution_for(int precision) {
    return resolution_for(precision, precision);
}

/**
 * Shortest precision whose resolution is at least as fine as both
 * targets, or MAX_PRECISION if none is.
 *
 * @throws InvalidResolutionError for negative or non-finite resolutions
 */
int precision_for(double res_lon, double res_lat);

inline int precision_for(double resolution) {
    return precision_for(resolution, resolution);
}

} // namespace geocell
