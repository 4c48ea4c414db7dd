#pragma once

#include "geocell/types.hpp"
#include <array>
#include <cstddef>
#include <string_view>

namespace geocell {

// Characteristic size of a geohash cell in meters
struct CellSize {
    double height;   // latitudinal
    double width;    // longitudinal
    double radius;   // sqrt(height * width / pi)
};

/**
 * Cell sizes indexed by precision 0..MAX_PRECISION.
 * Row 0 is the whole globe.
 */
extern const std::array<CellSize, MAX_PRECISION + 1> CELL_SIZES;

/**
 * Size table row for a precision
 * @throws InvalidPrecisionError outside 0..MAX_PRECISION
 */
const CellSize& cell_size(int precision);

/**
 * Latitudinal height and longitudinal width in meters of a geohash cell
 * @throws InvalidGeohashError
 */
LatLonDelta cell_sizes(std::string_view geohash);

// Number of leading symbols two geohashes share
std::size_t common_prefix_length(std::string_view a, std::string_view b) noexcept;

/**
 * Tier 1: size of the smallest cell containing both geohashes, i.e. the
 * radius at their common prefix length. A crude upper bound in meters.
 * @throws InvalidGeohashError
 */
double distance1(std::string_view a, std::string_view b);

/**
 * Tier 2: equirectangular distance between the cell centers.
 * With radius 0 the squared distance in degrees squared is returned.
 * @throws InvalidGeohashError, InvalidArgumentError for a negative or
 *         non-finite radius
 */
double distance2(std::string_view a, std::string_view b, double radius = R_M,
                 bool adjust = false, bool wrap = false);

/**
 * Tier 3: haversine great-circle distance between the cell centers
 * @throws InvalidGeohashError, InvalidArgumentError
 */
double distance3(std::string_view a, std::string_view b, double radius = R_M, bool wrap = false);

} // namespace geocell
