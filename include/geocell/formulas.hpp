#pragma once

#include "geocell/types.hpp"

namespace geocell {

/**
 * Coordinate validation and closed-form distance formulas
 *
 * All inputs are in degrees. The distance formulas return results in the
 * units of the supplied radius (meters for R_M).
 */
class Formulas {
public:
    /**
     * Validate a latitude/longitude pair
     * @throws InvalidCoordinateError if lat is outside [-90, 90], lon outside
     *         [-180, 180] or either is not finite
     */
    static Coordinate validate_coordinate(double lat, double lon);

    /**
     * Unroll a longitudinal delta into [-180, 180)
     */
    static double unroll180(double dlon) noexcept;

    /**
     * Squared flat-earth distance in degrees squared
     * @param adjust Scale the longitudinal delta by cos(mean latitude)
     * @param wrap Unroll the longitudinal delta before use
     */
    static double equirectangular_squared(const Coordinate& a, const Coordinate& b,
                                          bool adjust = false, bool wrap = false) noexcept;

    /**
     * Flat-earth (equirectangular) distance
     * See "Local, flat earth approximation", https://www.edwilliams.org/avform.htm#flat
     * @throws InvalidArgumentError for a non-positive or non-finite radius
     */
    static double equirectangular(const Coordinate& a, const Coordinate& b,
                                  double radius = R_M, bool adjust = false, bool wrap = false);

    /**
     * Great-circle distance using the haversine formula
     * @throws InvalidArgumentError for a non-positive or non-finite radius
     */
    static double haversine(const Coordinate& a, const Coordinate& b,
                            double radius = R_M, bool wrap = false);

    static constexpr double radians(double degrees) noexcept {
        return degrees * (PI / 180.0);
    }

    static constexpr double PI = 3.14159265358979323846;
};

} // namespace geocell
