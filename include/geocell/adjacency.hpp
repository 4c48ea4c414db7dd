#pragma once

#include "geocell/types.hpp"
#include <string>
#include <string_view>

namespace geocell {

/**
 * Neighbor and border tables for geohash adjacency
 *
 * For each cardinal direction and each parity of the hash length there is
 * a 32-symbol permutation (the neighbor table) and a small set of symbols
 * lying on that edge of their parent cell (the border table). Tables for
 * East/West are the North/South tables with parities swapped, since an odd
 * length flips which axis the final symbol spans.
 */
struct NeighborTables {
    // Index: [direction][parity], parity = length % 2
    static const std::string_view NEIGHBOR[4][2];
    static const std::string_view BORDER[4][2];

    static constexpr int index(Direction d) noexcept { return static_cast<int>(d); }
};

/**
 * Table-driven geohash adjacency
 *
 * adjacent() replaces the final symbol through the neighbor table; when that
 * symbol sits on the border of its parent, the parent itself is first moved
 * one cell in the same direction. No pole or antimeridian correction is
 * applied: the tables wrap longitude and reflect whatever they produce at
 * the poles.
 */
class Adjacency {
public:
    /**
     * Cell adjacent to geohash in a cardinal direction
     * @throws InvalidGeohashError
     */
    static std::string adjacent(std::string_view geohash, Direction direction);

    /**
     * Direction given as text; only the first character is significant
     * ("n", "N", "North" ...)
     * @throws InvalidDirectionError, InvalidGeohashError
     */
    static std::string adjacent(std::string_view geohash, std::string_view direction);

    /**
     * All 8 neighbors. Diagonals compose two cardinal steps:
     * NE = E(N), NW = W(N), SE = E(S), SW = W(S)
     */
    static Neighbors8 neighbors(std::string_view geohash);

    /**
     * Parse "N"/"S"/"E"/"W" (case-insensitive, first character only)
     * @throws InvalidDirectionError
     */
    static Direction parse_direction(std::string_view text);

    /**
     * adjacent() for an already normalized geohash
     * @throws GeocellException (INTERNAL_ERROR) for an empty geohash
     */
    static std::string adjacent_unchecked(std::string_view geohash, Direction direction);

    /**
     * neighbors() for an already normalized geohash
     */
    static Neighbors8 neighbors_unchecked(std::string_view geohash);
};

} // namespace geocell
