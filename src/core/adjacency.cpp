#include "geocell/adjacency.hpp"
#include "geocell/alphabet.hpp"
#include "geocell/error.hpp"
#include "geocell/logging.hpp"
#include <cctype>

namespace geocell {

/*
 * Neighbor permutations, per direction, for even and odd hash lengths.
 * Position i of a permutation holds the symbol whose neighbor is
 * Alphabet::SYMBOLS[i]. Derived from D. Troy's geohash-js tables.
 */
namespace {

constexpr std::string_view NEIGHBOR_N = "p0r21436x8zb9dcf5h7kjnmqesgutwvy";
constexpr std::string_view NEIGHBOR_E = "bc01fg45238967deuvhjyznpkmstqrwx";
constexpr std::string_view NEIGHBOR_S = "14365h7k9dcfesgujnmqp0r2twvyx8zb";
constexpr std::string_view NEIGHBOR_W = "238967debc01fg45kmstqrwxuvhjyznp";

constexpr std::string_view BORDER_N = "prxz";
constexpr std::string_view BORDER_E = "bcfguvyz";
constexpr std::string_view BORDER_S = "028b";
constexpr std::string_view BORDER_W = "0145hjnp";

} // anonymous namespace

const std::string_view NeighborTables::NEIGHBOR[4][2] = {
    {NEIGHBOR_N, NEIGHBOR_E},   // North
    {NEIGHBOR_S, NEIGHBOR_W},   // South
    {NEIGHBOR_E, NEIGHBOR_N},   // East
    {NEIGHBOR_W, NEIGHBOR_S},   // West
};

const std::string_view NeighborTables::BORDER[4][2] = {
    {BORDER_N, BORDER_E},
    {BORDER_S, BORDER_W},
    {BORDER_E, BORDER_N},
    {BORDER_W, BORDER_S},
};

const std::string& Neighbors8::at(std::string_view key) const {
    if (key == "N")  return n;
    if (key == "NE") return ne;
    if (key == "E")  return e;
    if (key == "SE") return se;
    if (key == "S")  return s;
    if (key == "SW") return sw;
    if (key == "W")  return w;
    if (key == "NW") return nw;
    throw InvalidDirectionError("unknown neighbor key '" + std::string(key) + "'", __func__);
}

Direction Adjacency::parse_direction(std::string_view text) {
    if (!text.empty()) {
        switch (std::toupper(static_cast<unsigned char>(text.front()))) {
            case 'N': return Direction::North;
            case 'S': return Direction::South;
            case 'E': return Direction::East;
            case 'W': return Direction::West;
            default: break;
        }
    }
    throw InvalidDirectionError("invalid direction '" + std::string(text) + "'", __func__,
                                "use one of N, S, E or W");
}

std::string Adjacency::adjacent_unchecked(std::string_view geohash, Direction direction) {
    GEOCELL_CHECK(!geohash.empty(), ErrorCode::INTERNAL_ERROR, "empty geohash has no neighbors");
    const int d = NeighborTables::index(direction);
    const int parity = static_cast<int>(geohash.size() & 1);

    const char last = geohash.back();
    const size_t i = NeighborTables::NEIGHBOR[d][parity].find(last);
    if (i == std::string_view::npos) {
        GEOCELL_THROW(ErrorCode::INTERNAL_ERROR,
                      "symbol '" + std::string(1, last) + "' missing from neighbor table");
    }

    std::string parent(geohash.substr(0, geohash.size() - 1));
    // A border symbol means the neighbor lies in the adjacent parent cell
    if (!parent.empty() && NeighborTables::BORDER[d][parity].find(last) != std::string_view::npos) {
        LOG_DEBUG("carry ", direction_char(direction), " from '", geohash, "' into parent '", parent, "'");
        parent = adjacent_unchecked(parent, direction);
    }

    parent.push_back(Alphabet::symbol_at(static_cast<int>(i)));
    return parent;
}

std::string Adjacency::adjacent(std::string_view geohash, Direction direction) {
    return adjacent_unchecked(Alphabet::normalize(geohash), direction);
}

std::string Adjacency::adjacent(std::string_view geohash, std::string_view direction) {
    Direction d = parse_direction(direction);
    return adjacent(geohash, d);
}

Neighbors8 Adjacency::neighbors_unchecked(std::string_view geohash) {
    Neighbors8 result;
    result.n = adjacent_unchecked(geohash, Direction::North);
    result.s = adjacent_unchecked(geohash, Direction::South);
    result.e = adjacent_unchecked(geohash, Direction::East);
    result.w = adjacent_unchecked(geohash, Direction::West);
    result.ne = adjacent_unchecked(result.n, Direction::East);
    result.nw = adjacent_unchecked(result.n, Direction::West);
    result.se = adjacent_unchecked(result.s, Direction::East);
    result.sw = adjacent_unchecked(result.s, Direction::West);
    return result;
}

Neighbors8 Adjacency::neighbors(std::string_view geohash) {
    return neighbors_unchecked(Alphabet::normalize(geohash));
}

} // namespace geocell
