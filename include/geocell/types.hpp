#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace geocell {

// Longest geohash handled: 12 characters = 60 bits
constexpr int MAX_PRECISION = 12;

// Mean earth radius in meters
constexpr double R_M = 6371008.771415;

// Geographic position in degrees
struct Coordinate {
    double lat, lon;

    constexpr Coordinate() noexcept : lat(0.0), lon(0.0) {}
    constexpr Coordinate(double lat_, double lon_) noexcept : lat(lat_), lon(lon_) {}
};

constexpr bool operator==(const Coordinate& lhs, const Coordinate& rhs) noexcept {
    return lhs.lat == rhs.lat && lhs.lon == rhs.lon;
}

constexpr bool operator!=(const Coordinate& lhs, const Coordinate& rhs) noexcept {
    return !(lhs == rhs);
}

// Latitudinal / longitudinal extent pair (degrees or meters depending on use)
struct LatLonDelta {
    double lat, lon;

    constexpr LatLonDelta() noexcept : lat(0.0), lon(0.0) {}
    constexpr LatLonDelta(double lat_, double lon_) noexcept : lat(lat_), lon(lon_) {}
};

/**
 * Rectangle denoted by a geohash, in degrees.
 * south <= north and west <= east always hold; the box never
 * straddles the antimeridian.
 */
struct BoundingBox {
    double south, west, north, east;

    constexpr BoundingBox() noexcept
        : south(-90.0), west(-180.0), north(90.0), east(180.0) {}
    constexpr BoundingBox(double s, double w, double n, double e) noexcept
        : south(s), west(w), north(n), east(e) {}

    constexpr double height() const noexcept { return north - south; }
    constexpr double width() const noexcept { return east - west; }

    constexpr Coordinate center() const noexcept {
        return Coordinate((south + north) * 0.5, (west + east) * 0.5);
    }

    constexpr bool contains(const Coordinate& c) const noexcept {
        return c.lat >= south && c.lat <= north && c.lon >= west && c.lon <= east;
    }
};

constexpr bool operator==(const BoundingBox& lhs, const BoundingBox& rhs) noexcept {
    return lhs.south == rhs.south && lhs.west == rhs.west &&
           lhs.north == rhs.north && lhs.east == rhs.east;
}

// Cardinal compass direction
enum class Direction {
    North,
    South,
    East,
    West
};

constexpr Direction opposite(Direction d) noexcept {
    switch (d) {
        case Direction::North: return Direction::South;
        case Direction::South: return Direction::North;
        case Direction::East:  return Direction::West;
        case Direction::West:  return Direction::East;
    }
    return d;
}

constexpr char direction_char(Direction d) noexcept {
    switch (d) {
        case Direction::North: return 'N';
        case Direction::South: return 'S';
        case Direction::East:  return 'E';
        case Direction::West:  return 'W';
    }
    return '?';
}

// All 8 surrounding cells of a geohash
struct Neighbors8 {
    std::string n, ne, e, se, s, sw, w, nw;

    static constexpr std::size_t COUNT = 8;
    static constexpr const char* KEYS[COUNT] = {"N", "NE", "E", "SE", "S", "SW", "W", "NW"};

    // Lookup by compass key ("N", "NE", ...); throws InvalidDirectionError
    const std::string& at(std::string_view key) const;
};

inline bool operator==(const Neighbors8& lhs, const Neighbors8& rhs) {
    return lhs.n == rhs.n && lhs.ne == rhs.ne && lhs.e == rhs.e && lhs.se == rhs.se &&
           lhs.s == rhs.s && lhs.sw == rhs.sw && lhs.w == rhs.w && lhs.nw == rhs.nw;
}

// Longitudinal and latitudinal resolution in degrees
struct Resolutions {
    double lon, lat;

    constexpr Resolutions() noexcept : lon(360.0), lat(180.0) {}
    constexpr Resolutions(double lon_, double lat_) noexcept : lon(lon_), lat(lat_) {}
};

// Human readable decode, each axis rounded to its own cell precision
struct DecodedText {
    std::string lat, lon;
};

} // namespace geocell
