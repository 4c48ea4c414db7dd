#pragma once

#include "geocell/types.hpp"
#include "geocell/codec.hpp"
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace geocell {

/**
 * Immutable geohash cell
 *
 * Wraps a validated, lowercase geohash string. Bounds, center and the 8
 * neighbors are computed on first use and cached for the lifetime of the
 * cell; the per-instance mutex only guards filling the caches.
 */
class GeohashCell {
public:
    /**
     * From a geohash ("u120fxw", any case) or a "lat,lon" pair
     * ("52.205,0.119"). A pair is encoded at the given precision, or at
     * the inferred precision when precision is 0.
     * @throws InvalidGeohashError, InvalidArgumentError,
     *         InvalidCoordinateError, InvalidPrecisionError
     */
    explicit GeohashCell(std::string_view text, int precision = 0);

    explicit GeohashCell(const char* text, int precision = 0)
        : GeohashCell(std::string_view(text), precision) {}

    explicit GeohashCell(const std::string& text, int precision = 0)
        : GeohashCell(std::string_view(text), precision) {}

    /**
     * From a position; precision 0 infers it
     */
    explicit GeohashCell(const Coordinate& position, int precision = 0);

    /**
     * From any value with lat and lon members
     */
    template<typename LatLonT>
    static GeohashCell from_point(const LatLonT& point, int precision = 0) {
        return GeohashCell(Coordinate(static_cast<double>(point.lat),
                                      static_cast<double>(point.lon)), precision);
    }

    // Named constructors
    static GeohashCell from_geohash(std::string_view geohash);
    static GeohashCell from_text(std::string_view latlon, int precision = 0);

    GeohashCell(const GeohashCell& other);
    GeohashCell& operator=(const GeohashCell& other);
    GeohashCell(GeohashCell&& other) noexcept;
    GeohashCell& operator=(GeohashCell&& other) noexcept;
    ~GeohashCell() = default;

    const std::string& geohash() const noexcept { return geohash_; }
    int precision() const noexcept { return static_cast<int>(geohash_.size()); }

    BoundingBox bounds() const;
    Coordinate center() const;
    LatLonDelta decode_error() const;
    DecodedText decode() const;

    // Height and width in meters
    LatLonDelta sizes() const;

    GeohashCell adjacent(Direction direction) const;
    GeohashCell adjacent(std::string_view direction) const;

    GeohashCell north() const;
    GeohashCell south() const;
    GeohashCell east() const;
    GeohashCell west() const;
    GeohashCell north_east() const;
    GeohashCell north_west() const;
    GeohashCell south_east() const;
    GeohashCell south_west() const;

    Neighbors8 neighbors() const;

    // Distance estimates, see distance.hpp
    double distance1_to(const GeohashCell& other) const;
    double distance2_to(const GeohashCell& other, double radius = R_M,
                        bool adjust = false, bool wrap = false) const;
    double distance3_to(const GeohashCell& other, double radius = R_M, bool wrap = false) const;

private:
    void clear() noexcept;

    struct Trusted {};
    GeohashCell(Trusted, std::string geohash) noexcept;

    static std::string parse_and_encode(std::string_view latlon, int precision);

    const Neighbors8& cached_neighbors() const;

    std::string geohash_;

    mutable std::mutex cache_mutex_;
    mutable std::optional<BoundingBox> bounds_;
    mutable std::optional<Coordinate> center_;
    mutable std::optional<Neighbors8> neighbors_;
};

inline bool operator==(const GeohashCell& lhs, const GeohashCell& rhs) noexcept {
    return lhs.geohash() == rhs.geohash();
}

inline bool operator!=(const GeohashCell& lhs, const GeohashCell& rhs) noexcept {
    return !(lhs == rhs);
}

inline bool operator<(const GeohashCell& lhs, const GeohashCell& rhs) noexcept {
    return lhs.geohash() < rhs.geohash();
}

inline std::ostream& operator<<(std::ostream& os, const GeohashCell& cell) {
    return os << cell.geohash();
}

} // namespace geocell
