#include "geocell/geohash_cell.hpp"
#include "geocell/adjacency.hpp"
#include "geocell/alphabet.hpp"
#include "geocell/distance.hpp"
#include "geocell/error.hpp"
#include "geocell/formulas.hpp"
#include "geocell/text.hpp"
#include <utility>
#include <vector>

namespace geocell {

namespace {

std::string encode_at(const Coordinate& c, int precision) {
    return precision == 0 ? Codec::encode(c.lat, c.lon)
                          : Codec::encode(c.lat, c.lon, precision);
}

} // anonymous namespace

std::string GeohashCell::parse_and_encode(std::string_view latlon, int precision) {
    std::vector<std::string_view> fields;
    size_t start = 0;
    while (true) {
        size_t comma = latlon.find(',', start);
        fields.push_back(latlon.substr(start, comma == std::string_view::npos ? std::string_view::npos
                                                                            : comma - start));
        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }
    if (fields.size() < 2) {
        throw InvalidArgumentError("expected \"lat,lon\" but got '" + std::string(latlon) + "'",
                                   "GeohashCell");
    }

    // A trailing height field is accepted and ignored
    double lat = parse_double(fields[0], "latitude");
    double lon = parse_double(fields[1], "longitude");
    return encode_at(Coordinate(lat, lon), precision);
}

GeohashCell::GeohashCell(std::string_view text, int precision)
    : geohash_(text.find(',') != std::string_view::npos ? parse_and_encode(text, precision)
                                                        : Alphabet::normalize(text)) {}

GeohashCell::GeohashCell(const Coordinate& position, int precision)
    : geohash_(encode_at(position, precision)) {}

GeohashCell::GeohashCell(Trusted, std::string geohash) noexcept
    : geohash_(std::move(geohash)) {}

GeohashCell GeohashCell::from_geohash(std::string_view geohash) {
    return GeohashCell(Trusted{}, Alphabet::normalize(geohash));
}

GeohashCell GeohashCell::from_text(std::string_view latlon, int precision) {
    return GeohashCell(Trusted{}, parse_and_encode(latlon, precision));
}

GeohashCell::GeohashCell(const GeohashCell& other)
    : geohash_(other.geohash_) {
    std::lock_guard<std::mutex> lock(other.cache_mutex_);
    bounds_ = other.bounds_;
    center_ = other.center_;
    neighbors_ = other.neighbors_;
}

GeohashCell& GeohashCell::operator=(const GeohashCell& other) {
    if (this != &other) {
        std::scoped_lock lock(cache_mutex_, other.cache_mutex_);
        geohash_ = other.geohash_;
        bounds_ = other.bounds_;
        center_ = other.center_;
        neighbors_ = other.neighbors_;
    }
    return *this;
}

GeohashCell::GeohashCell(GeohashCell&& other) noexcept
    : geohash_(std::move(other.geohash_))
    , bounds_(std::move(other.bounds_))
    , center_(std::move(other.center_))
    , neighbors_(std::move(other.neighbors_)) {
    other.clear();
}

// A moved-from cell is empty and holds no cached state
void GeohashCell::clear() noexcept {
    geohash_.clear();
    bounds_.reset();
    center_.reset();
    neighbors_.reset();
}

GeohashCell& GeohashCell::operator=(GeohashCell&& other) noexcept {
    if (this != &other) {
        geohash_ = std::move(other.geohash_);
        bounds_ = std::move(other.bounds_);
        center_ = std::move(other.center_);
        neighbors_ = std::move(other.neighbors_);
        other.clear();
    }
    return *this;
}

BoundingBox GeohashCell::bounds() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    if (!bounds_) {
        bounds_ = Codec::bounds_unchecked(geohash_);
    }
    return *bounds_;
}

Coordinate GeohashCell::center() const {
    BoundingBox box = bounds();
    std::lock_guard<std::mutex> lock(cache_mutex_);
    if (!center_) {
        center_ = box.center();
    }
    return *center_;
}

LatLonDelta GeohashCell::decode_error() const {
    BoundingBox box = bounds();
    return LatLonDelta(box.height() * 0.5, box.width() * 0.5);
}

DecodedText GeohashCell::decode() const {
    BoundingBox box = bounds();
    Coordinate c = center();
    return DecodedText{Codec::format_axis(c.lat, box.height()),
                       Codec::format_axis(c.lon, box.width())};
}

LatLonDelta GeohashCell::sizes() const {
    const CellSize& size = cell_size(precision());
    return LatLonDelta(size.height, size.width);
}

const Neighbors8& GeohashCell::cached_neighbors() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    if (!neighbors_) {
        neighbors_ = Adjacency::neighbors_unchecked(geohash_);
    }
    return *neighbors_;
}

Neighbors8 GeohashCell::neighbors() const {
    return cached_neighbors();
}

GeohashCell GeohashCell::adjacent(Direction direction) const {
    switch (direction) {
        case Direction::North: return north();
        case Direction::South: return south();
        case Direction::East:  return east();
        case Direction::West:  return west();
    }
    GEOCELL_THROW(ErrorCode::INTERNAL_ERROR, "unhandled direction");
}

GeohashCell GeohashCell::adjacent(std::string_view direction) const {
    return adjacent(Adjacency::parse_direction(direction));
}

GeohashCell GeohashCell::north() const      { return GeohashCell(Trusted{}, cached_neighbors().n); }
GeohashCell GeohashCell::south() const      { return GeohashCell(Trusted{}, cached_neighbors().s); }
GeohashCell GeohashCell::east() const       { return GeohashCell(Trusted{}, cached_neighbors().e); }
GeohashCell GeohashCell::west() const       { return GeohashCell(Trusted{}, cached_neighbors().w); }
GeohashCell GeohashCell::north_east() const { return GeohashCell(Trusted{}, cached_neighbors().ne); }
GeohashCell GeohashCell::north_west() const { return GeohashCell(Trusted{}, cached_neighbors().nw); }
GeohashCell GeohashCell::south_east() const { return GeohashCell(Trusted{}, cached_neighbors().se); }
GeohashCell GeohashCell::south_west() const { return GeohashCell(Trusted{}, cached_neighbors().sw); }

double GeohashCell::distance1_to(const GeohashCell& other) const {
    return CELL_SIZES[common_prefix_length(geohash_, other.geohash_)].radius;
}

double GeohashCell::distance2_to(const GeohashCell& other, double radius, bool adjust, bool wrap) const {
    if (radius == 0.0) {
        return Formulas::equirectangular_squared(center(), other.center(), adjust, wrap);
    }
    return Formulas::equirectangular(center(), other.center(), radius, adjust, wrap);
}

double GeohashCell::distance3_to(const GeohashCell& other, double radius, bool wrap) const {
    return Formulas::haversine(center(), other.center(), radius, wrap);
}

} // namespace geocell
