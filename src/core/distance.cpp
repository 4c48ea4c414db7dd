#include "geocell/distance.hpp"
#include "geocell/alphabet.hpp"
#include "geocell/codec.hpp"
#include "geocell/error.hpp"
#include "geocell/formulas.hpp"
#include <algorithm>

namespace geocell {

const std::array<CellSize, MAX_PRECISION + 1> CELL_SIZES = {{
    {20032e3, 20000e3, 11292815.096},   // 0
    { 5003e3,  5000e3,  2821794.075},   // 1
    {  650e3,  1225e3,   503442.397},   // 2
    {  156e3,   156e3,    88013.575},   // 3
    {  19500,   39100,    15578.683},   // 4
    {   4890,    4890,     2758.887},   // 5
    {    610,    1220,      486.710},   // 6
    {    153,     153,       86.321},   // 7
    {     19.1,    38.2,     15.239},   // 8
    {      4.77,    4.77,     2.691},   // 9
    {      0.596,   1.19,     0.475},   // 10
    {      0.149,   0.149,    0.084},   // 11
    {      0.0186,  0.0372,   0.015},   // 12
}};

const CellSize& cell_size(int precision) {
    if (precision < 0 || precision > MAX_PRECISION) {
        throw InvalidPrecisionError("no cell size for precision " + std::to_string(precision), __func__);
    }
    return CELL_SIZES[static_cast<size_t>(precision)];
}

LatLonDelta cell_sizes(std::string_view geohash) {
    std::string gh = Alphabet::normalize(geohash);
    const CellSize& size = CELL_SIZES[gh.size()];
    return LatLonDelta(size.height, size.width);
}

std::size_t common_prefix_length(std::string_view a, std::string_view b) noexcept {
    std::size_t n = std::min(a.size(), b.size());
    std::size_t i = 0;
    while (i < n && a[i] == b[i]) {
        ++i;
    }
    return i;
}

double distance1(std::string_view a, std::string_view b) {
    std::string ga = Alphabet::normalize(a);
    std::string gb = Alphabet::normalize(b);
    return CELL_SIZES[common_prefix_length(ga, gb)].radius;
}

double distance2(std::string_view a, std::string_view b, double radius, bool adjust, bool wrap) {
    Coordinate ca = Codec::decode_exact(a);
    Coordinate cb = Codec::decode_exact(b);
    if (radius == 0.0) {
        return Formulas::equirectangular_squared(ca, cb, adjust, wrap);
    }
    return Formulas::equirectangular(ca, cb, radius, adjust, wrap);
}

double distance3(std::string_view a, std::string_view b, double radius, bool wrap) {
    return Formulas::haversine(Codec::decode_exact(a), Codec::decode_exact(b), radius, wrap);
}

} // namespace geocell
