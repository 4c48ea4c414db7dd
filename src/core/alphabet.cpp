#include "geocell/alphabet.hpp"
#include "geocell/error.hpp"
#include <cctype>

namespace geocell {

namespace {

inline char fold(char c) noexcept {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

} // anonymous namespace

bool Alphabet::is_valid(std::string_view s) noexcept {
    if (s.empty() || s.size() > static_cast<std::size_t>(MAX_PRECISION)) {
        return false;
    }
    for (char c : s) {
        if (value_of(fold(c)) < 0) {
            return false;
        }
    }
    return true;
}

std::string Alphabet::normalize(std::string_view s) {
    if (s.empty()) {
        throw InvalidGeohashError("empty geohash", __func__);
    }
    if (s.size() > static_cast<std::size_t>(MAX_PRECISION)) {
        throw InvalidGeohashError("geohash '" + std::string(s) + "' longer than " +
                                  std::to_string(MAX_PRECISION) + " characters", __func__);
    }

    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        char lc = fold(c);
        if (value_of(lc) < 0) {
            throw InvalidGeohashError("geohash '" + std::string(s) + "' contains invalid character '" +
                                      std::string(1, c) + "'", __func__,
                                      "valid symbols are " + std::string(SYMBOLS));
        }
        out.push_back(lc);
    }
    return out;
}

} // namespace geocell
