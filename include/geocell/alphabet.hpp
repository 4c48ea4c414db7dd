#pragma once

#include "geocell/types.hpp"
#include <array>
#include <string>
#include <string_view>

namespace geocell {

namespace detail {

constexpr std::string_view GEOHASH_SYMBOLS = "0123456789bcdefghjkmnpqrstuvwxyz";

constexpr std::array<signed char, 256> build_decode_table() noexcept {
    std::array<signed char, 256> table{};
    for (auto& v : table) v = -1;
    for (std::size_t i = 0; i < GEOHASH_SYMBOLS.size(); ++i) {
        table[static_cast<unsigned char>(GEOHASH_SYMBOLS[i])] = static_cast<signed char>(i);
    }
    return table;
}

} // namespace detail

/**
 * Geohash base-32 alphabet
 *
 * Maps the 32 symbols "0123456789bcdefghjkmnpqrstuvwxyz" to the 5-bit
 * values 0..31 and back. Letters a, i, l and o are not part of it.
 * Only lowercase symbols are recognized; callers case-fold first.
 */
class Alphabet {
public:
    static constexpr std::string_view SYMBOLS = detail::GEOHASH_SYMBOLS;
    static constexpr int SIZE = 32;
    static constexpr int BITS_PER_SYMBOL = 5;

    /**
     * 5-bit value of a symbol
     * @return 0..31, or -1 if c is not a lowercase geohash symbol
     */
    static int value_of(char c) noexcept {
        return DECODE_TABLE[static_cast<unsigned char>(c)];
    }

    /**
     * Symbol for a 5-bit value (0..31, unchecked)
     */
    static constexpr char symbol_at(int value) noexcept {
        return SYMBOLS[static_cast<std::size_t>(value)];
    }

    /**
     * True if s has 1..MAX_PRECISION characters, all geohash symbols
     * after case folding
     */
    static bool is_valid(std::string_view s) noexcept;

    /**
     * Case-fold and validate a geohash string
     * @throws InvalidGeohashError on empty, too long or foreign input
     */
    static std::string normalize(std::string_view s);

private:
    static constexpr std::array<signed char, 256> DECODE_TABLE = detail::build_decode_table();
};

} // namespace geocell
