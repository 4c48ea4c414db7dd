#pragma once

#include <string_view>

namespace geocell {

/**
 * Strict numeric parsing for command-line and "lat,lon" input.
 * The whole text must be the number, surrounding whitespace aside.
 * what names the value in error messages ("latitude", "precision").
 *
 * @throws InvalidArgumentError on empty or trailing text, or a value
 *         outside the range of the result type
 */
int parse_int(std::string_view text, const char* what);
double parse_double(std::string_view text, const char* what);

// Text without leading and trailing whitespace
std::string_view trim(std::string_view text) noexcept;

} // namespace geocell
