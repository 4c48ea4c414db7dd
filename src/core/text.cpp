#include "geocell/text.hpp"
#include "geocell/error.hpp"
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <string>

namespace geocell {

namespace {

std::string unparsable(const char* what, const std::string& text, const char* why) {
    return std::string("cannot parse ") + what + " '" + text + "': " + why;
}

} // anonymous namespace

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
    return text;
}

int parse_int(std::string_view text, const char* what) {
    const std::string value(trim(text));
    if (value.empty()) {
        GEOCELL_THROW_INVALID_ARG(unparsable(what, value, "empty"));
    }

    char* end = nullptr;
    errno = 0;
    long parsed = std::strtol(value.c_str(), &end, 10);
    if (end != value.c_str() + value.size()) {
        GEOCELL_THROW_INVALID_ARG(unparsable(what, value, "not an integer"));
    }
    // long is wider than int on LP64; reject instead of truncating
    if (errno == ERANGE || parsed < INT_MIN || parsed > INT_MAX) {
        GEOCELL_THROW_INVALID_ARG(unparsable(what, value, "out of range"));
    }
    return static_cast<int>(parsed);
}

double parse_double(std::string_view text, const char* what) {
    const std::string value(trim(text));
    if (value.empty()) {
        GEOCELL_THROW_INVALID_ARG(unparsable(what, value, "empty"));
    }

    char* end = nullptr;
    errno = 0;
    double parsed = std::strtod(value.c_str(), &end);
    if (end != value.c_str() + value.size()) {
        GEOCELL_THROW_INVALID_ARG(unparsable(what, value, "not a number"));
    }
    if (errno == ERANGE) {
        GEOCELL_THROW_INVALID_ARG(unparsable(what, value, "out of range"));
    }
    return parsed;
}

} // namespace geocell
