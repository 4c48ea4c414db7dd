#pragma once

#include <stdexcept>
#include <string>

namespace geocell {

/**
 * Structured error reporting for geocell.
 * Every failure carries a code, the function it was raised in and an
 * optional hint for the caller.
 */

enum class ErrorCode {
    // General errors
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,

    // Input domain errors
    INVALID_COORDINATE = 100,
    INVALID_PRECISION = 101,
    INVALID_GEOHASH = 102,
    INVALID_DIRECTION = 103,
    INVALID_RESOLUTION = 104,

    // Internal errors
    INTERNAL_ERROR = 500
};

constexpr const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SUCCESS:            return "success";
        case ErrorCode::INVALID_ARGUMENT:   return "invalid argument";
        case ErrorCode::INVALID_COORDINATE: return "invalid coordinate";
        case ErrorCode::INVALID_PRECISION:  return "invalid precision";
        case ErrorCode::INVALID_GEOHASH:    return "invalid geohash";
        case ErrorCode::INVALID_DIRECTION:  return "invalid direction";
        case ErrorCode::INVALID_RESOLUTION: return "invalid resolution";
        case ErrorCode::INTERNAL_ERROR:     return "internal error";
    }
    return "unknown";
}

class GeocellException : public std::runtime_error {
public:
    explicit GeocellException(ErrorCode code, const std::string& message,
                              const std::string& context = "",
                              const std::string& suggestion = "")
        : std::runtime_error(compose(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    // "Geocell error [102]: ...\nContext: f\nSuggestion: ..."
    static std::string compose(ErrorCode code, const std::string& message,
                               const std::string& context, const std::string& suggestion) {
        std::string text = "Geocell error [";
        text += std::to_string(static_cast<int>(code));
        text += "]: ";
        text += message;
        if (!context.empty()) text += "\nContext: " + context;
        if (!suggestion.empty()) text += "\nSuggestion: " + suggestion;
        return text;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

/**
 * Exception type bound to one error code, so callers can catch a single
 * kind of failure
 */
template<ErrorCode Code>
class CodedError : public GeocellException {
public:
    static constexpr ErrorCode CODE = Code;

    explicit CodedError(const std::string& message, const std::string& context = "",
                        const std::string& suggestion = "")
        : GeocellException(Code, message, context, suggestion) {}
};

using InvalidArgumentError   = CodedError<ErrorCode::INVALID_ARGUMENT>;
using InvalidCoordinateError = CodedError<ErrorCode::INVALID_COORDINATE>;
using InvalidPrecisionError  = CodedError<ErrorCode::INVALID_PRECISION>;
using InvalidGeohashError    = CodedError<ErrorCode::INVALID_GEOHASH>;
using InvalidDirectionError  = CodedError<ErrorCode::INVALID_DIRECTION>;
using InvalidResolutionError = CodedError<ErrorCode::INVALID_RESOLUTION>;

// Error handling utilities
class ErrorHandler {
public:
    static void check_condition(bool condition, ErrorCode code,
                                const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "") {
        if (!condition) {
            throw GeocellException(code, message, context, suggestion);
        }
    }
};

// Macros attach the calling function as context
#define GEOCELL_CHECK(condition, code, message) \
    geocell::ErrorHandler::check_condition(condition, code, message, __func__)

#define GEOCELL_THROW(code, message) \
    throw geocell::GeocellException(code, message, __func__)

#define GEOCELL_THROW_INVALID_ARG(message) \
    throw geocell::InvalidArgumentError(message, __func__)

} // namespace geocell
