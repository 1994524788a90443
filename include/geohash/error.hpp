/**
 * @file error.hpp
 * @brief geohash16 error handling.
 *
 * Every fallible operation returns an Error code and writes its result
 * through an out-parameter. The optional ErrorInfo out-parameter carries
 * the offending input for diagnostics.
 *
 * @authors The geohash16 authors
 */

#ifndef GEOHASH_ERROR_HPP
#define GEOHASH_ERROR_HPP

#include "config.hpp"
#include "types.hpp"

#include <string>

namespace geohash {

/**
 * @brief Error codes returned by encode, decode and neighbor operations.
 */
enum class Error {
    Ok = 0,                      ///< Success
    InvalidCoordinateRange = -1, ///< Longitude or latitude outside the globe
    InvalidHashCharacter = -2    ///< Character outside 0-9a-f
};

/**
 * @brief Diagnostic payload for a failed operation.
 *
 * Only the field matching @c code is meaningful.
 */
struct ErrorInfo {
    Error code = Error::Ok;
    Coordinate coordinate; ///< Offending coordinate (InvalidCoordinateRange)
    char character = '\0'; ///< Offending character (InvalidHashCharacter)
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InvalidCoordinateRange:
        return "Invalid coordinate range";
    case Error::InvalidHashCharacter:
        return "Invalid hash character";
    default:
        return "Unknown error";
    }
}

/**
 * @brief Format an error together with its payload.
 *
 * e.g. "Invalid coordinate range: (190, -100)" or
 * "Invalid hash character: 'w' (0x77)".
 *
 * @param info Filled error information
 * @return Message suitable for logs and test output
 */
std::string describe(const ErrorInfo& info);

namespace detail {

inline Error fail_coordinate(ErrorInfo* info, const Coordinate& c) noexcept {
    if (info != nullptr) {
        info->code = Error::InvalidCoordinateRange;
        info->coordinate = c;
    }
    return Error::InvalidCoordinateRange;
}

inline Error fail_character(ErrorInfo* info, char ch) noexcept {
    if (info != nullptr) {
        info->code = Error::InvalidHashCharacter;
        info->character = ch;
    }
    return Error::InvalidHashCharacter;
}

} // namespace detail

} // namespace geohash

#endif // GEOHASH_ERROR_HPP
