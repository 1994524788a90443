/**
 * @file error.cpp
 * @brief Error message formatting.
 *
 * @authors The geohash16 authors
 */

#include <geohash/error.hpp>

#include <cstdio>
#include <limits>

namespace geohash {

std::string describe(const ErrorInfo& info) {
    char buf[128];

    switch (info.code) {
    case Error::InvalidCoordinateRange:
        // Full precision: a value just past a bound must not print as the bound
        std::snprintf(buf, sizeof(buf), "%s: (%.*g, %.*g)", error_string(info.code),
                      std::numeric_limits<double>::max_digits10, info.coordinate.x,
                      std::numeric_limits<double>::max_digits10, info.coordinate.y);
        break;
    case Error::InvalidHashCharacter: {
        unsigned code = static_cast<unsigned char>(info.character);
        if (code >= 0x20U && code < 0x7FU) {
            std::snprintf(buf, sizeof(buf), "%s: '%c' (0x%02x)", error_string(info.code),
                          info.character, code);
        } else {
            std::snprintf(buf, sizeof(buf), "%s: 0x%02x", error_string(info.code), code);
        }
        break;
    }
    default:
        return error_string(info.code);
    }

    return buf;
}

} // namespace geohash
