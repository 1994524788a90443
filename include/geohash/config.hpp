/**
 * @file config.hpp
 * @brief geohash16 compile-time configuration.
 *
 * Coordinate ranges, alphabet geometry and version constants shared by
 * the encoder, the decoder and the neighbor finder.
 *
 * @authors The geohash16 authors
 */

#ifndef GEOHASH_CONFIG_HPP
#define GEOHASH_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace geohash {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Longest hash the benchmark driver and tests work with (encode has no limit)
#ifndef GEOHASH_MAX_LENGTH
#define GEOHASH_MAX_LENGTH 32U
#endif

inline constexpr std::size_t MAX_LENGTH = GEOHASH_MAX_LENGTH;

/// Valid coordinate ranges in degrees
inline constexpr double MIN_LONGITUDE = -180.0;
inline constexpr double MAX_LONGITUDE = 180.0;
inline constexpr double MIN_LATITUDE = -90.0;
inline constexpr double MAX_LATITUDE = 90.0;

/// Each hash character carries one hex digit: 4 interleaved bits
inline constexpr std::size_t BITS_PER_CHAR = 4U;
inline constexpr std::size_t ALPHABET_SIZE = 1U << BITS_PER_CHAR;

/** @} */

} // namespace geohash

#endif // GEOHASH_CONFIG_HPP
