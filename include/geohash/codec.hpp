/**
 * @file codec.hpp
 * @brief Coordinate to hash encoding and hash to cell decoding.
 *
 * @authors The geohash16 authors
 */

#ifndef GEOHASH_CODEC_HPP
#define GEOHASH_CODEC_HPP

#include "config.hpp"
#include "error.hpp"
#include "types.hpp"

#include <string>
#include <string_view>

namespace geohash {

/**
 * @brief Encode a coordinate to a hash of a given length.
 *
 * Each character adds 4 interleaved bits, longitude first. Points inside
 * the same final cell produce the same hash.
 *
 * @param c Coordinate, longitude in [-180, 180] and latitude in [-90, 90]
 * @param length Number of characters to produce (0 gives an empty hash)
 * @param[out] out Encoded hash (unchanged on error)
 * @param[out] info Optional error details, filled on failure
 * @return Error::Ok on success, Error::InvalidCoordinateRange otherwise
 */
Error encode(const Coordinate& c, std::size_t length, std::string& out,
             ErrorInfo* info = nullptr);

/**
 * @brief Decode a hash to the cell it denotes.
 *
 * The empty hash denotes the whole globe. Input is scanned byte by byte:
 * for a multi-byte UTF-8 character ErrorInfo::character holds its first
 * byte.
 *
 * @param hash Hash made of 0-9a-f (lowercase only)
 * @param[out] out Cell bounds (unchanged on error)
 * @param[out] info Optional error details, filled on failure
 * @return Error::Ok on success, Error::InvalidHashCharacter otherwise
 */
Error decode_bbox(std::string_view hash, Rect& out, ErrorInfo* info = nullptr) noexcept;

/**
 * @brief Decode a hash to its cell center and per-axis error.
 *
 * lon_err and lat_err are half the cell width and height: the largest
 * distance between the center and any point that encodes to this hash.
 *
 * @param hash Hash made of 0-9a-f (lowercase only)
 * @param[out] out Center and errors (unchanged on error)
 * @param[out] info Optional error details, filled on failure
 * @return Error::Ok on success, Error::InvalidHashCharacter otherwise
 */
Error decode(std::string_view hash, DecodedHash& out, ErrorInfo* info = nullptr) noexcept;

} // namespace geohash

#endif // GEOHASH_CODEC_HPP
