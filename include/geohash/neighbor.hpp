/**
 * @file neighbor.hpp
 * @brief Adjacent cell lookup.
 *
 * A neighbor is found by decoding the hash, stepping the center one cell
 * width/height in the requested direction and encoding again at the same
 * length. Nothing wraps at the antimeridian or clamps at the poles:
 * stepping off the globe fails with Error::InvalidCoordinateRange.
 *
 * @authors The geohash16 authors
 */

#ifndef GEOHASH_NEIGHBOR_HPP
#define GEOHASH_NEIGHBOR_HPP

#include "error.hpp"
#include "types.hpp"

#include <string>
#include <string_view>

namespace geohash {

/**
 * @brief Find the adjacent hash in one direction.
 *
 * @param hash Source hash
 * @param direction Compass direction to step
 * @param[out] out Neighbor hash of the same length (unchanged on error)
 * @param[out] info Optional error details, filled on failure
 * @return Error::Ok on success, Error::InvalidHashCharacter if hash does
 *         not decode, Error::InvalidCoordinateRange if the step leaves the globe
 */
Error neighbor(std::string_view hash, Direction direction, std::string& out,
               ErrorInfo* info = nullptr);

/**
 * @brief Find all eight adjacent hashes.
 *
 * Directions are visited in ALL_DIRECTIONS order and the first failure
 * is returned; out is only written when every direction succeeds.
 *
 * @param hash Source hash
 * @param[out] out Neighbor set (unchanged on error)
 * @param[out] info Optional error details, filled on failure
 * @return Error::Ok on success, otherwise the first failing direction's error
 */
Error neighbors(std::string_view hash, Neighbors& out, ErrorInfo* info = nullptr);

} // namespace geohash

#endif // GEOHASH_NEIGHBOR_HPP
