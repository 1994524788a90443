/**
 * @file geohash.hpp
 * @brief geohash16 public API.
 *
 * Geohash encoding over a 16-symbol alphabet (0-9a-f): a coordinate maps
 * to a string naming a rectangular cell of the globe, obtained by
 * recursively halving longitude and latitude in turn. Longer strings name
 * smaller cells.
 *
 * @code
 * std::string hash;
 * geohash::encode({112.5584, 37.8324}, 12, hash);  // "e71150dc9947"
 *
 * geohash::DecodedHash cell;
 * geohash::decode("e71150", cell);  // center ~(112.5439, 37.8149)
 * @endcode
 *
 * @authors The geohash16 authors
 */

#ifndef GEOHASH_HPP
#define GEOHASH_HPP

#include "alphabet.hpp"
#include "codec.hpp"
#include "config.hpp"
#include "error.hpp"
#include "neighbor.hpp"
#include "refiner.hpp"
#include "types.hpp"

namespace geohash {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace geohash

#endif // GEOHASH_HPP
