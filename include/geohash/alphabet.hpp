/**
 * @file alphabet.hpp
 * @brief Mapping between 4-bit cell values and hash characters.
 *
 * The alphabet is the 16 lowercase hex digits 0123456789abcdef, one
 * character per 4 interleaved bits. This differs from the conventional
 * 32-symbol geohash alphabet (0-9 plus b-z without a, i, l, o), which
 * packs 5 bits per character; hashes from the two schemes are not
 * interchangeable.
 *
 * @authors The geohash16 authors
 */

#ifndef GEOHASH_ALPHABET_HPP
#define GEOHASH_ALPHABET_HPP

#include "config.hpp"
#include "error.hpp"

namespace geohash {

namespace detail {
inline constexpr char ALPHABET[ALPHABET_SIZE + 1] = "0123456789abcdef";
} // namespace detail

/**
 * @brief Map a 4-bit value to its hash character.
 *
 * @param value Cell value, only the low 4 bits are used
 * @return Character from 0-9a-f
 */
inline constexpr char value_to_char(std::uint8_t value) noexcept {
    return detail::ALPHABET[value & (ALPHABET_SIZE - 1U)];
}

/**
 * @brief Map a hash character back to its 4-bit value.
 *
 * Case-sensitive: 'A'-'F' are rejected.
 *
 * @param c Hash character
 * @param[out] value Value 0-15 (unchanged on error)
 * @return Error::Ok on success, Error::InvalidHashCharacter otherwise
 */
inline constexpr Error char_to_value(char c, std::uint8_t& value) noexcept {
    if (c >= '0' && c <= '9') {
        value = static_cast<std::uint8_t>(c - '0');
        return Error::Ok;
    }
    if (c >= 'a' && c <= 'f') {
        value = static_cast<std::uint8_t>(c - 'a' + 10);
        return Error::Ok;
    }
    return Error::InvalidHashCharacter;
}

} // namespace geohash

#endif // GEOHASH_ALPHABET_HPP
