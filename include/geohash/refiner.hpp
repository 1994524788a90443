/**
 * @file refiner.hpp
 * @brief Interleaved binary search over the longitude/latitude ranges.
 *
 * A CellRefiner starts from the whole globe and halves one axis per bit,
 * longitude first and then alternating. The bit counter is carried across
 * character boundaries and never reset.
 *
 * Encoding classifies a coordinate against the current midpoint to
 * produce bits; decoding applies given bits. Both narrow the bounds in
 * exactly the same way, which is what makes them inverses.
 *
 * @authors The geohash16 authors
 */

#ifndef GEOHASH_REFINER_HPP
#define GEOHASH_REFINER_HPP

#include "config.hpp"
#include "types.hpp"

namespace geohash {

/**
 * @brief One axis of the running bounds.
 */
struct Interval {
    double min;
    double max;

    [[nodiscard]] constexpr double mid() const noexcept { return (min + max) / 2.0; }

    /**
     * @brief Keep the upper half (bit 1) or the lower half (bit 0).
     */
    constexpr void shrink(int bit) noexcept {
        double m = mid();
        if (bit != 0) {
            min = m;
        } else {
            max = m;
        }
    }

    /**
     * @brief Select the half containing value and shrink to it.
     *
     * A value exactly on the midpoint goes to the lower half.
     *
     * @return The selected bit
     */
    constexpr int split(double value) noexcept {
        int bit = value > mid() ? 1 : 0;
        shrink(bit);
        return bit;
    }
};

/**
 * @brief Stateful cell narrowing shared by encode and decode_bbox.
 *
 * Lives on the caller's stack; one instance per operation.
 */
class CellRefiner {
public:
    /**
     * @brief Start from the whole globe with the longitude axis active.
     */
    constexpr CellRefiner() noexcept
        : lon_{MIN_LONGITUDE, MAX_LONGITUDE}, lat_{MIN_LATITUDE, MAX_LATITUDE}, bits_(0) {}

    /**
     * @brief Check whether the next bit refines longitude.
     */
    [[nodiscard]] constexpr bool lon_active() const noexcept { return (bits_ & 1U) == 0; }

    /**
     * @brief Number of bits consumed so far.
     */
    [[nodiscard]] constexpr std::size_t position() const noexcept { return bits_; }

    /**
     * @brief Emit the next bit for a coordinate and narrow the active axis.
     *
     * @param c Coordinate being encoded
     * @return 1 if c lies above the midpoint of the active axis, else 0
     */
    constexpr int classify(const Coordinate& c) noexcept {
        int bit = lon_active() ? lon_.split(c.x) : lat_.split(c.y);
        ++bits_;
        return bit;
    }

    /**
     * @brief Narrow the active axis according to a decoded bit.
     *
     * @param bit 1 keeps the upper half, 0 the lower half
     */
    constexpr void apply(int bit) noexcept {
        if (lon_active()) {
            lon_.shrink(bit);
        } else {
            lat_.shrink(bit);
        }
        ++bits_;
    }

    /**
     * @brief Produce one character's worth of bits, MSB first.
     *
     * @param c Coordinate being encoded
     * @return Value 0-15
     */
    constexpr std::uint8_t classify_char(const Coordinate& c) noexcept {
        std::uint8_t value = 0;
        for (std::size_t i = 0; i < BITS_PER_CHAR; ++i) {
            value = static_cast<std::uint8_t>((value << 1) | classify(c));
        }
        return value;
    }

    /**
     * @brief Apply one character's worth of bits, MSB first.
     *
     * @param value Value 0-15
     */
    constexpr void apply_char(std::uint8_t value) noexcept {
        for (std::size_t i = 0; i < BITS_PER_CHAR; ++i) {
            apply(static_cast<int>((value >> (BITS_PER_CHAR - 1U - i)) & 1U));
        }
    }

    /**
     * @brief Current cell.
     */
    [[nodiscard]] constexpr Rect bounds() const noexcept {
        return Rect{Coordinate{lon_.min, lat_.min}, Coordinate{lon_.max, lat_.max}};
    }

private:
    Interval lon_;
    Interval lat_;
    std::size_t bits_;
};

} // namespace geohash

#endif // GEOHASH_REFINER_HPP
