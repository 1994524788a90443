/**
 * @file types.hpp
 * @brief Value types: coordinates, cells, directions and neighbor sets.
 *
 * @authors The geohash16 authors
 */

#ifndef GEOHASH_TYPES_HPP
#define GEOHASH_TYPES_HPP

#include "config.hpp"

#include <array>
#include <string>

namespace geohash {

/**
 * @brief A point in degrees: x is longitude, y is latitude.
 *
 * No range is enforced here; encode() rejects points outside the globe.
 */
struct Coordinate {
    double x = 0.0; ///< Longitude
    double y = 0.0; ///< Latitude
};

inline bool operator==(const Coordinate& a, const Coordinate& b) noexcept {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(const Coordinate& a, const Coordinate& b) noexcept {
    return !(a == b);
}

/**
 * @brief Check a coordinate against the global longitude/latitude ranges.
 * @param c Coordinate to check (bounds inclusive)
 * @return true if c can be encoded
 */
inline bool is_valid(const Coordinate& c) noexcept {
    return c.x >= MIN_LONGITUDE && c.x <= MAX_LONGITUDE && c.y >= MIN_LATITUDE &&
           c.y <= MAX_LATITUDE;
}

/**
 * @brief Axis-aligned cell denoted by a hash, min.x <= max.x and min.y <= max.y.
 */
struct Rect {
    Coordinate min;
    Coordinate max;

    /// Midpoint of the cell
    [[nodiscard]] Coordinate center() const noexcept {
        return Coordinate{(min.x + max.x) / 2.0, (min.y + max.y) / 2.0};
    }

    /// Half of the longitude extent
    [[nodiscard]] double half_width() const noexcept { return (max.x - min.x) / 2.0; }

    /// Half of the latitude extent
    [[nodiscard]] double half_height() const noexcept { return (max.y - min.y) / 2.0; }
};

inline bool operator==(const Rect& a, const Rect& b) noexcept {
    return a.min == b.min && a.max == b.max;
}

/**
 * @brief Result of decode(): cell center plus the maximum deviation per axis.
 */
struct DecodedHash {
    Coordinate center;
    double lon_err = 0.0;
    double lat_err = 0.0;
};

/**
 * @brief Compass directions for neighbor lookup.
 */
enum class Direction { N, NE, E, SE, S, SW, W, NW };

/// Order in which neighbors() visits the directions
inline constexpr std::array<Direction, 8> ALL_DIRECTIONS = {
    Direction::SW, Direction::S,  Direction::SE, Direction::W,
    Direction::E,  Direction::NW, Direction::N,  Direction::NE};

/**
 * @brief Unit step of a direction as (dlat, dlng).
 */
struct DirectionOffset {
    double dlat;
    double dlng;
};

/**
 * @brief Get the latitude/longitude step for a direction.
 * @param d Direction
 * @return Signed unit step, e.g. NE = (1, 1), W = (0, -1)
 */
inline DirectionOffset direction_offset(Direction d) noexcept {
    switch (d) {
    case Direction::N:
        return {1.0, 0.0};
    case Direction::NE:
        return {1.0, 1.0};
    case Direction::E:
        return {0.0, 1.0};
    case Direction::SE:
        return {-1.0, 1.0};
    case Direction::S:
        return {-1.0, 0.0};
    case Direction::SW:
        return {-1.0, -1.0};
    case Direction::W:
        return {0.0, -1.0};
    case Direction::NW:
        return {1.0, -1.0};
    default:
        return {0.0, 0.0};
    }
}

/**
 * @brief Get the lowercase short name of a direction ("n", "ne", ...).
 */
inline const char* direction_name(Direction d) noexcept {
    switch (d) {
    case Direction::N:
        return "n";
    case Direction::NE:
        return "ne";
    case Direction::E:
        return "e";
    case Direction::SE:
        return "se";
    case Direction::S:
        return "s";
    case Direction::SW:
        return "sw";
    case Direction::W:
        return "w";
    case Direction::NW:
        return "nw";
    default:
        return "?";
    }
}

/**
 * @brief The eight cells adjacent to a hash, all of the same length.
 */
struct Neighbors {
    std::string n;
    std::string ne;
    std::string e;
    std::string se;
    std::string s;
    std::string sw;
    std::string w;
    std::string nw;

    /// Member holding the neighbor in direction d
    [[nodiscard]] const std::string& get(Direction d) const noexcept { return this->*member(d); }

    std::string& get(Direction d) noexcept { return this->*member(d); }

private:
    static std::string Neighbors::*member(Direction d) noexcept {
        switch (d) {
        case Direction::N:
            return &Neighbors::n;
        case Direction::NE:
            return &Neighbors::ne;
        case Direction::E:
            return &Neighbors::e;
        case Direction::SE:
            return &Neighbors::se;
        case Direction::S:
            return &Neighbors::s;
        case Direction::SW:
            return &Neighbors::sw;
        case Direction::W:
            return &Neighbors::w;
        default:
            return &Neighbors::nw;
        }
    }
};

inline bool operator==(const Neighbors& a, const Neighbors& b) noexcept {
    return a.n == b.n && a.ne == b.ne && a.e == b.e && a.se == b.se && a.s == b.s &&
           a.sw == b.sw && a.w == b.w && a.nw == b.nw;
}

} // namespace geohash

#endif // GEOHASH_TYPES_HPP
