/**
 * @file neighbor.cpp
 * @brief neighbor() and neighbors().
 *
 * @authors The geohash16 authors
 */

#include <geohash/codec.hpp>
#include <geohash/neighbor.hpp>

#include <cmath>
#include <utility>

namespace geohash {

Error neighbor(std::string_view hash, Direction direction, std::string& out, ErrorInfo* info) {
    DecodedHash decoded;
    auto result = decode(hash, decoded, info);
    if (result != Error::Ok) {
        return result;
    }

    // One full cell is twice the error margin on each axis
    DirectionOffset step = direction_offset(direction);
    Coordinate shifted{decoded.center.x + 2.0 * std::fabs(decoded.lon_err) * step.dlng,
                       decoded.center.y + 2.0 * std::fabs(decoded.lat_err) * step.dlat};

    return encode(shifted, hash.size(), out, info);
}

Error neighbors(std::string_view hash, Neighbors& out, ErrorInfo* info) {
    Neighbors found;
    for (Direction d : ALL_DIRECTIONS) {
        auto result = neighbor(hash, d, found.get(d), info);
        if (result != Error::Ok) {
            return result;
        }
    }

    out = std::move(found);
    return Error::Ok;
}

} // namespace geohash
