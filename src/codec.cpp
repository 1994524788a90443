/**
 * @file codec.cpp
 * @brief encode(), decode_bbox() and decode().
 *
 * Both directions drive the same CellRefiner: encode() classifies the
 * input coordinate to produce bits, decode_bbox() applies the bits of
 * each character.
 *
 * @authors The geohash16 authors
 */

#include <geohash/alphabet.hpp>
#include <geohash/codec.hpp>
#include <geohash/refiner.hpp>

#include <utility>

namespace geohash {

Error encode(const Coordinate& c, std::size_t length, std::string& out, ErrorInfo* info) {
    if (!is_valid(c)) {
        return detail::fail_coordinate(info, c);
    }

    std::string hash;
    hash.reserve(length);

    CellRefiner refiner;
    while (hash.size() < length) {
        hash.push_back(value_to_char(refiner.classify_char(c)));
    }

    out = std::move(hash);
    return Error::Ok;
}

Error decode_bbox(std::string_view hash, Rect& out, ErrorInfo* info) noexcept {
    CellRefiner refiner;
    for (char ch : hash) {
        std::uint8_t value = 0;
        if (char_to_value(ch, value) != Error::Ok) {
            return detail::fail_character(info, ch);
        }
        refiner.apply_char(value);
    }

    out = refiner.bounds();
    return Error::Ok;
}

Error decode(std::string_view hash, DecodedHash& out, ErrorInfo* info) noexcept {
    Rect cell;
    auto result = decode_bbox(hash, cell, info);
    if (result != Error::Ok) {
        return result;
    }

    out.center = cell.center();
    out.lon_err = cell.half_width();
    out.lat_err = cell.half_height();
    return Error::Ok;
}

} // namespace geohash
