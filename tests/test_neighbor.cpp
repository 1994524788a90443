/**
 * @file test_neighbor.cpp
 * @brief Unit tests for neighbor(), neighbors() and direction helpers.
 */

#include <catch2/catch_test_macros.hpp>
#include <geohash/codec.hpp>
#include <geohash/neighbor.hpp>

#include <cstring>
#include <string>

using namespace geohash;

TEST_CASE("direction_offset steps", "[neighbor]") {
    REQUIRE(direction_offset(Direction::N).dlat == 1.0);
    REQUIRE(direction_offset(Direction::N).dlng == 0.0);
    REQUIRE(direction_offset(Direction::NE).dlat == 1.0);
    REQUIRE(direction_offset(Direction::NE).dlng == 1.0);
    REQUIRE(direction_offset(Direction::E).dlat == 0.0);
    REQUIRE(direction_offset(Direction::E).dlng == 1.0);
    REQUIRE(direction_offset(Direction::SE).dlat == -1.0);
    REQUIRE(direction_offset(Direction::SE).dlng == 1.0);
    REQUIRE(direction_offset(Direction::S).dlat == -1.0);
    REQUIRE(direction_offset(Direction::S).dlng == 0.0);
    REQUIRE(direction_offset(Direction::SW).dlat == -1.0);
    REQUIRE(direction_offset(Direction::SW).dlng == -1.0);
    REQUIRE(direction_offset(Direction::W).dlat == 0.0);
    REQUIRE(direction_offset(Direction::W).dlng == -1.0);
    REQUIRE(direction_offset(Direction::NW).dlat == 1.0);
    REQUIRE(direction_offset(Direction::NW).dlng == -1.0);
}

TEST_CASE("direction_name", "[neighbor]") {
    REQUIRE(std::strcmp(direction_name(Direction::N), "n") == 0);
    REQUIRE(std::strcmp(direction_name(Direction::SE), "se") == 0);
    REQUIRE(std::strcmp(direction_name(Direction::NW), "nw") == 0);
}

TEST_CASE("ALL_DIRECTIONS lists each direction once", "[neighbor]") {
    int seen[8] = {};
    for (Direction d : ALL_DIRECTIONS) {
        ++seen[static_cast<int>(d)];
    }
    for (int count : seen) {
        REQUIRE(count == 1);
    }
}

TEST_CASE("Neighbors::get addresses the matching member", "[neighbor]") {
    Neighbors ns;
    for (Direction d : ALL_DIRECTIONS) {
        ns.get(d) = direction_name(d);
    }

    REQUIRE(ns.n == "n");
    REQUIRE(ns.ne == "ne");
    REQUIRE(ns.e == "e");
    REQUIRE(ns.se == "se");
    REQUIRE(ns.s == "s");
    REQUIRE(ns.sw == "sw");
    REQUIRE(ns.w == "w");
    REQUIRE(ns.nw == "nw");

    const Neighbors& view = ns;
    REQUIRE(view.get(Direction::SW) == "sw");
}

TEST_CASE("neighbor steps one cell", "[neighbor]") {
    std::string out;

    SECTION("north and south") {
        REQUIRE(neighbor("e71150dc99", Direction::N, out) == Error::Ok);
        REQUIRE(out == "e71150dc9c");
        REQUIRE(neighbor("e71150dc99", Direction::S, out) == Error::Ok);
        REQUIRE(out == "e71150dc98");
    }

    SECTION("east and west") {
        REQUIRE(neighbor("e71150dc99", Direction::E, out) == Error::Ok);
        REQUIRE(out == "e71150dc9b");
        REQUIRE(neighbor("e71150dc99", Direction::W, out) == Error::Ok);
        REQUIRE(out == "e71150dc93");
    }

    SECTION("crossing a parent cell boundary") {
        REQUIRE(neighbor("e7115", Direction::W, out) == Error::Ok);
        REQUIRE(out == "e5bbf");
    }
}

TEST_CASE("neighbor of a neighbor comes back", "[neighbor]") {
    const char* start = "4d8c0f1817";
    const Direction pairs[][2] = {{Direction::N, Direction::S},
                                  {Direction::E, Direction::W},
                                  {Direction::NE, Direction::SW},
                                  {Direction::NW, Direction::SE}};

    for (const auto& p : pairs) {
        std::string there;
        std::string back;
        REQUIRE(neighbor(start, p[0], there) == Error::Ok);
        REQUIRE(neighbor(there, p[1], back) == Error::Ok);
        REQUIRE(back == start);
    }
}

TEST_CASE("neighbor keeps the input length", "[neighbor]") {
    for (std::size_t len = 1; len <= 12; ++len) {
        std::string hash;
        REQUIRE(encode(Coordinate{-3.7038, 40.4168}, len, hash) == Error::Ok);

        Neighbors ns;
        REQUIRE(neighbors(hash, ns) == Error::Ok);
        for (Direction d : ALL_DIRECTIONS) {
            REQUIRE(ns.get(d).size() == len);
            REQUIRE(ns.get(d) != hash);
        }
    }
}

TEST_CASE("neighbor propagates decode errors", "[neighbor]") {
    std::string out = "untouched";
    ErrorInfo info;

    REQUIRE(neighbor("wwgj", Direction::N, out, &info) == Error::InvalidHashCharacter);
    REQUIRE(info.character == 'w');
    REQUIRE(out == "untouched");
}

TEST_CASE("neighbor fails when stepping off the globe", "[neighbor]") {
    std::string out = "untouched";
    ErrorInfo info;

    SECTION("east of the antimeridian") {
        // 'f' spans lon [90, 180]: one step east is centred at 225
        REQUIRE(neighbor("f", Direction::E, out, &info) == Error::InvalidCoordinateRange);
        REQUIRE(info.coordinate.x == 225.0);
        REQUIRE(info.coordinate.y == 67.5);
    }

    SECTION("south of the south pole") {
        REQUIRE(neighbor("0", Direction::S, out, &info) == Error::InvalidCoordinateRange);
        REQUIRE(info.coordinate.x == -135.0);
        REQUIRE(info.coordinate.y == -112.5);
    }

    REQUIRE(out == "untouched");
}

TEST_CASE("neighbors aborts on the first failure", "[neighbor]") {
    Neighbors ns;
    ns.n = "keep";
    ErrorInfo info;

    SECTION("invalid hash") {
        REQUIRE(neighbors("e7G", ns, &info) == Error::InvalidHashCharacter);
        REQUIRE(info.character == 'G');
    }

    SECTION("edge cell: south-east fails first") {
        // 'e' spans lon [90, 180], lat [0, 45]: SW and S stay on the globe,
        // SE is the first direction in visiting order that leaves it.
        REQUIRE(neighbors("e", ns, &info) == Error::InvalidCoordinateRange);
        REQUIRE(info.coordinate.x == 225.0);
        REQUIRE(info.coordinate.y == -22.5);
    }

    REQUIRE(ns.n == "keep");
    REQUIRE(ns.s.empty());
}
