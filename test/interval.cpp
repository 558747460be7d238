#include <catch2/catch.hpp>

#include "cipherlist/interval.hpp"

#include <sstream>

using namespace cipherlist;

using int_interval = interval<u32>;

TEST_CASE("interval properties", "[interval]") {
    CHECK(int_interval(1, 2).contains(1));
    CHECK(int_interval(1, 2).contains(2));
    CHECK_FALSE(int_interval(2, 3).contains(1));
    CHECK_FALSE(int_interval(1, 2).contains(3));

    CHECK(int_interval(1, 4).contains(int_interval(2, 3)));
    CHECK_FALSE(int_interval(1, 2).contains(int_interval(2, 3)));

    CHECK(int_interval(1, 3).overlaps(int_interval(3, 5)));
    CHECK_FALSE(int_interval(0, 1).overlaps(int_interval(2, 3)));

    CHECK(int_interval(0, 1).precedes_adjacent(int_interval(2, 3)));
    CHECK_FALSE(int_interval(0, 1).precedes_adjacent(int_interval(3, 4)));
    CHECK_FALSE(int_interval(2, 3).precedes_adjacent(int_interval(0, 1)));

    CHECK(int_interval(5).is_point());
    CHECK(int_interval(5).length() == 1);
    CHECK(int_interval(2, 4).length() == 3);
    CHECK_FALSE(int_interval(2, 4).is_point());
}

TEST_CASE("interval output", "[interval]") {
    std::ostringstream o;
    o << int_interval(7) << int_interval(2, 4);
    REQUIRE(o.str() == "[7][2-4]");

    std::ostringstream bytes;
    bytes << interval<u8>(65, 66);
    REQUIRE(bytes.str() == "[65-66]");
}
