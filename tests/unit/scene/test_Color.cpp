#include <doctest/doctest.h>

#include <versewall/scene/Color.hpp>

using namespace VW::Scene;

TEST_SUITE("scene.color") {

TEST_CASE("parse accepts both hex forms") {
    auto teal = parse_color("#26A69A");
    REQUIRE(teal.has_value());
    CHECK(*teal == rgb(0x26, 0xA6, 0x9A));

    auto translucent = parse_color("80ff0000");
    REQUIRE(translucent.has_value());
    CHECK(translucent->a == 0x80);
    CHECK(translucent->r == 0xFF);
    CHECK(translucent->g == 0);
}

TEST_CASE("parse rejects malformed text") {
    CHECK_FALSE(parse_color("").has_value());
    CHECK_FALSE(parse_color("#").has_value());
    CHECK_FALSE(parse_color("#12345").has_value());
    CHECK_FALSE(parse_color("#GG0000").has_value());
    CHECK_FALSE(parse_color("#1234567").has_value());
}

TEST_CASE("format is upper-case ARGB") {
    CHECK(format_color(rgb(0x26, 0xa6, 0x9a)) == "#FF26A69A");
    CHECK(format_color(with_alpha(rgb(1, 2, 3), 0)) == "#00010203");
    CHECK(parse_color(format_color(rgb(10, 20, 30))) == rgb(10, 20, 30));
}

TEST_CASE("luminance and float conversion") {
    CHECK(luminance(rgb(0, 0, 0)) == 0.0);
    CHECK(luminance(rgb(255, 255, 255)) == doctest::Approx(255.0));
    auto f = to_float(with_alpha(rgb(255, 0, 51), 0));
    CHECK(f[0] == 1.0f);
    CHECK(f[2] == doctest::Approx(0.2f));
    CHECK(f[3] == 0.0f);
}

}
