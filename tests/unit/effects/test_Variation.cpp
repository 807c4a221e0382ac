#include <doctest/doctest.h>

#include <versewall/effects/DeterministicRng.hpp>
#include <versewall/effects/Variation.hpp>

#include <cmath>
#include <limits>
#include <numbers>

using namespace VW::Effects;

TEST_SUITE("effects.variation") {

TEST_CASE("stable_hash32 is case-insensitive and zero for empty input") {
    CHECK(stable_hash32("") == 0u);
    CHECK(stable_hash32("\\\\.\\DISPLAY1") == stable_hash32("\\\\.\\display1"));
    CHECK(stable_hash32("DISPLAY1") != stable_hash32("DISPLAY2"));
    // FNV-1a 32 of "a".
    CHECK(stable_hash32("A") == 0xE40C292Cu);
}

TEST_CASE("wrap_variation maps into [0, 2pi)") {
    constexpr double two_pi = 2.0 * std::numbers::pi;
    CHECK(wrap_variation(0.0) == 0.0);
    CHECK(wrap_variation(two_pi) == doctest::Approx(0.0));
    CHECK(wrap_variation(-1.0) == doctest::Approx(two_pi - 1.0));
    CHECK(wrap_variation(7.0) == doctest::Approx(7.0 - two_pi));
    CHECK(wrap_variation(std::numeric_limits<double>::quiet_NaN()) == 0.0);
    CHECK(wrap_variation(std::numeric_limits<double>::infinity()) == 0.0);
    for (double v : {-1000.0, -0.001, 3.0, 1e9}) {
        auto w = wrap_variation(v);
        CHECK(w >= 0.0);
        CHECK(w < two_pi);
    }
}

TEST_CASE("combine_seed quantizes the offset to 1e-5") {
    CHECK(combine_seed(42, 1.0) == combine_seed(42, 1.000000001));
    CHECK(combine_seed(42, 1.0) != combine_seed(42, 1.0001));
    CHECK(combine_seed(42, 1.0) != combine_seed(43, 1.0));
}

TEST_CASE("monitor_variation depends on id and rectangle") {
    DeviceRect left{0, 0, 1920, 1080};
    DeviceRect right{1920, 0, 3840, 1080};
    auto a = monitor_variation("DISPLAY1", left);
    auto b = monitor_variation("DISPLAY1", right);
    auto c = monitor_variation("DISPLAY2", left);
    CHECK(a != b);
    CHECK(a != c);
    CHECK(a == monitor_variation("display1", left));
    for (auto v : {a, b, c}) {
        CHECK(v >= 0.0);
        CHECK(v < 2.0 * std::numbers::pi);
    }
}

TEST_CASE("variation_from_seed stays in range") {
    for (std::int32_t seed : {0, 1, -1, 123456, std::numeric_limits<std::int32_t>::max()}) {
        auto v = variation_from_seed(seed);
        CHECK(v >= 0.0);
        CHECK(v < 2.0 * std::numbers::pi);
    }
    CHECK(variation_from_seed(0) == 0.0);
}

TEST_CASE("device rect helpers") {
    DeviceRect rect{10, 20, 110, 70};
    CHECK(rect.width() == 100);
    CHECK(rect.height() == 50);
    CHECK_FALSE(rect.empty());
    CHECK(DeviceRect{5, 5, 5, 10}.empty());
}

}

TEST_SUITE("effects.rng") {

TEST_CASE("same seed replays the same stream") {
    DeterministicRng a(99);
    DeterministicRng b(99);
    for (int i = 0; i < 64; ++i) {
        CHECK(a.next_double() == b.next_double());
    }
    DeterministicRng c(100);
    DeterministicRng d(99);
    CHECK(c.next_double() != d.next_double());
}

TEST_CASE("ranges are honoured") {
    DeterministicRng rng(7);
    for (int i = 0; i < 1000; ++i) {
        auto d = rng.next_double();
        CHECK(d >= 0.0);
        CHECK(d < 1.0);
        auto n = rng.next_int(3, 9);
        CHECK(n >= 3);
        CHECK(n < 9);
        auto r = rng.next_range(-2.0, 2.0);
        CHECK(r >= -2.0);
        CHECK(r < 2.0);
    }
    CHECK(rng.next_int(5, 5) == 5);
    CHECK(rng.next_int(5, 1) == 5);
}

}
