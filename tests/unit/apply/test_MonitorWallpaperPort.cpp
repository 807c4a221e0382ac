#include <doctest/doctest.h>

#include "VerseWallTestHelper.hpp"

#include <versewall/apply/MonitorWallpaperPort.hpp>

using namespace VW;
using namespace VW::Apply;

TEST_SUITE("apply.monitors") {

TEST_CASE("query_monitors skips monitors with empty geometry") {
    Test::FakeWallpaperPort port({
        Test::FakeMonitor{"A", Effects::DeviceRect{0, 0, 100, 100}, PixelSize{100, 100}},
        Test::FakeMonitor{"B", Effects::DeviceRect{100, 0, 100, 100}, PixelSize{0, 100}},
        Test::FakeMonitor{"C", Effects::DeviceRect{100, 0, 300, 100}, PixelSize{400, 200}, DpiScale{2.0, 2.0}},
    });

    auto targets = query_monitors(port);
    REQUIRE(targets.has_value());
    REQUIRE(targets->size() == 2);
    CHECK((*targets)[0].id == "A");
    CHECK((*targets)[1].id == "C");
    CHECK((*targets)[1].index == 2);
    CHECK((*targets)[1].logical_width() == doctest::Approx(200.0));
    CHECK((*targets)[1].logical_height() == doctest::Approx(100.0));
}

TEST_CASE("distinct rectangles and the primary monitor") {
    std::vector<MonitorTarget> targets{
        MonitorTarget{.id = "L", .index = 0, .rect = Effects::DeviceRect{-1920, 0, 0, 1080}},
        MonitorTarget{.id = "P", .index = 1, .rect = Effects::DeviceRect{0, 0, 1920, 1080}},
        MonitorTarget{.id = "M", .index = 2, .rect = Effects::DeviceRect{0, 0, 1920, 1080}},
    };
    CHECK(distinct_rect_count(targets) == 2);
    REQUIRE(primary_target(targets) != nullptr);
    CHECK(primary_target(targets)->id == "P");

    targets.erase(targets.begin() + 1, targets.end());
    CHECK(primary_target(targets)->id == "L");
    CHECK(primary_target({}) == nullptr);
}

TEST_CASE("fill mode names") {
    CHECK(fill_mode_name(FillMode::Fill) == "fill");
    CHECK(fill_mode_name(FillMode::Span) == "span");
}

}
