#include <doctest/doctest.h>

#include "VerseWallTestHelper.hpp"

#include <versewall/effects/Variation.hpp>
#include <versewall/scene/SceneGraph.hpp>

using namespace VW;
using namespace VW::Scene;

TEST_SUITE("scene.graph") {

TEST_CASE("the effect is initialized once, at the laid out size") {
    SceneGraph graph{Test::make_inputs(42, Effects::EffectKind::Blobs)};
    graph.set_variation_offset(1.5);
    CHECK(graph.effect().initialization_count() == 0);

    graph.layout(1920.0, 1080.0);
    CHECK(graph.effect().initialization_count() == 1);
    CHECK(graph.effect().canvas_width() == doctest::Approx(1920.0));
    CHECK(graph.effect().canvas_height() == doctest::Approx(1080.0));
    CHECK(graph.effect().variation_offset() == doctest::Approx(1.5));

    graph.layout(1920.0, 1080.0);
    CHECK(graph.effect().initialization_count() == 1);
}

TEST_CASE("a new monitor size and offset cost one initialization") {
    SceneGraph graph{Test::make_inputs(42, Effects::EffectKind::Bubbles)};
    graph.layout(1920.0, 1080.0);
    auto before = graph.effect().initialization_count();

    auto offset = Effects::monitor_variation("DISPLAY2", Effects::DeviceRect{1920, 0, 3840, 1200});
    graph.set_variation_offset(graph.variation_offset() + offset);
    // Deferred until the size of the next canvas is known.
    CHECK(graph.effect().initialization_count() == before);

    graph.layout(1920.0, 1200.0);
    CHECK(graph.effect().initialization_count() == before + 1);
    CHECK(graph.effect().canvas_height() == doctest::Approx(1200.0));
}

TEST_CASE("restoring the offset before the next layout is free") {
    SceneGraph graph{Test::make_inputs(7, Effects::EffectKind::Blobs)};
    graph.layout(800.0, 600.0);
    auto base = graph.variation_offset();
    auto before = graph.effect().initialization_count();

    graph.set_variation_offset(base);
    graph.layout(800.0, 600.0);
    CHECK(graph.effect().initialization_count() == before);
}

TEST_CASE("deferred initialization matches a fresh graph") {
    SceneGraph reused{Test::make_inputs(42, Effects::EffectKind::Blobs)};
    reused.layout(320.0, 200.0);
    reused.set_variation_offset(0.75);
    reused.layout(240.0, 180.0);

    SceneGraph fresh{Test::make_inputs(42, Effects::EffectKind::Blobs)};
    fresh.set_variation_offset(0.75);
    fresh.layout(240.0, 180.0);

    auto const& a = reused.effect().shapes();
    auto const& b = fresh.effect().shapes();
    REQUIRE(a.size() == b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        CAPTURE(i);
        CHECK(a[i].active == b[i].active);
        CHECK(a[i].x == doctest::Approx(b[i].x));
        CHECK(a[i].y == doctest::Approx(b[i].y));
    }
}

}
