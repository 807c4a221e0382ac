#include <doctest/doctest.h>

#include <versewall/scene/CompositionSurface.hpp>
#include <versewall/text/FontFace.hpp>

#include <cmath>
#include <variant>

using namespace VW;
using namespace VW::Scene;

namespace {

auto poem_inputs(Orientation orientation) -> SceneInputs {
    SceneInputs inputs;
    inputs.poem.main_text = "床前明月光，疑是地上霜。";
    inputs.poem.title = "静夜思";
    inputs.poem.author = "李白";
    inputs.style.orientation = orientation;
    inputs.style.poem_font = Text::FontFace::placeholder();
    inputs.style.author_font = Text::FontFace::placeholder();
    return inputs;
}

auto glyph_runs(DrawList const& list) -> std::vector<GlyphRunCommand const*> {
    std::vector<GlyphRunCommand const*> runs;
    for (auto const& command : list.commands) {
        if (auto run = std::get_if<GlyphRunCommand>(&command)) {
            runs.push_back(run);
        }
    }
    return runs;
}

} // namespace

TEST_SUITE("scene.composition") {

TEST_CASE("fragments split on punctuation and drop empty pieces") {
    auto fragments = split_fragments(U"床前明月光，疑是地上霜。\n\n举头望明月,低头思故乡!");
    REQUIRE(fragments.size() == 4);
    CHECK(fragments[0] == U"床前明月光");
    CHECK(fragments[1] == U"疑是地上霜");
    CHECK(fragments[3] == U"低头思故乡");
    CHECK(split_fragments(U"。，\n").empty());
    CHECK(split_fragments(U"").empty());
}

TEST_CASE("text color follows background luminance") {
    CHECK(legible_text_color(rgb(245, 245, 245), false) == rgb(55, 71, 79));
    CHECK(legible_text_color(rgb(20, 20, 40), false) == rgb(255, 255, 255));
    CHECK(legible_text_color(rgb(245, 245, 245), true) == rgb(255, 255, 255));
    CHECK(secondary_text_color(rgb(255, 255, 255)) == rgb(200, 200, 200));
    CHECK(secondary_text_color(rgb(55, 71, 79)) == rgb(128, 128, 128));
}

TEST_CASE("watermark font size is clamped") {
    auto large = watermark_metrics(1, 1920.0, 10000.0);
    CHECK(large.font_size == 240.0);
    CHECK(large.top == doctest::Approx(1000.0));

    auto small = watermark_metrics(20, 800.0, 600.0);
    CHECK(small.font_size == 70.0);
    CHECK(small.top == 60.0);
    CHECK(small.line_height == doctest::Approx(70.0 * 1.28));
    CHECK(small.right_margin == doctest::Approx(std::round(24.0 + 70.0 * 0.25)));

    auto fallback = watermark_metrics(0, 0.0, 0.0);
    CHECK(fallback.top == 85.0);
    CHECK(fallback.font_size >= 70.0);
    CHECK(fallback.font_size <= 240.0);
}

TEST_CASE("wave canvas is a bottom band") {
    CHECK(CompositionSurface::effect_canvas_height(Effects::EffectKind::Wave, 1080.0) == kWaveBandHeight);
    CHECK(CompositionSurface::effect_canvas_height(Effects::EffectKind::Wave, 300.0) == 300.0);
    CHECK(CompositionSurface::effect_canvas_height(Effects::EffectKind::Blobs, 1080.0) == 1080.0);
}

TEST_CASE("vertical layout draws columns right to left") {
    CompositionSurface surface;
    auto list = surface.compose(poem_inputs(Orientation::Vertical), {}, 1280.0, 720.0);
    CHECK(list.logical_width == 1280.0f);
    REQUIRE_FALSE(list.commands.empty());
    CHECK(kind_of(list.commands.front()) == DrawCommandKind::Rect);
    CHECK(list.count(DrawCommandKind::Rect) == 1);
    CHECK(list.count(DrawCommandKind::RoundedRect) == 1);

    auto runs = glyph_runs(list);
    // Two poem columns, quote-title-quote stack, two seal characters.
    REQUIRE(runs.size() == 2 + 5 + 2);
    REQUIRE(runs[0]->glyphs.size() == 5);
    CHECK(runs[0]->glyphs[0].glyph_id == U'床');
    CHECK(runs[1]->glyphs[0].glyph_id == U'疑');
    CHECK(runs[0]->glyphs[0].x > runs[1]->glyphs[0].x);
    // Characters in a column stack downward.
    CHECK(runs[0]->glyphs[1].y > runs[0]->glyphs[0].y);
    CHECK(runs[0]->glyphs[0].x == runs[0]->glyphs[1].x);
    CHECK(runs[2]->glyphs[0].glyph_id == U'﹁');
    CHECK(runs.back()->synthetic_bold);
}

TEST_CASE("horizontal layout keeps lines in one run") {
    CompositionSurface surface;
    auto list = surface.compose(poem_inputs(Orientation::Horizontal), {}, 1280.0, 720.0);
    auto runs = glyph_runs(list);
    REQUIRE(runs.size() == 3);
    CHECK(runs[0]->glyphs.size() == 10);
    CHECK(runs[0]->glyphs[5].y > runs[0]->glyphs[0].y);
    CHECK(runs[0]->glyphs[1].x > runs[0]->glyphs[0].x);
    // Title is wrapped in corner brackets.
    CHECK(runs[1]->glyphs.front().glyph_id == U'「');
    CHECK(runs[1]->glyphs.back().glyph_id == U'」');
    CHECK(runs[2]->glyphs.size() == 2);
}

TEST_CASE("effect paths sit between background and text") {
    Effects::EffectPath path;
    path.geometry.move_to({0, 0});
    path.geometry.line_to({10, 0});
    path.geometry.line_to({10, 10});
    path.geometry.close();
    path.fill = rgb(1, 2, 3);
    std::vector<Effects::EffectPath> paths{path, path};

    auto inputs = poem_inputs(Orientation::Vertical);
    inputs.dark_theme = true;
    CompositionSurface surface;
    auto list = surface.compose(inputs, paths, 1000.0, 1000.0);
    REQUIRE(list.commands.size() > 4);
    CHECK(kind_of(list.commands[1]) == DrawCommandKind::Path);
    CHECK(kind_of(list.commands[2]) == DrawCommandKind::Path);
    auto const* overlay = std::get_if<RectCommand>(&list.commands[3]);
    REQUIRE(overlay != nullptr);
    CHECK(overlay->color[3] == kDarkOverlayOpacity);

    // The wave band is translated to the bottom of the canvas.
    auto const& moved = std::get<PathCommand>(list.commands[1]);
    CHECK(moved.path.points[0].y == doctest::Approx(1000.0 - kWaveBandHeight));

    auto runs = glyph_runs(list);
    CHECK(runs[0]->color[0] == 1.0f);
}

TEST_CASE("watermark is drawn last") {
    auto inputs = poem_inputs(Orientation::Horizontal);
    inputs.watermark = "天青";
    CompositionSurface surface;
    auto list = surface.compose(inputs, {}, 1920.0, 1080.0);
    auto const* last = std::get_if<GlyphRunCommand>(&list.commands.back());
    REQUIRE(last != nullptr);
    CHECK(last->glyphs.size() == 2);
    CHECK(last->color[3] == doctest::Approx(26.0f / 255.0f));
    CHECK(last->glyphs[1].y > last->glyphs[0].y);

    inputs.watermark = std::string{};
    auto without = surface.compose(inputs, {}, 1920.0, 1080.0);
    CHECK(glyph_runs(without).size() == 3);
}

TEST_CASE("layout is a pure function of its inputs") {
    CompositionSurface surface;
    auto inputs = poem_inputs(Orientation::Vertical);
    auto a = surface.compose(inputs, {}, 1366.0, 768.0);
    auto b = surface.compose(inputs, {}, 1366.0, 768.0);
    auto ra = glyph_runs(a);
    auto rb = glyph_runs(b);
    REQUIRE(ra.size() == rb.size());
    for (std::size_t i = 0; i < ra.size(); ++i) {
        REQUIRE(ra[i]->glyphs.size() == rb[i]->glyphs.size());
        for (std::size_t g = 0; g < ra[i]->glyphs.size(); ++g) {
            CHECK(ra[i]->glyphs[g].x == rb[i]->glyphs[g].x);
            CHECK(ra[i]->glyphs[g].y == rb[i]->glyphs[g].y);
        }
    }
}

}
