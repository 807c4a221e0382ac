#include <doctest/doctest.h>

#include "VerseWallTestHelper.hpp"

#include <versewall/app/SceneComposer.hpp>
#include <versewall/text/FontFace.hpp>

#include <string>
#include <vector>

using namespace VW;
using namespace VW::App;

namespace {

auto palette() -> Theme::TraditionalColorPalette {
    auto loaded = Theme::TraditionalColorPalette::from_json(R"([{"hex": "#26a69a", "name": "青碧"}])");
    REQUIRE(loaded.has_value());
    return *loaded;
}

auto poem() -> Poem::PoemContent {
    Poem::PoemContent content;
    content.content = "举头望明月";
    content.origin.title = "静夜思";
    content.origin.author = "李白";
    content.origin.content = {"床前明月光", "举头望明月"};
    return content;
}

auto unresolved(Text::FontQuery const& query) -> Expected<Text::ResolvedFontFile> {
    return std::unexpected(Error{Error::Code::NotFound, "no installed font matches '" + query.family + "'"});
}

// The default family as a placeholder face; nothing else resolves.
struct TestFonts : FontLibrary {
    TestFonts()
        : FontLibrary(unresolved) {
        register_face(std::string(Settings::kDefaultFontFamily), Text::FontFace::placeholder());
    }
};

} // namespace

TEST_SUITE("app.composer") {

TEST_CASE("settings map onto scene inputs") {
    Settings::AppSettings settings;
    settings.orientation = Scene::Orientation::Horizontal;
    settings.poem_font_size = 48;
    settings.line_spacing = 12;
    settings.background_effect = Effects::EffectKind::Bubbles;
    settings.background_seed = 99;
    settings.show_full_poem = true;

    Settings::ResolvedTheme theme{true, Scene::rgb(1, 2, 3), Scene::rgb(4, 5, 6)};
    auto colors = palette();
    TestFonts fonts;
    auto content = poem();
    auto composed = compose_scene_inputs(settings, CompositionContext{content, theme, colors, fonts});
    REQUIRE(composed.has_value());
    auto const& inputs = *composed;

    CHECK(inputs.poem.main_text == "床前明月光\n举头望明月");
    CHECK(inputs.poem.author == "李白");
    CHECK(inputs.style.orientation == Scene::Orientation::Horizontal);
    CHECK(inputs.style.poem_font_size == 48.0f);
    CHECK(inputs.style.line_spacing == 12.0f);
    CHECK(inputs.effect == Effects::EffectKind::Bubbles);
    CHECK(inputs.seed == 99);
    CHECK(inputs.dark_theme);
    CHECK(inputs.background == Scene::rgb(1, 2, 3));
    CHECK(inputs.effect_color == Scene::rgb(4, 5, 6));
    CHECK_FALSE(inputs.watermark.has_value());
}

TEST_CASE("watermark names the effect color when enabled") {
    Settings::AppSettings settings;
    settings.show_traditional_color_name = true;
    Settings::ResolvedTheme theme;
    auto colors = palette();
    TestFonts fonts;
    auto content = poem();

    auto inputs = compose_scene_inputs(settings, CompositionContext{content, theme, colors, fonts});
    REQUIRE(inputs.has_value());
    CHECK(inputs->watermark == "青碧");

    settings.wave_color = "#FF000001";
    auto unnamed = compose_scene_inputs(settings, CompositionContext{content, theme, colors, fonts});
    REQUIRE(unnamed.has_value());
    CHECK_FALSE(unnamed->watermark.has_value());
}

TEST_CASE("an unresolvable family is an error, not an empty face") {
    Settings::AppSettings settings;
    settings.author_font_family = "Missing Kai";
    Settings::ResolvedTheme theme;
    auto colors = palette();
    TestFonts fonts;
    auto content = poem();

    auto inputs = compose_scene_inputs(settings, CompositionContext{content, theme, colors, fonts});
    REQUIRE_FALSE(inputs.has_value());
    CHECK(inputs.error().code == Error::Code::NotFound);

    auto face = fonts.face(FontSpec{"", "Missing Kai"}, "李白");
    REQUIRE_FALSE(face.has_value());
    CHECK(face.error().code == Error::Code::NotFound);
}

TEST_CASE("the resolver sees the family, the fallbacks and the sample text") {
    std::vector<Text::FontQuery> queries;
    FontLibrary fonts{[&](Text::FontQuery const& query) -> Expected<Text::ResolvedFontFile> {
        queries.push_back(query);
        return Text::ResolvedFontFile{"/nonexistent/versewall/kai.ttc", query.family, 2};
    }};

    auto face = fonts.face(FontSpec{"", "LXGW WenKai"}, "床前明月光");
    // The resolved file does not exist, so loading fails.
    REQUIRE_FALSE(face.has_value());
    CHECK(face.error().code == Error::Code::NotFound);
    REQUIRE(queries.size() == 1);
    CHECK(queries[0].family == "LXGW WenKai");
    CHECK(queries[0].sample_text == "床前明月光");
    CHECK(queries[0].fallback_families == Text::default_fallback_families());
}

TEST_CASE("a font file wins over the family and faces are cached") {
    auto font = Test::system_font();
    if (!font) {
        MESSAGE("no installed outline font; file loading not checked");
        return;
    }
    int resolves = 0;
    FontLibrary fonts{[&](Text::FontQuery const& query) {
        ++resolves;
        return unresolved(query);
    }};
    auto spec = FontSpec{font->source(), "Missing Kai"};
    auto first = fonts.face(spec, "Moon");
    REQUIRE(first.has_value());
    CHECK((*first)->has_outlines());
    CHECK(fonts.face(spec, "Moon").value() == *first);
    CHECK(resolves == 0);

    // A missing file falls back to the family.
    auto missing = fonts.face(FontSpec{"/nonexistent/versewall/kai.ttf", "Missing Kai"}, "Moon");
    CHECK_FALSE(missing.has_value());
    CHECK(resolves == 1);
}

TEST_CASE("the default family resolves to an installed face") {
    if (!Test::system_font()) {
        MESSAGE("no installed outline font; resolution not checked");
        return;
    }
    Settings::AppSettings settings;
    Settings::ResolvedTheme theme;
    auto colors = palette();
    FontLibrary fonts;
    auto content = poem();

    auto inputs = compose_scene_inputs(settings, CompositionContext{content, theme, colors, fonts});
    REQUIRE(inputs.has_value());
    REQUIRE(inputs->style.poem_font != nullptr);
    CHECK(inputs->style.poem_font->has_outlines());
    CHECK(inputs->style.author_font->has_outlines());
}

}
