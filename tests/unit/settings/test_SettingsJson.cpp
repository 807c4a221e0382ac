#include <doctest/doctest.h>

#include <versewall/settings/SettingsJson.hpp>

using namespace VW;
using namespace VW::Settings;

TEST_SUITE("settings.json") {

TEST_CASE("serialized settings parse back unchanged") {
    AppSettings settings;
    settings.theme = ThemeMode::Dark;
    settings.background_effect = Effects::EffectKind::Blobs;
    settings.background_seed = -12345;
    settings.poem_font_file = "/usr/share/fonts/kai.ttf";
    settings.orientation = Scene::Orientation::Horizontal;
    settings.horizontal_alignment = Scene::HorizontalAlignment::Right;
    settings.horizontal_footer_offset = -30;
    settings.refresh_interval_minutes = 0;
    settings.show_traditional_color_name = true;

    auto parsed = parse_settings(serialize_settings(settings));
    REQUIRE(parsed.has_value());
    CHECK(*parsed == settings);
}

TEST_CASE("font families are stored beside the font files") {
    auto defaults = settings_to_json(AppSettings{});
    CHECK(defaults["PoetryFontFamily"] == "Microsoft YaHei");
    CHECK(defaults["AuthorFontFamily"] == "Microsoft YaHei");

    auto parsed = parse_settings(R"({"PoetryFontFamily": "LXGW WenKai", "AuthorFontFamily": 7})");
    REQUIRE(parsed.has_value());
    CHECK(parsed->poem_font_family == "LXGW WenKai");
    CHECK(parsed->author_font_family == "Microsoft YaHei");

    AppSettings before;
    AppSettings after = before;
    after.author_font_family = "KaiTi";
    CHECK(changed_fields(before, after) == std::vector<std::string>{"AuthorFontFamily"});
    CHECK(affects_image(Field::AuthorFontFamily));
}

TEST_CASE("enums are written by name") {
    auto document = settings_to_json(AppSettings{});
    CHECK(document["Theme"] == "System");
    CHECK(document["BackgroundEffect"] == "wave");
    CHECK(document["PoetryOrientation"] == "Vertical");
    CHECK(document["WaveColor"] == "#FF26A69A");
}

TEST_CASE("legacy ordinals are accepted") {
    auto parsed = parse_settings(R"({
        "Theme": 1,
        "BackgroundEffect": 2,
        "PoetryOrientation": 0,
        "VerticalPoetryAlignment": 2,
        "HorizontalPoetryAlignment": 0
    })");
    REQUIRE(parsed.has_value());
    CHECK(parsed->theme == ThemeMode::Dark);
    CHECK(parsed->background_effect == Effects::EffectKind::Blobs);
    CHECK(parsed->orientation == Scene::Orientation::Horizontal);
    CHECK(parsed->vertical_alignment == Scene::VerticalAlignment::Bottom);
    CHECK(parsed->horizontal_alignment == Scene::HorizontalAlignment::Left);
}

TEST_CASE("bad values keep their defaults") {
    auto parsed = parse_settings(R"({
        "Theme": 9,
        "BackgroundEffect": "sparkles",
        "WaveColor": "teal",
        "PoetryFontSize": 2,
        "AuthorFontSize": "large",
        "PoetryLineSpacing": -4,
        "ShowFullPoetry": "yes",
        "RefreshIntervalMinutes": 15,
        "Unknown": [1, 2, 3]
    })");
    REQUIRE(parsed.has_value());
    AppSettings defaults;
    CHECK(parsed->theme == defaults.theme);
    CHECK(parsed->background_effect == defaults.background_effect);
    CHECK(parsed->wave_color == defaults.wave_color);
    CHECK(parsed->poem_font_size == defaults.poem_font_size);
    CHECK(parsed->author_font_size == defaults.author_font_size);
    CHECK(parsed->line_spacing == defaults.line_spacing);
    CHECK(parsed->show_full_poem == defaults.show_full_poem);
    CHECK(parsed->refresh_interval_minutes == 15);
}

TEST_CASE("malformed documents are rejected") {
    auto broken = parse_settings("{ not json");
    REQUIRE_FALSE(broken.has_value());
    CHECK(broken.error().code == Error::Code::MalformedInput);

    auto array = parse_settings("[1, 2]");
    REQUIRE_FALSE(array.has_value());
    CHECK(array.error().code == Error::Code::MalformedInput);

    CHECK(settings_from_json(nlohmann::json::array()) == AppSettings{});
}

}

TEST_SUITE("settings.fields") {

TEST_CASE("changed fields are reported in declaration order") {
    AppSettings before;
    AppSettings after = before;
    CHECK(changed_fields(before, after).empty());

    after.refresh_interval_minutes = 5;
    after.theme = ThemeMode::Light;
    after.wave_color = "#FF123456";
    auto changed = changed_fields(before, after);
    REQUIRE(changed.size() == 3);
    CHECK(changed[0] == Field::Theme);
    CHECK(changed[1] == Field::WaveColor);
    CHECK(changed[2] == Field::RefreshIntervalMinutes);
}

TEST_CASE("only scheduling fields leave the image alone") {
    CHECK_FALSE(affects_image(Field::RefreshIntervalMinutes));
    CHECK_FALSE(affects_image(Field::RandomizeTraditionalColor));
    CHECK(affects_image(Field::WaveColor));
    CHECK(affects_image(Field::ShowFullPoetry));
    CHECK(affects_image(Field::BackgroundSeed));
}

TEST_CASE("theme mode names") {
    CHECK(parse_theme_mode("dark") == ThemeMode::Dark);
    CHECK(parse_theme_mode(theme_mode_name(ThemeMode::System)) == ThemeMode::System);
    CHECK_FALSE(parse_theme_mode("sepia").has_value());
}

}
