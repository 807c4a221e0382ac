#include <doctest/doctest.h>

#include "VerseWallTestHelper.hpp"

#include <versewall/settings/EntropySource.hpp>
#include <versewall/settings/SettingsJson.hpp>
#include <versewall/settings/SettingsStore.hpp>
#include <versewall/settings/ThemeResolver.hpp>

#include "core/FileIO.hpp"

using namespace VW;
using namespace VW::Settings;

TEST_SUITE("settings.store") {

TEST_CASE("missing file keeps defaults") {
    Test::TempDir dir("versewall_settings_missing");
    SettingsStore store(dir.path / "settings.json");
    auto loaded = store.load();
    REQUIRE_FALSE(loaded.has_value());
    CHECK(loaded.error().code == Error::Code::NotFound);
    CHECK(store.snapshot() == AppSettings{});
}

TEST_CASE("malformed file is reported and ignored") {
    Test::TempDir dir("versewall_settings_malformed");
    auto path = dir.path / "settings.json";
    Test::write_text(path, "{\"Theme\": ");
    SettingsStore store(path);
    auto loaded = store.load();
    REQUIRE_FALSE(loaded.has_value());
    CHECK(loaded.error().code == Error::Code::MalformedInput);
    CHECK(store.snapshot() == AppSettings{});
}

TEST_CASE("load reads the file") {
    Test::TempDir dir("versewall_settings_load");
    auto path = dir.path / "settings.json";
    Test::write_text(path, R"({"PoetryFontSize": 48, "ShowFullPoetry": true})");
    SettingsStore store(path);
    REQUIRE(store.load().has_value());
    CHECK(store.snapshot().poem_font_size == 48);
    CHECK(store.snapshot().show_full_poem);
}

TEST_CASE("update persists and notifies with the changed fields") {
    Test::TempDir dir("versewall_settings_update");
    auto path = dir.path / "settings.json";
    SettingsStore store(path);

    int calls = 0;
    std::vector<std::string> seen;
    AppSettings delivered;
    auto subscription = store.subscribe([&](AppSettings const& settings, std::vector<std::string> const& changed) {
        ++calls;
        seen = changed;
        delivered = settings;
    });
    CHECK(subscription.active());

    auto result = store.update([](AppSettings& s) {
        s.wave_color = "#FF112233";
        s.refresh_interval_minutes = 10;
    });
    REQUIRE(result.has_value());
    CHECK(result->size() == 2);
    CHECK(calls == 1);
    CHECK(seen == std::vector<std::string>{std::string(Field::WaveColor), std::string(Field::RefreshIntervalMinutes)});
    CHECK(delivered.wave_color == "#FF112233");

    auto text = readTextFile(path);
    REQUIRE(text.has_value());
    auto reread = parse_settings(*text);
    REQUIRE(reread.has_value());
    CHECK(reread->refresh_interval_minutes == 10);

    // No-op updates do not notify.
    auto none = store.update([](AppSettings& s) { s.refresh_interval_minutes = 10; });
    REQUIRE(none.has_value());
    CHECK(none->empty());
    CHECK(calls == 1);

    subscription.reset();
    CHECK_FALSE(subscription.active());
    REQUIRE(store.update([](AppSettings& s) { s.line_spacing = 30; }).has_value());
    CHECK(calls == 1);
}

TEST_CASE("subscribers run even when saving fails") {
    Test::TempDir dir("versewall_settings_readonly");
    auto blocker = dir.path / "blocker";
    Test::write_text(blocker, "file");
    SettingsStore store(blocker / "settings.json");

    int calls = 0;
    auto subscription = store.subscribe([&](AppSettings const&, std::vector<std::string> const&) { ++calls; });
    auto result = store.update([](AppSettings& s) { s.poem_font_size = 40; });
    CHECK_FALSE(result.has_value());
    CHECK(calls == 1);
    CHECK(store.snapshot().poem_font_size == 40);
}

TEST_CASE("subscription may outlive the store") {
    SettingsStore::Subscription subscription;
    {
        SettingsStore store("");
        subscription = store.subscribe([](AppSettings const&, std::vector<std::string> const&) {});
        CHECK(subscription.active());
    }
    CHECK_FALSE(subscription.active());
    subscription.reset();
}

TEST_CASE("in-memory store never touches disk") {
    SettingsStore store("");
    CHECK(store.load().has_value());
    CHECK(store.save().has_value());
    auto result = store.update([](AppSettings& s) { s.theme = ThemeMode::Dark; });
    REQUIRE(result.has_value());
    CHECK(store.snapshot().theme == ThemeMode::Dark);
}

}

TEST_SUITE("settings.seed") {

TEST_CASE("seed is drawn once and persisted") {
    SettingsStore store("");
    Test::SequenceEntropy entropy({0x80000000u, 77u});
    auto first = ensure_seed(store, entropy);
    REQUIRE(first.has_value());
    // High bit masked off, zero replaced by one.
    CHECK(*first == 1);
    CHECK(store.snapshot().background_seed == 1);

    auto second = ensure_seed(store, entropy);
    REQUIRE(second.has_value());
    CHECK(*second == 1);
}

TEST_CASE("existing seed is kept") {
    AppSettings initial;
    initial.background_seed = 4242;
    SettingsStore store("", initial);
    Test::SequenceEntropy entropy({7u});
    auto kept = ensure_seed(store, entropy);
    REQUIRE(kept.has_value());
    CHECK(*kept == 4242);
    CHECK(draw_seed(entropy) == 7);
}

}

TEST_SUITE("settings.theme") {

TEST_CASE("explicit modes ignore the probe") {
    AppSettings settings;
    settings.background_color = std::string(kDefaultBackgroundColor);
    Test::FixedThemeProbe dark_probe(true);

    settings.theme = ThemeMode::Light;
    auto light = resolve_theme(settings, dark_probe);
    CHECK_FALSE(light.dark);
    CHECK(light.background == kLightBackground);

    settings.theme = ThemeMode::Dark;
    auto dark = resolve_theme(settings, dark_probe);
    CHECK(dark.dark);
    CHECK(dark.background == kDarkBackground);
}

TEST_CASE("system mode follows the probe") {
    AppSettings settings;
    Test::FixedThemeProbe dark_probe(true);
    Test::FixedThemeProbe unknown(std::nullopt);
    CHECK(resolve_theme(settings, dark_probe).dark);
    CHECK_FALSE(resolve_theme(settings, unknown).dark);
}

TEST_CASE("custom colors override the theme") {
    AppSettings settings;
    settings.theme = ThemeMode::Dark;
    settings.background_color = "#FF102030";
    settings.wave_color = "#FFAABBCC";
    Test::FixedThemeProbe probe(std::nullopt);
    auto theme = resolve_theme(settings, probe);
    CHECK(theme.background == Scene::rgb(0x10, 0x20, 0x30));
    CHECK(theme.effect_color == Scene::rgb(0xAA, 0xBB, 0xCC));

    settings.wave_color = "not-a-color";
    CHECK(resolve_theme(settings, probe).effect_color == kFallbackEffectColor);
}

}
