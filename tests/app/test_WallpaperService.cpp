#include <doctest/doctest.h>

#include "VerseWallTestHelper.hpp"
#include "task/TaskPool.hpp"

#include <versewall/app/WallpaperService.hpp>
#include <versewall/text/FontFace.hpp>

#include <atomic>

using namespace VW;
using namespace std::chrono_literals;

namespace {

class CountingProvider final : public Poem::PoemProvider {
public:
    auto fetch() -> Expected<Poem::PoemContent> override {
        auto n = ++calls;
        Poem::PoemContent poem;
        poem.content = "第" + std::to_string(n) + "首";
        poem.origin.title = "题" + std::to_string(n);
        poem.origin.author = "佚名";
        return poem;
    }

    std::atomic<int> calls{0};
};

// Keeps the suite independent of the fonts installed on the machine.
auto no_installed_fonts(Text::FontQuery const& query) -> Expected<Text::ResolvedFontFile> {
    return std::unexpected(Error{Error::Code::NotFound, "no installed font matches '" + query.family + "'"});
}

auto initial_settings() -> Settings::AppSettings {
    Settings::AppSettings settings;
    settings.background_seed = 17;
    settings.refresh_interval_minutes = 0;
    return settings;
}

struct ServiceHarness {
    explicit ServiceHarness(std::chrono::milliseconds minute_length = 1min)
        : dir("versewall_service")
        , store("", initial_settings())
        , port({Test::FakeMonitor{"DISPLAY1", Effects::DeviceRect{0, 0, 160, 100}, Apply::PixelSize{160, 100}}})
        , pool(2)
        , pipeline(surface, pool)
        , coordinator(port, pipeline, &notifier, Apply::ApplyCoordinatorOptions{.output_dir = dir.path, .debounce = 100ms})
        , cache(dir.path / "poem.json")
        , palette(load_palette())
        , probe(false)
        , entropy({1u})
        , service(App::WallpaperServiceDeps{store, coordinator, &provider, cache, palette, probe, entropy, no_installed_fonts},
                  minute_length) {
        service.fonts().register_face(std::string(Settings::kDefaultFontFamily), Text::FontFace::placeholder());
    }

    static auto load_palette() -> Theme::TraditionalColorPalette {
        auto loaded = Theme::TraditionalColorPalette::from_json(R"([
            {"hex": "#1661ab", "name": "靛青", "lightSuitable": true},
            {"hex": "#c04851", "name": "玉红", "lightSuitable": true}
        ])");
        return loaded ? std::move(*loaded) : Theme::TraditionalColorPalette::builtin();
    }

    Test::TempDir              dir;
    Settings::SettingsStore    store;
    Test::FakeWallpaperPort    port;
    Test::FailingRenderSurface surface;
    Test::RecordingNotifier    notifier;
    TaskPool                   pool;
    Render::RenderPipeline     pipeline;
    Apply::ApplyCoordinator    coordinator;
    Poem::PoemCache            cache;
    CountingProvider           provider;
    Theme::TraditionalColorPalette palette;
    Test::FixedThemeProbe      probe;
    Test::SequenceEntropy      entropy;
    App::WallpaperService      service;
};

} // namespace

TEST_SUITE("app.service") {

TEST_CASE("apply_now renders the stored settings with the fetched poem") {
    ServiceHarness h;
    auto report = h.service.apply_now(false, "startup");
    CHECK(report.succeeded());
    CHECK(report.reason == "startup");
    CHECK(report.seed == 17);
    CHECK(h.provider.calls.load() == 1);
    CHECK(h.service.current_poem().source == Poem::PoemSource::Provider);
    CHECK(h.port.installs().size() == 1);
    REQUIRE_FALSE(h.surface.seeds().empty());
    CHECK(h.surface.seeds().front() == 17);
    // The fetched poem is cached for the next start.
    CHECK(h.cache.load().has_value());
}

TEST_CASE("requests carry the current poem until a refresh") {
    ServiceHarness h;
    auto first = h.service.make_request(true, "a");
    auto second = h.service.make_request(true, "b");
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(first->inputs.poem.main_text == "第1首");
    CHECK(second->inputs.poem.main_text == "第1首");
    CHECK(second->reason == "b");
    CHECK(h.provider.calls.load() == 1);
}

TEST_CASE("an unresolvable font family fails the apply without rendering") {
    ServiceHarness h;
    REQUIRE(h.store.update([](Settings::AppSettings& s) { s.poem_font_family = "Missing Kai"; }).has_value());

    auto request = h.service.make_request(false, "direct");
    REQUIRE_FALSE(request.has_value());
    CHECK(request.error().code == Error::Code::NotFound);

    auto report = h.service.apply_now(false, "startup");
    CHECK_FALSE(report.succeeded());
    REQUIRE(report.error.has_value());
    CHECK(report.error->code == Error::Code::NotFound);
    CHECK(report.reason == "startup");
    CHECK(h.port.installs().empty());
    CHECK(h.surface.builds.load() == 0);
    CHECK(h.coordinator.cycles_completed() == 0);
    REQUIRE(h.coordinator.last_report().has_value());
    CHECK(h.coordinator.last_report()->error.has_value());
    CHECK(h.notifier.kinds() == std::vector<Apply::NoticeKind>{Apply::NoticeKind::Failure});
}

TEST_CASE("image settings changes queue one silent apply") {
    ServiceHarness h;
    h.service.start();
    REQUIRE(h.store.update([](Settings::AppSettings& s) { s.poem_font_size = 40; }).has_value());
    REQUIRE(h.store.update([](Settings::AppSettings& s) { s.line_spacing = 8; }).has_value());
    h.coordinator.wait_idle();

    CHECK(h.coordinator.cycles_completed() == 1);
    auto report = h.coordinator.last_report();
    REQUIRE(report.has_value());
    CHECK(report->silent);
    CHECK(report->reason == "settings changed: PoetryLineSpacing");
    CHECK(h.notifier.kinds().empty());
}

TEST_CASE("interval changes reschedule without rendering") {
    ServiceHarness h;
    h.service.start();
    CHECK_FALSE(h.service.scheduler().enabled());

    REQUIRE(h.store.update([](Settings::AppSettings& s) { s.refresh_interval_minutes = 30; }).has_value());
    h.coordinator.wait_idle();
    CHECK(h.service.scheduler().interval_minutes() == 30);
    CHECK(h.service.scheduler().enabled());
    CHECK(h.coordinator.cycles_completed() == 0);

    h.service.stop();
    CHECK_FALSE(h.service.scheduler().enabled());
}

TEST_CASE("stop unsubscribes from the store") {
    ServiceHarness h;
    h.service.start();
    h.service.stop();
    REQUIRE(h.store.update([](Settings::AppSettings& s) { s.poem_font_size = 50; }).has_value());
    h.coordinator.wait_idle();
    CHECK(h.coordinator.cycles_completed() == 0);
}

TEST_CASE("refresh fetches a new poem and applies it") {
    ServiceHarness h;
    h.service.start();
    (void)h.service.make_request(true, "prime");
    h.service.refresh();
    h.coordinator.wait_idle();

    CHECK(h.provider.calls.load() == 2);
    CHECK(h.service.current_poem().poem.content == "第2首");
    auto report = h.coordinator.last_report();
    REQUIRE(report.has_value());
    CHECK(report->reason == "refresh");
    CHECK(h.coordinator.cycles_completed() == 1);
}

TEST_CASE("refresh with random colors persists the pick") {
    ServiceHarness h;
    REQUIRE(h.store.update([](Settings::AppSettings& s) { s.randomize_traditional_color = true; }).has_value());
    h.service.start();
    h.service.refresh();
    h.coordinator.wait_idle();

    // Entropy 1 selects the second light-suitable entry.
    CHECK(h.store.snapshot().wave_color == "#c04851");
    CHECK(h.coordinator.cycles_completed() == 1);
    auto report = h.coordinator.last_report();
    REQUIRE(report.has_value());
    CHECK(report->reason == "settings changed: WaveColor");
}

TEST_CASE("the refresh timer drives refreshes") {
    ServiceHarness h(10ms);
    h.service.start();
    REQUIRE(h.store.update([](Settings::AppSettings& s) { s.refresh_interval_minutes = 1; }).has_value());
    CHECK(Test::wait_until([&] { return h.provider.calls.load() >= 2; }));
    h.service.stop();
    h.coordinator.wait_idle();
    CHECK(h.service.scheduler().fire_count() >= 1);
    CHECK(h.coordinator.cycles_completed() >= 1);
}

}
