#pragma once

#include <versewall/app/SceneComposer.hpp>
#include <versewall/apply/ApplyCoordinator.hpp>
#include <versewall/apply/RefreshScheduler.hpp>
#include <versewall/poem/PoemProvider.hpp>
#include <versewall/settings/EntropySource.hpp>
#include <versewall/settings/SettingsStore.hpp>
#include <versewall/settings/ThemeResolver.hpp>
#include <versewall/theme/TraditionalColorPalette.hpp>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace VW::App {

struct WallpaperServiceDeps {
    Settings::SettingsStore&              store;
    Apply::ApplyCoordinator&              coordinator;
    Poem::PoemProvider*                   provider = nullptr;
    Poem::PoemCache const&                cache;
    Theme::TraditionalColorPalette const& palette;
    Settings::ThemeProbe&                 theme_probe;
    Settings::EntropySource&              entropy;
    // Empty uses fontconfig.
    FontLibrary::Resolver font_resolver = {};
};

/**
 * WallpaperService - connects the apply triggers to the coordinator.
 *
 * - A settings change that alters the image queues a silent apply.
 * - A change of the refresh interval reschedules the refresh timer.
 * - A refresh tick fetches a new poem and, when enabled, a random palette
 *   color; the color is persisted, so the apply it causes arrives through
 *   the settings subscription. Otherwise the tick queues the apply itself.
 */
class WallpaperService {
public:
    explicit WallpaperService(WallpaperServiceDeps deps,
                              std::chrono::milliseconds minute_length = std::chrono::minutes{1});
    ~WallpaperService();

    WallpaperService(WallpaperService const&)                    = delete;
    auto operator=(WallpaperService const&) -> WallpaperService& = delete;

    // Subscribes to the store and arms the refresh timer.
    auto start() -> void;
    auto stop() -> void;

    // Runs one cycle now on the calling thread. A request that cannot be
    // composed is reported through the coordinator without rendering.
    auto apply_now(bool silent, std::string reason) -> Apply::ApplyReport;
    auto queue_apply(bool silent, std::string reason) -> void;
    auto refresh() -> void;

    [[nodiscard]] auto make_request(bool silent, std::string reason) -> Expected<Apply::ApplyRequest>;
    [[nodiscard]] auto current_poem() -> Poem::AcquiredPoem;
    [[nodiscard]] auto fonts() -> FontLibrary& { return fonts_; }
    [[nodiscard]] auto scheduler() const -> Apply::RefreshScheduler const& { return scheduler_; }

private:
    auto on_settings_changed(Settings::AppSettings const& settings, std::vector<std::string> const& changed) -> void;
    auto acquire_locked() -> Poem::AcquiredPoem const&;
    // Persists a random palette color. Returns true when the color changed.
    auto randomize_color() -> bool;

    WallpaperServiceDeps                  deps_;
    FontLibrary                           fonts_;
    std::mutex                            poem_mutex_;
    std::optional<Poem::AcquiredPoem>     poem_;
    Settings::SettingsStore::Subscription subscription_;
    // Declared last so its thread stops before the rest is torn down.
    Apply::RefreshScheduler scheduler_;
};

} // namespace VW::App
