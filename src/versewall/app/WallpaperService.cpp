#include <versewall/app/WallpaperService.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace VW::App {

WallpaperService::WallpaperService(WallpaperServiceDeps deps, std::chrono::milliseconds minute_length)
    : deps_(deps)
    , fonts_(deps.font_resolver ? deps.font_resolver : FontLibrary::Resolver{Text::resolve_font_file})
    , scheduler_([this] { refresh(); }, minute_length) {}

WallpaperService::~WallpaperService() {
    stop();
}

auto WallpaperService::start() -> void {
    subscription_ = deps_.store.subscribe([this](Settings::AppSettings const& settings, std::vector<std::string> const& changed) {
        on_settings_changed(settings, changed);
    });
    scheduler_.set_interval(deps_.store.snapshot().refresh_interval_minutes);
}

auto WallpaperService::stop() -> void {
    subscription_.reset();
    scheduler_.set_interval(0);
}

auto WallpaperService::acquire_locked() -> Poem::AcquiredPoem const& {
    if (!poem_) {
        poem_ = Poem::acquire_poem(deps_.provider, deps_.cache);
    }
    return *poem_;
}

auto WallpaperService::current_poem() -> Poem::AcquiredPoem {
    std::lock_guard<std::mutex> lock(poem_mutex_);
    return acquire_locked();
}

auto WallpaperService::make_request(bool silent, std::string reason) -> Expected<Apply::ApplyRequest> {
    auto settings = deps_.store.snapshot();
    auto theme = Settings::resolve_theme(settings, deps_.theme_probe);

    Expected<Scene::SceneInputs> inputs;
    {
        std::lock_guard<std::mutex> lock(poem_mutex_);
        auto const& poem = acquire_locked();
        inputs = compose_scene_inputs(settings, CompositionContext{poem.poem, theme, deps_.palette, fonts_});
    }
    if (!inputs) {
        return std::unexpected(inputs.error());
    }
    Apply::ApplyRequest request;
    request.inputs = std::move(*inputs);
    request.silent = silent;
    request.reason = std::move(reason);
    return request;
}

auto WallpaperService::apply_now(bool silent, std::string reason) -> Apply::ApplyReport {
    auto request = make_request(silent, reason);
    if (!request) {
        return deps_.coordinator.reject(std::move(reason), silent, request.error());
    }
    return deps_.coordinator.apply(std::move(*request));
}

auto WallpaperService::queue_apply(bool silent, std::string reason) -> void {
    auto request = make_request(silent, reason);
    if (!request) {
        deps_.coordinator.reject(std::move(reason), silent, request.error());
        return;
    }
    deps_.coordinator.queue_apply(std::move(*request));
}

auto WallpaperService::on_settings_changed(Settings::AppSettings const& settings, std::vector<std::string> const& changed) -> void {
    if (std::find(changed.begin(), changed.end(), Settings::Field::RefreshIntervalMinutes) != changed.end()) {
        vw_log("Refresh interval now " + std::to_string(settings.refresh_interval_minutes) + " min", "Settings");
        scheduler_.set_interval(settings.refresh_interval_minutes);
    }
    auto image_changed = std::ranges::any_of(changed, [](std::string const& field) { return Settings::affects_image(field); });
    if (image_changed) {
        queue_apply(true, "settings changed: " + changed.front());
    }
}

auto WallpaperService::randomize_color() -> bool {
    auto settings = deps_.store.snapshot();
    auto theme = Settings::resolve_theme(settings, deps_.theme_probe);
    auto const* pick = deps_.palette.pick_random(theme.dark, deps_.entropy);
    if (pick == nullptr) {
        return false;
    }
    vw_log("Refresh picked " + pick->name + " " + pick->hex, "Settings");
    auto changed = deps_.store.update([&](Settings::AppSettings& next) { next.wave_color = pick->hex; });
    if (!changed) {
        vw_log("Could not persist the refreshed color: " + describeError(changed.error()), "Settings", "Warning");
    }
    return deps_.store.snapshot().wave_color != settings.wave_color;
}

auto WallpaperService::refresh() -> void {
    {
        std::lock_guard<std::mutex> lock(poem_mutex_);
        poem_ = Poem::acquire_poem(deps_.provider, deps_.cache);
    }
    if (deps_.store.snapshot().randomize_traditional_color && randomize_color()) {
        return;
    }
    queue_apply(true, "refresh");
}

} // namespace VW::App
