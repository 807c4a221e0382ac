#include <versewall/settings/ThemeResolver.hpp>

#include "log/TaggedLogger.hpp"

#include <cstdlib>
#include <string_view>

namespace VW::Settings {

auto EnvThemeProbe::system_prefers_dark() -> std::optional<bool> {
    auto const* value = std::getenv("VERSEWALL_SYSTEM_THEME");
    if (value == nullptr) {
        return std::nullopt;
    }
    std::string_view theme{value};
    if (theme == "dark" || theme == "Dark") {
        return true;
    }
    if (theme == "light" || theme == "Light") {
        return false;
    }
    return std::nullopt;
}

auto resolve_theme(AppSettings const& settings, ThemeProbe& probe) -> ResolvedTheme {
    ResolvedTheme theme;
    switch (settings.theme) {
    case ThemeMode::Light:
        theme.dark = false;
        break;
    case ThemeMode::Dark:
        theme.dark = true;
        break;
    case ThemeMode::System:
        theme.dark = probe.system_prefers_dark().value_or(false);
        break;
    }
    theme.background = theme.dark ? kDarkBackground : kLightBackground;

    auto custom = Scene::parse_color(settings.background_color);
    auto default_background = Scene::parse_color(kDefaultBackgroundColor);
    if (custom && custom != default_background) {
        theme.background = *custom;
    }

    if (auto effect = Scene::parse_color(settings.wave_color)) {
        theme.effect_color = *effect;
    } else {
        vw_log("Effect color '" + settings.wave_color + "' is not a color, using the fallback", "Settings", "Warning");
        theme.effect_color = kFallbackEffectColor;
    }
    return theme;
}

} // namespace VW::Settings
