#pragma once

#include <versewall/scene/Color.hpp>
#include <versewall/settings/AppSettings.hpp>

#include <optional>

namespace VW::Settings {

inline constexpr Scene::Argb kLightBackground     = Scene::rgb(245, 245, 245);
inline constexpr Scene::Argb kDarkBackground      = Scene::rgb(30, 30, 30);
inline constexpr Scene::Argb kFallbackEffectColor = Scene::rgb(57, 73, 171);

// Answers whether the desktop prefers a dark theme; nullopt when unknown.
class ThemeProbe {
public:
    virtual ~ThemeProbe() = default;
    virtual auto system_prefers_dark() -> std::optional<bool> = 0;
};

// Reads $VERSEWALL_SYSTEM_THEME ("dark" or "light").
class EnvThemeProbe final : public ThemeProbe {
public:
    auto system_prefers_dark() -> std::optional<bool> override;
};

struct ResolvedTheme {
    bool        dark = false;
    Scene::Argb background   = kLightBackground;
    Scene::Argb effect_color = Scene::rgb(0x26, 0xA6, 0x9A);
};

// Theme background unless a custom background color replaces it; an
// unparsable effect color falls back to kFallbackEffectColor.
auto resolve_theme(AppSettings const& settings, ThemeProbe& probe) -> ResolvedTheme;

} // namespace VW::Settings
