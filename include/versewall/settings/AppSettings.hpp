#pragma once

#include <versewall/effects/EffectGenerator.hpp>
#include <versewall/scene/SceneInputs.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace VW::Settings {

enum class ThemeMode {
    Light,
    Dark,
    System,
};

auto theme_mode_name(ThemeMode mode) -> std::string_view;
auto parse_theme_mode(std::string_view name) -> std::optional<ThemeMode>;

// Field names as they appear in settings.json and in change notifications.
namespace Field {
inline constexpr std::string_view Theme                      = "Theme";
inline constexpr std::string_view BackgroundColor            = "BackgroundColor";
inline constexpr std::string_view BackgroundEffect           = "BackgroundEffect";
inline constexpr std::string_view WaveColor                  = "WaveColor";
inline constexpr std::string_view BackgroundSeed             = "BackgroundSeed";
inline constexpr std::string_view PoetryFontFamily           = "PoetryFontFamily";
inline constexpr std::string_view PoetryFontFile             = "PoetryFontFile";
inline constexpr std::string_view PoetryFontSize             = "PoetryFontSize";
inline constexpr std::string_view AuthorFontFamily           = "AuthorFontFamily";
inline constexpr std::string_view AuthorFontFile             = "AuthorFontFile";
inline constexpr std::string_view AuthorFontSize             = "AuthorFontSize";
inline constexpr std::string_view PoetryOrientation          = "PoetryOrientation";
inline constexpr std::string_view VerticalPoetryAlignment    = "VerticalPoetryAlignment";
inline constexpr std::string_view HorizontalPoetryAlignment  = "HorizontalPoetryAlignment";
inline constexpr std::string_view PoetryLineSpacing          = "PoetryLineSpacing";
inline constexpr std::string_view PoetryCharacterSpacing     = "PoetryCharacterSpacing";
inline constexpr std::string_view PoetryVerticalCharSpacing  = "PoetryVerticalCharacterSpacing";
inline constexpr std::string_view VerticalPoetryOffset       = "VerticalPoetryOffset";
inline constexpr std::string_view HorizontalPoetryOffset     = "HorizontalPoetryOffset";
inline constexpr std::string_view RefreshIntervalMinutes     = "RefreshIntervalMinutes";
inline constexpr std::string_view ShowFullPoetry             = "ShowFullPoetry";
inline constexpr std::string_view ShowTraditionalColorName   = "ShowTraditionalColorNameOnRight";
inline constexpr std::string_view RandomizeTraditionalColor  = "RandomTraditionalWaveColorOnRefresh";
} // namespace Field

inline constexpr std::string_view kDefaultBackgroundColor = "#FF1E3A8A";
inline constexpr std::string_view kDefaultWaveColor       = "#FF26A69A";
inline constexpr std::string_view kDefaultFontFamily      = "Microsoft YaHei";

// Plain value snapshot of every user setting.
struct AppSettings {
    ThemeMode           theme             = ThemeMode::System;
    std::string         background_color  = std::string(kDefaultBackgroundColor);
    Effects::EffectKind background_effect = Effects::EffectKind::Wave;
    std::string         wave_color        = std::string(kDefaultWaveColor);
    // 0 means "not chosen yet"; see ensure_seed().
    std::int32_t background_seed = 0;

    // A family name resolved against the installed fonts. A non-empty font
    // file wins over the family when it loads.
    std::string poem_font_family = std::string(kDefaultFontFamily);
    std::string poem_font_file;
    int         poem_font_size = 36;
    std::string author_font_family = std::string(kDefaultFontFamily);
    std::string author_font_file;
    int         author_font_size = 18;

    Scene::Orientation         orientation          = Scene::Orientation::Vertical;
    Scene::VerticalAlignment   vertical_alignment   = Scene::VerticalAlignment::Center;
    Scene::HorizontalAlignment horizontal_alignment = Scene::HorizontalAlignment::Center;

    int line_spacing               = 20;
    int character_spacing          = 4;
    int vertical_character_spacing = 2;
    int vertical_footer_offset     = 0;
    int horizontal_footer_offset   = 0;

    int refresh_interval_minutes = 60;

    bool show_full_poem              = false;
    bool show_traditional_color_name = false;
    bool randomize_traditional_color = false;

    friend auto operator==(AppSettings const&, AppSettings const&) -> bool = default;
};

// Names of the fields that differ, in declaration order.
auto changed_fields(AppSettings const& before, AppSettings const& after) -> std::vector<std::string>;

// Whether a change to the field alters the rendered wallpaper.
auto affects_image(std::string_view field) -> bool;

} // namespace VW::Settings
