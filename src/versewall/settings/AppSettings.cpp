#include <versewall/settings/AppSettings.hpp>

namespace VW::Settings {

auto theme_mode_name(ThemeMode mode) -> std::string_view {
    switch (mode) {
    case ThemeMode::Light:
        return "Light";
    case ThemeMode::Dark:
        return "Dark";
    case ThemeMode::System:
        return "System";
    }
    return "System";
}

auto parse_theme_mode(std::string_view name) -> std::optional<ThemeMode> {
    if (name == "Light" || name == "light") {
        return ThemeMode::Light;
    }
    if (name == "Dark" || name == "dark") {
        return ThemeMode::Dark;
    }
    if (name == "System" || name == "system") {
        return ThemeMode::System;
    }
    return std::nullopt;
}

auto changed_fields(AppSettings const& before, AppSettings const& after) -> std::vector<std::string> {
    std::vector<std::string> changed;
    auto check = [&](bool differs, std::string_view name) {
        if (differs) {
            changed.emplace_back(name);
        }
    };
    check(before.theme != after.theme, Field::Theme);
    check(before.background_color != after.background_color, Field::BackgroundColor);
    check(before.background_effect != after.background_effect, Field::BackgroundEffect);
    check(before.wave_color != after.wave_color, Field::WaveColor);
    check(before.background_seed != after.background_seed, Field::BackgroundSeed);
    check(before.poem_font_family != after.poem_font_family, Field::PoetryFontFamily);
    check(before.poem_font_file != after.poem_font_file, Field::PoetryFontFile);
    check(before.poem_font_size != after.poem_font_size, Field::PoetryFontSize);
    check(before.author_font_family != after.author_font_family, Field::AuthorFontFamily);
    check(before.author_font_file != after.author_font_file, Field::AuthorFontFile);
    check(before.author_font_size != after.author_font_size, Field::AuthorFontSize);
    check(before.orientation != after.orientation, Field::PoetryOrientation);
    check(before.vertical_alignment != after.vertical_alignment, Field::VerticalPoetryAlignment);
    check(before.horizontal_alignment != after.horizontal_alignment, Field::HorizontalPoetryAlignment);
    check(before.line_spacing != after.line_spacing, Field::PoetryLineSpacing);
    check(before.character_spacing != after.character_spacing, Field::PoetryCharacterSpacing);
    check(before.vertical_character_spacing != after.vertical_character_spacing, Field::PoetryVerticalCharSpacing);
    check(before.vertical_footer_offset != after.vertical_footer_offset, Field::VerticalPoetryOffset);
    check(before.horizontal_footer_offset != after.horizontal_footer_offset, Field::HorizontalPoetryOffset);
    check(before.refresh_interval_minutes != after.refresh_interval_minutes, Field::RefreshIntervalMinutes);
    check(before.show_full_poem != after.show_full_poem, Field::ShowFullPoetry);
    check(before.show_traditional_color_name != after.show_traditional_color_name, Field::ShowTraditionalColorName);
    check(before.randomize_traditional_color != after.randomize_traditional_color, Field::RandomizeTraditionalColor);
    return changed;
}

auto affects_image(std::string_view field) -> bool {
    return field != Field::RefreshIntervalMinutes && field != Field::RandomizeTraditionalColor;
}

} // namespace VW::Settings
