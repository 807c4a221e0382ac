#include <versewall/settings/SettingsJson.hpp>
#include <versewall/scene/Color.hpp>

#include <initializer_list>
#include <limits>

namespace VW::Settings {
namespace {

using json = nlohmann::json;

auto orientation_name(Scene::Orientation orientation) -> std::string_view {
    return orientation == Scene::Orientation::Horizontal ? "Horizontal" : "Vertical";
}

auto vertical_alignment_name(Scene::VerticalAlignment alignment) -> std::string_view {
    switch (alignment) {
    case Scene::VerticalAlignment::Top:
        return "Top";
    case Scene::VerticalAlignment::Center:
        return "Center";
    case Scene::VerticalAlignment::Bottom:
        return "Bottom";
    }
    return "Center";
}

auto horizontal_alignment_name(Scene::HorizontalAlignment alignment) -> std::string_view {
    switch (alignment) {
    case Scene::HorizontalAlignment::Left:
        return "Left";
    case Scene::HorizontalAlignment::Center:
        return "Center";
    case Scene::HorizontalAlignment::Right:
        return "Right";
    }
    return "Center";
}

auto find(json const& document, std::string_view key) -> json const* {
    auto it = document.find(std::string(key));
    if (it == document.end()) {
        return nullptr;
    }
    return &*it;
}

auto read_int(json const& document, std::string_view key, int& out, int min_value, int max_value) -> void {
    auto const* value = find(document, key);
    if (value == nullptr || !value->is_number_integer()) {
        return;
    }
    auto number = value->get<std::int64_t>();
    if (number < min_value || number > max_value) {
        return;
    }
    out = static_cast<int>(number);
}

auto read_bool(json const& document, std::string_view key, bool& out) -> void {
    auto const* value = find(document, key);
    if (value != nullptr && value->is_boolean()) {
        out = value->get<bool>();
    }
}

auto read_string(json const& document, std::string_view key, std::string& out) -> void {
    auto const* value = find(document, key);
    if (value != nullptr && value->is_string()) {
        out = value->get<std::string>();
    }
}

auto read_color(json const& document, std::string_view key, std::string& out) -> void {
    auto const* value = find(document, key);
    if (value == nullptr || !value->is_string()) {
        return;
    }
    auto text = value->get<std::string>();
    if (Scene::parse_color(text)) {
        out = std::move(text);
    }
}

// Enum stored either by name or by its legacy ordinal.
template <typename Enum, typename Parse>
auto read_enum(json const& document, std::string_view key, Enum& out, Parse parse, std::initializer_list<Enum> ordinals) -> void {
    auto const* value = find(document, key);
    if (value == nullptr) {
        return;
    }
    if (value->is_string()) {
        if (auto parsed = parse(value->get<std::string>())) {
            out = *parsed;
        }
        return;
    }
    if (value->is_number_integer()) {
        auto index = value->get<std::int64_t>();
        if (index >= 0 && static_cast<std::size_t>(index) < ordinals.size()) {
            out = *(ordinals.begin() + index);
        }
    }
}

auto parse_orientation(std::string_view name) -> std::optional<Scene::Orientation> {
    if (name == "Vertical" || name == "vertical") {
        return Scene::Orientation::Vertical;
    }
    if (name == "Horizontal" || name == "horizontal") {
        return Scene::Orientation::Horizontal;
    }
    return std::nullopt;
}

auto parse_vertical_alignment(std::string_view name) -> std::optional<Scene::VerticalAlignment> {
    if (name == "Top" || name == "top") {
        return Scene::VerticalAlignment::Top;
    }
    if (name == "Center" || name == "center") {
        return Scene::VerticalAlignment::Center;
    }
    if (name == "Bottom" || name == "bottom") {
        return Scene::VerticalAlignment::Bottom;
    }
    return std::nullopt;
}

auto parse_horizontal_alignment(std::string_view name) -> std::optional<Scene::HorizontalAlignment> {
    if (name == "Left" || name == "left") {
        return Scene::HorizontalAlignment::Left;
    }
    if (name == "Center" || name == "center") {
        return Scene::HorizontalAlignment::Center;
    }
    if (name == "Right" || name == "right") {
        return Scene::HorizontalAlignment::Right;
    }
    return std::nullopt;
}

auto key(std::string_view name) -> std::string {
    return std::string(name);
}

} // namespace

auto settings_to_json(AppSettings const& settings) -> json {
    json document = json::object();
    document[key(Field::Theme)] = std::string(theme_mode_name(settings.theme));
    document[key(Field::BackgroundColor)] = settings.background_color;
    document[key(Field::BackgroundEffect)] = std::string(Effects::effect_kind_name(settings.background_effect));
    document[key(Field::WaveColor)] = settings.wave_color;
    document[key(Field::BackgroundSeed)] = settings.background_seed;
    document[key(Field::PoetryFontFamily)] = settings.poem_font_family;
    document[key(Field::PoetryFontFile)] = settings.poem_font_file;
    document[key(Field::PoetryFontSize)] = settings.poem_font_size;
    document[key(Field::AuthorFontFamily)] = settings.author_font_family;
    document[key(Field::AuthorFontFile)] = settings.author_font_file;
    document[key(Field::AuthorFontSize)] = settings.author_font_size;
    document[key(Field::PoetryOrientation)] = std::string(orientation_name(settings.orientation));
    document[key(Field::VerticalPoetryAlignment)] = std::string(vertical_alignment_name(settings.vertical_alignment));
    document[key(Field::HorizontalPoetryAlignment)] = std::string(horizontal_alignment_name(settings.horizontal_alignment));
    document[key(Field::PoetryLineSpacing)] = settings.line_spacing;
    document[key(Field::PoetryCharacterSpacing)] = settings.character_spacing;
    document[key(Field::PoetryVerticalCharSpacing)] = settings.vertical_character_spacing;
    document[key(Field::VerticalPoetryOffset)] = settings.vertical_footer_offset;
    document[key(Field::HorizontalPoetryOffset)] = settings.horizontal_footer_offset;
    document[key(Field::RefreshIntervalMinutes)] = settings.refresh_interval_minutes;
    document[key(Field::ShowFullPoetry)] = settings.show_full_poem;
    document[key(Field::ShowTraditionalColorName)] = settings.show_traditional_color_name;
    document[key(Field::RandomizeTraditionalColor)] = settings.randomize_traditional_color;
    return document;
}

auto settings_from_json(json const& document) -> AppSettings {
    AppSettings settings;
    if (!document.is_object()) {
        return settings;
    }
    constexpr int kIntMax = std::numeric_limits<int>::max();
    constexpr int kIntMin = std::numeric_limits<int>::min();

    read_enum(document, Field::Theme, settings.theme, parse_theme_mode,
              {ThemeMode::Light, ThemeMode::Dark, ThemeMode::System});
    read_color(document, Field::BackgroundColor, settings.background_color);
    read_enum(document, Field::BackgroundEffect, settings.background_effect, Effects::parse_effect_kind,
              {Effects::EffectKind::Wave, Effects::EffectKind::Bubbles, Effects::EffectKind::Blobs});
    read_color(document, Field::WaveColor, settings.wave_color);
    int seed = settings.background_seed;
    read_int(document, Field::BackgroundSeed, seed, kIntMin, kIntMax);
    settings.background_seed = seed;
    read_string(document, Field::PoetryFontFamily, settings.poem_font_family);
    read_string(document, Field::PoetryFontFile, settings.poem_font_file);
    read_int(document, Field::PoetryFontSize, settings.poem_font_size, 6, 400);
    read_string(document, Field::AuthorFontFamily, settings.author_font_family);
    read_string(document, Field::AuthorFontFile, settings.author_font_file);
    read_int(document, Field::AuthorFontSize, settings.author_font_size, 6, 400);
    read_enum(document, Field::PoetryOrientation, settings.orientation, parse_orientation,
              {Scene::Orientation::Horizontal, Scene::Orientation::Vertical});
    read_enum(document, Field::VerticalPoetryAlignment, settings.vertical_alignment, parse_vertical_alignment,
              {Scene::VerticalAlignment::Top, Scene::VerticalAlignment::Center, Scene::VerticalAlignment::Bottom});
    read_enum(document, Field::HorizontalPoetryAlignment, settings.horizontal_alignment, parse_horizontal_alignment,
              {Scene::HorizontalAlignment::Left, Scene::HorizontalAlignment::Center, Scene::HorizontalAlignment::Right});
    read_int(document, Field::PoetryLineSpacing, settings.line_spacing, 0, 1000);
    read_int(document, Field::PoetryCharacterSpacing, settings.character_spacing, 0, 1000);
    read_int(document, Field::PoetryVerticalCharSpacing, settings.vertical_character_spacing, 0, 1000);
    read_int(document, Field::VerticalPoetryOffset, settings.vertical_footer_offset, -10000, 10000);
    read_int(document, Field::HorizontalPoetryOffset, settings.horizontal_footer_offset, -10000, 10000);
    read_int(document, Field::RefreshIntervalMinutes, settings.refresh_interval_minutes, kIntMin, kIntMax);
    read_bool(document, Field::ShowFullPoetry, settings.show_full_poem);
    read_bool(document, Field::ShowTraditionalColorName, settings.show_traditional_color_name);
    read_bool(document, Field::RandomizeTraditionalColor, settings.randomize_traditional_color);
    return settings;
}

auto parse_settings(std::string_view text) -> Expected<AppSettings> {
    auto document = json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "settings file is not valid JSON"});
    }
    if (!document.is_object()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "settings file must hold a JSON object"});
    }
    return settings_from_json(document);
}

auto serialize_settings(AppSettings const& settings) -> std::string {
    return settings_to_json(settings).dump(2);
}

} // namespace VW::Settings
