#pragma once

#include "core/Error.hpp"

#include <versewall/scene/Color.hpp>

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace VW::Settings {
class EntropySource;
}

namespace VW::Theme {

struct TraditionalColor {
    std::string name;
    std::string pinyin;
    // Normalized "#RRGGBB" or "#AARRGGBB".
    std::string hex;
    Scene::Argb color;
    bool        light_suitable = false;
    bool        dark_suitable  = false;
};

// "#abc" expands to "#aabbcc"; 6 and 8 digit forms pass through. Anything
// else is rejected.
auto normalize_hex(std::string_view hex) -> std::optional<std::string>;

/**
 * Named traditional Chinese colors.
 *
 * The watermark shows the name of the entry whose RGB matches the effect
 * color. A refresh may pick a random entry suited to the current theme.
 */
class TraditionalColorPalette {
public:
    [[nodiscard]] static auto builtin() -> TraditionalColorPalette;
    // JSON array of {hex, name, pinyin, lightSuitable, darkSuitable}.
    [[nodiscard]] static auto from_json(std::string_view text) -> Expected<TraditionalColorPalette>;
    [[nodiscard]] static auto load(std::filesystem::path const& path) -> Expected<TraditionalColorPalette>;
    // First candidate file that loads with at least one color, else builtin().
    [[nodiscard]] static auto load_first(std::span<std::filesystem::path const> candidates) -> TraditionalColorPalette;

    [[nodiscard]] auto entries() const -> std::vector<TraditionalColor> const& { return entries_; }
    [[nodiscard]] auto size() const -> std::size_t { return entries_.size(); }

    // Alpha is ignored.
    [[nodiscard]] auto find_by_rgb(Scene::Argb color) const -> TraditionalColor const*;
    [[nodiscard]] auto name_for(std::string_view color_text) const -> std::optional<std::string>;

    // Uniform pick among entries suited to the theme, or among all entries
    // when none is suited. nullptr only for an empty palette.
    [[nodiscard]] auto pick_random(bool dark_theme, Settings::EntropySource& entropy) const -> TraditionalColor const*;

private:
    explicit TraditionalColorPalette(std::vector<TraditionalColor> entries);

    std::vector<TraditionalColor> entries_;
};

} // namespace VW::Theme
