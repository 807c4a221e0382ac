#pragma once

#include <versewall/effects/EffectGenerator.hpp>
#include <versewall/scene/Color.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace VW::Text {
class FontFace;
}

namespace VW::Scene {

enum class Orientation {
    Vertical,
    Horizontal,
};

enum class VerticalAlignment {
    Top,
    Center,
    Bottom,
};

enum class HorizontalAlignment {
    Left,
    Center,
    Right,
};

struct PoemText {
    std::string main_text;
    std::string title;
    std::string author;
};

struct TextStyle {
    Orientation orientation = Orientation::Vertical;
    VerticalAlignment vertical_alignment = VerticalAlignment::Center;
    HorizontalAlignment horizontal_alignment = HorizontalAlignment::Center;

    std::shared_ptr<Text::FontFace const> poem_font;
    std::shared_ptr<Text::FontFace const> author_font;

    float poem_font_size = 36.0f;
    float author_font_size = 18.0f;
    float line_spacing = 20.0f;
    float character_spacing = 4.0f;
    float vertical_character_spacing = 2.0f;
    float vertical_footer_offset = 0.0f;
    float horizontal_footer_offset = 0.0f;
};

// Everything a frame depends on besides the canvas size and variation offset.
struct SceneInputs {
    PoemText poem;
    TextStyle style;
    Argb background = rgb(245, 245, 245);
    bool dark_theme = false;
    Effects::EffectKind effect = Effects::EffectKind::Wave;
    Argb effect_color = rgb(0x26, 0xA6, 0x9A);
    std::int32_t seed = 0;
    // Vertical color-name label on the right edge.
    std::optional<std::string> watermark;
};

} // namespace VW::Scene
