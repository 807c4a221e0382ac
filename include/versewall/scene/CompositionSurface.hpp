#pragma once

#include <versewall/effects/EffectGenerator.hpp>
#include <versewall/scene/DrawCommands.hpp>
#include <versewall/scene/SceneInputs.hpp>

#include <span>
#include <string>
#include <vector>

namespace VW::Scene {

// Placement of the vertical color-name label.
struct WatermarkMetrics {
    double font_size = 0.0;
    double line_height = 0.0;
    double top = 0.0;
    double right_margin = 0.0;
    double nudge = 0.0;
};

inline constexpr Argb kSealColor = rgb(0xB7, 0x1C, 0x1C);
inline constexpr float kDarkOverlayOpacity = 0.42f;
inline constexpr double kWaveBandHeight = 400.0;

/**
 * Lays out the wallpaper for one logical canvas.
 *
 * Output is a back-to-front DrawList: background, effect paths, dark-theme
 * overlay, poem text with its footer, then the optional watermark. Layout
 * depends only on its arguments.
 */
class CompositionSurface {
public:
    [[nodiscard]] auto compose(SceneInputs const& inputs,
                               std::span<Effects::EffectPath const> effect_paths,
                               double logical_width,
                               double logical_height) const -> DrawList;

    // Height of the effect canvas for a logical canvas height.
    [[nodiscard]] static auto effect_canvas_height(Effects::EffectKind kind, double logical_height) -> double;
};

// Poem fragments split at CJK/ASCII sentence punctuation and line breaks; empty pieces dropped.
[[nodiscard]] auto split_fragments(std::u32string_view text) -> std::vector<std::u32string>;

[[nodiscard]] auto legible_text_color(Argb background, bool dark_theme) -> Argb;
[[nodiscard]] auto secondary_text_color(Argb text_color) -> Argb;

[[nodiscard]] auto watermark_metrics(std::size_t char_count, double canvas_width, double canvas_height) -> WatermarkMetrics;

} // namespace VW::Scene
