#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace VW::Scene {

// 8-bit sRGB color with straight alpha, the form settings and palettes store.
struct Argb {
    std::uint8_t a = 255;
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;

    friend auto operator==(Argb const&, Argb const&) -> bool = default;
};

inline constexpr auto rgb(std::uint8_t r, std::uint8_t g, std::uint8_t b) -> Argb {
    return Argb{255, r, g, b};
}

inline constexpr auto with_alpha(Argb color, std::uint8_t alpha) -> Argb {
    color.a = alpha;
    return color;
}

inline auto to_float(Argb color) -> std::array<float, 4> {
    return {static_cast<float>(color.r) / 255.0f,
            static_cast<float>(color.g) / 255.0f,
            static_cast<float>(color.b) / 255.0f,
            static_cast<float>(color.a) / 255.0f};
}

// Rec. 601 luma on 0..255 channels.
inline constexpr auto luminance(Argb color) -> double {
    return 0.299 * color.r + 0.587 * color.g + 0.114 * color.b;
}

// Accepts "#RRGGBB" and "#AARRGGBB" (leading '#' optional, case-insensitive).
[[nodiscard]] auto parse_color(std::string_view text) -> std::optional<Argb>;

// Always "#AARRGGBB", upper case.
[[nodiscard]] auto format_color(Argb color) -> std::string;

} // namespace VW::Scene
