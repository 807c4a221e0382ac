#include <versewall/scene/Color.hpp>

#include <cstdio>

namespace VW::Scene {
namespace {

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return 10 + (c - 'a');
    }
    if (c >= 'A' && c <= 'F') {
        return 10 + (c - 'A');
    }
    return -1;
}

auto read_byte(std::string_view text, std::size_t offset) -> std::optional<std::uint8_t> {
    auto hi = hex_value(text[offset]);
    auto lo = hex_value(text[offset + 1]);
    if (hi < 0 || lo < 0) {
        return std::nullopt;
    }
    return static_cast<std::uint8_t>(hi * 16 + lo);
}

} // namespace

auto parse_color(std::string_view text) -> std::optional<Argb> {
    if (!text.empty() && text.front() == '#') {
        text.remove_prefix(1);
    }
    if (text.size() != 6 && text.size() != 8) {
        return std::nullopt;
    }
    Argb color{};
    std::size_t offset = 0;
    if (text.size() == 8) {
        auto alpha = read_byte(text, 0);
        if (!alpha) {
            return std::nullopt;
        }
        color.a = *alpha;
        offset = 2;
    }
    auto r = read_byte(text, offset);
    auto g = read_byte(text, offset + 2);
    auto b = read_byte(text, offset + 4);
    if (!r || !g || !b) {
        return std::nullopt;
    }
    color.r = *r;
    color.g = *g;
    color.b = *b;
    return color;
}

auto format_color(Argb color) -> std::string {
    char buffer[10];
    std::snprintf(buffer, sizeof(buffer), "#%02X%02X%02X%02X", color.a, color.r, color.g, color.b);
    return std::string(buffer);
}

} // namespace VW::Scene
