#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <variant>
#include <vector>

namespace VW::Text {
class FontFace;
}

namespace VW::Scene {

enum class DrawCommandKind : std::uint32_t {
    Rect = 0,
    RoundedRect = 1,
    Path = 2,
    GlyphRun = 3,
};

enum class FillRule : std::uint32_t {
    NonZero = 0,
    EvenOdd = 1,
};

struct Point {
    double x = 0.0;
    double y = 0.0;

    friend auto operator==(Point const&, Point const&) -> bool = default;
};

enum class PathVerb : std::uint8_t {
    MoveTo,
    LineTo,
    QuadTo,
    CubicTo,
    Close,
};

// Verb stream plus packed points: MoveTo/LineTo consume one point, QuadTo two,
// CubicTo three, Close none.
struct PathGeometry {
    std::vector<PathVerb> verbs;
    std::vector<Point> points;

    auto move_to(Point p) -> void {
        verbs.push_back(PathVerb::MoveTo);
        points.push_back(p);
    }
    auto line_to(Point p) -> void {
        verbs.push_back(PathVerb::LineTo);
        points.push_back(p);
    }
    auto quad_to(Point c, Point p) -> void {
        verbs.push_back(PathVerb::QuadTo);
        points.push_back(c);
        points.push_back(p);
    }
    auto cubic_to(Point c1, Point c2, Point p) -> void {
        verbs.push_back(PathVerb::CubicTo);
        points.push_back(c1);
        points.push_back(c2);
        points.push_back(p);
    }
    auto close() -> void {
        verbs.push_back(PathVerb::Close);
    }
    [[nodiscard]] auto empty() const -> bool {
        return verbs.empty();
    }
};

struct RectCommand {
    float min_x = 0.0f;
    float min_y = 0.0f;
    float max_x = 0.0f;
    float max_y = 0.0f;
    std::array<float, 4> color{0.0f, 0.0f, 0.0f, 1.0f};
};

struct RoundedRectCommand {
    float min_x = 0.0f;
    float min_y = 0.0f;
    float max_x = 0.0f;
    float max_y = 0.0f;
    float radius = 0.0f;
    std::array<float, 4> color{0.0f, 0.0f, 0.0f, 1.0f};
};

struct PathCommand {
    PathGeometry path;
    FillRule fill_rule = FillRule::NonZero;
    std::array<float, 4> fill_color{0.0f, 0.0f, 0.0f, 1.0f};
};

struct PositionedGlyph {
    std::uint32_t glyph_id = 0;
    // Pen position of the glyph origin (baseline), logical units.
    float x = 0.0f;
    float y = 0.0f;
};

struct GlyphRunCommand {
    std::shared_ptr<Text::FontFace const> font;
    std::vector<PositionedGlyph> glyphs;
    float font_size = 12.0f;
    bool synthetic_bold = false;
    std::array<float, 4> color{0.0f, 0.0f, 0.0f, 1.0f};
};

using DrawCommand = std::variant<RectCommand, RoundedRectCommand, PathCommand, GlyphRunCommand>;

inline auto kind_of(DrawCommand const& command) -> DrawCommandKind {
    return static_cast<DrawCommandKind>(command.index());
}

// Back-to-front list of draw commands in logical coordinates.
struct DrawList {
    float logical_width = 0.0f;
    float logical_height = 0.0f;
    std::vector<DrawCommand> commands;

    [[nodiscard]] auto count(DrawCommandKind kind) const -> std::size_t {
        std::size_t total = 0;
        for (auto const& command : commands) {
            if (kind_of(command) == kind) {
                ++total;
            }
        }
        return total;
    }
};

} // namespace VW::Scene
