#pragma once

#include <versewall/scene/DrawCommands.hpp>
#include <versewall/scene/PixelBuffer.hpp>

#include <array>
#include <cstdint>
#include <vector>

namespace VW::Scene::RasterDetail {

struct LinearPremulColor {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 0.0f;
};

auto clamp_unit(float value) -> float;
auto to_byte(float value) -> std::uint8_t;
auto srgb_to_linear(float value) -> float;
auto linear_to_srgb(float value) -> float;

// Straight sRGB in, premultiplied linear out.
auto make_linear_color(std::array<float, 4> const& rgba) -> LinearPremulColor;
// Premultiplied linear in, straight sRGB bytes out.
auto encode_pixel(float const* linear_premul) -> std::array<std::uint8_t, 4>;

// Logical to pixel mapping: p' = p * scale + offset.
struct Transform {
    double scale_x = 1.0;
    double scale_y = 1.0;
    double offset_x = 0.0;
    double offset_y = 0.0;

    [[nodiscard]] auto apply(Point p) const -> Point {
        return Point{p.x * scale_x + offset_x, p.y * scale_y + offset_y};
    }
};

auto rounded_rect_path(double min_x, double min_y, double max_x, double max_y, double radius) -> PathGeometry;

/**
 * Scanline polygon filler over a linear premultiplied float buffer.
 *
 * Each pixel row is sampled with four sub-scanlines; spans carry fractional
 * horizontal coverage at their ends.
 */
class CoverageRasterizer {
public:
    CoverageRasterizer(int width, int height);

    auto fill_rect(double min_x, double min_y, double max_x, double max_y, LinearPremulColor const& color) -> void;
    auto fill_path(PathGeometry const& path, Transform const& transform, FillRule rule, LinearPremulColor const& color) -> void;

    [[nodiscard]] auto encode() const -> PixelBuffer;

    [[nodiscard]] auto width() const -> int { return width_; }
    [[nodiscard]] auto height() const -> int { return height_; }

private:
    struct Edge {
        double x0;
        double y0;
        double x1;
        double y1;
        int direction;
    };

    auto blend(int x, int y, LinearPremulColor const& color, float coverage) -> void;
    auto add_span(double x0, double x1, float weight) -> void;

    int width_;
    int height_;
    std::vector<float> buffer_;
    std::vector<float> row_coverage_;
};

// Converts a path into line edges in pixel space.
auto flatten(PathGeometry const& path, Transform const& transform) -> std::vector<std::array<Point, 2>>;

} // namespace VW::Scene::RasterDetail
