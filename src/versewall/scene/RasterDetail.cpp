#include "RasterDetail.hpp"

#include <algorithm>
#include <cmath>

namespace VW::Scene::RasterDetail {
namespace {

constexpr int kSubScanlines = 4;
constexpr int kMaxCurveSteps = 32;
// Target length of one flattened curve step, in pixels.
constexpr double kCurveStepPx = 2.0;

auto distance(Point a, Point b) -> double {
    return std::hypot(b.x - a.x, b.y - a.y);
}

auto curve_steps(double control_length) -> int {
    auto steps = static_cast<int>(std::ceil(control_length / kCurveStepPx));
    return std::clamp(steps, 1, kMaxCurveSteps);
}

} // namespace

auto clamp_unit(float value) -> float {
    return std::clamp(value, 0.0f, 1.0f);
}

auto to_byte(float value) -> std::uint8_t {
    return static_cast<std::uint8_t>(std::lround(clamp_unit(value) * 255.0f));
}

auto srgb_to_linear(float value) -> float {
    value = clamp_unit(value);
    if (value <= 0.04045f) {
        return value / 12.92f;
    }
    return std::pow((value + 0.055f) / 1.055f, 2.4f);
}

auto linear_to_srgb(float value) -> float {
    value = clamp_unit(value);
    if (value <= 0.0031308f) {
        return value * 12.92f;
    }
    return 1.055f * std::pow(value, 1.0f / 2.4f) - 0.055f;
}

auto make_linear_color(std::array<float, 4> const& rgba) -> LinearPremulColor {
    auto alpha = clamp_unit(rgba[3]);
    return LinearPremulColor{
        .r = srgb_to_linear(rgba[0]) * alpha,
        .g = srgb_to_linear(rgba[1]) * alpha,
        .b = srgb_to_linear(rgba[2]) * alpha,
        .a = alpha,
    };
}

auto encode_pixel(float const* linear_premul) -> std::array<std::uint8_t, 4> {
    auto alpha = clamp_unit(linear_premul[3]);
    std::array<std::uint8_t, 4> out{0, 0, 0, to_byte(alpha)};
    if (alpha <= 0.0f) {
        return out;
    }
    for (int i = 0; i < 3; ++i) {
        auto straight = std::clamp(linear_premul[i] / alpha, 0.0f, 1.0f);
        out[static_cast<std::size_t>(i)] = to_byte(linear_to_srgb(straight));
    }
    return out;
}

auto rounded_rect_path(double min_x, double min_y, double max_x, double max_y, double radius) -> PathGeometry {
    constexpr double kappa = 0.5522847498307936;
    radius = std::clamp(radius, 0.0, std::min(max_x - min_x, max_y - min_y) * 0.5);
    auto k = radius * kappa;
    PathGeometry path;
    path.move_to({min_x + radius, min_y});
    path.line_to({max_x - radius, min_y});
    path.cubic_to({max_x - radius + k, min_y}, {max_x, min_y + radius - k}, {max_x, min_y + radius});
    path.line_to({max_x, max_y - radius});
    path.cubic_to({max_x, max_y - radius + k}, {max_x - radius + k, max_y}, {max_x - radius, max_y});
    path.line_to({min_x + radius, max_y});
    path.cubic_to({min_x + radius - k, max_y}, {min_x, max_y - radius + k}, {min_x, max_y - radius});
    path.line_to({min_x, min_y + radius});
    path.cubic_to({min_x, min_y + radius - k}, {min_x + radius - k, min_y}, {min_x + radius, min_y});
    path.close();
    return path;
}

auto flatten(PathGeometry const& path, Transform const& transform) -> std::vector<std::array<Point, 2>> {
    std::vector<std::array<Point, 2>> lines;
    std::size_t cursor = 0;
    Point current{};
    Point start{};
    bool open = false;

    auto emit = [&](Point to) {
        lines.push_back({current, to});
        current = to;
    };
    auto close_subpath = [&]() {
        if (open && current != start) {
            emit(start);
        }
        current = start;
        open = false;
    };

    for (auto verb : path.verbs) {
        switch (verb) {
        case PathVerb::MoveTo:
            close_subpath();
            current = transform.apply(path.points[cursor++]);
            start = current;
            open = true;
            break;
        case PathVerb::LineTo:
            emit(transform.apply(path.points[cursor++]));
            open = true;
            break;
        case PathVerb::QuadTo: {
            auto p0 = current;
            auto c = transform.apply(path.points[cursor++]);
            auto p1 = transform.apply(path.points[cursor++]);
            auto steps = curve_steps(distance(p0, c) + distance(c, p1));
            for (int i = 1; i <= steps; ++i) {
                auto t = static_cast<double>(i) / steps;
                auto u = 1.0 - t;
                emit(Point{u * u * p0.x + 2.0 * u * t * c.x + t * t * p1.x,
                           u * u * p0.y + 2.0 * u * t * c.y + t * t * p1.y});
            }
            open = true;
            break;
        }
        case PathVerb::CubicTo: {
            auto p0 = current;
            auto c1 = transform.apply(path.points[cursor++]);
            auto c2 = transform.apply(path.points[cursor++]);
            auto p1 = transform.apply(path.points[cursor++]);
            auto steps = curve_steps(distance(p0, c1) + distance(c1, c2) + distance(c2, p1));
            for (int i = 1; i <= steps; ++i) {
                auto t = static_cast<double>(i) / steps;
                auto u = 1.0 - t;
                auto a = u * u * u;
                auto b = 3.0 * u * u * t;
                auto d = 3.0 * u * t * t;
                auto e = t * t * t;
                emit(Point{a * p0.x + b * c1.x + d * c2.x + e * p1.x,
                           a * p0.y + b * c1.y + d * c2.y + e * p1.y});
            }
            open = true;
            break;
        }
        case PathVerb::Close:
            close_subpath();
            break;
        }
    }
    close_subpath();
    return lines;
}

CoverageRasterizer::CoverageRasterizer(int width, int height)
    : width_(std::max(width, 0))
    , height_(std::max(height, 0))
    , buffer_(static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_) * 4u, 0.0f)
    , row_coverage_(static_cast<std::size_t>(width_) + 1u, 0.0f) {}

auto CoverageRasterizer::blend(int x, int y, LinearPremulColor const& color, float coverage) -> void {
    auto* dest = buffer_.data() + (static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) + static_cast<std::size_t>(x)) * 4u;
    auto src_a = color.a * coverage;
    auto inv_alpha = 1.0f - src_a;
    dest[0] = clamp_unit(color.r * coverage + dest[0] * inv_alpha);
    dest[1] = clamp_unit(color.g * coverage + dest[1] * inv_alpha);
    dest[2] = clamp_unit(color.b * coverage + dest[2] * inv_alpha);
    dest[3] = clamp_unit(src_a + dest[3] * inv_alpha);
}

auto CoverageRasterizer::fill_rect(double min_x, double min_y, double max_x, double max_y, LinearPremulColor const& color) -> void {
    min_x = std::max(min_x, 0.0);
    min_y = std::max(min_y, 0.0);
    max_x = std::min(max_x, static_cast<double>(width_));
    max_y = std::min(max_y, static_cast<double>(height_));
    if (min_x >= max_x || min_y >= max_y) {
        return;
    }
    auto y_begin = static_cast<int>(std::floor(min_y));
    auto y_end = static_cast<int>(std::ceil(max_y));
    auto x_begin = static_cast<int>(std::floor(min_x));
    auto x_end = static_cast<int>(std::ceil(max_x));
    for (int y = y_begin; y < y_end; ++y) {
        auto cov_y = std::min(y + 1.0, max_y) - std::max(static_cast<double>(y), min_y);
        for (int x = x_begin; x < x_end; ++x) {
            auto cov_x = std::min(x + 1.0, max_x) - std::max(static_cast<double>(x), min_x);
            auto coverage = static_cast<float>(cov_x * cov_y);
            if (coverage > 0.0f) {
                blend(x, y, color, coverage);
            }
        }
    }
}

auto CoverageRasterizer::add_span(double x0, double x1, float weight) -> void {
    x0 = std::clamp(x0, 0.0, static_cast<double>(width_));
    x1 = std::clamp(x1, 0.0, static_cast<double>(width_));
    if (x1 <= x0) {
        return;
    }
    auto i0 = static_cast<int>(std::floor(x0));
    auto i1 = static_cast<int>(std::floor(x1));
    if (i0 == i1) {
        row_coverage_[static_cast<std::size_t>(i0)] += static_cast<float>(x1 - x0) * weight;
        return;
    }
    row_coverage_[static_cast<std::size_t>(i0)] += static_cast<float>(i0 + 1 - x0) * weight;
    for (int i = i0 + 1; i < i1; ++i) {
        row_coverage_[static_cast<std::size_t>(i)] += weight;
    }
    if (i1 < width_) {
        row_coverage_[static_cast<std::size_t>(i1)] += static_cast<float>(x1 - i1) * weight;
    }
}

auto CoverageRasterizer::fill_path(PathGeometry const& path, Transform const& transform, FillRule rule, LinearPremulColor const& color) -> void {
    if (width_ == 0 || height_ == 0 || path.empty() || color.a <= 0.0f) {
        return;
    }
    std::vector<Edge> edges;
    double min_y = static_cast<double>(height_);
    double max_y = 0.0;
    for (auto const& line : flatten(path, transform)) {
        auto const& a = line[0];
        auto const& b = line[1];
        if (a.y == b.y) {
            continue;
        }
        Edge edge = a.y < b.y ? Edge{a.x, a.y, b.x, b.y, 1} : Edge{b.x, b.y, a.x, a.y, -1};
        min_y = std::min(min_y, edge.y0);
        max_y = std::max(max_y, edge.y1);
        edges.push_back(edge);
    }
    if (edges.empty()) {
        return;
    }

    auto row_begin = std::clamp(static_cast<int>(std::floor(min_y)), 0, height_);
    auto row_end = std::clamp(static_cast<int>(std::ceil(max_y)), 0, height_);
    constexpr float weight = 1.0f / static_cast<float>(kSubScanlines);

    std::vector<Edge const*> row_edges;
    std::vector<std::pair<double, int>> crossings;
    for (int y = row_begin; y < row_end; ++y) {
        row_edges.clear();
        for (auto const& edge : edges) {
            if (edge.y1 > y && edge.y0 < y + 1.0) {
                row_edges.push_back(&edge);
            }
        }
        if (row_edges.empty()) {
            continue;
        }

        auto touched_min = width_;
        auto touched_max = -1;
        for (int s = 0; s < kSubScanlines; ++s) {
            auto sample_y = y + (s + 0.5) / kSubScanlines;
            crossings.clear();
            for (auto const* edge : row_edges) {
                if (sample_y < edge->y0 || sample_y >= edge->y1) {
                    continue;
                }
                auto t = (sample_y - edge->y0) / (edge->y1 - edge->y0);
                crossings.emplace_back(edge->x0 + t * (edge->x1 - edge->x0), edge->direction);
            }
            if (crossings.size() < 2) {
                continue;
            }
            std::sort(crossings.begin(), crossings.end(), [](auto const& lhs, auto const& rhs) { return lhs.first < rhs.first; });

            int winding = 0;
            for (std::size_t i = 0; i + 1 < crossings.size(); ++i) {
                winding += rule == FillRule::NonZero ? crossings[i].second : 1;
                auto inside = rule == FillRule::NonZero ? winding != 0 : (winding % 2) != 0;
                if (!inside) {
                    continue;
                }
                auto x0 = crossings[i].first;
                auto x1 = crossings[i + 1].first;
                add_span(x0, x1, weight);
                touched_min = std::min(touched_min, std::clamp(static_cast<int>(std::floor(x0)), 0, width_ - 1));
                touched_max = std::max(touched_max, std::clamp(static_cast<int>(std::floor(x1)), 0, width_ - 1));
            }
        }

        for (int x = touched_min; x <= touched_max; ++x) {
            auto& coverage = row_coverage_[static_cast<std::size_t>(x)];
            if (coverage > 0.0f) {
                blend(x, y, color, std::min(coverage, 1.0f));
            }
            coverage = 0.0f;
        }
    }
}

auto CoverageRasterizer::encode() const -> PixelBuffer {
    PixelBuffer out;
    out.width = width_;
    out.height = height_;
    out.rgba.resize(buffer_.size());
    for (std::size_t i = 0; i < buffer_.size(); i += 4) {
        auto pixel = encode_pixel(buffer_.data() + i);
        out.rgba[i] = pixel[0];
        out.rgba[i + 1] = pixel[1];
        out.rgba[i + 2] = pixel[2];
        out.rgba[i + 3] = pixel[3];
    }
    return out;
}

} // namespace VW::Scene::RasterDetail
