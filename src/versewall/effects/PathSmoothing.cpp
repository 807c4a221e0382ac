#include <versewall/effects/PathSmoothing.hpp>

namespace VW::Effects {

using Scene::PathGeometry;
using Scene::Point;

auto chaikin_closed(std::span<Point const> points) -> std::vector<Point> {
    std::vector<Point> smooth;
    auto count = points.size();
    if (count < 3) {
        smooth.assign(points.begin(), points.end());
        return smooth;
    }
    smooth.reserve(count * 2);
    for (std::size_t i = 0; i < count; ++i) {
        auto const& p0 = points[i];
        auto const& p1 = points[(i + 1) % count];
        smooth.push_back(Point{p0.x * 0.75 + p1.x * 0.25, p0.y * 0.75 + p1.y * 0.25});
        smooth.push_back(Point{p0.x * 0.25 + p1.x * 0.75, p0.y * 0.25 + p1.y * 0.75});
    }
    return smooth;
}

auto closed_bezier_through(std::span<Point const> points) -> PathGeometry {
    PathGeometry path;
    auto count = points.size();
    if (count < 4) {
        return path;
    }
    path.move_to(points[0]);
    for (std::size_t i = 0; i < count; ++i) {
        auto const& p0 = points[(i + count - 1) % count];
        auto const& p1 = points[i];
        auto const& p2 = points[(i + 1) % count];
        auto const& p3 = points[(i + 2) % count];
        Point c1{p1.x + (p2.x - p0.x) / 10.0, p1.y + (p2.y - p0.y) / 10.0};
        Point c2{p2.x - (p3.x - p1.x) / 10.0, p2.y - (p3.y - p1.y) / 10.0};
        path.cubic_to(c1, c2, p2);
    }
    path.close();
    return path;
}

auto circle_path(Point center, double radius) -> PathGeometry {
    constexpr double kappa = 0.5522847498307936;
    auto k = radius * kappa;
    auto cx = center.x;
    auto cy = center.y;
    PathGeometry path;
    path.move_to({cx + radius, cy});
    path.cubic_to({cx + radius, cy + k}, {cx + k, cy + radius}, {cx, cy + radius});
    path.cubic_to({cx - k, cy + radius}, {cx - radius, cy + k}, {cx - radius, cy});
    path.cubic_to({cx - radius, cy - k}, {cx - k, cy - radius}, {cx, cy - radius});
    path.cubic_to({cx + k, cy - radius}, {cx + radius, cy - k}, {cx + radius, cy});
    path.close();
    return path;
}

auto smoothed_band(std::span<Point const> samples, double bottom_y) -> PathGeometry {
    PathGeometry path;
    if (samples.empty()) {
        return path;
    }
    path.move_to(samples.front());
    if (samples.size() == 1) {
        path.line_to({samples.front().x, bottom_y});
        path.close();
        return path;
    }
    for (std::size_t i = 1; i + 1 < samples.size(); ++i) {
        auto const& control = samples[i];
        auto const& next = samples[i + 1];
        path.quad_to(control, Point{(control.x + next.x) * 0.5, (control.y + next.y) * 0.5});
    }
    path.line_to(samples.back());
    path.line_to({samples.back().x, bottom_y});
    path.line_to({samples.front().x, bottom_y});
    path.close();
    return path;
}

} // namespace VW::Effects
