#include "ShapePlacer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace VW::Effects {

ShapePlacer::ShapePlacer(double width, double height, PlacementParams const& params)
    : width_(width)
    , height_(height)
    , min_dim_(std::min(width, height))
    , min_radius_(min_dim_ * params.min_radius_factor)
    , max_radius_(min_dim_ * params.max_radius_factor)
    , padding_(min_dim_ * params.padding_factor)
    , params_(params) {}

auto ShapePlacer::next_radius(DeterministicRng& rng) const -> double {
    auto u = rng.next_double();
    auto radius = min_radius_ + (max_radius_ - min_radius_) * (u * u);
    if (rng.next_double() < params_.anchor_chance) {
        radius = min_dim_ * (params_.anchor_min_factor + rng.next_double() * params_.anchor_span_factor);
    }
    return radius;
}

auto ShapePlacer::candidate(DeterministicRng& rng, bool prefer_edge, double radius) const -> Circle {
    auto edge_offset = [&]() {
        return radius * (params_.edge_offset_min + rng.next_double() * params_.edge_offset_span);
    };
    if (!prefer_edge) {
        auto x = (rng.next_double() * 1.25 - 0.125) * width_;
        auto y = (rng.next_double() * 1.25 - 0.125) * height_;
        return Circle{x, y, radius};
    }
    switch (rng.next_int(0, 4)) {
    case 0: {
        auto x = -edge_offset();
        auto y = (rng.next_double() * 1.2 - 0.1) * height_;
        return Circle{x, y, radius};
    }
    case 1: {
        auto x = width_ + edge_offset();
        auto y = (rng.next_double() * 1.2 - 0.1) * height_;
        return Circle{x, y, radius};
    }
    case 2: {
        auto x = (rng.next_double() * 1.2 - 0.1) * width_;
        auto y = -edge_offset();
        return Circle{x, y, radius};
    }
    default: {
        auto x = (rng.next_double() * 1.2 - 0.1) * width_;
        auto y = height_ + edge_offset();
        return Circle{x, y, radius};
    }
    }
}

auto ShapePlacer::worst_overlap(Circle const& c) const -> double {
    auto worst = -std::numeric_limits<double>::infinity();
    for (auto const& other : placed_) {
        auto dx = c.x - other.x;
        auto dy = c.y - other.y;
        auto min_dist = c.radius + other.radius + padding_;
        worst = std::max(worst, min_dist - std::sqrt(dx * dx + dy * dy));
    }
    return worst;
}

auto ShapePlacer::place(DeterministicRng& rng, bool prefer_edge) -> Placement {
    Circle best{0.0, 0.0, 0.0};
    auto best_overlap = std::numeric_limits<double>::infinity();
    for (int attempt = 0; attempt < params_.max_attempts; ++attempt) {
        auto radius = next_radius(rng);
        auto c = candidate(rng, prefer_edge, radius);
        auto overlap = worst_overlap(c);
        if (overlap < 0.0) {
            placed_.push_back(c);
            return Placement{c.x, c.y, c.radius, false};
        }
        if (overlap < best_overlap) {
            best = c;
            best_overlap = overlap;
        }
    }
    placed_.push_back(best);
    return Placement{best.x, best.y, best.radius, true};
}

} // namespace VW::Effects
