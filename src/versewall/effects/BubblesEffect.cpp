#include <versewall/effects/BubblesEffect.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>

#include <versewall/effects/PathSmoothing.hpp>

#include "ShapePlacer.hpp"

namespace VW::Effects {
namespace {

constexpr std::size_t kSlotCount = 12;

auto bubble_params() -> PlacementParams {
    PlacementParams params;
    params.min_radius_factor = 0.06;
    params.max_radius_factor = 0.26;
    params.padding_factor = 0.01;
    params.anchor_chance = 0.25;
    params.anchor_min_factor = 0.20;
    params.anchor_span_factor = 0.18;
    params.edge_offset_min = 0.25;
    params.edge_offset_span = 0.35;
    params.max_attempts = 60;
    return params;
}

// Drift direction away from zero so every bubble visibly moves.
auto drift_direction(DeterministicRng& rng) -> double {
    auto value = rng.next_double() * 2.0 - 1.0;
    if (std::abs(value) < 0.15) {
        value = value < 0.0 ? -0.15 : 0.15;
    }
    return value;
}

} // namespace

BubblesEffect::BubblesEffect()
    : EffectGenerator(kSlotCount) {}

auto BubblesEffect::time_scale() const -> double {
    return 0.20;
}

auto BubblesEffect::layout(DeterministicRng& rng, double width, double height) -> void {
    auto slots = static_cast<int>(shapes_.size());
    auto active = rng.next_int(std::min(5, slots), slots + 1);
    auto edge_target = std::min(2, active);

    ShapePlacer placer(width, height, bubble_params());
    for (int i = 0; i < active; ++i) {
        auto placement = placer.place(rng, i < edge_target);
        auto& s = shapes_[static_cast<std::size_t>(i)];
        s.active = true;
        s.degraded = placement.degraded;
        s.x = placement.x;
        s.y = placement.y;
        s.radius = placement.radius;
        s.drift_x = drift_direction(rng);
        s.drift_y = drift_direction(rng);
        s.phase = rng.next_double() * std::numbers::pi * 2.0;
        s.pulse = 0.4 + rng.next_double() * 0.9;
        s.drift = 8.0 + s.radius * 0.02;
    }
}

auto BubblesEffect::drifted_center(std::size_t index) const -> Scene::Point {
    auto const& s = shapes_[index];
    return Scene::Point{
        s.x + std::sin(time_ * 0.9 + s.phase) * s.drift * s.drift_x,
        s.y + std::cos(time_ * 0.75 + s.phase * 1.3) * s.drift * s.drift_y,
    };
}

auto BubblesEffect::build_path(std::size_t index, double, double) const -> Scene::PathGeometry {
    auto const& s = shapes_[index];
    auto scale = 1.0 + std::sin(time_ * 0.6 + s.phase) * (0.03 + s.pulse * 0.02);
    return circle_path(drifted_center(index), s.radius * scale);
}

} // namespace VW::Effects
