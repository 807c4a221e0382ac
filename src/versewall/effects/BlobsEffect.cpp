#include <versewall/effects/BlobsEffect.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <vector>

#include <versewall/effects/PathSmoothing.hpp>

#include "ShapePlacer.hpp"

namespace VW::Effects {
namespace {

constexpr std::size_t kSlotCount = 10;
constexpr double kTwoPi = std::numbers::pi * 2.0;

// Radial multiplier bounds for the harmonic profile.
constexpr double kProfileMin = 0.84;
constexpr double kProfileMax = 1.18;

auto blob_params() -> PlacementParams {
    PlacementParams params;
    params.min_radius_factor = 0.08;
    params.max_radius_factor = 0.30;
    params.padding_factor = 0.012;
    params.anchor_chance = 0.30;
    params.anchor_min_factor = 0.18;
    params.anchor_span_factor = 0.22;
    params.edge_offset_min = 0.22;
    params.edge_offset_span = 0.40;
    params.max_attempts = 70;
    return params;
}

} // namespace

BlobsEffect::BlobsEffect()
    : EffectGenerator(kSlotCount) {}

auto BlobsEffect::time_scale() const -> double {
    return 0.18;
}

auto BlobsEffect::layout(DeterministicRng& rng, double width, double height) -> void {
    auto slots = static_cast<int>(shapes_.size());
    auto active = rng.next_int(std::min(4, slots), slots + 1);
    auto edge_target = std::min(2, active);

    ShapePlacer placer(width, height, blob_params());
    for (int i = 0; i < active; ++i) {
        auto placement = placer.place(rng, i < edge_target);
        auto& s = shapes_[static_cast<std::size_t>(i)];
        s.active = true;
        s.degraded = placement.degraded;
        s.x = placement.x;
        s.y = placement.y;
        s.radius = placement.radius;
        s.phase = rng.next_double() * kTwoPi;
        s.drift = 5.0 + rng.next_double() * 12.0;
        s.segments = 34 + rng.next_int(0, 12);
        s.rotation = rng.next_double() * kTwoPi;
        s.stretch_x = 0.78 + rng.next_double() * 0.55;
        s.stretch_y = 0.78 + rng.next_double() * 0.55;
        s.a2 = 0.05 + rng.next_double() * 0.06;
        s.a3 = 0.02 + rng.next_double() * 0.05;
        s.a5 = 0.01 + rng.next_double() * 0.04;
        s.p2 = rng.next_double() * kTwoPi;
        s.p3 = rng.next_double() * kTwoPi;
        s.p5 = rng.next_double() * kTwoPi;
    }
}

auto BlobsEffect::drifted_center(std::size_t index) const -> Scene::Point {
    auto const& s = shapes_[index];
    return Scene::Point{
        s.x + std::sin(time_ * 0.8 + s.phase) * s.drift,
        s.y + std::cos(time_ * 0.65 + s.phase * 1.3) * (s.drift * 0.9),
    };
}

auto BlobsEffect::build_path(std::size_t index, double, double) const -> Scene::PathGeometry {
    auto const& s = shapes_[index];
    if (s.segments < 3) {
        return {};
    }
    auto center = drifted_center(index);
    auto cos_r = std::cos(s.rotation);
    auto sin_r = std::sin(s.rotation);

    std::vector<Scene::Point> outline;
    outline.reserve(static_cast<std::size_t>(s.segments));
    for (int k = 0; k < s.segments; ++k) {
        auto a = (static_cast<double>(k) / static_cast<double>(s.segments)) * kTwoPi;
        auto n2 = std::sin(a * 2.0 + s.p2 + s.phase + time_ * 0.18) * s.a2;
        auto n3 = std::sin(a * 3.0 + s.p3 + s.phase * 0.7 - time_ * 0.14) * s.a3;
        auto n5 = std::sin(a * 5.0 + s.p5 + time_ * 0.10) * s.a5;
        auto rr = s.radius * std::clamp(1.0 + n2 + n3 + n5, kProfileMin, kProfileMax);

        auto lx = std::cos(a) * rr * s.stretch_x;
        auto ly = std::sin(a) * rr * s.stretch_y;
        outline.push_back(Scene::Point{
            center.x + (lx * cos_r - ly * sin_r),
            center.y + (lx * sin_r + ly * cos_r),
        });
    }
    auto smooth = chaikin_closed(outline);
    return closed_bezier_through(smooth);
}

} // namespace VW::Effects
