#include <versewall/effects/WaveEffect.hpp>

#include <cmath>
#include <vector>

#include <versewall/effects/PathSmoothing.hpp>

namespace VW::Effects {
namespace {

constexpr std::size_t kLayerCount = 5;
constexpr double kSampleStep = 20.0;

} // namespace

WaveEffect::WaveEffect()
    : EffectGenerator(kLayerCount) {}

auto WaveEffect::time_scale() const -> double {
    return 0.3;
}

// Layers are fixed; only the phase carries the seeded variation.
auto WaveEffect::layout(DeterministicRng&, double width, double height) -> void {
    auto n = static_cast<double>(shapes_.size());
    for (std::size_t i = 0; i < shapes_.size(); ++i) {
        auto& layer = shapes_[i];
        auto factor = static_cast<double>(i) / n;
        layer.active = true;
        layer.x = width * 0.5;
        layer.y = height * (0.5 + 0.1 * static_cast<double>(i));
        layer.radius = 40.0 + factor * 40.0;
        layer.drift = 0.002 + static_cast<double>(i) * 0.0005;
        layer.phase = static_cast<double>(i) * 1.5 + variation_offset();
    }
}

auto WaveEffect::build_path(std::size_t index, double width, double height) const -> Scene::PathGeometry {
    auto const& layer = shapes_[index];
    auto amplitude = layer.radius;
    auto frequency = layer.drift;
    auto phase = time_ + layer.phase;
    auto base_y = layer.y;

    auto edge_y = [&](double x) {
        return base_y + std::sin(x * frequency + phase) * amplitude
               + std::sin(x * frequency * 2.5 + phase * 1.3) * (amplitude * 0.3);
    };

    std::vector<Scene::Point> samples;
    samples.reserve(static_cast<std::size_t>(width / kSampleStep) + 2);
    for (double x = 0.0; x <= width; x += kSampleStep) {
        samples.push_back(Scene::Point{x, edge_y(x)});
    }
    if (samples.empty() || samples.back().x < width) {
        samples.push_back(Scene::Point{width, edge_y(width)});
    }
    return smoothed_band(samples, height);
}

} // namespace VW::Effects
