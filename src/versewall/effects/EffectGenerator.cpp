#include <versewall/effects/EffectGenerator.hpp>
#include <versewall/effects/BlobsEffect.hpp>
#include <versewall/effects/BubblesEffect.hpp>
#include <versewall/effects/Variation.hpp>
#include <versewall/effects/WaveEffect.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cmath>

namespace VW::Effects {

auto effect_kind_name(EffectKind kind) -> std::string_view {
    switch (kind) {
    case EffectKind::Wave:
        return "wave";
    case EffectKind::Bubbles:
        return "bubbles";
    case EffectKind::Blobs:
        return "blobs";
    }
    return "wave";
}

auto parse_effect_kind(std::string_view name) -> std::optional<EffectKind> {
    if (name == "wave" || name == "Wave") {
        return EffectKind::Wave;
    }
    if (name == "bubbles" || name == "Bubbles") {
        return EffectKind::Bubbles;
    }
    if (name == "blobs" || name == "Blobs") {
        return EffectKind::Blobs;
    }
    return std::nullopt;
}

auto depth_color(Scene::Argb base_color, bool is_dark_theme, std::size_t index, std::size_t count) -> Scene::Argb {
    auto factor = count <= 1 ? 0.0 : static_cast<double>(index) / static_cast<double>(count - 1);
    auto channel = [&](std::uint8_t c) -> std::uint8_t {
        if (is_dark_theme) {
            return static_cast<std::uint8_t>(c * (0.3 + 0.7 * factor));
        }
        auto mix = 0.5 + 0.5 * factor;
        return static_cast<std::uint8_t>(c * mix + 255.0 * (1.0 - mix));
    };
    Scene::Argb out{};
    out.a = is_dark_theme ? static_cast<std::uint8_t>(30 + factor * 100)
                          : static_cast<std::uint8_t>(80 + factor * 175);
    out.r = channel(base_color.r);
    out.g = channel(base_color.g);
    out.b = channel(base_color.b);
    return out;
}

auto outside_heal_bounds(double cx, double cy, double width, double height) -> bool {
    return cx < -width * 0.5 || cx > width * 1.5 || cy < -height * 0.8 || cy > height * 1.8;
}

auto make_effect(EffectKind kind) -> std::unique_ptr<EffectGenerator> {
    switch (kind) {
    case EffectKind::Wave:
        return std::make_unique<WaveEffect>();
    case EffectKind::Bubbles:
        return std::make_unique<BubblesEffect>();
    case EffectKind::Blobs:
        return std::make_unique<BlobsEffect>();
    }
    return std::make_unique<WaveEffect>();
}

EffectGenerator::EffectGenerator(std::size_t slot_count)
    : shapes_(slot_count) {}

auto EffectGenerator::initialize(double canvas_width, double canvas_height, std::int32_t seed) -> void {
    if (std::isfinite(canvas_width) && canvas_width > 0.0) {
        canvas_width_ = canvas_width;
    }
    if (std::isfinite(canvas_height) && canvas_height > 0.0) {
        canvas_height_ = canvas_height;
    }
    seed_ = seed;
    reinitialize();
    rebuild_paths();
}

auto EffectGenerator::initialize(double canvas_width, double canvas_height, std::int32_t seed, double variation_offset) -> void {
    variation_offset_ = wrap_variation(variation_offset);
    initialize(canvas_width, canvas_height, seed);
}

auto EffectGenerator::advance(double dt) -> void {
    if (std::isfinite(dt)) {
        time_ += dt * time_scale();
    }
    rebuild_paths();
    if (needs_heal()) {
        vw_log("Shape drifted out of bounds; re-initializing " + std::string(effect_kind_name(kind())) + " layout", "Effect");
        reinitialize();
        rebuild_paths();
    }
}

auto EffectGenerator::set_canvas_size(double width, double height) -> void {
    if (!std::isfinite(width) || width <= 0.0) {
        return;
    }
    if (!std::isfinite(height) || height <= 0.0) {
        return;
    }
    if (std::abs(canvas_width_ - width) < 0.01 && std::abs(canvas_height_ - height) < 0.01) {
        return;
    }
    canvas_width_ = width;
    canvas_height_ = height;
    reinitialize();
    advance(0.0);
}

auto EffectGenerator::set_variation_offset(double offset) -> void {
    variation_offset_ = wrap_variation(offset);
    reinitialize();
    rebuild_paths();
}

auto EffectGenerator::update_color(Scene::Argb base_color, bool is_dark_theme) -> void {
    base_color_ = base_color;
    dark_theme_ = is_dark_theme;
    recolor();
    for (auto& path : paths_) {
        path.fill = fills_[path.shape_index];
    }
}

auto EffectGenerator::active_count() const -> std::size_t {
    return static_cast<std::size_t>(std::count_if(shapes_.begin(), shapes_.end(), [](auto const& s) { return s.active; }));
}

auto EffectGenerator::degraded_count() const -> std::size_t {
    return static_cast<std::size_t>(std::count_if(shapes_.begin(), shapes_.end(), [](auto const& s) { return s.active && s.degraded; }));
}

auto EffectGenerator::drifted_center(std::size_t index) const -> Scene::Point {
    return Scene::Point{shapes_[index].x, shapes_[index].y};
}

auto EffectGenerator::reinitialize() -> void {
    auto width = std::max(canvas_width_, 1.0);
    auto height = std::max(canvas_height_, 1.0);
    DeterministicRng rng(combine_seed(seed_, variation_offset_));
    for (auto& shape : shapes_) {
        shape = ShapeState{};
    }
    layout(rng, width, height);
    ++initializations_;
    if (auto degraded = degraded_count(); degraded > 0) {
        vw_log(std::to_string(degraded) + " " + std::string(effect_kind_name(kind()))
                   + " shape(s) placed without meeting the spacing rule",
               "Effect", "Warning");
    }
    recolor();
}

auto EffectGenerator::recolor() -> void {
    fills_.assign(shapes_.size(), Scene::Argb{0, 0, 0, 0});
    auto count = active_count();
    std::size_t visible_index = 0;
    for (std::size_t i = 0; i < shapes_.size(); ++i) {
        if (!shapes_[i].active) {
            continue;
        }
        fills_[i] = depth_color(base_color_, dark_theme_, visible_index++, count);
    }
}

auto EffectGenerator::rebuild_paths() -> void {
    auto width = std::max(canvas_width_, 1.0);
    auto height = std::max(canvas_height_, 1.0);
    paths_.clear();
    for (std::size_t i = 0; i < shapes_.size(); ++i) {
        if (!shapes_[i].active) {
            continue;
        }
        auto geometry = build_path(i, width, height);
        if (geometry.empty()) {
            continue;
        }
        paths_.push_back(EffectPath{i, std::move(geometry), fills_[i]});
    }
}

auto EffectGenerator::needs_heal() const -> bool {
    auto width = std::max(canvas_width_, 1.0);
    auto height = std::max(canvas_height_, 1.0);
    for (std::size_t i = 0; i < shapes_.size(); ++i) {
        if (!shapes_[i].active) {
            continue;
        }
        auto center = drifted_center(i);
        if (outside_heal_bounds(center.x, center.y, width, height)) {
            return true;
        }
    }
    return false;
}

} // namespace VW::Effects
