#pragma once

#include <versewall/effects/DeterministicRng.hpp>
#include <versewall/effects/ShapeState.hpp>
#include <versewall/scene/Color.hpp>
#include <versewall/scene/DrawCommands.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace VW::Effects {

enum class EffectKind {
    Wave,
    Bubbles,
    Blobs,
};

[[nodiscard]] auto effect_kind_name(EffectKind kind) -> std::string_view;
[[nodiscard]] auto parse_effect_kind(std::string_view name) -> std::optional<EffectKind>;

// Geometry and fill of one active shape at the current time.
struct EffectPath {
    std::size_t shape_index = 0;
    Scene::PathGeometry geometry;
    Scene::Argb fill;
};

/**
 * EffectGenerator - seeded set of decorative shapes sized to a canvas.
 *
 * Identical (seed, variation offset, canvas size) inputs produce identical
 * ShapeState vectors and paths. advance(dt) moves the animation clock and
 * rebuilds paths; initialize() and set_variation_offset() recompute the
 * layout wholesale.
 */
class EffectGenerator {
public:
    virtual ~EffectGenerator() = default;

    [[nodiscard]] virtual auto kind() const -> EffectKind = 0;

    auto initialize(double canvas_width, double canvas_height, std::int32_t seed) -> void;
    // Same, with the variation offset applied in the same pass.
    auto initialize(double canvas_width, double canvas_height, std::int32_t seed, double variation_offset) -> void;
    auto advance(double dt) -> void;
    auto set_canvas_size(double width, double height) -> void;
    auto set_variation_offset(double offset) -> void;
    auto update_color(Scene::Argb base_color, bool is_dark_theme) -> void;

    [[nodiscard]] auto shapes() const -> std::vector<ShapeState> const& { return shapes_; }
    [[nodiscard]] auto paths() const -> std::vector<EffectPath> const& { return paths_; }
    [[nodiscard]] auto active_count() const -> std::size_t;
    [[nodiscard]] auto degraded_count() const -> std::size_t;

    [[nodiscard]] auto canvas_width() const -> double { return canvas_width_; }
    [[nodiscard]] auto canvas_height() const -> double { return canvas_height_; }
    [[nodiscard]] auto seed() const -> std::int32_t { return seed_; }
    [[nodiscard]] auto variation_offset() const -> double { return variation_offset_; }
    [[nodiscard]] auto time() const -> double { return time_; }
    [[nodiscard]] auto initialization_count() const -> std::size_t { return initializations_; }

protected:
    explicit EffectGenerator(std::size_t slot_count);

    // Recomputes shapes_ from a fresh stream; the canvas is at least 1x1.
    virtual auto layout(DeterministicRng& rng, double width, double height) -> void = 0;
    // Geometry for shapes_[index] at time_.
    virtual auto build_path(std::size_t index, double width, double height) const -> Scene::PathGeometry = 0;
    // Animation clock rate applied to dt.
    [[nodiscard]] virtual auto time_scale() const -> double = 0;
    // Current drifted center of shapes_[index], used for the runaway check.
    [[nodiscard]] virtual auto drifted_center(std::size_t index) const -> Scene::Point;

    std::vector<ShapeState> shapes_;
    double time_ = 0.0;

private:
    auto reinitialize() -> void;
    auto rebuild_paths() -> void;
    auto recolor() -> void;
    [[nodiscard]] auto needs_heal() const -> bool;

    std::vector<EffectPath> paths_;
    std::vector<Scene::Argb> fills_;
    double canvas_width_ = 1.0;
    double canvas_height_ = 1.0;
    std::int32_t seed_ = 0;
    double variation_offset_ = 0.0;
    Scene::Argb base_color_ = Scene::rgb(0x26, 0xA6, 0x9A);
    bool dark_theme_ = false;
    std::size_t initializations_ = 0;
};

// Depth-graded fill for the index-th of count active shapes.
[[nodiscard]] auto depth_color(Scene::Argb base_color, bool is_dark_theme, std::size_t index, std::size_t count) -> Scene::Argb;

// True when a drifted center has run away from the canvas.
[[nodiscard]] auto outside_heal_bounds(double cx, double cy, double width, double height) -> bool;

[[nodiscard]] auto make_effect(EffectKind kind) -> std::unique_ptr<EffectGenerator>;

} // namespace VW::Effects
