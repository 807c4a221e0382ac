#pragma once

#include <versewall/effects/EffectGenerator.hpp>
#include <versewall/scene/CompositionSurface.hpp>
#include <versewall/scene/DrawCommands.hpp>
#include <versewall/scene/SceneInputs.hpp>

#include <memory>

namespace VW::Scene {

/**
 * Retained scene: the inputs, the live effect generator and the draw list of
 * the most recent layout pass.
 *
 * Not thread-safe; whoever drives a render owns the graph for the duration.
 */
class SceneGraph {
public:
    explicit SceneGraph(SceneInputs inputs);

    [[nodiscard]] auto inputs() const -> SceneInputs const& { return inputs_; }

    // Lays out effect and text for a logical canvas and returns the result.
    // The effect is (re)initialized here, once per change of canvas size or
    // variation offset.
    auto layout(double logical_width, double logical_height) -> DrawList const&;

    // Takes effect at the next layout().
    auto set_variation_offset(double offset) -> void;
    [[nodiscard]] auto variation_offset() const -> double;
    // Offset derived from the seed alone, used when no monitor perturbation applies.
    [[nodiscard]] auto base_variation_offset() const -> double { return base_variation_; }

    [[nodiscard]] auto effect() -> Effects::EffectGenerator& { return *effect_; }
    [[nodiscard]] auto effect() const -> Effects::EffectGenerator const& { return *effect_; }
    [[nodiscard]] auto draw_list() const -> DrawList const& { return draw_list_; }
    [[nodiscard]] auto layout_count() const -> std::size_t { return layout_count_; }

private:
    SceneInputs inputs_;
    std::unique_ptr<Effects::EffectGenerator> effect_;
    CompositionSurface composition_;
    DrawList draw_list_;
    double base_variation_ = 0.0;
    double variation_ = 0.0;
    bool effect_initialized_ = false;
    bool variation_pending_ = false;
    double effect_width_ = 0.0;
    double effect_height_ = 0.0;
    std::size_t layout_count_ = 0;
};

} // namespace VW::Scene
