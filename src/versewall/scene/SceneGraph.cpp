#include <versewall/scene/SceneGraph.hpp>
#include <versewall/effects/Variation.hpp>

#include <cmath>

namespace VW::Scene {

SceneGraph::SceneGraph(SceneInputs inputs)
    : inputs_(std::move(inputs))
    , effect_(Effects::make_effect(inputs_.effect))
    , base_variation_(Effects::variation_from_seed(inputs_.seed))
    , variation_(base_variation_) {
    effect_->update_color(inputs_.effect_color, inputs_.dark_theme);
}

auto SceneGraph::layout(double logical_width, double logical_height) -> DrawList const& {
    auto effect_height = CompositionSurface::effect_canvas_height(inputs_.effect, logical_height);
    auto resized = std::abs(effect_width_ - logical_width) >= 0.01 || std::abs(effect_height_ - effect_height) >= 0.01;
    if (!effect_initialized_ || variation_pending_ || resized) {
        effect_->initialize(logical_width, effect_height, inputs_.seed, variation_);
        effect_initialized_ = true;
        variation_pending_ = false;
        effect_width_ = logical_width;
        effect_height_ = effect_height;
    }
    draw_list_ = composition_.compose(inputs_, effect_->paths(), logical_width, logical_height);
    ++layout_count_;
    return draw_list_;
}

auto SceneGraph::set_variation_offset(double offset) -> void {
    auto wrapped = Effects::wrap_variation(offset);
    if (wrapped != variation_) {
        variation_ = wrapped;
        variation_pending_ = true;
    }
}

auto SceneGraph::variation_offset() const -> double {
    return variation_;
}

} // namespace VW::Scene
