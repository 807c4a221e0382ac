#pragma once

#include <versewall/effects/EffectGenerator.hpp>

namespace VW::Effects {

class BubblesEffect final : public EffectGenerator {
public:
    BubblesEffect();

    [[nodiscard]] auto kind() const -> EffectKind override { return EffectKind::Bubbles; }

protected:
    auto layout(DeterministicRng& rng, double width, double height) -> void override;
    auto build_path(std::size_t index, double width, double height) const -> Scene::PathGeometry override;
    [[nodiscard]] auto time_scale() const -> double override;
    [[nodiscard]] auto drifted_center(std::size_t index) const -> Scene::Point override;
};

} // namespace VW::Effects
