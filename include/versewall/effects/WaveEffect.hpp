#pragma once

#include <versewall/effects/EffectGenerator.hpp>

namespace VW::Effects {

class WaveEffect final : public EffectGenerator {
public:
    WaveEffect();

    [[nodiscard]] auto kind() const -> EffectKind override { return EffectKind::Wave; }

protected:
    auto layout(DeterministicRng& rng, double width, double height) -> void override;
    auto build_path(std::size_t index, double width, double height) const -> Scene::PathGeometry override;
    [[nodiscard]] auto time_scale() const -> double override;
};

} // namespace VW::Effects
