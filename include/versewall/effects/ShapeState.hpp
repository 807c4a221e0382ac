#pragma once

#include <cstdint>

namespace VW::Effects {

// Placement and animation parameters for one decorative primitive.
struct ShapeState {
    double x = 0.0;
    double y = 0.0;
    double radius = 0.0;
    double phase = 0.0;
    double drift = 0.0;
    int segments = 0;

    double rotation = 0.0;
    double stretch_x = 1.0;
    double stretch_y = 1.0;

    double a2 = 0.0;
    double a3 = 0.0;
    double a5 = 0.0;
    double p2 = 0.0;
    double p3 = 0.0;
    double p5 = 0.0;

    // Bubbles only.
    double drift_x = 0.0;
    double drift_y = 0.0;
    double pulse = 0.0;

    bool active = false;
    // Placed after the attempt budget ran out; may violate the spacing rule.
    bool degraded = false;

    friend auto operator==(ShapeState const&, ShapeState const&) -> bool = default;
};

} // namespace VW::Effects
