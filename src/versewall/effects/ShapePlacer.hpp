#pragma once

#include <versewall/effects/DeterministicRng.hpp>

#include <vector>

namespace VW::Effects {

struct PlacementParams {
    double min_radius_factor = 0.08;
    double max_radius_factor = 0.30;
    double padding_factor = 0.012;
    double anchor_chance = 0.30;
    double anchor_min_factor = 0.18;
    double anchor_span_factor = 0.22;
    double edge_offset_min = 0.22;
    double edge_offset_span = 0.40;
    int max_attempts = 70;
};

struct Placement {
    double x = 0.0;
    double y = 0.0;
    double radius = 0.0;
    bool degraded = false;
};

// Rejection sampler enforcing distance >= r1 + r2 + padding between placed circles.
class ShapePlacer {
public:
    ShapePlacer(double width, double height, PlacementParams const& params);

    auto place(DeterministicRng& rng, bool prefer_edge) -> Placement;

    [[nodiscard]] auto padding() const -> double { return padding_; }

private:
    struct Circle {
        double x;
        double y;
        double radius;
    };

    auto next_radius(DeterministicRng& rng) const -> double;
    auto candidate(DeterministicRng& rng, bool prefer_edge, double radius) const -> Circle;
    // Largest shortfall against the spacing rule; <= 0 means the candidate fits.
    [[nodiscard]] auto worst_overlap(Circle const& c) const -> double;

    double width_;
    double height_;
    double min_dim_;
    double min_radius_;
    double max_radius_;
    double padding_;
    PlacementParams params_;
    std::vector<Circle> placed_;
};

} // namespace VW::Effects
