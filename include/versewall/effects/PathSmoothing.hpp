#pragma once

#include <versewall/scene/DrawCommands.hpp>

#include <span>
#include <vector>

namespace VW::Effects {

// One Chaikin corner-cutting pass over a closed polygon (quarter/three-quarter split).
[[nodiscard]] auto chaikin_closed(std::span<Scene::Point const> points) -> std::vector<Scene::Point>;

// Closed cubic Bezier through every point; control handles are neighbour
// differences scaled by 1/10. Returns an empty path for fewer than 4 points.
[[nodiscard]] auto closed_bezier_through(std::span<Scene::Point const> points) -> Scene::PathGeometry;

// Closed circle as four cubic arcs.
[[nodiscard]] auto circle_path(Scene::Point center, double radius) -> Scene::PathGeometry;

// Band whose top edge passes through samples (left to right), smoothed with
// quadratic midpoint interpolation and closed down to bottom_y.
[[nodiscard]] auto smoothed_band(std::span<Scene::Point const> samples, double bottom_y) -> Scene::PathGeometry;

} // namespace VW::Effects
