#pragma once

#include "core/Error.hpp"

#include <versewall/scene/PixelBuffer.hpp>
#include <versewall/scene/SceneGraph.hpp>
#include <versewall/scene/SceneInputs.hpp>

#include <memory>

namespace VW::Scene {

// Logical canvas plus the physical pixel size and DPI scale it maps to.
struct RenderTarget {
    double logical_width = 0.0;
    double logical_height = 0.0;
    int pixel_width = 0;
    int pixel_height = 0;
    double dpi_scale_x = 1.0;
    double dpi_scale_y = 1.0;
};

using SceneHandle = std::shared_ptr<SceneGraph>;

/**
 * RenderSurface - builds scenes and turns them into pixels.
 *
 * Contract
 * - build_scene() returns a fresh scene for the inputs; it never shares state
 *   with scenes built earlier.
 * - rasterize() runs a layout pass at the target's logical size, then fills
 *   a buffer of exactly pixel_width x pixel_height. Logical coordinates are
 *   scaled by pixel/logical on each axis.
 * - The caller owns the scene for the duration of rasterize(); implementations
 *   do not synchronize access to it.
 * - Implementations may throw; callers are expected to contain that at the
 *   per-target boundary.
 */
class RenderSurface {
public:
    virtual ~RenderSurface() = default;

    virtual auto build_scene(SceneInputs inputs) -> Expected<SceneHandle> = 0;
    virtual auto rasterize(SceneHandle const& scene, RenderTarget const& target) -> Expected<PixelBufferPtr> = 0;
};

auto validate_target(RenderTarget const& target) -> Expected<void>;

// CPU rasterizer over a linear premultiplied float buffer.
class SoftwareRenderSurface final : public RenderSurface {
public:
    auto build_scene(SceneInputs inputs) -> Expected<SceneHandle> override;
    auto rasterize(SceneHandle const& scene, RenderTarget const& target) -> Expected<PixelBufferPtr> override;
};

} // namespace VW::Scene
