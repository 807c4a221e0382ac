#include <versewall/scene/RenderSurface.hpp>
#include <versewall/text/FontFace.hpp>

#include "RasterDetail.hpp"
#include "log/TaggedLogger.hpp"

#include <cmath>
#include <new>
#include <string>
#include <type_traits>

namespace VW::Scene {
namespace {

using RasterDetail::CoverageRasterizer;
using RasterDetail::Transform;

// Horizontal offset of the second pass of a synthetic bold glyph, in ems.
constexpr double kSyntheticBoldOffsetEm = 0.035;

auto make_error(std::string message, Error::Code code) -> Error {
    return Error{code, std::move(message)};
}

auto draw_glyph_run(GlyphRunCommand const& command, CoverageRasterizer& raster, Transform const& canvas) -> void {
    if (command.glyphs.empty()) {
        return;
    }
    if (!command.font || !command.font->has_outlines()) {
        vw_log("Skipping " + std::to_string(command.glyphs.size()) + " glyphs: the face has no outlines", "Render", "Warning");
        return;
    }
    auto color = RasterDetail::make_linear_color(command.color);
    auto size = static_cast<double>(command.font_size);
    for (auto const& glyph : command.glyphs) {
        auto outline = command.font->outline(glyph.glyph_id);
        if (outline.empty()) {
            continue;
        }
        Transform transform{
            .scale_x = size * canvas.scale_x,
            .scale_y = size * canvas.scale_y,
            .offset_x = glyph.x * canvas.scale_x,
            .offset_y = glyph.y * canvas.scale_y,
        };
        raster.fill_path(outline, transform, FillRule::NonZero, color);
        if (command.synthetic_bold) {
            transform.offset_x += kSyntheticBoldOffsetEm * size * canvas.scale_x;
            raster.fill_path(outline, transform, FillRule::NonZero, color);
        }
    }
}

auto draw_command(DrawCommand const& command, CoverageRasterizer& raster, Transform const& canvas) -> void {
    std::visit(
        [&](auto const& cmd) {
            using T = std::decay_t<decltype(cmd)>;
            if constexpr (std::is_same_v<T, RectCommand>) {
                raster.fill_rect(cmd.min_x * canvas.scale_x,
                                 cmd.min_y * canvas.scale_y,
                                 cmd.max_x * canvas.scale_x,
                                 cmd.max_y * canvas.scale_y,
                                 RasterDetail::make_linear_color(cmd.color));
            } else if constexpr (std::is_same_v<T, RoundedRectCommand>) {
                auto path = RasterDetail::rounded_rect_path(cmd.min_x, cmd.min_y, cmd.max_x, cmd.max_y, cmd.radius);
                raster.fill_path(path, canvas, FillRule::NonZero, RasterDetail::make_linear_color(cmd.color));
            } else if constexpr (std::is_same_v<T, PathCommand>) {
                raster.fill_path(cmd.path, canvas, cmd.fill_rule, RasterDetail::make_linear_color(cmd.fill_color));
            } else {
                draw_glyph_run(cmd, raster, canvas);
            }
        },
        command);
}

} // namespace

auto validate_target(RenderTarget const& target) -> Expected<void> {
    if (!std::isfinite(target.logical_width) || !std::isfinite(target.logical_height)
        || target.logical_width <= 0.0 || target.logical_height <= 0.0) {
        return std::unexpected(make_error("render target logical size must be positive", Error::Code::InvalidArgument));
    }
    if (target.pixel_width <= 0 || target.pixel_height <= 0) {
        return std::unexpected(make_error("render target pixel size must be positive", Error::Code::InvalidArgument));
    }
    return {};
}

auto SoftwareRenderSurface::build_scene(SceneInputs inputs) -> Expected<SceneHandle> {
    return std::make_shared<SceneGraph>(std::move(inputs));
}

auto SoftwareRenderSurface::rasterize(SceneHandle const& scene, RenderTarget const& target) -> Expected<PixelBufferPtr> {
    if (!scene) {
        return std::unexpected(make_error("rasterize called without a scene", Error::Code::InvalidArgument));
    }
    if (auto valid = validate_target(target); !valid) {
        return std::unexpected(valid.error());
    }

    try {
        auto const& draw_list = scene->layout(target.logical_width, target.logical_height);
        Transform canvas{
            .scale_x = static_cast<double>(target.pixel_width) / target.logical_width,
            .scale_y = static_cast<double>(target.pixel_height) / target.logical_height,
        };
        CoverageRasterizer raster{target.pixel_width, target.pixel_height};
        for (auto const& command : draw_list.commands) {
            draw_command(command, raster, canvas);
        }
        auto buffer = std::make_shared<PixelBuffer>(raster.encode());
        vw_log("Rasterized " + std::to_string(target.pixel_width) + "x" + std::to_string(target.pixel_height)
                   + " from " + std::to_string(draw_list.commands.size()) + " commands",
               "Render");
        return PixelBufferPtr{std::move(buffer)};
    } catch (std::bad_alloc const&) {
        return std::unexpected(make_error("out of memory rasterizing "
                                              + std::to_string(target.pixel_width) + "x"
                                              + std::to_string(target.pixel_height),
                                          Error::Code::RenderFailed));
    } catch (std::exception const& ex) {
        return std::unexpected(make_error(std::string("rasterize failed: ") + ex.what(), Error::Code::RenderFailed));
    }
}

} // namespace VW::Scene
