#pragma once

#include "core/Error.hpp"

#include <versewall/render/AtomicFileWriter.hpp>
#include <versewall/scene/RenderSurface.hpp>

#include <filesystem>

namespace VW {
class TaskPool;
}

namespace VW::Render {

/**
 * RenderPipeline - scene to pixels to a PNG on disk.
 *
 * render() rasterizes on the calling thread, which must own the scene.
 * write_png() encodes and writes the temp file on the task pool and waits for
 * the result, so the caller never proceeds with a half-written file.
 */
class RenderPipeline {
public:
    RenderPipeline(Scene::RenderSurface& surface, TaskPool& pool, AtomicFileWriter writer = {});

    auto render(Scene::SceneHandle const& scene, Scene::RenderTarget const& target) -> Expected<Scene::PixelBufferPtr>;
    auto write_png(Scene::PixelBufferPtr const& buffer, std::filesystem::path const& temp_path) const -> Expected<void>;
    auto commit(std::filesystem::path const& temp_path, std::filesystem::path const& final_path) const -> Expected<void>;

    // render() + write_png() + commit() through "<final>.tmp".
    auto render_to_file(Scene::SceneHandle const& scene,
                        Scene::RenderTarget const& target,
                        std::filesystem::path const& final_path) -> Expected<void>;

    [[nodiscard]] auto surface() -> Scene::RenderSurface& { return surface_; }

private:
    Scene::RenderSurface& surface_;
    TaskPool&             pool_;
    AtomicFileWriter      writer_;
};

} // namespace VW::Render
