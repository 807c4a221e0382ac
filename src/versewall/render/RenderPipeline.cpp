#include <versewall/render/PngEncoder.hpp>
#include <versewall/render/RenderPipeline.hpp>

#include "log/TaggedLogger.hpp"
#include "task/TaskPool.hpp"

#include <exception>
#include <string>

namespace VW::Render {

RenderPipeline::RenderPipeline(Scene::RenderSurface& surface, TaskPool& pool, AtomicFileWriter writer)
    : surface_(surface)
    , pool_(pool)
    , writer_(std::move(writer)) {}

auto RenderPipeline::render(Scene::SceneHandle const& scene, Scene::RenderTarget const& target)
    -> Expected<Scene::PixelBufferPtr> {
    if (auto valid = Scene::validate_target(target); !valid) {
        return std::unexpected(valid.error());
    }
    auto buffer = surface_.rasterize(scene, target);
    if (!buffer) {
        return buffer;
    }
    auto const& pixels = **buffer;
    if (pixels.width != target.pixel_width || pixels.height != target.pixel_height) {
        return std::unexpected(Error{Error::Code::RenderFailed,
                                     "surface produced " + std::to_string(pixels.width) + "x" + std::to_string(pixels.height)
                                         + " for a " + std::to_string(target.pixel_width) + "x"
                                         + std::to_string(target.pixel_height) + " target"});
    }
    return buffer;
}

auto RenderPipeline::write_png(Scene::PixelBufferPtr const& buffer, std::filesystem::path const& temp_path) const
    -> Expected<void> {
    if (!buffer) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "no pixel buffer to write"});
    }
    auto job = pool_.async([buffer, temp_path, writer = writer_]() -> Expected<void> {
        auto encoded = encode_png(*buffer);
        if (!encoded) {
            return std::unexpected(encoded.error());
        }
        return writer.write_temp(temp_path, *encoded);
    });
    if (!job) {
        return std::unexpected(job.error());
    }
    try {
        return job->get();
    } catch (std::exception const& ex) {
        return std::unexpected(Error{Error::Code::TransientIO, std::string("png write failed: ") + ex.what()});
    }
}

auto RenderPipeline::commit(std::filesystem::path const& temp_path, std::filesystem::path const& final_path) const
    -> Expected<void> {
    return writer_.commit(temp_path, final_path);
}

auto RenderPipeline::render_to_file(Scene::SceneHandle const& scene,
                                    Scene::RenderTarget const& target,
                                    std::filesystem::path const& final_path) -> Expected<void> {
    auto buffer = render(scene, target);
    if (!buffer) {
        return std::unexpected(buffer.error());
    }
    auto temp_path = final_path;
    temp_path += ".tmp";
    if (auto written = write_png(*buffer, temp_path); !written) {
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        return written;
    }
    if (auto committed = commit(temp_path, final_path); !committed) {
        return committed;
    }
    vw_log("Wrote " + final_path.string(), "Render");
    return {};
}

} // namespace VW::Render
