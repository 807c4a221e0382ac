#pragma once

#include "core/Error.hpp"

#include <versewall/poem/PoemContent.hpp>
#include <versewall/render/AtomicFileWriter.hpp>

#include <filesystem>

namespace VW::Poem {

// The last poem shown, kept on disk so a restart without network still has one.
class PoemCache {
public:
    explicit PoemCache(std::filesystem::path path);

    auto load() const -> Expected<PoemContent>;
    auto save(PoemContent const& poem) const -> Expected<void>;

    [[nodiscard]] auto path() const -> std::filesystem::path const& { return path_; }

private:
    std::filesystem::path    path_;
    Render::AtomicFileWriter writer_;
};

} // namespace VW::Poem
