#pragma once

#include "core/Error.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>
#include <system_error>

namespace VW::Render {

/**
 * AtomicFileWriter - two-phase file replacement.
 *
 * write_temp() creates the parent directory, writes the bytes to a temp path,
 * optionally fsyncs and closes it. commit() renames the temp file over the
 * canonical path. When the rename is refused the temp file is copied over the
 * canonical path and then removed.
 *
 * Readers of the canonical path see either the previous content or the new
 * content, except in the copy fallback where the platform offers nothing
 * better.
 */
class AtomicFileWriter {
public:
    using RenameFn = std::function<std::error_code(std::filesystem::path const&, std::filesystem::path const&)>;

    AtomicFileWriter();
    explicit AtomicFileWriter(RenameFn rename, bool fsync_data = true);

    auto write_temp(std::filesystem::path const& temp_path, std::span<std::uint8_t const> data) const -> Expected<void>;
    auto commit(std::filesystem::path const& temp_path, std::filesystem::path const& final_path) const -> Expected<void>;

    // write_temp() to "<path>.tmp" followed by commit(). On failure the temp
    // file is removed and the canonical file keeps its previous bytes.
    auto write(std::filesystem::path const& path, std::span<std::uint8_t const> data) const -> Expected<void>;

private:
    RenameFn rename_;
    bool     fsync_data_ = true;
};

} // namespace VW::Render
