#include <versewall/render/AtomicFileWriter.hpp>

#include "log/TaggedLogger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <unistd.h>

namespace VW::Render {
namespace {

auto io_error(std::string message, std::filesystem::path const& path) -> Error {
    message.append(" '");
    message.append(path.string());
    message.push_back('\'');
    return Error{Error::Code::TransientIO, std::move(message)};
}

auto errno_suffix() -> std::string {
    return std::string(": ") + std::strerror(errno);
}

auto default_rename(std::filesystem::path const& from, std::filesystem::path const& to) -> std::error_code {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    return ec;
}

} // namespace

AtomicFileWriter::AtomicFileWriter()
    : rename_(default_rename) {}

AtomicFileWriter::AtomicFileWriter(RenameFn rename, bool fsync_data)
    : rename_(rename ? std::move(rename) : RenameFn{default_rename})
    , fsync_data_(fsync_data) {}

auto AtomicFileWriter::write_temp(std::filesystem::path const& temp_path, std::span<std::uint8_t const> data) const
    -> Expected<void> {
    std::error_code ec;
    auto parent = temp_path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(io_error("failed to create directory for", temp_path));
        }
    }

    int fd = ::open(temp_path.c_str(), O_CREAT | O_TRUNC | O_WRONLY | O_CLOEXEC, 0644);
    if (fd < 0) {
        return std::unexpected(io_error("failed to open temp file" + errno_suffix(), temp_path));
    }

    std::size_t total_written = 0;
    while (total_written < data.size()) {
        auto written = ::write(fd, data.data() + total_written, data.size() - total_written);
        if (written < 0 && errno == EINTR) {
            continue;
        }
        if (written <= 0) {
            auto error = io_error("failed to write temp file" + errno_suffix(), temp_path);
            ::close(fd);
            return std::unexpected(std::move(error));
        }
        total_written += static_cast<std::size_t>(written);
    }

    if (fsync_data_ && ::fsync(fd) != 0) {
        auto error = io_error("failed to fsync temp file" + errno_suffix(), temp_path);
        ::close(fd);
        return std::unexpected(std::move(error));
    }
    if (::close(fd) != 0) {
        return std::unexpected(io_error("failed to close temp file" + errno_suffix(), temp_path));
    }
    return {};
}

auto AtomicFileWriter::commit(std::filesystem::path const& temp_path, std::filesystem::path const& final_path) const
    -> Expected<void> {
    auto rename_error = rename_(temp_path, final_path);
    if (!rename_error) {
        return {};
    }

    vw_log("Rename of '" + temp_path.string() + "' failed (" + rename_error.message() + "), copying instead", "Render", "Warning");
    std::error_code ec;
    std::filesystem::copy_file(temp_path, final_path, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return std::unexpected(io_error("failed to copy temp file over", final_path));
    }
    std::filesystem::remove(temp_path, ec);
    if (ec) {
        vw_log("Could not remove temp file '" + temp_path.string() + "': " + ec.message(), "Render", "Warning");
    }
    return {};
}

auto AtomicFileWriter::write(std::filesystem::path const& path, std::span<std::uint8_t const> data) const -> Expected<void> {
    auto temp_path = path;
    temp_path += ".tmp";
    auto done = write_temp(temp_path, data);
    if (done) {
        done = commit(temp_path, path);
    }
    if (!done) {
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
    }
    return done;
}

} // namespace VW::Render
