#include <versewall/platform/CommandWallpaperPort.hpp>

#include "log/TaggedLogger.hpp"

#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace VW::Platform {

auto run_shell_command(std::string const& command) -> int {
    auto child = fork();
    if (child == -1) {
        vw_log(std::string("fork failed: ") + std::strerror(errno), "Port", "Error");
        return -1;
    }
    if (child == 0) {
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }
    int status = 0;
    while (waitpid(child, &status, 0) == -1) {
        if (errno != EINTR) {
            vw_log(std::string("waitpid failed: ") + std::strerror(errno), "Port", "Error");
            return -1;
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

auto shell_quote(std::string_view text) -> std::string {
    std::string quoted;
    quoted.reserve(text.size() + 2);
    quoted.push_back('\'');
    for (char ch : text) {
        if (ch == '\'') {
            quoted.append("'\\''");
        } else {
            quoted.push_back(ch);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

auto expand_command(std::string_view pattern,
                    std::filesystem::path const& path,
                    std::optional<std::string> const& monitor_id,
                    Apply::FillMode mode) -> std::string {
    struct Placeholder {
        std::string_view key;
        std::string      value;
    };
    Placeholder const placeholders[] = {
        {"{path}", shell_quote(path.string())},
        {"{monitor}", shell_quote(monitor_id.value_or(std::string{}))},
        {"{mode}", std::string(Apply::fill_mode_name(mode))},
    };

    std::string out;
    std::size_t i = 0;
    while (i < pattern.size()) {
        bool replaced = false;
        if (pattern[i] == '{') {
            for (auto const& placeholder : placeholders) {
                if (pattern.substr(i, placeholder.key.size()) == placeholder.key) {
                    out.append(placeholder.value);
                    i += placeholder.key.size();
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) {
            out.push_back(pattern[i]);
            ++i;
        }
    }
    return out;
}

CommandWallpaperPort::CommandWallpaperPort(Apply::MonitorWallpaperPort& geometry,
                                           std::string                  command_template,
                                           CommandRunner                runner)
    : geometry_(geometry)
    , command_template_(std::move(command_template))
    , runner_(std::move(runner)) {}

auto CommandWallpaperPort::enumerate_monitors() -> Expected<std::vector<std::string>> {
    return geometry_.enumerate_monitors();
}

auto CommandWallpaperPort::monitor_rect(std::string const& monitor_id) -> Expected<Effects::DeviceRect> {
    return geometry_.monitor_rect(monitor_id);
}

auto CommandWallpaperPort::monitor_pixel_size(std::string const& monitor_id) -> Expected<Apply::PixelSize> {
    return geometry_.monitor_pixel_size(monitor_id);
}

auto CommandWallpaperPort::monitor_dpi_scale(std::string const& monitor_id) -> Expected<Apply::DpiScale> {
    return geometry_.monitor_dpi_scale(monitor_id);
}

auto CommandWallpaperPort::set_wallpaper(std::optional<std::string> const& monitor_id, std::filesystem::path const& path)
    -> Expected<void> {
    auto command = expand_command(command_template_, path, monitor_id, mode_);
    vw_log("Running: " + command, "Port");
    auto status = runner_(command);
    if (status != 0) {
        return std::unexpected(Error{Error::Code::OSApiRejected,
                                     "install command exited with status " + std::to_string(status)});
    }
    return geometry_.set_wallpaper(monitor_id, path);
}

auto CommandWallpaperPort::set_position(Apply::FillMode mode) -> Expected<void> {
    mode_ = mode;
    return geometry_.set_position(mode);
}

} // namespace VW::Platform
