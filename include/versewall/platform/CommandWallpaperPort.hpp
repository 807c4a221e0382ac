#pragma once

#include "core/Error.hpp"

#include <versewall/apply/MonitorWallpaperPort.hpp>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace VW::Platform {

// Runs a command line through /bin/sh -c and returns its exit status
// (128 + signal for signalled children, -1 when it could not be started).
using CommandRunner = std::function<int(std::string const& command)>;

auto run_shell_command(std::string const& command) -> int;

// Single-quotes text for /bin/sh.
auto shell_quote(std::string_view text) -> std::string;

/**
 * Expands a command template. "{path}" becomes the quoted image path and
 * "{monitor}" the quoted monitor id ("" when installing on every monitor).
 * "{mode}" becomes the fill-mode name last passed to set_position.
 */
auto expand_command(std::string_view pattern,
                    std::filesystem::path const& path,
                    std::optional<std::string> const& monitor_id,
                    Apply::FillMode mode) -> std::string;

/**
 * CommandWallpaperPort - installs wallpapers by running a user command.
 *
 * Monitor geometry queries are forwarded to the wrapped port. Each
 * set_wallpaper call expands the template and runs it; a non-zero exit
 * status is reported as OSApiRejected.
 */
class CommandWallpaperPort final : public Apply::MonitorWallpaperPort {
public:
    CommandWallpaperPort(Apply::MonitorWallpaperPort& geometry,
                         std::string                  command_template,
                         CommandRunner                runner = run_shell_command);

    auto enumerate_monitors() -> Expected<std::vector<std::string>> override;
    auto monitor_rect(std::string const& monitor_id) -> Expected<Effects::DeviceRect> override;
    auto monitor_pixel_size(std::string const& monitor_id) -> Expected<Apply::PixelSize> override;
    auto monitor_dpi_scale(std::string const& monitor_id) -> Expected<Apply::DpiScale> override;
    auto set_wallpaper(std::optional<std::string> const& monitor_id, std::filesystem::path const& path) -> Expected<void> override;
    auto set_position(Apply::FillMode mode) -> Expected<void> override;

private:
    Apply::MonitorWallpaperPort& geometry_;
    std::string                  command_template_;
    CommandRunner                runner_;
    Apply::FillMode              mode_ = Apply::FillMode::Fill;
};

} // namespace VW::Platform
