#pragma once

#include "core/Error.hpp"

#include <versewall/apply/MonitorWallpaperPort.hpp>

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace VW::Platform {

/**
 * Monitor layout described by a JSON file:
 *
 *   {"monitors": [{"id": "DP-1", "rect": [0, 0, 1920, 1080],
 *                  "pixelSize": [1920, 1080], "dpiScale": [1.0, 1.0]}]}
 *
 * pixelSize defaults to the rect size and dpiScale to 1. Ids must be
 * strings; rect edges and pixel sizes must be integers that fit 32 bits and
 * describe a non-empty area. Installs are recorded, not performed; wrap the
 * port in a CommandWallpaperPort to run them.
 */
class JsonMonitorWallpaperPort final : public Apply::MonitorWallpaperPort {
public:
    struct Monitor {
        std::string         id;
        Effects::DeviceRect rect;
        Apply::PixelSize    pixel_size;
        Apply::DpiScale     dpi_scale;
    };

    struct Assignment {
        std::optional<std::string> monitor_id;
        std::filesystem::path      path;
    };

    explicit JsonMonitorWallpaperPort(std::vector<Monitor> monitors);

    [[nodiscard]] static auto from_json(std::string_view text) -> Expected<JsonMonitorWallpaperPort>;
    [[nodiscard]] static auto load(std::filesystem::path const& path) -> Expected<JsonMonitorWallpaperPort>;
    // One 1920x1080 monitor at scale 1.
    [[nodiscard]] static auto single_default() -> JsonMonitorWallpaperPort;

    JsonMonitorWallpaperPort(JsonMonitorWallpaperPort&& other) noexcept;

    auto enumerate_monitors() -> Expected<std::vector<std::string>> override;
    auto monitor_rect(std::string const& monitor_id) -> Expected<Effects::DeviceRect> override;
    auto monitor_pixel_size(std::string const& monitor_id) -> Expected<Apply::PixelSize> override;
    auto monitor_dpi_scale(std::string const& monitor_id) -> Expected<Apply::DpiScale> override;
    auto set_wallpaper(std::optional<std::string> const& monitor_id, std::filesystem::path const& path) -> Expected<void> override;
    auto set_position(Apply::FillMode mode) -> Expected<void> override;

    [[nodiscard]] auto assignments() const -> std::vector<Assignment>;
    [[nodiscard]] auto fill_mode() const -> std::optional<Apply::FillMode>;

private:
    auto find(std::string const& monitor_id) const -> Monitor const*;

    std::vector<Monitor>           monitors_;
    mutable std::mutex             mutex_;
    std::vector<Assignment>        assignments_;
    std::optional<Apply::FillMode> fill_mode_;
};

} // namespace VW::Platform
