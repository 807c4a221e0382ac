#pragma once

#include "core/Error.hpp"

#include <versewall/effects/Variation.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace VW::Apply {

enum class FillMode {
    Center,
    Tile,
    Stretch,
    Fit,
    Fill,
    Span,
};

auto fill_mode_name(FillMode mode) -> std::string_view;

struct PixelSize {
    int width = 0;
    int height = 0;
};

struct DpiScale {
    double x = 1.0;
    double y = 1.0;
};

// One monitor as seen at the start of an apply attempt.
struct MonitorTarget {
    std::string          id;
    std::size_t          index = 0;
    Effects::DeviceRect  rect;
    PixelSize            pixel_size;
    DpiScale             dpi_scale;

    [[nodiscard]] auto logical_width() const -> double;
    [[nodiscard]] auto logical_height() const -> double;
};

/**
 * MonitorWallpaperPort - the operating system's wallpaper surface.
 *
 * Contract
 * - enumerate_monitors() lists monitor ids in the platform's order.
 * - set_wallpaper(std::nullopt, path) installs one image on every monitor.
 * - Failures are reported as OSApiRejected (or NotFound for unknown ids);
 *   implementations do not throw for expected platform refusals.
 */
class MonitorWallpaperPort {
public:
    virtual ~MonitorWallpaperPort() = default;

    virtual auto enumerate_monitors() -> Expected<std::vector<std::string>> = 0;
    virtual auto monitor_rect(std::string const& monitor_id) -> Expected<Effects::DeviceRect> = 0;
    virtual auto monitor_pixel_size(std::string const& monitor_id) -> Expected<PixelSize> = 0;
    virtual auto monitor_dpi_scale(std::string const& monitor_id) -> Expected<DpiScale> = 0;
    virtual auto set_wallpaper(std::optional<std::string> const& monitor_id, std::filesystem::path const& path) -> Expected<void> = 0;
    virtual auto set_position(FillMode mode) -> Expected<void> = 0;
};

// Queries every monitor; monitors whose queries fail or whose rect or pixel
// size is empty are logged and left out.
auto query_monitors(MonitorWallpaperPort& port) -> Expected<std::vector<MonitorTarget>>;

// Number of distinct device rectangles among the targets.
auto distinct_rect_count(std::vector<MonitorTarget> const& targets) -> std::size_t;

// The monitor at the virtual-desktop origin, or the first one.
auto primary_target(std::vector<MonitorTarget> const& targets) -> MonitorTarget const*;

} // namespace VW::Apply
