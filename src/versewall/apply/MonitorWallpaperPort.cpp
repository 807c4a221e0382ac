#include <versewall/apply/MonitorWallpaperPort.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace VW::Apply {

auto fill_mode_name(FillMode mode) -> std::string_view {
    switch (mode) {
    case FillMode::Center:
        return "center";
    case FillMode::Tile:
        return "tile";
    case FillMode::Stretch:
        return "stretch";
    case FillMode::Fit:
        return "fit";
    case FillMode::Fill:
        return "fill";
    case FillMode::Span:
        return "span";
    }
    return "fill";
}

auto MonitorTarget::logical_width() const -> double {
    return pixel_size.width / std::max(dpi_scale.x, 0.01);
}

auto MonitorTarget::logical_height() const -> double {
    return pixel_size.height / std::max(dpi_scale.y, 0.01);
}

auto query_monitors(MonitorWallpaperPort& port) -> Expected<std::vector<MonitorTarget>> {
    auto ids = port.enumerate_monitors();
    if (!ids) {
        return std::unexpected(ids.error());
    }

    std::vector<MonitorTarget> targets;
    for (std::size_t i = 0; i < ids->size(); ++i) {
        auto const& id = (*ids)[i];
        if (id.empty()) {
            continue;
        }
        auto rect = port.monitor_rect(id);
        auto size = port.monitor_pixel_size(id);
        auto scale = port.monitor_dpi_scale(id);
        if (!rect || !size || !scale) {
            auto const& error = !rect ? rect.error() : (!size ? size.error() : scale.error());
            vw_log("Monitor[" + std::to_string(i) + "] " + id + " query failed: " + describeError(error), "Port", "Warning");
            continue;
        }
        if (rect->empty() || size->width <= 0 || size->height <= 0) {
            vw_log("Monitor[" + std::to_string(i) + "] " + id + " has an empty geometry, skipped", "Port", "Warning");
            continue;
        }
        targets.push_back(MonitorTarget{
            .id = id,
            .index = i,
            .rect = *rect,
            .pixel_size = *size,
            .dpi_scale = *scale,
        });
    }
    return targets;
}

auto distinct_rect_count(std::vector<MonitorTarget> const& targets) -> std::size_t {
    std::vector<Effects::DeviceRect> seen;
    for (auto const& target : targets) {
        if (std::find(seen.begin(), seen.end(), target.rect) == seen.end()) {
            seen.push_back(target.rect);
        }
    }
    return seen.size();
}

auto primary_target(std::vector<MonitorTarget> const& targets) -> MonitorTarget const* {
    if (targets.empty()) {
        return nullptr;
    }
    for (auto const& target : targets) {
        if (target.rect.left == 0 && target.rect.top == 0) {
            return &target;
        }
    }
    return &targets.front();
}

} // namespace VW::Apply
