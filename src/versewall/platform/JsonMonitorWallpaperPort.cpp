#include <versewall/platform/JsonMonitorWallpaperPort.hpp>

#include "core/FileIO.hpp"
#include "log/TaggedLogger.hpp"

#include <array>
#include <cmath>
#include <cstdint>
#include <limits>

#include <nlohmann/json.hpp>

namespace VW::Platform {
namespace {

using json = nlohmann::json;

auto malformed(std::string message) -> Error {
    return Error{Error::Code::MalformedInput, std::move(message)};
}

// Whole number that fits an int32. Float literals such as 10.0 do not count.
auto read_int32(json const& value) -> std::optional<std::int32_t> {
    if (value.is_number_unsigned()) {
        auto v = value.get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max())) {
            return std::nullopt;
        }
        return static_cast<std::int32_t>(v);
    }
    if (value.is_number_integer()) {
        auto v = value.get<std::int64_t>();
        if (v < std::numeric_limits<std::int32_t>::min() || v > std::numeric_limits<std::int32_t>::max()) {
            return std::nullopt;
        }
        return static_cast<std::int32_t>(v);
    }
    return std::nullopt;
}

// Missing key: nullopt. Present but not [a, b]: an error.
auto read_pair(json const& object, char const* key) -> Expected<std::optional<std::pair<json, json>>> {
    auto it = object.find(key);
    if (it == object.end()) {
        return std::nullopt;
    }
    if (!it->is_array() || it->size() != 2) {
        return std::unexpected(malformed(std::string(key) + " must be a pair"));
    }
    return std::make_pair((*it)[0], (*it)[1]);
}

auto read_rect(json const& item, std::string const& label) -> Expected<Effects::DeviceRect> {
    auto rect = item.find("rect");
    if (rect == item.end() || !rect->is_array() || rect->size() != 4) {
        return std::unexpected(malformed(label + ".rect must be [left, top, right, bottom]"));
    }
    std::array<std::int32_t, 4> edges{};
    for (std::size_t e = 0; e < edges.size(); ++e) {
        auto edge = read_int32((*rect)[e]);
        if (!edge) {
            return std::unexpected(malformed(label + ".rect must hold 32-bit integers"));
        }
        edges[e] = *edge;
    }
    auto width = static_cast<std::int64_t>(edges[2]) - edges[0];
    auto height = static_cast<std::int64_t>(edges[3]) - edges[1];
    if (width <= 0 || height <= 0 || width > std::numeric_limits<std::int32_t>::max()
        || height > std::numeric_limits<std::int32_t>::max()) {
        return std::unexpected(malformed(label + ".rect must have a positive size"));
    }
    return Effects::DeviceRect{edges[0], edges[1], edges[2], edges[3]};
}

auto read_monitor(json const& item, std::size_t index) -> Expected<JsonMonitorWallpaperPort::Monitor> {
    auto label = "monitors[" + std::to_string(index) + "]";
    if (!item.is_object()) {
        return std::unexpected(malformed(label + " must be an object"));
    }

    JsonMonitorWallpaperPort::Monitor monitor;
    if (auto id = item.find("id"); id == item.end()) {
        monitor.id = "monitor-" + std::to_string(index);
    } else if (!id->is_string() || id->get_ref<std::string const&>().empty()) {
        return std::unexpected(malformed(label + ".id must be a non-empty string"));
    } else {
        monitor.id = id->get<std::string>();
    }

    auto rect = read_rect(item, label);
    if (!rect) {
        return std::unexpected(rect.error());
    }
    monitor.rect = *rect;
    monitor.pixel_size = Apply::PixelSize{monitor.rect.width(), monitor.rect.height()};

    auto size = read_pair(item, "pixelSize");
    if (!size) {
        return std::unexpected(malformed(label + ".pixelSize must be [width, height]"));
    }
    if (*size) {
        auto width = read_int32((*size)->first);
        auto height = read_int32((*size)->second);
        if (!width || !height || *width <= 0 || *height <= 0) {
            return std::unexpected(malformed(label + ".pixelSize must hold positive 32-bit integers"));
        }
        monitor.pixel_size = Apply::PixelSize{*width, *height};
    }

    auto scale = read_pair(item, "dpiScale");
    if (!scale) {
        return std::unexpected(malformed(label + ".dpiScale must be [x, y]"));
    }
    if (*scale) {
        auto const& [x, y] = **scale;
        if (!x.is_number() || !y.is_number() || !std::isfinite(x.get<double>()) || !std::isfinite(y.get<double>())
            || x.get<double>() <= 0.0 || y.get<double>() <= 0.0) {
            return std::unexpected(malformed(label + ".dpiScale must hold positive numbers"));
        }
        monitor.dpi_scale = Apply::DpiScale{x.get<double>(), y.get<double>()};
    }
    return monitor;
}

} // namespace

JsonMonitorWallpaperPort::JsonMonitorWallpaperPort(std::vector<Monitor> monitors)
    : monitors_(std::move(monitors)) {}

JsonMonitorWallpaperPort::JsonMonitorWallpaperPort(JsonMonitorWallpaperPort&& other) noexcept
    : monitors_(std::move(other.monitors_)) {
    std::lock_guard<std::mutex> lock(other.mutex_);
    assignments_ = std::move(other.assignments_);
    fill_mode_ = other.fill_mode_;
}

auto JsonMonitorWallpaperPort::from_json(std::string_view text) -> Expected<JsonMonitorWallpaperPort> {
    auto document = json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(malformed("monitor layout is not valid JSON"));
    }
    auto list = document.is_object() ? document.find("monitors") : document.end();
    if (!document.is_object() || list == document.end() || !list->is_array()) {
        return std::unexpected(malformed("monitor layout needs a \"monitors\" array"));
    }

    std::vector<Monitor> monitors;
    monitors.reserve(list->size());
    for (std::size_t i = 0; i < list->size(); ++i) {
        auto monitor = read_monitor((*list)[i], i);
        if (!monitor) {
            return std::unexpected(monitor.error());
        }
        monitors.push_back(std::move(*monitor));
    }
    return JsonMonitorWallpaperPort{std::move(monitors)};
}

auto JsonMonitorWallpaperPort::load(std::filesystem::path const& path) -> Expected<JsonMonitorWallpaperPort> {
    auto text = readTextFile(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    return from_json(*text);
}

auto JsonMonitorWallpaperPort::single_default() -> JsonMonitorWallpaperPort {
    return JsonMonitorWallpaperPort{{Monitor{
        .id = "default",
        .rect = Effects::DeviceRect{0, 0, 1920, 1080},
        .pixel_size = Apply::PixelSize{1920, 1080},
        .dpi_scale = Apply::DpiScale{1.0, 1.0},
    }}};
}

auto JsonMonitorWallpaperPort::find(std::string const& monitor_id) const -> Monitor const* {
    for (auto const& monitor : monitors_) {
        if (monitor.id == monitor_id) {
            return &monitor;
        }
    }
    return nullptr;
}

auto JsonMonitorWallpaperPort::enumerate_monitors() -> Expected<std::vector<std::string>> {
    std::vector<std::string> ids;
    ids.reserve(monitors_.size());
    for (auto const& monitor : monitors_) {
        ids.push_back(monitor.id);
    }
    return ids;
}

auto JsonMonitorWallpaperPort::monitor_rect(std::string const& monitor_id) -> Expected<Effects::DeviceRect> {
    if (auto const* monitor = find(monitor_id)) {
        return monitor->rect;
    }
    return std::unexpected(Error{Error::Code::NotFound, "unknown monitor " + monitor_id});
}

auto JsonMonitorWallpaperPort::monitor_pixel_size(std::string const& monitor_id) -> Expected<Apply::PixelSize> {
    if (auto const* monitor = find(monitor_id)) {
        return monitor->pixel_size;
    }
    return std::unexpected(Error{Error::Code::NotFound, "unknown monitor " + monitor_id});
}

auto JsonMonitorWallpaperPort::monitor_dpi_scale(std::string const& monitor_id) -> Expected<Apply::DpiScale> {
    if (auto const* monitor = find(monitor_id)) {
        return monitor->dpi_scale;
    }
    return std::unexpected(Error{Error::Code::NotFound, "unknown monitor " + monitor_id});
}

auto JsonMonitorWallpaperPort::set_wallpaper(std::optional<std::string> const& monitor_id, std::filesystem::path const& path)
    -> Expected<void> {
    if (monitor_id && find(*monitor_id) == nullptr) {
        return std::unexpected(Error{Error::Code::NotFound, "unknown monitor " + *monitor_id});
    }
    std::lock_guard<std::mutex> lock(mutex_);
    assignments_.push_back(Assignment{monitor_id, path});
    vw_log("Wallpaper " + path.string() + " -> " + monitor_id.value_or("all monitors"), "Port");
    return {};
}

auto JsonMonitorWallpaperPort::set_position(Apply::FillMode mode) -> Expected<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    fill_mode_ = mode;
    return {};
}

auto JsonMonitorWallpaperPort::assignments() const -> std::vector<Assignment> {
    std::lock_guard<std::mutex> lock(mutex_);
    return assignments_;
}

auto JsonMonitorWallpaperPort::fill_mode() const -> std::optional<Apply::FillMode> {
    std::lock_guard<std::mutex> lock(mutex_);
    return fill_mode_;
}

} // namespace VW::Platform
