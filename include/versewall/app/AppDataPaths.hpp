#pragma once

#include "core/Error.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace VW::App {

// Where versewall keeps its files.
struct AppDataPaths {
    std::filesystem::path root;

    [[nodiscard]] auto settings_file() const -> std::filesystem::path { return root / "settings.json"; }
    [[nodiscard]] auto poem_cache_file() const -> std::filesystem::path { return root / "poetry_cache.json"; }
    [[nodiscard]] auto palette_file() const -> std::filesystem::path { return root / "traditional_colors.json"; }
    [[nodiscard]] auto log_file() const -> std::filesystem::path { return root / "debug.log"; }
    // Wallpaper images and their temp files.
    [[nodiscard]] auto wallpaper_dir() const -> std::filesystem::path { return root; }
};

using EnvLookup = std::function<std::optional<std::string>(char const*)>;

auto process_env(char const* name) -> std::optional<std::string>;

// $VERSEWALL_DATA_DIR, then $XDG_DATA_HOME/versewall, then
// $HOME/.local/share/versewall. NotFound when none is set.
auto resolve_app_data_paths(EnvLookup const& env = process_env) -> Expected<AppDataPaths>;

} // namespace VW::App
