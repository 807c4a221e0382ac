#include <versewall/app/AppDataPaths.hpp>

#include <cstdlib>

namespace VW::App {

auto process_env(char const* name) -> std::optional<std::string> {
    auto const* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

auto resolve_app_data_paths(EnvLookup const& env) -> Expected<AppDataPaths> {
    if (auto explicit_dir = env("VERSEWALL_DATA_DIR")) {
        return AppDataPaths{std::filesystem::path(*explicit_dir)};
    }
    if (auto xdg = env("XDG_DATA_HOME")) {
        return AppDataPaths{std::filesystem::path(*xdg) / "versewall"};
    }
    if (auto home = env("HOME")) {
        return AppDataPaths{std::filesystem::path(*home) / ".local" / "share" / "versewall"};
    }
    return std::unexpected(Error{Error::Code::NotFound, "no data directory: set VERSEWALL_DATA_DIR or HOME"});
}

} // namespace VW::App
