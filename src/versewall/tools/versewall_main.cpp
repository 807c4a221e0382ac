#include "cli/ToolOptions.hpp"
#include "log/TaggedLogger.hpp"
#include "task/TaskPool.hpp"

#include <versewall/app/AppDataPaths.hpp>
#include <versewall/app/WallpaperService.hpp>
#include <versewall/apply/ApplyCoordinator.hpp>
#include <versewall/platform/CommandWallpaperPort.hpp>
#include <versewall/platform/JsonMonitorWallpaperPort.hpp>
#include <versewall/render/RenderPipeline.hpp>
#include <versewall/scene/RenderSurface.hpp>
#include <versewall/settings/EntropySource.hpp>
#include <versewall/settings/SettingsStore.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

namespace {

std::atomic<bool> g_should_stop = false;

void handle_signal(int) {
    g_should_stop.store(true);
}

// Without --verbose only warnings, errors and notices reach stderr.
auto configure_logging(VW::Cli::ToolOptions const& options) -> void {
    auto& log = VW::logger();
    if (!options.verbose) {
        log.setStderrEnabled(false);
        log.setSink([](VW::TaggedLogger::LogMessage const& message, std::string const& line) {
            if (message.tags.contains("Warning") || message.tags.contains("Error") || message.tags.contains("Notice")) {
                std::lock_guard<std::mutex> lock(VW::TaggedLogger::coutMutex);
                std::cerr << line << '\n';
            }
        });
    }
    if (!options.log_file.empty() && !log.openLogFile(options.log_file)) {
        std::cerr << "versewall: cannot open log file " << options.log_file << '\n';
    }
}

auto exit_code(VW::Apply::ApplyReport const& report) -> int {
    return report.succeeded() ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace

int main(int argc, char** argv) {
    auto options_opt = VW::Cli::parse_tool_options(argc, argv);
    if (!options_opt) {
        VW::Cli::print_tool_usage(std::cerr);
        return EXIT_FAILURE;
    }
    auto options = *options_opt;
    if (options.show_help) {
        VW::Cli::print_tool_usage(std::cout);
        return EXIT_SUCCESS;
    }

    VW::set_thread_name("Main");
    configure_logging(options);

    std::filesystem::path settings_path = options.settings_file;
    std::filesystem::path output_dir = options.output_dir;
    std::optional<VW::App::AppDataPaths> data_paths;
    if (settings_path.empty() || output_dir.empty()) {
        auto resolved = VW::App::resolve_app_data_paths();
        if (!resolved) {
            std::cerr << "versewall: " << VW::describeError(resolved.error())
                      << " (pass --settings and --output-dir, or set VERSEWALL_DATA_DIR)\n";
            return EXIT_FAILURE;
        }
        data_paths = *resolved;
        if (settings_path.empty()) {
            settings_path = data_paths->settings_file();
        }
        if (output_dir.empty()) {
            output_dir = data_paths->wallpaper_dir();
        }
        if (options.log_file.empty() && !VW::logger().openLogFile(data_paths->log_file())) {
            std::cerr << "versewall: cannot open log file " << data_paths->log_file() << '\n';
        }
    }

    VW::Settings::SettingsStore store{settings_path};
    if (auto loaded = store.load(); !loaded && loaded.error().code != VW::Error::Code::NotFound) {
        vw_log("Settings not loaded: " + VW::describeError(loaded.error()), "Settings", "Warning");
    }
    VW::Settings::SystemEntropy entropy;
    if (options.seed || options.effect) {
        auto updated = store.update([&](VW::Settings::AppSettings& settings) {
            if (options.seed) {
                settings.background_seed = *options.seed;
            }
            if (options.effect) {
                settings.background_effect = *options.effect;
            }
        });
        if (!updated) {
            vw_log("Settings not saved: " + VW::describeError(updated.error()), "Settings", "Warning");
        }
    }
    if (auto seed = VW::Settings::ensure_seed(store, entropy); !seed) {
        vw_log("Seed not persisted: " + VW::describeError(seed.error()), "Settings", "Warning");
    }

    auto geometry = [&]() -> std::optional<VW::Platform::JsonMonitorWallpaperPort> {
        if (options.monitors_file.empty()) {
            return VW::Platform::JsonMonitorWallpaperPort::single_default();
        }
        auto loaded = VW::Platform::JsonMonitorWallpaperPort::load(options.monitors_file);
        if (!loaded) {
            std::cerr << "versewall: " << VW::describeError(loaded.error()) << '\n';
            return std::nullopt;
        }
        return std::move(*loaded);
    }();
    if (!geometry) {
        return EXIT_FAILURE;
    }
    std::unique_ptr<VW::Platform::CommandWallpaperPort> command_port;
    VW::Apply::MonitorWallpaperPort* port = &*geometry;
    if (!options.install_command.empty()) {
        command_port = std::make_unique<VW::Platform::CommandWallpaperPort>(*geometry, options.install_command);
        port = command_port.get();
    }

    std::vector<std::filesystem::path> palette_candidates;
    if (data_paths) {
        palette_candidates.push_back(data_paths->palette_file());
    }
    palette_candidates.push_back(output_dir / "traditional_colors.json");
    auto palette = VW::Theme::TraditionalColorPalette::load_first(palette_candidates);

    VW::Poem::PoemCache cache{data_paths ? data_paths->poem_cache_file() : output_dir / "poetry_cache.json"};
    std::unique_ptr<VW::Poem::FilePoemProvider> provider;
    if (!options.poem_file.empty()) {
        provider = std::make_unique<VW::Poem::FilePoemProvider>(options.poem_file);
    }

    VW::Scene::SoftwareRenderSurface surface;
    VW::Render::RenderPipeline pipeline{surface, VW::TaskPool::shared()};
    VW::Apply::LogNotifier notifier;
    VW::Apply::ApplyCoordinator coordinator{*port, pipeline, &notifier, VW::Apply::ApplyCoordinatorOptions{.output_dir = output_dir}};
    VW::Settings::EnvThemeProbe theme_probe;

    VW::App::WallpaperService service{VW::App::WallpaperServiceDeps{
        .store = store,
        .coordinator = coordinator,
        .provider = provider.get(),
        .cache = cache,
        .palette = palette,
        .theme_probe = theme_probe,
        .entropy = entropy,
    }};

    auto report = service.apply_now(options.silent, "startup");
    if (!options.watch) {
        VW::logger().flush();
        return exit_code(report);
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    service.start();
    vw_log("Watching for refreshes; interrupt to stop", "Apply");
    while (!g_should_stop.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    service.stop();
    coordinator.wait_idle();
    VW::logger().flush();
    return EXIT_SUCCESS;
}
