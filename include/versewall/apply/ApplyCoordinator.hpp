#pragma once

#include "core/Error.hpp"

#include <versewall/apply/DebounceTimer.hpp>
#include <versewall/apply/FairLock.hpp>
#include <versewall/apply/MonitorWallpaperPort.hpp>
#include <versewall/apply/UserNotifier.hpp>
#include <versewall/render/RenderPipeline.hpp>
#include <versewall/scene/SceneInputs.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace VW::Apply {

enum class ApplyState {
    Idle,
    Queued,
    Rendering,
    Committing,
};

auto apply_state_name(ApplyState state) -> std::string_view;

struct ApplyRequest {
    Scene::SceneInputs inputs;
    // Silent requests never reach the UserNotifier.
    bool        silent = true;
    std::string reason;
};

enum class ApplyMode {
    None,
    MultiMonitor,
    Single,
};

struct MonitorOutcome {
    std::string              monitor_id;
    std::size_t              index = 0;
    std::filesystem::path    temp_path;
    std::filesystem::path    final_path;
    double                   variation_offset = 0.0;
    bool                     written   = false;
    bool                     installed = false;
    std::optional<Error>     error;
};

struct ApplyReport {
    std::string                 batch_id;
    std::string                 reason;
    bool                        silent = true;
    ApplyMode                   mode   = ApplyMode::None;
    bool                        fallback_triggered = false;
    std::size_t                 monitor_count = 0;
    std::size_t                 distinct_rects = 0;
    std::size_t                 purged_temp_files = 0;
    std::int32_t                seed = 0;
    std::vector<MonitorOutcome> outcomes;
    std::optional<Error>        error;

    [[nodiscard]] auto installed_count() const -> std::size_t;
    [[nodiscard]] auto succeeded() const -> bool { return !error && installed_count() > 0; }
};

struct ApplyCoordinatorOptions {
    std::filesystem::path     output_dir;
    std::chrono::milliseconds debounce{250};
    std::chrono::minutes      stale_temp_age{5};
};

/**
 * ApplyCoordinator - serializes, debounces and executes apply cycles.
 *
 * Cycle: purge stale temp files, query monitors, then either render one file
 * per monitor (more than one distinct device rectangle) or one shared file.
 * In the per-monitor branch every file is written and committed before the
 * first set_wallpaper() call. A monitor that fails is skipped; if the branch
 * as a whole fails the cycle falls back to the shared file.
 *
 * apply() runs a cycle on the calling thread once the FIFO lock admits it.
 * queue_apply() debounces: only the last request of a burst runs, on the
 * debounce thread. No failure escapes; everything lands in the ApplyReport.
 */
class ApplyCoordinator {
public:
    using ReportListener = std::function<void(ApplyReport const&)>;

    ApplyCoordinator(MonitorWallpaperPort& port,
                     Render::RenderPipeline& pipeline,
                     UserNotifier* notifier,
                     ApplyCoordinatorOptions options);
    ~ApplyCoordinator();

    ApplyCoordinator(ApplyCoordinator const&)                    = delete;
    auto operator=(ApplyCoordinator const&) -> ApplyCoordinator& = delete;

    auto apply(ApplyRequest request) -> ApplyReport;
    auto queue_apply(ApplyRequest request) -> void;
    // Records a cycle that failed before it could render, e.g. when no font
    // resolves, and reports it like any other failed cycle.
    auto reject(std::string reason, bool silent, Error error) -> ApplyReport;

    // Blocks until no debounced request is pending and no cycle is running.
    auto wait_idle() -> void;

    auto set_report_listener(ReportListener listener) -> void;

    [[nodiscard]] auto state() const -> ApplyState;
    [[nodiscard]] auto cycles_completed() const -> std::uint64_t { return cycles_.load(); }
    [[nodiscard]] auto last_report() const -> std::optional<ApplyReport>;
    [[nodiscard]] auto options() const -> ApplyCoordinatorOptions const& { return options_; }

    // Batch id "yyyyMMdd_HHmmss_fff" in UTC.
    [[nodiscard]] static auto make_batch_id(std::chrono::system_clock::time_point now) -> std::string;
    // Removes "wallpaper_*.tmp.png" files in dir older than max_age. Returns the count.
    static auto purge_stale_temp_files(std::filesystem::path const& dir, std::chrono::minutes max_age) -> std::size_t;

private:
    auto run_cycle(ApplyRequest const& request) -> ApplyReport;
    auto apply_multi(Scene::SceneHandle const& scene,
                     std::vector<MonitorTarget> const& targets,
                     ApplyReport& report) -> Expected<void>;
    auto apply_single(Scene::SceneHandle const& scene,
                      std::vector<MonitorTarget> const& targets,
                      ApplyReport& report) -> Expected<void>;
    auto cleanup_batch(std::string const& batch_id) -> void;
    auto publish(ApplyReport const& report) -> void;
    auto notify(ApplyReport const& report) -> void;
    auto set_state(ApplyState state) -> void;

    MonitorWallpaperPort&   port_;
    Render::RenderPipeline& pipeline_;
    UserNotifier*           notifier_;
    ApplyCoordinatorOptions options_;
    FairLock                cycle_lock_;

    mutable std::mutex         state_mutex_;
    ApplyState                 state_ = ApplyState::Idle;
    std::optional<ApplyReport> last_report_;
    ReportListener             listener_;
    std::atomic<std::uint64_t> cycles_{0};

    // Declared last so it stops before the members its actions use.
    DebounceTimer debounce_;
};

} // namespace VW::Apply
