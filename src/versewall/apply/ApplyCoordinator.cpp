#include <versewall/apply/ApplyCoordinator.hpp>
#include <versewall/effects/Variation.hpp>

#include "log/TaggedLogger.hpp"

#include <ctime>
#include <exception>
#include <iomanip>
#include <new>
#include <sstream>

namespace VW::Apply {
namespace {

constexpr std::string_view kTempSuffix = ".tmp.png";
constexpr std::string_view kWallpaperPrefix = "wallpaper_";

auto ends_with(std::string_view text, std::string_view suffix) -> bool {
    return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

auto rect_to_string(Effects::DeviceRect const& rect) -> std::string {
    std::ostringstream oss;
    oss << rect.left << ',' << rect.top << ',' << rect.right << ',' << rect.bottom;
    return oss.str();
}

auto render_target_for(MonitorTarget const& target) -> Scene::RenderTarget {
    return Scene::RenderTarget{
        .logical_width = target.logical_width(),
        .logical_height = target.logical_height(),
        .pixel_width = target.pixel_size.width,
        .pixel_height = target.pixel_size.height,
        .dpi_scale_x = target.dpi_scale.x,
        .dpi_scale_y = target.dpi_scale.y,
    };
}

// Restores the scene's variation offset when a per-monitor pass ends.
class VariationRestore {
public:
    VariationRestore(Scene::SceneGraph& scene, double offset)
        : scene_(scene)
        , offset_(offset) {}
    ~VariationRestore() { scene_.set_variation_offset(offset_); }

    VariationRestore(VariationRestore const&)                    = delete;
    auto operator=(VariationRestore const&) -> VariationRestore& = delete;

private:
    Scene::SceneGraph& scene_;
    double             offset_;
};

} // namespace

auto apply_state_name(ApplyState state) -> std::string_view {
    switch (state) {
    case ApplyState::Idle:
        return "idle";
    case ApplyState::Queued:
        return "queued";
    case ApplyState::Rendering:
        return "rendering";
    case ApplyState::Committing:
        return "committing";
    }
    return "idle";
}

auto ApplyReport::installed_count() const -> std::size_t {
    std::size_t count = 0;
    for (auto const& outcome : outcomes) {
        if (outcome.installed) {
            ++count;
        }
    }
    return count;
}

ApplyCoordinator::ApplyCoordinator(MonitorWallpaperPort& port,
                                   Render::RenderPipeline& pipeline,
                                   UserNotifier* notifier,
                                   ApplyCoordinatorOptions options)
    : port_(port)
    , pipeline_(pipeline)
    , notifier_(notifier)
    , options_(std::move(options))
    , debounce_(options_.debounce) {}

ApplyCoordinator::~ApplyCoordinator() {
    debounce_.cancel();
}

auto ApplyCoordinator::apply(ApplyRequest request) -> ApplyReport {
    std::lock_guard<FairLock> guard(cycle_lock_);
    auto report = run_cycle(request);
    set_state(debounce_.pending() ? ApplyState::Queued : ApplyState::Idle);
    ++cycles_;
    publish(report);
    return report;
}

auto ApplyCoordinator::reject(std::string reason, bool silent, Error error) -> ApplyReport {
    ApplyReport report;
    report.reason = std::move(reason);
    report.silent = silent;
    report.error  = std::move(error);
    vw_log("Apply skipped (" + report.reason + "): " + describeError(*report.error), "Apply", "Warning");
    publish(report);
    return report;
}

auto ApplyCoordinator::publish(ApplyReport const& report) -> void {
    ReportListener listener;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_report_ = report;
        listener = listener_;
    }
    notify(report);
    if (listener) {
        listener(report);
    }
}

auto ApplyCoordinator::queue_apply(ApplyRequest request) -> void {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == ApplyState::Idle) {
            state_ = ApplyState::Queued;
        }
    }
    vw_log("Apply queued (" + request.reason + ")", "Apply");
    debounce_.schedule([this, request = std::move(request)]() { this->apply(request); });
}

auto ApplyCoordinator::wait_idle() -> void {
    debounce_.wait_idle();
    std::lock_guard<FairLock> guard(cycle_lock_);
}

auto ApplyCoordinator::set_report_listener(ReportListener listener) -> void {
    std::lock_guard<std::mutex> lock(state_mutex_);
    listener_ = std::move(listener);
}

auto ApplyCoordinator::state() const -> ApplyState {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

auto ApplyCoordinator::last_report() const -> std::optional<ApplyReport> {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_report_;
}

auto ApplyCoordinator::set_state(ApplyState state) -> void {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = state;
}

auto ApplyCoordinator::make_batch_id(std::chrono::system_clock::time_point now) -> std::string {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y%m%d_%H%M%S") << '_' << std::setfill('0') << std::setw(3) << millis.count();
    return oss.str();
}

auto ApplyCoordinator::purge_stale_temp_files(std::filesystem::path const& dir, std::chrono::minutes max_age) -> std::size_t {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return 0;
    }
    auto cutoff = std::filesystem::file_time_type::clock::now() - max_age;
    std::size_t purged = 0;
    for (auto const& entry : it) {
        auto name = entry.path().filename().string();
        if (!name.starts_with(kWallpaperPrefix) || !ends_with(name, kTempSuffix)) {
            continue;
        }
        auto written = entry.last_write_time(ec);
        if (ec || written > cutoff) {
            ec.clear();
            continue;
        }
        if (std::filesystem::remove(entry.path(), ec)) {
            ++purged;
        } else if (ec) {
            vw_log("Could not purge " + name + ": " + ec.message(), "Apply", "Warning");
            ec.clear();
        }
    }
    return purged;
}

auto ApplyCoordinator::cleanup_batch(std::string const& batch_id) -> void {
    std::error_code ec;
    std::filesystem::directory_iterator it(options_.output_dir, ec);
    if (ec) {
        return;
    }
    auto suffix = "_" + batch_id + std::string(kTempSuffix);
    for (auto const& entry : it) {
        auto name = entry.path().filename().string();
        if (!name.starts_with(kWallpaperPrefix) || !ends_with(name, suffix)) {
            continue;
        }
        std::filesystem::remove(entry.path(), ec);
        if (ec) {
            vw_log("Could not remove " + name + ": " + ec.message(), "Apply", "Warning");
            ec.clear();
        }
    }
}

auto ApplyCoordinator::run_cycle(ApplyRequest const& request) -> ApplyReport {
    ApplyReport report;
    report.batch_id = make_batch_id(std::chrono::system_clock::now());
    report.reason = request.reason;
    report.silent = request.silent;
    report.seed = request.inputs.seed;

    set_state(ApplyState::Rendering);
    vw_log("Apply cycle started: batch=" + report.batch_id + " reason=" + request.reason
               + (request.silent ? " (silent)" : ""),
           "Apply");

    try {
        std::error_code ec;
        std::filesystem::create_directories(options_.output_dir, ec);
        if (ec) {
            report.error = Error{Error::Code::TransientIO, "cannot create " + options_.output_dir.string() + ": " + ec.message()};
            vw_log("Apply aborted: " + describeError(*report.error), "Apply", "Error");
            return report;
        }

        report.purged_temp_files = purge_stale_temp_files(options_.output_dir, options_.stale_temp_age);
        if (report.purged_temp_files > 0) {
            vw_log("Purged " + std::to_string(report.purged_temp_files) + " stale temp files", "Apply");
        }

        auto targets = query_monitors(port_);
        if (!targets) {
            report.error = targets.error();
            vw_log("Monitor enumeration failed: " + describeError(*report.error), "Apply", "Error");
            cleanup_batch(report.batch_id);
            return report;
        }
        report.monitor_count = targets->size();
        report.distinct_rects = distinct_rect_count(*targets);
        vw_log("Monitors: count=" + std::to_string(report.monitor_count)
                   + " distinctRects=" + std::to_string(report.distinct_rects),
               "Apply");

        auto scene = pipeline_.surface().build_scene(request.inputs);
        if (!scene) {
            report.error = scene.error();
            vw_log("Scene construction failed: " + describeError(*report.error), "Apply", "Error");
            cleanup_batch(report.batch_id);
            return report;
        }

        bool done = false;
        if (report.distinct_rects > 1) {
            std::optional<Error> failure;
            try {
                if (auto multi = apply_multi(*scene, *targets, report); multi) {
                    done = true;
                } else {
                    failure = multi.error();
                }
            } catch (std::exception const& ex) {
                failure = Error{Error::Code::UnknownError, ex.what()};
            }
            if (!done) {
                report.fallback_triggered = true;
                report.outcomes.clear();
                vw_log("Multi-monitor apply failed, falling back to a single image: "
                           + describeError(failure.value_or(Error{Error::Code::UnknownError, "unknown"})),
                       "Apply", "Warning");
                set_state(ApplyState::Rendering);
            }
        }

        if (!done) {
            if (auto single = apply_single(*scene, *targets, report); !single) {
                report.error = single.error();
            }
        }
    } catch (std::bad_alloc const&) {
        report.error = Error{Error::Code::RenderFailed, "out of memory during apply"};
    } catch (std::exception const& ex) {
        report.error = Error{Error::Code::UnknownError, ex.what()};
    }

    cleanup_batch(report.batch_id);
    if (report.error) {
        vw_log("Apply cycle failed: batch=" + report.batch_id + " " + describeError(*report.error), "Apply", "Error");
    } else {
        vw_log("Apply cycle finished: batch=" + report.batch_id + " installed="
                   + std::to_string(report.installed_count()),
               "Apply");
    }
    return report;
}

auto ApplyCoordinator::apply_multi(Scene::SceneHandle const& scene,
                                   std::vector<MonitorTarget> const& targets,
                                   ApplyReport& report) -> Expected<void> {
    report.mode = ApplyMode::MultiMonitor;
    if (auto positioned = port_.set_position(FillMode::Fill); !positioned) {
        return std::unexpected(positioned.error());
    }

    auto base_offset = scene->variation_offset();
    VariationRestore restore{*scene, base_offset};

    for (auto const& target : targets) {
        MonitorOutcome outcome;
        outcome.monitor_id = target.id;
        outcome.index = target.index;
        auto index = std::to_string(target.index);
        outcome.temp_path = options_.output_dir / ("wallpaper_" + index + "_" + report.batch_id + std::string(kTempSuffix));
        outcome.final_path = options_.output_dir / ("wallpaper_" + index + ".png");
        outcome.variation_offset = Effects::wrap_variation(base_offset + Effects::monitor_variation(target.id, target.rect));

        vw_log("Monitor[" + index + "]: id=" + target.id + " rect=" + rect_to_string(target.rect)
                   + " px=" + std::to_string(target.pixel_size.width) + "x" + std::to_string(target.pixel_size.height),
               "Apply");
        try {
            scene->set_variation_offset(outcome.variation_offset);
            auto buffer = pipeline_.render(scene, render_target_for(target));
            if (!buffer) {
                outcome.error = buffer.error();
            } else if (auto written = pipeline_.write_png(*buffer, outcome.temp_path); !written) {
                outcome.error = written.error();
            } else {
                outcome.written = true;
            }
        } catch (std::bad_alloc const&) {
            outcome.error = Error{Error::Code::RenderFailed, "out of memory rendering monitor " + index};
        } catch (std::exception const& ex) {
            outcome.error = Error{Error::Code::RenderFailed, ex.what()};
        }
        if (outcome.error) {
            vw_log("Monitor[" + index + "] skipped: " + describeError(*outcome.error), "Apply", "Warning");
        }
        report.outcomes.push_back(std::move(outcome));
    }

    set_state(ApplyState::Committing);
    std::size_t committed = 0;
    for (auto& outcome : report.outcomes) {
        if (!outcome.written) {
            continue;
        }
        if (auto done = pipeline_.commit(outcome.temp_path, outcome.final_path); !done) {
            outcome.written = false;
            outcome.error = done.error();
            vw_log("Monitor[" + std::to_string(outcome.index) + "] commit failed: " + describeError(done.error()), "Apply", "Warning");
            continue;
        }
        ++committed;
    }
    if (committed == 0) {
        return std::unexpected(Error{Error::Code::RenderFailed, "no monitor image was written"});
    }

    for (auto& outcome : report.outcomes) {
        if (!outcome.written) {
            continue;
        }
        vw_log("Set monitor wallpaper: index=" + std::to_string(outcome.index) + " batch=" + report.batch_id
                   + " path=" + outcome.final_path.string(),
               "Apply");
        if (auto installed = port_.set_wallpaper(outcome.monitor_id, outcome.final_path); !installed) {
            outcome.error = installed.error();
            vw_log("Monitor[" + std::to_string(outcome.index) + "] install rejected: " + describeError(installed.error()), "Apply", "Warning");
            continue;
        }
        outcome.installed = true;
    }
    return {};
}

auto ApplyCoordinator::apply_single(Scene::SceneHandle const& scene,
                                    std::vector<MonitorTarget> const& targets,
                                    ApplyReport& report) -> Expected<void> {
    report.mode = ApplyMode::Single;
    auto const* primary = primary_target(targets);
    if (primary == nullptr) {
        return std::unexpected(Error{Error::Code::NotFound, "no monitor available"});
    }

    MonitorOutcome outcome;
    outcome.index = primary->index;
    outcome.temp_path = options_.output_dir / ("wallpaper_" + report.batch_id + std::string(kTempSuffix));
    outcome.final_path = options_.output_dir / "wallpaper.png";
    outcome.variation_offset = scene->variation_offset();

    auto target = render_target_for(*primary);
    vw_log("Single image: logical=" + std::to_string(static_cast<int>(target.logical_width)) + "x"
               + std::to_string(static_cast<int>(target.logical_height)) + " px="
               + std::to_string(target.pixel_width) + "x" + std::to_string(target.pixel_height),
           "Apply");

    auto finish = [&](Error error) -> Expected<void> {
        outcome.error = error;
        report.outcomes.push_back(std::move(outcome));
        return std::unexpected(std::move(error));
    };

    Expected<Scene::PixelBufferPtr> buffer = std::unexpected(Error{Error::Code::UnknownError, "not rendered"});
    try {
        buffer = pipeline_.render(scene, target);
    } catch (std::exception const& ex) {
        return finish(Error{Error::Code::RenderFailed, ex.what()});
    }
    if (!buffer) {
        return finish(buffer.error());
    }
    if (auto written = pipeline_.write_png(*buffer, outcome.temp_path); !written) {
        return finish(written.error());
    }
    outcome.written = true;

    set_state(ApplyState::Committing);
    if (auto committed = pipeline_.commit(outcome.temp_path, outcome.final_path); !committed) {
        outcome.written = false;
        return finish(committed.error());
    }
    if (auto installed = port_.set_wallpaper(std::nullopt, outcome.final_path); !installed) {
        vw_log("Install rejected: " + describeError(installed.error()), "Apply", "Warning");
        return finish(installed.error());
    }
    outcome.installed = true;
    report.outcomes.push_back(std::move(outcome));
    return {};
}

auto ApplyCoordinator::notify(ApplyReport const& report) -> void {
    if (report.silent || notifier_ == nullptr) {
        return;
    }
    if (report.fallback_triggered) {
        notifier_->notify(NoticeKind::Fallback, "Per-monitor wallpapers failed; one image was applied to every monitor instead.");
    }
    if (report.succeeded()) {
        auto message = report.mode == ApplyMode::MultiMonitor
                           ? "Wallpaper applied to " + std::to_string(report.installed_count()) + " monitors."
                           : std::string("Wallpaper applied.");
        notifier_->notify(NoticeKind::Success, message);
        return;
    }
    auto error = report.error.value_or(Error{Error::Code::OSApiRejected, "no wallpaper was installed"});
    notifier_->notify(NoticeKind::Failure, "Wallpaper could not be applied: " + describeError(error));
}

} // namespace VW::Apply
