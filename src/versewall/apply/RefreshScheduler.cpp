#include <versewall/apply/RefreshScheduler.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <exception>
#include <string>

namespace VW::Apply {

RefreshScheduler::RefreshScheduler(Callback callback, std::chrono::milliseconds minute_length)
    : callback_(std::move(callback))
    , minute_length_(minute_length)
    , worker_([this](std::stop_token stop) { this->run(stop); }) {}

RefreshScheduler::~RefreshScheduler() {
    worker_.request_stop();
    cv_.notify_all();
}

auto RefreshScheduler::set_interval(int minutes) -> void {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        interval_minutes_ = minutes <= 0 ? 0 : std::max(1, minutes);
        ++generation_;
    }
    if (minutes <= 0) {
        vw_log("Refresh timer disabled", "Apply");
    } else {
        vw_log("Refresh timer set to " + std::to_string(std::max(1, minutes)) + " min", "Apply");
    }
    cv_.notify_all();
}

auto RefreshScheduler::interval_minutes() const -> int {
    std::lock_guard<std::mutex> lock(mutex_);
    return interval_minutes_;
}

auto RefreshScheduler::enabled() const -> bool {
    return interval_minutes() > 0;
}

auto RefreshScheduler::fire_count() const -> std::uint64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return fires_;
}

auto RefreshScheduler::run(std::stop_token stop) -> void {
    set_thread_name("Refresh");
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop.stop_requested()) {
        if (interval_minutes_ <= 0) {
            auto generation = generation_;
            cv_.wait(lock, stop, [&] { return generation_ != generation; });
            continue;
        }
        auto generation = generation_;
        auto period = minute_length_ * interval_minutes_;
        auto changed = cv_.wait_for(lock, stop, period, [&] { return generation_ != generation; });
        if (changed || stop.stop_requested() || interval_minutes_ <= 0) {
            continue;
        }
        ++fires_;
        auto callback = callback_;
        lock.unlock();
        try {
            if (callback) {
                callback();
            }
        } catch (std::exception const& ex) {
            vw_log(std::string("Refresh callback failed: ") + ex.what(), "Apply", "Error");
        }
        lock.lock();
    }
}

} // namespace VW::Apply
