#include <versewall/apply/DebounceTimer.hpp>

#include "log/TaggedLogger.hpp"

#include <exception>

namespace VW::Apply {

DebounceTimer::DebounceTimer(std::chrono::milliseconds delay)
    : delay_(delay)
    , worker_([this](std::stop_token stop) { this->run(stop); }) {}

DebounceTimer::~DebounceTimer() {
    worker_.request_stop();
    cv_.notify_all();
}

auto DebounceTimer::schedule(Action action) -> void {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_) {
            ++superseded_;
        }
        pending_  = std::move(action);
        deadline_ = Clock::now() + delay_;
        ++generation_;
    }
    cv_.notify_all();
}

auto DebounceTimer::cancel() -> bool {
    bool dropped = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped = pending_.has_value();
        pending_.reset();
        ++generation_;
    }
    cv_.notify_all();
    idle_cv_.notify_all();
    return dropped;
}

auto DebounceTimer::wait_idle() -> void {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return !pending_ && !running_; });
}

auto DebounceTimer::pending() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.has_value();
}

auto DebounceTimer::superseded_count() const -> std::uint64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return superseded_;
}

auto DebounceTimer::fired_count() const -> std::uint64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return fired_;
}

auto DebounceTimer::run(std::stop_token stop) -> void {
    set_thread_name("Debounce");
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop.stop_requested()) {
        if (!pending_) {
            cv_.wait(lock, stop, [this] { return pending_.has_value(); });
            continue;
        }
        auto generation = generation_;
        auto deadline   = deadline_;
        cv_.wait_until(lock, stop, deadline, [&] { return generation_ != generation; });
        if (stop.stop_requested()) {
            break;
        }
        if (generation_ != generation || !pending_ || Clock::now() < deadline_) {
            continue;
        }

        auto action = std::move(*pending_);
        pending_.reset();
        running_ = true;
        ++fired_;
        lock.unlock();
        try {
            action();
        } catch (std::exception const& ex) {
            vw_log(std::string("Debounced action failed: ") + ex.what(), "Apply", "Error");
        }
        lock.lock();
        running_ = false;
        idle_cv_.notify_all();
    }
    pending_.reset();
    running_ = false;
    idle_cv_.notify_all();
}

} // namespace VW::Apply
