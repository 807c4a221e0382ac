#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace VW::Apply {

/**
 * DebounceTimer - runs only the last of a burst of scheduled actions.
 *
 * schedule() replaces any pending action and restarts the delay. An action
 * runs on the timer's own thread once the delay elapses without another
 * schedule(). A replaced action never runs. A running action is never
 * interrupted; schedules that arrive meanwhile start a fresh delay that is
 * evaluated after it returns.
 */
class DebounceTimer {
public:
    using Action = std::function<void()>;
    using Clock  = std::chrono::steady_clock;

    explicit DebounceTimer(std::chrono::milliseconds delay);
    ~DebounceTimer();

    DebounceTimer(DebounceTimer const&)                    = delete;
    auto operator=(DebounceTimer const&) -> DebounceTimer& = delete;

    auto schedule(Action action) -> void;
    // Drops the pending action, if any. Returns whether one was dropped.
    auto cancel() -> bool;
    // Blocks until nothing is pending and no action is running.
    auto wait_idle() -> void;

    [[nodiscard]] auto pending() const -> bool;
    [[nodiscard]] auto superseded_count() const -> std::uint64_t;
    [[nodiscard]] auto fired_count() const -> std::uint64_t;
    [[nodiscard]] auto delay() const -> std::chrono::milliseconds { return delay_; }

private:
    auto run(std::stop_token stop) -> void;

    std::chrono::milliseconds   delay_;
    mutable std::mutex          mutex_;
    std::condition_variable_any cv_;
    std::condition_variable     idle_cv_;
    std::optional<Action>       pending_;
    Clock::time_point           deadline_{};
    std::uint64_t               generation_ = 0;
    std::uint64_t               superseded_ = 0;
    std::uint64_t               fired_      = 0;
    bool                        running_    = false;
    std::jthread                worker_;
};

} // namespace VW::Apply
