#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace VW::Apply {

/**
 * Periodic trigger in whole minutes.
 *
 * set_interval(n) with n <= 0 disables the timer; positive values are
 * clamped to at least one minute and restart the period. The callback runs on
 * the scheduler's thread. minute_length exists so tests can shrink a minute.
 */
class RefreshScheduler {
public:
    using Callback = std::function<void()>;

    explicit RefreshScheduler(Callback callback,
                              std::chrono::milliseconds minute_length = std::chrono::minutes{1});
    ~RefreshScheduler();

    RefreshScheduler(RefreshScheduler const&)                    = delete;
    auto operator=(RefreshScheduler const&) -> RefreshScheduler& = delete;

    auto set_interval(int minutes) -> void;

    [[nodiscard]] auto interval_minutes() const -> int;
    [[nodiscard]] auto enabled() const -> bool;
    [[nodiscard]] auto fire_count() const -> std::uint64_t;

private:
    auto run(std::stop_token stop) -> void;

    Callback                    callback_;
    std::chrono::milliseconds   minute_length_;
    mutable std::mutex          mutex_;
    std::condition_variable_any cv_;
    int                         interval_minutes_ = 0;
    std::uint64_t               generation_       = 0;
    std::uint64_t               fires_            = 0;
    std::jthread                worker_;
};

} // namespace VW::Apply
