#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace VW::Apply {

/**
 * Ticket lock: waiters are admitted strictly in the order they called lock().
 * Waiting blocks on a condition variable. Satisfies BasicLockable, so
 * std::lock_guard and std::unique_lock work with it.
 */
class FairLock {
public:
    FairLock() = default;
    FairLock(FairLock const&)                    = delete;
    auto operator=(FairLock const&) -> FairLock& = delete;

    auto lock() -> void {
        std::unique_lock<std::mutex> guard(mutex_);
        auto ticket = next_ticket_++;
        cv_.wait(guard, [&] { return serving_ == ticket; });
    }

    auto unlock() -> void {
        {
            std::lock_guard<std::mutex> guard(mutex_);
            ++serving_;
        }
        cv_.notify_all();
    }

    // Callers queued or holding the lock.
    [[nodiscard]] auto contention() const -> std::uint64_t {
        std::lock_guard<std::mutex> guard(mutex_);
        return next_ticket_ - serving_;
    }

private:
    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    std::uint64_t           next_ticket_ = 0;
    std::uint64_t           serving_     = 0;
};

} // namespace VW::Apply
