#pragma once
#include "core/Error.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <vector>

namespace VW {

/**
 * TaskPool - fixed set of worker threads for the PNG encode and file writes.
 *
 * - submit() refuses empty jobs (InvalidArgument) and any job after
 *   shutdown() began (UnknownError).
 * - shutdown() lets queued jobs finish, then joins the workers. Calling it
 *   again is harmless.
 * - An exception escaping a job is logged; the worker keeps running.
 */
class TaskPool {
public:
    using Job = std::function<void()>;

    explicit TaskPool(std::size_t threadCount = std::thread::hardware_concurrency());
    ~TaskPool();

    // Process-wide pool used by the command-line tool.
    static TaskPool& shared();

    TaskPool(TaskPool const&)                    = delete;
    auto operator=(TaskPool const&) -> TaskPool& = delete;

    auto submit(Job job) -> std::optional<Error>;
    auto shutdown() -> void;
    [[nodiscard]] auto size() const -> std::size_t;

    // Runs fn on a worker. Its result or exception arrives through the future.
    template <typename F>
    auto async(F&& fn) -> Expected<std::future<std::invoke_result_t<F>>>;

private:
    auto run(std::size_t index) -> void;

    mutable std::mutex        mutex_;
    std::condition_variable   wake_;
    std::deque<Job>           queue_;
    bool                      closing_ = false;
    std::vector<std::jthread> workers_;
};

template <typename F>
auto TaskPool::async(F&& fn) -> Expected<std::future<std::invoke_result_t<F>>> {
    using Result = std::invoke_result_t<F>;
    auto task    = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
    auto future  = task->get_future();
    if (auto refused = submit([task] { (*task)(); })) {
        return std::unexpected(std::move(*refused));
    }
    return future;
}

} // namespace VW
