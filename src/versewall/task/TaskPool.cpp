#include "TaskPool.hpp"
#include "log/TaggedLogger.hpp"

#include <exception>
#include <string>
#include <system_error>

namespace VW {

TaskPool& TaskPool::shared() {
    // Never destroyed, so late log calls from workers stay valid at exit.
    static TaskPool* pool = new TaskPool();
    return *pool;
}

TaskPool::TaskPool(std::size_t threadCount) {
    auto const wanted = threadCount == 0 ? std::size_t{1} : threadCount;
    workers_.reserve(wanted);
    for (std::size_t i = 0; i < wanted; ++i) {
        try {
            workers_.emplace_back([this, i] { run(i); });
        } catch (std::system_error const& error) {
            vw_log(std::string("Could not start pool worker: ") + error.what(), "TaskPool", "Error");
            break;
        }
    }
    vw_log("Pool started with " + std::to_string(workers_.size()) + " workers", "TaskPool");
}

TaskPool::~TaskPool() {
    shutdown();
}

auto TaskPool::submit(Job job) -> std::optional<Error> {
    if (!job) {
        return Error{Error::Code::InvalidArgument, "Empty job"};
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closing_) {
            return Error{Error::Code::UnknownError, "Pool is shutting down"};
        }
        if (workers_.empty()) {
            return Error{Error::Code::UnknownError, "Pool has no workers"};
        }
        queue_.push_back(std::move(job));
    }
    wake_.notify_one();
    return std::nullopt;
}

auto TaskPool::shutdown() -> void {
    std::vector<std::jthread> joining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closing_ = true;
        joining.swap(workers_);
    }
    wake_.notify_all();
    if (joining.empty()) {
        return;
    }
    // Destroying the jthreads joins them once the queue is empty.
    joining.clear();
    vw_log("Pool stopped", "TaskPool");
}

auto TaskPool::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

auto TaskPool::run(std::size_t index) -> void {
    set_thread_name("Pool-" + std::to_string(index));
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            wake_.wait(lock, [this] { return closing_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        try {
            job();
        } catch (std::exception const& error) {
            vw_log(std::string("Pool job threw: ") + error.what(), "TaskPool", "Error");
        }
    }
}

} // namespace VW
