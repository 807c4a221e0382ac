#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <set>
#include <source_location>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace VW {

/**
 * TaggedLogger - asynchronous logger shared by the render and apply threads.
 *
 * vw_log() only enqueues. A worker thread filters each message by its tags,
 * formats it as
 *   YYYY-mm-dd HH:MM:SS.mmm [tag][tag] [thread] [dir/file.cpp:line] message
 * and hands the line to the sink, the log file and stderr.
 *
 * Filtering: a message with any skipped tag is dropped. When the enabled set
 * is non-empty every tag of the message must be in it.
 */
class TaggedLogger {
public:
    struct LogMessage {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string>                 tags;
        std::string                           message;
        std::string                           threadName;
        std::source_location                  location;
    };

    using Sink = std::function<void(LogMessage const&, std::string const& line)>;

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto setThreadName(const std::string& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;
    auto setStderrEnabled(bool enabled) -> void;
    auto setSink(Sink sink) -> void;
    auto setSkipTags(std::set<std::string> tags) -> void;
    auto setEnabledTags(std::set<std::string> tags) -> void;
    // Appends; creates missing parent directories.
    auto openLogFile(std::filesystem::path const& path) -> bool;
    auto closeLogFile() -> void;

    // Blocks until every queued message has been written.
    auto flush() -> void;

    // Serializes stderr and stdout writers.
    static std::mutex coutMutex;

private:
    auto enqueue(LogMessage message) -> void;
    auto drain(std::stop_token stop) -> void;
    auto emit(LogMessage const& message) -> void;
    auto accepts(std::set<std::string> const& tags) const -> bool;
    auto threadNameFor(std::thread::id id) -> std::string;

    std::atomic<bool> enabled_{true};
    std::atomic<bool> stderr_{true};

    std::mutex                  queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::condition_variable     idle_cv_;
    std::vector<LogMessage>     pending_;
    bool                        writing_ = false;

    // Guards the filters and the outputs.
    mutable std::mutex    output_mutex_;
    std::set<std::string> skip_tags_{"TaskPool"};
    std::set<std::string> enabled_tags_;
    Sink                  sink_;
    std::ofstream         file_;

    std::mutex                                       names_mutex_;
    std::unordered_map<std::thread::id, std::string> thread_names_;
    int                                              next_thread_number_ = 0;

    // Last member so the worker stops before the queue is destroyed.
    std::jthread worker_;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!enabled_.load(std::memory_order_relaxed))
        return;
    enqueue(LogMessage{.timestamp  = std::chrono::system_clock::now(),
                       .tags       = {std::string(std::forward<Tags>(tags))...},
                       .message    = message,
                       .threadName = threadNameFor(std::this_thread::get_id()),
                       .location   = location});
}

#define vw_log(message, ...) ::VW::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace VW
