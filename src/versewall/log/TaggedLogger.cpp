#include "TaggedLogger.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace VW {
namespace {

// "dir/file.cpp" from a full source path.
auto shortSourcePath(char const* file) -> std::string {
    std::filesystem::path path{file};
    if (!path.has_parent_path())
        return path.filename().string();
    return (path.parent_path().filename() / path.filename()).string();
}

auto formatLine(TaggedLogger::LogMessage const& msg) -> std::string {
    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(msg.timestamp.time_since_epoch()).count() % 1000;
    auto const time   = std::chrono::system_clock::to_time_t(msg.timestamp);
    std::tm    local{};
    localtime_r(&time, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis << ' ';
    if (!msg.tags.empty()) {
        for (auto const& tag : msg.tags)
            out << '[' << tag << ']';
        out << ' ';
    }
    out << '[' << msg.threadName << "] [" << shortSourcePath(msg.location.file_name()) << ':' << msg.location.line() << "] "
        << msg.message;
    return out.str();
}

} // namespace

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger()
    : worker_([this](std::stop_token stop) { drain(stop); }) {}

TaggedLogger::~TaggedLogger() {
    worker_.request_stop();
    queue_cv_.notify_all();
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    std::lock_guard<std::mutex> lock(names_mutex_);
    thread_names_[std::this_thread::get_id()] = name;
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    enabled_.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::setStderrEnabled(bool enabled) -> void {
    stderr_.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::setSink(Sink sink) -> void {
    std::lock_guard<std::mutex> lock(output_mutex_);
    sink_ = std::move(sink);
}

auto TaggedLogger::setSkipTags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(output_mutex_);
    skip_tags_ = std::move(tags);
}

auto TaggedLogger::setEnabledTags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(output_mutex_);
    enabled_tags_ = std::move(tags);
}

auto TaggedLogger::openLogFile(std::filesystem::path const& path) -> bool {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (file_.is_open())
        file_.close();
    file_.open(path, std::ios::out | std::ios::app);
    return file_.is_open();
}

auto TaggedLogger::closeLogFile() -> void {
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (file_.is_open())
        file_.close();
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return pending_.empty() && !writing_; });
}

auto TaggedLogger::enqueue(LogMessage message) -> void {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        pending_.push_back(std::move(message));
    }
    queue_cv_.notify_one();
}

auto TaggedLogger::drain(std::stop_token stop) -> void {
    std::vector<LogMessage> batch;
    std::unique_lock<std::mutex> lock(queue_mutex_);
    while (true) {
        queue_cv_.wait(lock, stop, [this] { return !pending_.empty(); });
        if (pending_.empty()) {
            // Stop requested with nothing left to write.
            idle_cv_.notify_all();
            return;
        }
        batch.swap(pending_);
        writing_ = true;
        lock.unlock();
        for (auto const& message : batch)
            emit(message);
        batch.clear();
        lock.lock();
        writing_ = false;
        if (pending_.empty())
            idle_cv_.notify_all();
    }
}

auto TaggedLogger::accepts(std::set<std::string> const& tags) const -> bool {
    for (auto const& tag : tags) {
        if (skip_tags_.contains(tag))
            return false;
        if (!enabled_tags_.empty() && !enabled_tags_.contains(tag))
            return false;
    }
    return true;
}

auto TaggedLogger::emit(LogMessage const& message) -> void {
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (!accepts(message.tags))
        return;

    auto const line = formatLine(message);
    if (sink_)
        sink_(message, line);
    if (file_.is_open())
        file_ << line << '\n' << std::flush;
    if (stderr_.load(std::memory_order_relaxed)) {
        std::lock_guard<std::mutex> out(coutMutex);
        std::cerr << line << '\n' << std::flush;
    }
}

auto TaggedLogger::threadNameFor(std::thread::id id) -> std::string {
    std::lock_guard<std::mutex> lock(names_mutex_);
    auto [it, inserted] = thread_names_.try_emplace(id);
    if (inserted)
        it->second = "Thread " + std::to_string(next_thread_number_++);
    return it->second;
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace VW
