#include <doctest/doctest.h>

#include "log/TaggedLogger.hpp"

#include "VerseWallTestHelper.hpp"

#include <fstream>
#include <iterator>
#include <mutex>
#include <string>
#include <vector>

namespace {

// Captures formatted lines from a private logger instance.
struct CapturedLogger {
    CapturedLogger() {
        logger.setStderrEnabled(false);
        logger.setSink([this](VW::TaggedLogger::LogMessage const&, std::string const& line) {
            std::lock_guard<std::mutex> lock(mutex);
            lines.push_back(line);
        });
    }

    auto captured() -> std::vector<std::string> {
        logger.flush();
        std::lock_guard<std::mutex> lock(mutex);
        return lines;
    }

    VW::TaggedLogger         logger;
    std::mutex               mutex;
    std::vector<std::string> lines;
};

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("messages reach the sink with tags and thread name") {
    CapturedLogger capture;
    capture.logger.setThreadName("Worker-7");
    capture.logger.log_impl("hello log", std::source_location::current(), "Apply", "Warning");
    auto lines = capture.captured();
    REQUIRE(lines.size() == 1);
    CHECK(lines[0].find("[Apply][Warning]") != std::string::npos);
    CHECK(lines[0].find("[Worker-7]") != std::string::npos);
    CHECK(lines[0].find("hello log") != std::string::npos);
}

TEST_CASE("disabled logging drops messages") {
    CapturedLogger capture;
    capture.logger.setLoggingEnabled(false);
    capture.logger.log_impl("dropped", std::source_location::current(), "Apply");
    CHECK(capture.captured().empty());

    capture.logger.setLoggingEnabled(true);
    capture.logger.log_impl("kept", std::source_location::current(), "Apply");
    CHECK(capture.captured().size() == 1);
}

TEST_CASE("TaskPool tag is skipped by default") {
    CapturedLogger capture;
    capture.logger.log_impl("worker chatter", std::source_location::current(), "TaskPool");
    CHECK(capture.captured().empty());

    capture.logger.setSkipTags({});
    capture.logger.log_impl("worker chatter", std::source_location::current(), "TaskPool");
    CHECK(capture.captured().size() == 1);
}

TEST_CASE("enabled tags require every tag of a message") {
    CapturedLogger capture;
    capture.logger.setEnabledTags({"Render"});
    capture.logger.log_impl("keep me", std::source_location::current(), "Render");
    capture.logger.log_impl("drop me", std::source_location::current(), "Render", "Error");
    auto lines = capture.captured();
    REQUIRE(lines.size() == 1);
    CHECK(lines[0].find("keep me") != std::string::npos);
}

TEST_CASE("log file receives every line") {
    VW::Test::TempDir dir("versewall_logfile");
    auto path = dir.path / "logs" / "versewall.log";
    CapturedLogger capture;
    REQUIRE(capture.logger.openLogFile(path));
    capture.logger.log_impl("first", std::source_location::current(), "Settings");
    capture.logger.log_impl("second", std::source_location::current(), "Settings");
    capture.logger.flush();
    capture.logger.closeLogFile();

    std::ifstream in(path);
    std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    CHECK(text.find("first") != std::string::npos);
    CHECK(text.find("second") != std::string::npos);
}

TEST_CASE("short path keeps the parent directory") {
    CapturedLogger capture;
#line 42 "dir/subdir/TaggedLoggerChild.cpp"
    capture.logger.log_impl("has parent", std::source_location::current(), "Solo");
#line 103 "tests/unit/log/test_TaggedLogger.cpp"
    auto lines = capture.captured();
    REQUIRE(lines.size() == 1);
    CHECK(lines[0].find("subdir/TaggedLoggerChild.cpp:42") != std::string::npos);
}

}
