#include <doctest/doctest.h>

#include "VerseWallTestHelper.hpp"

#include <versewall/apply/DebounceTimer.hpp>

#include <atomic>
#include <stdexcept>
#include <thread>

using namespace VW;
using namespace std::chrono_literals;

TEST_SUITE("apply.debounce") {

TEST_CASE("a burst of schedules runs only the last action") {
    Apply::DebounceTimer timer(60ms);
    std::atomic<int> last{0};
    std::atomic<int> runs{0};

    for (int i = 1; i <= 5; ++i) {
        timer.schedule([&, i] {
            last = i;
            ++runs;
        });
        std::this_thread::sleep_for(5ms);
    }
    timer.wait_idle();

    CHECK(runs.load() == 1);
    CHECK(last.load() == 5);
    CHECK(timer.superseded_count() == 4);
    CHECK(timer.fired_count() == 1);
    CHECK_FALSE(timer.pending());
}

TEST_CASE("the delay restarts on every schedule") {
    Apply::DebounceTimer timer(80ms);
    std::atomic<bool> ran{false};
    auto start = Apply::DebounceTimer::Clock::now();

    timer.schedule([&] { ran = true; });
    std::this_thread::sleep_for(50ms);
    timer.schedule([&] { ran = true; });
    timer.wait_idle();

    CHECK(ran.load());
    CHECK(Apply::DebounceTimer::Clock::now() - start >= 130ms);
}

TEST_CASE("cancel drops the pending action") {
    Apply::DebounceTimer timer(50ms);
    std::atomic<int> runs{0};
    timer.schedule([&] { ++runs; });
    CHECK(timer.cancel());
    CHECK_FALSE(timer.cancel());
    std::this_thread::sleep_for(100ms);
    CHECK(runs.load() == 0);
}

TEST_CASE("a throwing action does not stop the timer") {
    Apply::DebounceTimer timer(10ms);
    std::atomic<int> runs{0};
    timer.schedule([] { throw std::runtime_error("boom"); });
    timer.wait_idle();
    timer.schedule([&] { ++runs; });
    timer.wait_idle();
    CHECK(runs.load() == 1);
    CHECK(timer.fired_count() == 2);
}

}
