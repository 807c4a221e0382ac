#include <doctest/doctest.h>

#include "VerseWallTestHelper.hpp"

#include <versewall/apply/RefreshScheduler.hpp>

#include <atomic>
#include <thread>

using namespace VW;
using namespace std::chrono_literals;

TEST_SUITE("apply.refresh") {

TEST_CASE("an interval of zero never fires") {
    std::atomic<int> fired{0};
    Apply::RefreshScheduler scheduler([&] { ++fired; }, 5ms);
    scheduler.set_interval(0);
    std::this_thread::sleep_for(60ms);
    CHECK(fired.load() == 0);
    CHECK_FALSE(scheduler.enabled());
    CHECK(scheduler.fire_count() == 0);
}

TEST_CASE("negative intervals disable and positive ones fire repeatedly") {
    std::atomic<int> fired{0};
    Apply::RefreshScheduler scheduler([&] { ++fired; }, 5ms);
    scheduler.set_interval(-3);
    CHECK(scheduler.interval_minutes() == 0);

    scheduler.set_interval(1);
    CHECK(scheduler.enabled());
    CHECK(Test::wait_until([&] { return fired.load() >= 3; }));

    scheduler.set_interval(0);
    auto stopped_at = scheduler.fire_count();
    std::this_thread::sleep_for(40ms);
    CHECK(scheduler.fire_count() == stopped_at);
}

TEST_CASE("the period is a whole number of minutes") {
    std::atomic<int> fired{0};
    Apply::RefreshScheduler scheduler([&] { ++fired; }, 20ms);
    scheduler.set_interval(3);
    CHECK(scheduler.interval_minutes() == 3);
    std::this_thread::sleep_for(30ms);
    CHECK(fired.load() == 0);
    CHECK(Test::wait_until([&] { return fired.load() >= 1; }));
}

}
