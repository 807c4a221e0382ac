#include <doctest/doctest.h>

#include "task/TaskPool.hpp"

#include "VerseWallTestHelper.hpp"

#include <atomic>
#include <stdexcept>
#include <vector>

using namespace VW;
using namespace std::chrono_literals;

TEST_SUITE("task.pool") {

TEST_CASE("jobs run on the workers") {
    TaskPool pool(2);
    CHECK(pool.size() == 2);
    std::atomic<int> counter{0};
    for (int i = 0; i < 50; ++i) {
        CHECK_FALSE(pool.submit([&counter] { ++counter; }).has_value());
    }
    CHECK(Test::wait_until([&] { return counter.load() == 50; }));
}

TEST_CASE("async hands back results and exceptions") {
    TaskPool pool(2);
    auto value = pool.async([] { return 6 * 7; });
    REQUIRE(value.has_value());
    CHECK(value->get() == 42);

    auto failing = pool.async([]() -> int { throw std::runtime_error("boom"); });
    REQUIRE(failing.has_value());
    CHECK_THROWS_AS(failing->get(), std::runtime_error);
}

TEST_CASE("a throwing job does not stop the worker") {
    TaskPool pool(1);
    REQUIRE_FALSE(pool.submit([] { throw std::runtime_error("ignored"); }).has_value());
    auto after = pool.async([] { return true; });
    REQUIRE(after.has_value());
    CHECK(after->get());
}

TEST_CASE("queued jobs drain on shutdown and later submissions are refused") {
    TaskPool pool(1);
    std::atomic<int> done{0};
    for (int i = 0; i < 5; ++i) {
        REQUIRE_FALSE(pool.submit([&done] {
            std::this_thread::sleep_for(2ms);
            ++done;
        }).has_value());
    }
    pool.shutdown();
    CHECK(done.load() == 5);
    CHECK(pool.size() == 0);

    auto refused = pool.submit([] {});
    REQUIRE(refused.has_value());
    CHECK(refused->code == Error::Code::UnknownError);
    CHECK_FALSE(pool.async([] { return 1; }).has_value());
    pool.shutdown();
}

TEST_CASE("empty jobs are invalid") {
    TaskPool pool(1);
    auto error = pool.submit(TaskPool::Job{});
    REQUIRE(error.has_value());
    CHECK(error->code == Error::Code::InvalidArgument);
}

TEST_CASE("zero threads still gets one worker") {
    TaskPool pool(0);
    CHECK(pool.size() == 1);
}

}
