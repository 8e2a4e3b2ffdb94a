/**
 * @file test_periodic_task.cpp
 * @brief Unit tests for PeriodicTask.
 */

#include "executor/periodic_task.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace lab_alloc;
using namespace std::chrono_literals;

namespace {

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = 2s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(1ms);
    }
    return pred();
}

}  // namespace

TEST(PeriodicTaskTest, RunsRepeatedly) {
    std::atomic<int> runs{0};
    PeriodicTask task("counter", 0ms, 5ms, [&runs] { runs.fetch_add(1); });

    task.start();
    EXPECT_TRUE(task.is_running());
    EXPECT_TRUE(wait_until([&] { return runs.load() >= 3; }));
    task.stop();

    EXPECT_FALSE(task.is_running());
    EXPECT_GE(task.run_count(), 3u);
}

TEST(PeriodicTaskTest, SurvivesExceptions) {
    std::atomic<int> errors{0};
    PeriodicTask task(
        "flaky", 0ms, 2ms,
        [] { throw std::runtime_error("cleanup failed"); },
        [&errors](const std::exception& e) {
            EXPECT_STREQ(e.what(), "cleanup failed");
            errors.fetch_add(1);
        });

    task.start();
    EXPECT_TRUE(wait_until([&] { return errors.load() >= 2; }));
    task.stop();
    EXPECT_GE(task.failure_count(), 2u);
    EXPECT_EQ(task.failure_count(), task.run_count());
}

TEST(PeriodicTaskTest, StopInterruptsLongDelay) {
    std::atomic<int> runs{0};
    PeriodicTask task("slow", 1h, 1h, [&runs] { runs.fetch_add(1); });

    task.start();
    auto begin = std::chrono::steady_clock::now();
    task.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 1s);
    EXPECT_EQ(runs.load(), 0);
}

TEST(PeriodicTaskTest, StartIsIdempotent) {
    std::atomic<int> runs{0};
    PeriodicTask task("once", 0ms, 1h, [&runs] { runs.fetch_add(1); });

    task.start();
    task.start();
    EXPECT_TRUE(wait_until([&] { return runs.load() >= 1; }));
    std::this_thread::sleep_for(20ms);
    task.stop();
    EXPECT_EQ(runs.load(), 1);
    EXPECT_EQ(task.name(), "once");
}
