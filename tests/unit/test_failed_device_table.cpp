/**
 * @file test_failed_device_table.cpp
 * @brief Unit tests for FailedDeviceTable quarantine windows.
 */

#include "device/failed_device_table.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <thread>

using namespace lab_alloc;
using namespace std::chrono_literals;

class FailedDeviceTableTest : public ::testing::Test {
protected:
    ManualClock clock_;
    MemorySink* sink_ = nullptr;
    std::unique_ptr<Logger> logger_;

    void SetUp() override {
        auto sink = std::make_unique<MemorySink>();
        sink_ = sink.get();
        logger_ = std::make_unique<Logger>(std::move(sink), LogLevel::Debug);
    }

    std::unique_ptr<FailedDeviceTable> make_table(
        uint32_t threshold = 3,
        std::chrono::milliseconds cleanup_interval = FailedDeviceTableConfig{}.cleanup_interval) {
        FailedDeviceTableConfig config;
        config.max_init_failures_before_fail = threshold;
        config.cleanup_interval = cleanup_interval;
        return std::make_unique<FailedDeviceTable>(config, clock_, *logger_);
    }
};

TEST_F(FailedDeviceTableTest, BelowThresholdIsNotFailed) {
    auto table = make_table(3);
    table->add("d1");
    table->add("d1");

    EXPECT_FALSE(table->has("d1"));
    EXPECT_EQ(table->failure_count("d1"), 2u);

    clock_.advance(9min);
    EXPECT_FALSE(table->has("d1"));
    EXPECT_EQ(table->failure_count("d1"), 2u);
}

TEST_F(FailedDeviceTableTest, ReachingThresholdQuarantines) {
    auto table = make_table(3);
    for (int i = 0; i < 3; ++i) table->add("d1");

    EXPECT_TRUE(table->has("d1"));
    EXPECT_TRUE(table->failed_device_ids().contains("d1"));
    EXPECT_TRUE(sink_->contains("Device d1 failed init 3 times, quarantined"));
}

TEST_F(FailedDeviceTableTest, FailedDeviceStaysFailedForTwentyMinutes) {
    auto table = make_table(3);
    for (int i = 0; i < 3; ++i) table->add("d1");

    clock_.advance(19min);
    EXPECT_TRUE(table->has("d1"));

    clock_.advance(1min + 1ms);
    EXPECT_FALSE(table->has("d1"));
    EXPECT_EQ(table->entry_count(), 0u);
}

TEST_F(FailedDeviceTableTest, WindowCountsFromLastFailure) {
    auto table = make_table(3);
    for (int i = 0; i < 3; ++i) table->add("d1");

    clock_.advance(15min);
    table->add("d1");
    clock_.advance(15min);
    EXPECT_TRUE(table->has("d1"));
    EXPECT_EQ(table->failure_count("d1"), 4u);
}

TEST_F(FailedDeviceTableTest, ExpiredEntryStartsOver) {
    auto table = make_table(3);
    table->add("d1");
    table->add("d1");

    clock_.advance(10min + 1ms);
    EXPECT_EQ(table->failure_count("d1"), 0u);

    table->add("d1");
    EXPECT_EQ(table->failure_count("d1"), 1u);
    EXPECT_FALSE(table->has("d1"));
}

TEST_F(FailedDeviceTableTest, FailuresWithinWindowAccumulate) {
    auto table = make_table(3);
    table->add("d1");
    clock_.advance(9min);
    table->add("d1");
    clock_.advance(9min);
    table->add("d1");

    EXPECT_TRUE(table->has("d1"));
}

TEST_F(FailedDeviceTableTest, RemoveResetsFailedDevice) {
    auto table = make_table(2);
    table->add("d1");
    table->add("d1");
    ASSERT_TRUE(table->has("d1"));

    table->remove("d1");
    EXPECT_FALSE(table->has("d1"));
    EXPECT_EQ(table->failure_count("d1"), 0u);

    table->add("d1");
    EXPECT_FALSE(table->has("d1"));
}

TEST_F(FailedDeviceTableTest, ThresholdOfOne) {
    auto table = make_table(1);
    table->add("d1");
    EXPECT_TRUE(table->has("d1"));
    EXPECT_FALSE(table->has("d2"));
}

TEST_F(FailedDeviceTableTest, ZeroThresholdIsClampedToOne) {
    auto table = make_table(0);
    EXPECT_EQ(table->max_init_failures_before_fail(), 1u);
}

TEST_F(FailedDeviceTableTest, CleanupTaskStartsOnFirstFailure) {
    auto table = make_table(3);
    EXPECT_FALSE(table->cleanup_task_running());

    table->add("d1");
    EXPECT_TRUE(table->cleanup_task_running());
}

TEST_F(FailedDeviceTableTest, BackgroundCleanupPurgesExpiredEntries) {
    auto table = make_table(3, 5ms);
    table->add("a");
    table->add("b");
    for (int i = 0; i < 3; ++i) table->add("q");
    clock_.advance(11min);

    // Only the cleanup task touches the map here.
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (table->entry_count() > 1 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }

    EXPECT_EQ(table->entry_count(), 1u);
    EXPECT_TRUE(sink_->contains("Purged 2 expired failed-device entries, 1 left"));
    EXPECT_TRUE(table->has("q"));
}

TEST_F(FailedDeviceTableTest, DevicesAreIndependent) {
    auto table = make_table(2);
    table->add("d1");
    table->add("d2");
    table->add("d1");

    auto failed = table->failed_device_ids();
    EXPECT_EQ(failed.size(), 1u);
    EXPECT_TRUE(failed.contains("d1"));
    EXPECT_EQ(table->failure_count("d2"), 1u);
}
