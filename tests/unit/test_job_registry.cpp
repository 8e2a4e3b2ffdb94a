/**
 * @file test_job_registry.cpp
 * @brief Unit tests for SimpleJobInfo and JobRegistry.
 */

#include "scheduler/job_registry.hpp"
#include "scheduler/simple_job_info.hpp"
#include "telemetry/json_sink.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

using namespace lab_alloc;
using namespace lab_alloc::test_support;

namespace {

TestLocator test_locator(const std::string& id, const std::string& job_id = "job-1") {
    return TestLocator{id, "test_" + id, JobLocator{job_id, "demo_job"}};
}

}  // namespace

TEST(SimpleJobInfoTest, AddTestKeepsFirstLocator) {
    ManualClock clock;
    SimpleJobInfo info(make_job(clock));

    EXPECT_TRUE(info.add_test(test_locator("t1")));
    auto renamed = test_locator("t1");
    renamed.name = "other";
    EXPECT_FALSE(info.add_test(renamed));

    ASSERT_TRUE(info.test("t1").has_value());
    EXPECT_EQ(info.test("t1")->name, "test_t1");
    EXPECT_EQ(info.test_count(), 1u);
}

TEST(SimpleJobInfoTest, RemoveTest) {
    ManualClock clock;
    SimpleJobInfo info(make_job(clock));
    info.add_test(test_locator("t1"));
    info.add_test(test_locator("t2"));

    auto removed = info.remove_test("t1");
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->id, "t1");
    EXPECT_FALSE(info.remove_test("t1").has_value());
    EXPECT_FALSE(info.has_test("t1"));
    EXPECT_TRUE(info.has_test("t2"));

    auto tests = info.tests();
    ASSERT_EQ(tests.size(), 1u);
    EXPECT_EQ(tests.begin()->first, "t2");
}

TEST(SimpleJobInfoTest, ConcurrentAddsAreAtomic) {
    ManualClock clock;
    SimpleJobInfo info(make_job(clock));
    std::atomic<int> added{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                if (info.add_test(test_locator("t" + std::to_string(i)))) added.fetch_add(1);
            }
        });
    }
    for (auto& thread : threads) thread.join();

    EXPECT_EQ(added.load(), 50);
    EXPECT_EQ(info.test_count(), 50u);
}

class JobRegistryTest : public ::testing::Test {
protected:
    ManualClock clock_;
    MemorySink* sink_ = nullptr;
    std::unique_ptr<Logger> logger_;

    void SetUp() override {
        auto sink = std::make_unique<MemorySink>();
        sink_ = sink.get();
        logger_ = std::make_unique<Logger>(std::move(sink), LogLevel::Debug);
    }
};

TEST_F(JobRegistryTest, AddJobRejectsDuplicates) {
    JobRegistry registry(*logger_);
    ASSERT_TRUE(registry.add_job(make_job(clock_)).has_value());

    auto duplicate = registry.add_job(make_job(clock_));
    ASSERT_FALSE(duplicate.has_value());
    EXPECT_EQ(duplicate.error().code, ErrorCode::AlreadyExists);
    EXPECT_EQ(duplicate.error().message, "Job job-1 already exist");
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(JobRegistryTest, AddAndRemoveTests) {
    JobRegistry registry(*logger_);
    ASSERT_TRUE(registry.add_job(make_job(clock_)).has_value());

    TestScheduleUnit test(test_locator("t1"), Timing::fresh(clock_));
    auto added = registry.add_test(test);
    ASSERT_TRUE(added.has_value());
    EXPECT_TRUE(*added);

    auto again = registry.add_test(test);
    ASSERT_TRUE(again.has_value());
    EXPECT_FALSE(*again);

    auto removed = registry.remove_test("job-1", "t1");
    ASSERT_TRUE(removed.has_value());
    ASSERT_TRUE(removed->has_value());
    EXPECT_EQ((*removed)->id, "t1");

    auto missing = registry.remove_test("job-1", "t1");
    ASSERT_TRUE(missing.has_value());
    EXPECT_FALSE(missing->has_value());
    EXPECT_TRUE(sink_->contains("Test t1 not found in job job-1"));
}

TEST_F(JobRegistryTest, UnknownJobIsNotFound) {
    JobRegistry registry(*logger_);
    TestScheduleUnit test(test_locator("t1", "nope"), Timing::fresh(clock_));

    auto added = registry.add_test(test);
    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error().code, ErrorCode::NotFound);

    auto removed = registry.remove_test("nope", "t1");
    ASSERT_FALSE(removed.has_value());
    EXPECT_EQ(removed.error().code, ErrorCode::NotFound);
}

TEST_F(JobRegistryTest, RemoveJob) {
    JobRegistry registry(*logger_);
    ASSERT_TRUE(registry.add_job(make_job(job_params("b"), clock_)).has_value());
    ASSERT_TRUE(registry.add_job(make_job(job_params("a"), clock_)).has_value());

    EXPECT_EQ(registry.job_ids(), (std::vector<JobId>{"a", "b"}));
    EXPECT_TRUE(registry.remove_job("a"));
    EXPECT_FALSE(registry.remove_job("a"));
    EXPECT_EQ(registry.job("a"), nullptr);
    ASSERT_NE(registry.job("b"), nullptr);
    EXPECT_EQ(registry.job("b")->schedule_unit().locator().id, "b");
}
