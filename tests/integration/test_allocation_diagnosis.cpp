/**
 * @file test_allocation_diagnosis.cpp
 * @brief Integration tests: scenario → quarantine → querier → diagnostician.
 */

#include "core/config.hpp"
#include "device/failed_device_table.hpp"
#include "device/scenario_loader.hpp"
#include "diagnostic/single_device_diagnostician.hpp"
#include "scheduler/job_registry.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

using namespace lab_alloc;
using namespace std::chrono_literals;

namespace {

// serial-1 is perfect but keeps failing init, serial-2 is busy, serial-3
// belongs to someone else.
constexpr const char* kLabScenario = R"(
    [job]
    id = "job-7"
    name = "camera_tests"
    run_as = "alice"
    driver = "AndroidInstrumentation"
    device_type = "AndroidRealDevice"
    start_timeout_sec = 300
    job_timeout_sec = 3600

    [[device]]
    id = "serial-1"
    owners = ["alice"]
    types = ["AndroidRealDevice"]
    drivers = ["AndroidInstrumentation"]
    [[device.dimension]]
    name = "host_ip"
    value = "10.0.0.1"

    [[device]]
    id = "serial-2"
    status = "BUSY"
    owners = ["alice"]
    types = ["AndroidRealDevice"]
    drivers = ["AndroidInstrumentation"]
    [[device.dimension]]
    name = "host_ip"
    value = "10.0.0.1"

    [[device]]
    id = "serial-3"
    owners = ["bob"]
    types = ["AndroidRealDevice"]
    drivers = ["AndroidInstrumentation"]
    [[device.dimension]]
    name = "host_ip"
    value = "10.0.0.2"

    [[init_failure]]
    control_id = "serial-1"
    count = 3
)";

bool contains(const std::string& text, const std::string& fragment) {
    return text.find(fragment) != std::string::npos;
}

}  // namespace

class AllocationDiagnosisTest : public ::testing::Test {
protected:
    ManualClock clock_;
    MemorySink* sink_ = nullptr;
    std::unique_ptr<Logger> logger_;
    Config config_ = default_config();
    Scenario scenario_;
    std::shared_ptr<const JobScheduleUnit> job_;

    void SetUp() override {
        auto sink = std::make_unique<MemorySink>();
        sink_ = sink.get();
        logger_ = std::make_unique<Logger>(std::move(sink), LogLevel::Debug);

        auto scenario = parse_scenario(kLabScenario);
        ASSERT_TRUE(scenario.has_value()) << scenario.error().message;
        scenario_ = std::move(scenario).value();

        auto unit = JobScheduleUnit::create(scenario_.job, clock_);
        ASSERT_TRUE(unit.has_value()) << unit.error().message;
        job_ = std::make_shared<const JobScheduleUnit>(std::move(unit).value());
    }

    void record_init_failures(FailedDeviceTable& table) const {
        for (const auto& failure : scenario_.init_failures) {
            for (uint32_t i = 0; i < failure.count; ++i) table.add(failure.control_id);
        }
    }

    std::vector<QueryDeviceInfo> visible_devices(FailedDeviceTable& table) const {
        auto failed = table.failed_device_ids();
        std::vector<QueryDeviceInfo> visible;
        for (const auto& device : scenario_.devices) {
            if (!failed.contains(device.id)) visible.push_back(device);
        }
        return visible;
    }
};

TEST_F(AllocationDiagnosisTest, QuarantinedDeviceLeavesOnlyImperfectCandidates) {
    JobRegistry registry(*logger_);
    ASSERT_TRUE(registry.add_job(job_).has_value());

    FailedDeviceTable table(config_.failed_device_table, clock_, *logger_);
    record_init_failures(table);
    ASSERT_TRUE(table.has("serial-1"));

    InMemoryDeviceQuerier querier(visible_devices(table));
    SingleDeviceDiagnostician diagnostician(job_, querier, *logger_, config_.diagnostic);

    for (int pass = 0; pass < 3; ++pass) {
        auto report = diagnostician.diagnose_job(false);
        ASSERT_TRUE(report.has_value()) << report.error().message;
    }

    auto report = diagnostician.last_report();
    ASSERT_NE(report, nullptr);
    EXPECT_EQ(diagnostician.history_size(), 3u);

    // The busy device and the foreign device together cover every requirement.
    EXPECT_EQ(report->overall_score(), SingleDeviceAssessment::kMaxScore);
    EXPECT_FALSE(report->has_perfect_match());
    EXPECT_EQ(report->device_count(), 2u);
    EXPECT_TRUE(diagnostician.has_device_matched_requirement_but_busy());

    auto result = report->result();
    EXPECT_EQ(result.error_id, AllocationErrorId::UserConfigError);
    EXPECT_TRUE(contains(result.message, "No device can meet all of your requirements."));
    EXPECT_TRUE(contains(result.message, " - serial-2@10.0.0.1"));
    EXPECT_TRUE(contains(result.message, " - serial-3@10.0.0.2"));
    EXPECT_FALSE(contains(result.message, "serial-1"));
    ASSERT_TRUE(result.cause.has_value());
    EXPECT_EQ(result.cause->error_id, AllocationErrorId::UserConfigErrorDeviceBusy);

    EXPECT_TRUE(registry.remove_job(job_->locator().id));
}

TEST_F(AllocationDiagnosisTest, ReleasedDeviceIsReportedAsInfraError) {
    FailedDeviceTable table(config_.failed_device_table, clock_, *logger_);
    record_init_failures(table);

    clock_.advance(FailedDeviceTable::kTimeToStayFailed + 1min);
    ASSERT_FALSE(table.has("serial-1"));

    InMemoryDeviceQuerier querier(visible_devices(table));
    SingleDeviceDiagnostician diagnostician(job_, querier, *logger_, config_.diagnostic);
    auto report = diagnostician.diagnose_job(false);
    ASSERT_TRUE(report.has_value()) << report.error().message;

    auto result = (*report)->result();
    EXPECT_EQ(result.error_id, AllocationErrorId::InfraError);
    EXPECT_TRUE(contains(result.message, "following 1 devices"));
    EXPECT_TRUE(contains(result.message, " - serial-1@10.0.0.1"));
}

TEST_F(AllocationDiagnosisTest, DeviceTurningBusyStaysImperfect) {
    InMemoryDeviceQuerier querier(scenario_.devices);
    SingleDeviceDiagnostician diagnostician(job_, querier, *logger_, config_.diagnostic);

    ASSERT_TRUE(diagnostician.diagnose_job(false).has_value());
    ASSERT_NE(diagnostician.last_report(), nullptr);
    EXPECT_EQ(diagnostician.last_report()->perfect_match_devices(),
              std::vector<std::string>{"serial-1@10.0.0.1"});

    // The next pass only asks for the perfect device.
    auto narrowed = diagnostician.current_query_filter();
    ASSERT_EQ(narrowed.dimension_filters.size(), 1u);
    EXPECT_EQ(narrowed.dimension_filters.front().value_regex, "serial-1");

    auto busy = scenario_.devices.front();
    busy.status = "BUSY";
    querier.upsert_device(busy);
    ASSERT_TRUE(diagnostician.diagnose_job(false).has_value());

    auto report = diagnostician.last_report();
    EXPECT_FALSE(report->has_perfect_match());
    EXPECT_FALSE(report->device_assessment("serial-1@10.0.0.1")->has_max_score());

    auto result = report->result();
    EXPECT_EQ(result.error_id, AllocationErrorId::UserConfigError);
    ASSERT_TRUE(result.cause.has_value());
    EXPECT_EQ(result.cause->error_id, AllocationErrorId::UserConfigErrorDeviceBusy);

    diagnostician.log_extra_info();
    EXPECT_TRUE(sink_->contains("Score for serial-1@10.0.0.1: 22 21 "));
}

TEST_F(AllocationDiagnosisTest, QueryOutageKeepsLastReport) {
    InMemoryDeviceQuerier querier(scenario_.devices);
    SingleDeviceDiagnostician diagnostician(job_, querier, *logger_, config_.diagnostic);
    ASSERT_TRUE(diagnostician.diagnose_job(false).has_value());
    auto before = diagnostician.last_report();

    querier.fail_next_query(Error{ErrorCode::QueryFailed, "inventory unavailable"});
    EXPECT_FALSE(diagnostician.diagnose_job(false).has_value());
    EXPECT_EQ(diagnostician.last_report(), before);

    ASSERT_TRUE(diagnostician.diagnose_job(false).has_value());
    EXPECT_EQ(diagnostician.history_size(), 2u);
}
