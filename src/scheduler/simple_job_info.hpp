/**
 * @file simple_job_info.hpp
 * @brief Scheduler-side bookkeeping of a job and its pending tests.
 */

#pragma once

#include "model/schedule_unit.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace lab_alloc {

/**
 * @brief A job known to the scheduler plus the tests currently under it.
 *
 * The schedule unit is shared and immutable; the test map is guarded by a
 * mutex so add_test() is an atomic check-and-insert.
 */
class SimpleJobInfo {
public:
    explicit SimpleJobInfo(std::shared_ptr<const JobScheduleUnit> schedule_unit);

    [[nodiscard]] const JobScheduleUnit& schedule_unit() const noexcept { return *schedule_unit_; }
    [[nodiscard]] std::shared_ptr<const JobScheduleUnit> shared_schedule_unit() const noexcept {
        return schedule_unit_;
    }

    /// Returns false, leaving the stored locator untouched, if the id is known.
    bool add_test(const TestLocator& test);

    /// Returns the removed locator, or nullopt if the id was not present.
    std::optional<TestLocator> remove_test(const TestId& test_id);

    [[nodiscard]] bool has_test(const TestId& test_id) const;
    [[nodiscard]] std::optional<TestLocator> test(const TestId& test_id) const;
    [[nodiscard]] size_t test_count() const;

    /// Snapshot ordered by test id.
    [[nodiscard]] std::map<TestId, TestLocator> tests() const;

private:
    std::shared_ptr<const JobScheduleUnit> schedule_unit_;
    mutable std::mutex mutex_;
    std::map<TestId, TestLocator> tests_;
};

}  // namespace lab_alloc
