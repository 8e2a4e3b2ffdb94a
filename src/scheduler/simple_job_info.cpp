/**
 * @file simple_job_info.cpp
 * @brief SimpleJobInfo implementation.
 */

#include "scheduler/simple_job_info.hpp"

namespace lab_alloc {

SimpleJobInfo::SimpleJobInfo(std::shared_ptr<const JobScheduleUnit> schedule_unit)
    : schedule_unit_(std::move(schedule_unit)) {}

bool SimpleJobInfo::add_test(const TestLocator& test) {
    std::lock_guard lock(mutex_);
    return tests_.try_emplace(test.id, test).second;
}

std::optional<TestLocator> SimpleJobInfo::remove_test(const TestId& test_id) {
    std::lock_guard lock(mutex_);
    auto node = tests_.extract(test_id);
    if (node.empty()) return std::nullopt;
    return std::move(node.mapped());
}

bool SimpleJobInfo::has_test(const TestId& test_id) const {
    std::lock_guard lock(mutex_);
    return tests_.contains(test_id);
}

std::optional<TestLocator> SimpleJobInfo::test(const TestId& test_id) const {
    std::lock_guard lock(mutex_);
    auto it = tests_.find(test_id);
    if (it == tests_.end()) return std::nullopt;
    return it->second;
}

size_t SimpleJobInfo::test_count() const {
    std::lock_guard lock(mutex_);
    return tests_.size();
}

std::map<TestId, TestLocator> SimpleJobInfo::tests() const {
    std::lock_guard lock(mutex_);
    return tests_;
}

}  // namespace lab_alloc
