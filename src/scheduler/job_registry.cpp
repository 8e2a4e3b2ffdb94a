/**
 * @file job_registry.cpp
 * @brief JobRegistry implementation.
 */

#include "scheduler/job_registry.hpp"

#include <algorithm>
#include <format>
#include <mutex>

namespace lab_alloc {

JobRegistry::JobRegistry(Logger& logger) : logger_(logger) {}

Result<void> JobRegistry::add_job(std::shared_ptr<const JobScheduleUnit> job) {
    auto locator = job->locator();
    {
        std::unique_lock lock(mutex_);
        auto [it, inserted] = jobs_.try_emplace(locator.id, nullptr);
        if (!inserted) {
            return Error{ErrorCode::AlreadyExists, "Job " + locator.id + " already exist"};
        }
        it->second = std::make_shared<SimpleJobInfo>(std::move(job));
    }
    logger_.info(std::format("Added job {}", locator.to_string()));
    return {};
}

bool JobRegistry::remove_job(const JobId& job_id) {
    size_t erased = 0;
    {
        std::unique_lock lock(mutex_);
        erased = jobs_.erase(job_id);
    }
    if (erased) {
        logger_.info(std::format("Job deleted: {}", job_id));
    } else {
        logger_.info(std::format("Job does not exist: {}", job_id));
    }
    return erased > 0;
}

Result<bool> JobRegistry::add_test(const TestScheduleUnit& test) {
    const auto& locator = test.locator();
    auto info = job(locator.job.id);
    if (!info) {
        return Error{ErrorCode::NotFound, "Job " + locator.job.id + " not found"};
    }
    bool added = info->add_test(locator);
    if (added) {
        logger_.info(std::format("Added test {}", locator.to_string()));
    } else {
        logger_.debug(std::format("Test already added: {}", locator.to_string()));
    }
    return added;
}

Result<std::optional<TestLocator>> JobRegistry::remove_test(const JobId& job_id,
                                                           const TestId& test_id) {
    auto info = job(job_id);
    if (!info) {
        return Error{ErrorCode::NotFound, "Job " + job_id + " not found"};
    }
    auto removed = info->remove_test(test_id);
    if (removed) {
        logger_.info(std::format("Test {} removed from job {}", test_id, job_id));
    } else {
        logger_.warn(std::format("Test {} not found in job {}", test_id, job_id));
    }
    return removed;
}

std::shared_ptr<SimpleJobInfo> JobRegistry::job(const JobId& job_id) const {
    std::shared_lock lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) return nullptr;
    return it->second;
}

std::vector<JobId> JobRegistry::job_ids() const {
    std::shared_lock lock(mutex_);
    std::vector<JobId> ids;
    ids.reserve(jobs_.size());
    for (const auto& [id, info] : jobs_) ids.push_back(id);
    std::sort(ids.begin(), ids.end());
    return ids;
}

size_t JobRegistry::size() const {
    std::shared_lock lock(mutex_);
    return jobs_.size();
}

}  // namespace lab_alloc
