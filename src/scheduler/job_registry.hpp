/**
 * @file job_registry.hpp
 * @brief Thread-safe table of the jobs currently known to the scheduler.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "scheduler/simple_job_info.hpp"

#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace lab_alloc {

class JobRegistry {
public:
    explicit JobRegistry(Logger& logger);

    /// Fails with AlreadyExists if a job with the same id is registered.
    Result<void> add_job(std::shared_ptr<const JobScheduleUnit> job);

    /// Returns false if the job was not registered.
    bool remove_job(const JobId& job_id);

    /**
     * @brief Registers a test under its job.
     * @return true if newly added, false if already present; NotFound if the
     *         job is unknown.
     */
    Result<bool> add_test(const TestScheduleUnit& test);

    /// Returns the removed locator; NotFound if the job is unknown.
    Result<std::optional<TestLocator>> remove_test(const JobId& job_id, const TestId& test_id);

    [[nodiscard]] std::shared_ptr<SimpleJobInfo> job(const JobId& job_id) const;
    [[nodiscard]] std::vector<JobId> job_ids() const;
    [[nodiscard]] size_t size() const;

private:
    Logger& logger_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<JobId, std::shared_ptr<SimpleJobInfo>> jobs_;
};

}  // namespace lab_alloc
