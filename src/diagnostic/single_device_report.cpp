/**
 * @file single_device_report.cpp
 * @brief SingleDeviceReport bookkeeping and message generation.
 */

#include "diagnostic/single_device_report.hpp"

#include <algorithm>
#include <sstream>

namespace lab_alloc {

namespace {

constexpr size_t kIdsPerCandidateType = 2;

std::string join(const std::vector<std::string>& items, const std::string& sep, size_t limit) {
    std::ostringstream oss;
    size_t n = std::min(limit, items.size());
    for (size_t i = 0; i < n; ++i) {
        if (i > 0) oss << sep;
        oss << items[i];
    }
    return oss.str();
}

std::string format_set(const std::set<std::string>& values) {
    std::vector<std::string> items(values.begin(), values.end());
    return "[" + join(items, ", ", items.size()) + "]";
}

std::string format_dimensions(const JobDimensions& dimensions) {
    std::vector<std::string> items;
    for (const auto& [name, value] : dimensions) items.push_back(name + "=" + value);
    return "{" + join(items, ", ", items.size()) + "}";
}

std::string format_multimap(const std::map<std::string, std::set<std::string>>& dimensions) {
    std::vector<std::string> items;
    for (const auto& [name, values] : dimensions) items.push_back(name + "=" + format_set(values));
    return "{" + join(items, ", ", items.size()) + "}";
}

}  // anonymous namespace

// ── Merge rule ───────────────────────────────

bool should_replace_assessment(const SingleDeviceAssessment* previous,
                               const SingleDeviceAssessment& latest) {
    if (previous == nullptr) return true;
    return previous->score() == SingleDeviceAssessment::kMaxScore
        && latest.score() < SingleDeviceAssessment::kMaxScore;
}

SingleDeviceAssessment merge_assessment(const SingleDeviceAssessment* previous,
                                        SingleDeviceAssessment latest) {
    if (should_replace_assessment(previous, latest)) return latest;
    return *previous;
}

// ── SingleDeviceReport ───────────────────────

SingleDeviceReport::SingleDeviceReport(std::shared_ptr<const JobScheduleUnit> job,
                                       std::optional<SingleDeviceAssessment> overall_assessment,
                                       bool no_perfect_candidate,
                                       DiagnosticConfig config)
    : job_(std::move(job))
    , overall_assessment_(std::move(overall_assessment))
    , no_perfect_candidate_(no_perfect_candidate)
    , config_(config) {}

int SingleDeviceReport::overall_score() const {
    return overall_assessment_ ? overall_assessment_->score() : SingleDeviceAssessment::kMinScore;
}

void SingleDeviceReport::set_device_assessment(const std::string& device_id,
                                               SingleDeviceAssessment assessment) {
    int score = assessment.score();
    auto it = device_assessments_.find(device_id);
    if (it != device_assessments_.end() && it->second.score() == score) {
        // Same score bucket; keep the device's position in it.
        it->second = std::move(assessment);
        return;
    }
    if (it != device_assessments_.end()) {
        auto ids_it = score_to_device_ids_.find(it->second.score());
        if (ids_it != score_to_device_ids_.end()) {
            std::erase(ids_it->second, device_id);
            if (ids_it->second.empty()) score_to_device_ids_.erase(ids_it);
        }
        it->second = std::move(assessment);
    } else {
        device_assessments_.emplace(device_id, std::move(assessment));
    }
    score_to_device_ids_[score].push_back(device_id);
}

const SingleDeviceAssessment* SingleDeviceReport::device_assessment(const std::string& device_id) const {
    auto it = device_assessments_.find(device_id);
    return it == device_assessments_.end() ? nullptr : &it->second;
}

bool SingleDeviceReport::has_perfect_match() const {
    return score_to_device_ids_.contains(SingleDeviceAssessment::kMaxScore);
}

std::vector<std::string> SingleDeviceReport::perfect_match_devices() const {
    auto it = score_to_device_ids_.find(SingleDeviceAssessment::kMaxScore);
    if (it == score_to_device_ids_.end()) return {};
    return it->second;
}

DiagnosticResult SingleDeviceReport::result() const {
    const auto& device_type = job_->device_type();

    if (!overall_assessment_) {
        return DiagnosticResult{AllocationErrorId::UserConfigError,
                                "No " + device_type + " found", std::nullopt};
    }
    if (overall_assessment_->score() < SingleDeviceAssessment::kMaxScore) {
        return overall_failure_result();
    }

    auto perfect_ids = perfect_match_devices();
    if (!perfect_ids.empty()) {
        return perfect_match_result(perfect_ids);
    }
    return candidate_suggestion_result();
}

DiagnosticResult SingleDeviceReport::overall_failure_result() const {
    const auto& overall = *overall_assessment_;
    const auto& device_type = job_->device_type();
    std::ostringstream report;
    std::optional<AllocationCause> cause;

    if (!overall.is_accessible()) {
        std::string msg = "You (" + job_->user().run_as + ") don't have access to any "
                        + device_type + ". Please use the 'run_as' setting to specify an"
                        + " authorized group you are in, or contact the device owners to"
                        + " request access.\n";
        report << msg;
        cause = AllocationCause{AllocationErrorId::UserConfigErrorDeviceNoAccess, msg};
    }
    if (!overall.is_driver_supported()) {
        report << "No " << device_type << " can support driver " << job_->driver() << ".\n";
    }
    if (!overall.is_device_type_supported()) {
        report << "No " << device_type << " can support device type " << device_type << ".\n";
    }
    if (!overall.is_decorators_supported()) {
        report << "No " << device_type << " can support decorators "
               << format_set(overall.unsupported_decorators()) << ".\n";
    }
    if (!overall.is_dimensions_supported()) {
        std::string msg = "No " + device_type + " can support job dimensions "
                        + format_dimensions(overall.unsupported_dimensions()) + ".\n";
        report << msg;
        if (!cause) {
            cause = AllocationCause{AllocationErrorId::UserConfigErrorDeviceNotExist, msg};
        }
    }
    if (!overall.is_dimensions_satisfied()) {
        report << "Job does not satisfy the required dimensions of any " << device_type << " "
               << format_multimap(overall.unsatisfied_dimensions()) << ".\n";
    }
    if (!overall.is_idle()) {
        report << "No IDLE " << device_type
               << ". Please extend the timeout settings to wait longer.\n";
    }
    return DiagnosticResult{AllocationErrorId::DeviceNotSatisfySlo, report.str(), std::move(cause)};
}

DiagnosticResult SingleDeviceReport::perfect_match_result(const std::vector<std::string>& ids) const {
    auto start_timeout = job_->timeout().start_timeout;
    if (start_timeout < config_.min_start_timeout) {
        return DiagnosticResult{
            AllocationErrorId::UserConfigError,
            "Failed to allocate any devices within " + std::to_string(start_timeout.count())
                + " ms. Please increase your start_timeout setting to >"
                + std::to_string(std::chrono::duration_cast<std::chrono::seconds>(
                                     config_.min_start_timeout).count())
                + " seconds and try again",
            std::nullopt};
    }
    if (no_perfect_candidate_) {
        return DiagnosticResult{
            AllocationErrorId::UserConfigError,
            "Failed to find suitable device with allocation exit strategy "
                + job_->allocation_exit_strategy()
                + ". Consider to use another allocation exit strategy.",
            std::nullopt};
    }

    std::ostringstream report;
    report << "Your job should be able to allocate the following " << ids.size()
           << " devices but the scheduler failed to allocate them. Please try again."
           << " If you still see this error after retrying, please report it to the lab"
           << " administrators:\n - "
           << join(ids, "\n - ", config_.max_candidate_types);
    if (ids.size() > config_.max_candidate_types) {
        report << "\n - ...(truncated " << ids.size() - config_.max_candidate_types
               << " devices)...";
    }
    return DiagnosticResult{AllocationErrorId::InfraError, report.str(), std::nullopt};
}

DiagnosticResult SingleDeviceReport::candidate_suggestion_result() const {
    const auto& run_as = job_->user().run_as;
    std::optional<AllocationCause> cause;
    std::vector<std::string> candidate_types;
    const size_t max_types = config_.max_candidate_types;

    // Best scores first; devices with identical errors form one candidate type.
    for (auto score_it = score_to_device_ids_.rbegin();
         score_it != score_to_device_ids_.rend() && candidate_types.size() < max_types;
         ++score_it) {
        int score = score_it->first;
        if (score >= SingleDeviceAssessment::kMaxScore) continue;

        std::vector<std::pair<std::string, std::vector<std::string>>> error_to_ids;
        for (const auto& id : score_it->second) {
            const auto* assessment = device_assessment(id);
            if (assessment == nullptr) continue;

            std::ostringstream error;
            error << "============ Score " << score << " ============\nErrors:";
            if (!assessment->is_accessible()) {
                error << "\n - NO_ACCESS (current user: " << run_as << ")";
                if (!cause) {
                    cause = AllocationCause{
                        AllocationErrorId::UserConfigErrorDeviceNoAccess,
                        "NO_ACCESS (current user: " + run_as + ") for device " + id + "."};
                }
            }
            if (assessment->is_potential_accessible()) {
                error << "\n - POTENTIAL_ACCESS: The device owner is the default value."
                      << " Need to change to the current user: " << run_as;
                if (!cause) {
                    cause = AllocationCause{
                        AllocationErrorId::UserConfigErrorDeviceNoAccess,
                        "POTENTIAL_ACCESS: The device " + id + " owner is the default value."
                            + " Need to change to the current user: " + run_as};
                }
            }
            if (!assessment->is_driver_supported()) {
                error << "\n - DRIVER_NOT_SUPPORTED: " << job_->driver();
            }
            if (!assessment->is_device_type_supported()) {
                error << "\n - DEVICE_TYPE_NOT_SUPPORTED: " << job_->device_type();
            }
            if (!assessment->is_decorators_supported()) {
                error << "\n - DECORATORS_NOT_SUPPORTED: "
                      << format_set(assessment->unsupported_decorators());
            }
            if (!assessment->is_dimensions_supported()) {
                error << "\n - DIMENSIONS_NOT_SUPPORTED: "
                      << format_dimensions(assessment->unsupported_dimensions());
            }
            if (!assessment->is_dimensions_satisfied()) {
                error << "\n - DIMENSIONS_NOT_SATISFIED: "
                      << format_multimap(assessment->unsatisfied_dimensions());
            }
            if (assessment->is_missing()) {
                error << "\n - DEVICE_IS_MISSING";
                if (!cause) {
                    cause = AllocationCause{AllocationErrorId::UserConfigErrorDeviceMissing,
                                            "DEVICE_IS_MISSING for device " + id + "."};
                }
            } else if (!assessment->is_idle()) {
                error << "\n - NOT_IDLE";
                if (!cause) {
                    cause = AllocationCause{AllocationErrorId::UserConfigErrorDeviceBusy,
                                            "NOT_IDLE for device " + id + "."};
                }
            }

            auto key = error.str();
            auto group = std::find_if(error_to_ids.begin(), error_to_ids.end(),
                                      [&](const auto& entry) { return entry.first == key; });
            if (group == error_to_ids.end()) {
                error_to_ids.emplace_back(key, std::vector<std::string>{id});
            } else {
                group->second.push_back(id);
            }
        }

        for (const auto& [error, ids] : error_to_ids) {
            std::string candidate_type = error + "\nCandidates:\n - "
                                       + join(ids, "\n - ", kIdsPerCandidateType);
            if (ids.size() > kIdsPerCandidateType) {
                candidate_type += "\n - (truncated " + std::to_string(ids.size() - kIdsPerCandidateType)
                                + " devices)";
            }
            candidate_types.push_back(std::move(candidate_type));
            if (candidate_types.size() >= max_types) break;
        }
    }

    if (candidate_types.empty()) {
        return DiagnosticResult{AllocationErrorId::InfraError,
                                "Diagnostician can not determine why devices were not allocated.",
                                std::nullopt};
    }

    std::string report = "No device can meet all of your requirements."
                         " Did you mean to use one of the following devices:\n"
                       + join(candidate_types, "\n", candidate_types.size());
    if (candidate_types.size() >= max_types) {
        report += "\n==== (truncated other candidate devices) ====";
    }
    return DiagnosticResult{AllocationErrorId::UserConfigError, std::move(report), std::move(cause)};
}

}  // namespace lab_alloc
