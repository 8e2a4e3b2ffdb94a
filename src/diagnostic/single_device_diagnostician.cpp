/**
 * @file single_device_diagnostician.cpp
 * @brief SingleDeviceDiagnostician implementation.
 */

#include "diagnostic/single_device_diagnostician.hpp"

#include "model/dimension.hpp"

#include <algorithm>
#include <format>

namespace lab_alloc {

namespace {

std::string strip_lab_suffix(const std::string& universal_id) {
    auto pos = universal_id.find('@');
    return (pos != std::string::npos && pos > 0) ? universal_id.substr(0, pos) : universal_id;
}

std::string host_dimension(const QueryDeviceInfo& record, std::string_view name) {
    for (const auto& dimension : record.dimensions) {
        if (equals_ignore_case(dimension.name, name)) return dimension.value;
    }
    return std::string{dimension::value::kUnknown};
}

}  // anonymous namespace

SingleDeviceDiagnostician::SingleDeviceDiagnostician(std::shared_ptr<const JobScheduleUnit> job,
                                                     IDeviceQuerier& querier,
                                                     Logger& logger,
                                                     DiagnosticConfig config,
                                                     DeviceFilter filter,
                                                     std::shared_ptr<const SingleDeviceAssessor> assessor)
    : job_(std::move(job))
    , querier_(querier)
    , logger_(logger)
    , config_(config)
    , filter_(std::move(filter))
    , assessor_(assessor ? std::move(assessor) : std::make_shared<const SingleDeviceAssessor>()) {}

Result<std::shared_ptr<const SingleDeviceReport>> SingleDeviceDiagnostician::diagnose_job(
    bool no_perfect_candidate) {
    std::lock_guard pass_lock(diagnose_mutex_);

    auto candidates = query_devices(current_query_filter());
    if (!candidates) {
        logger_.warn(std::format("Device query failed for job {}: {}",
                                 job_->locator().to_string(), candidates.error().describe()));
        return candidates.error();
    }

    auto previous = last_report_.load(std::memory_order_acquire);
    std::shared_ptr<SingleDeviceReport> report;
    if (previous) {
        report = std::make_shared<SingleDeviceReport>(*previous);
    } else if (candidates.value().empty()) {
        report = std::make_shared<SingleDeviceReport>(job_, std::nullopt, no_perfect_candidate, config_);
    } else {
        report = std::make_shared<SingleDeviceReport>(
            job_, assessor_->assess(*job_, candidates.value()), no_perfect_candidate, config_);
    }

    // Every requirement is met by some device but no single device meets them all,
    // so each candidate is assessed on its own.
    bool matched_but_busy = false;
    if (report->overall_score() == SingleDeviceAssessment::kMaxScore) {
        for (const auto& candidate : candidates.value()) {
            auto device_id = candidate.locator.universal_id();
            auto assessment = assessor_->assess(*job_, candidate);
            if (assessment.is_requirement_matched_but_busy()) matched_but_busy = true;
            auto merged = merge_assessment(report->device_assessment(device_id), std::move(assessment));
            report->set_device_assessment(device_id, std::move(merged));
        }
    }
    matched_but_busy_.store(matched_but_busy, std::memory_order_release);

    std::shared_ptr<const SingleDeviceReport> published = std::move(report);
    last_report_.store(published, std::memory_order_release);
    size_t pass = 0;
    {
        std::lock_guard lock(history_mutex_);
        history_.push_back(published);
        pass = history_.size();
    }
    logger_.debug(std::format("Diagnose pass {} for job {}: {} candidates, overall score {}", pass,
                              job_->locator().to_string(), candidates.value().size(),
                              published->overall_score()));
    return published;
}

std::shared_ptr<const SingleDeviceReport> SingleDeviceDiagnostician::last_report() const {
    return last_report_.load(std::memory_order_acquire);
}

size_t SingleDeviceDiagnostician::history_size() const {
    std::lock_guard lock(history_mutex_);
    return history_.size();
}

DeviceQueryFilter SingleDeviceDiagnostician::current_query_filter() const {
    auto previous = last_report_.load(std::memory_order_acquire);
    if (previous) {
        auto perfect_ids = previous->perfect_match_devices();
        if (perfect_ids.size() < config_.max_query_device_count) {
            std::string value_regex;
            for (size_t i = 0; i < perfect_ids.size(); ++i) {
                if (i > 0) value_regex += "|";
                value_regex += strip_lab_suffix(perfect_ids[i]);
            }
            DeviceQueryFilter filter;
            filter.dimension_filters.push_back(
                DimensionFilter{std::string{dimension::name::kId}, std::move(value_regex)});
            return filter;
        }
    }
    return filter_.filter_for(*job_);
}

Result<std::vector<DeviceInfo>> SingleDeviceDiagnostician::query_devices(const DeviceQueryFilter& filter) {
    auto result = querier_.query_device(filter);
    if (!result) return result.error();

    std::vector<DeviceInfo> candidates;
    candidates.reserve(result.value().devices.size());
    for (const auto& record : result.value().devices) {
        auto device = convert_device_info(record);
        if (!device) return device.error();
        if (is_candidate(device.value())) {
            candidates.push_back(std::move(device).value());
        }
    }
    return candidates;
}

bool SingleDeviceDiagnostician::is_candidate(const DeviceInfo& device) const {
    const auto& job_dimensions = job_->dimensions();

    // Devices with a SIM card are reserved for jobs that ask for one.
    auto sims = device.dimensions.supported.get(std::string{dimension::name::kSimCardInfo});
    bool device_has_sim = std::any_of(sims.begin(), sims.end(), [](const std::string& v) {
        return v != dimension::value::kNoSim;
    });
    if (device_has_sim && !job_dimensions.contains(std::string{dimension::name::kSimCardInfo})) {
        return false;
    }

    // Devices in a dedicated pool are reserved for jobs that ask for that pool.
    auto pools = device.dimensions.supported.get(std::string{dimension::name::kPoolName});
    bool device_in_private_pool = std::any_of(pools.begin(), pools.end(), [](const std::string& v) {
        return v != dimension::value::kDefaultPoolName;
    });
    auto job_pool = job_dimensions.find(std::string{dimension::name::kPoolName});
    bool job_wants_private_pool = job_pool != job_dimensions.end()
                               && job_pool->second != dimension::value::kDefaultPoolName;
    return !device_in_private_pool || job_wants_private_pool;
}

void SingleDeviceDiagnostician::log_extra_info() const {
    std::vector<std::shared_ptr<const SingleDeviceReport>> history;
    {
        std::lock_guard lock(history_mutex_);
        history = history_;
    }

    std::vector<std::string> perfect_candidates;
    for (size_t i = 0; i < history.size(); ++i) {
        auto ids = history[i]->perfect_match_devices();
        std::string joined;
        for (size_t j = 0; j < ids.size(); ++j) {
            if (j > 0) joined += ", ";
            joined += ids[j];
        }
        logger_.info(std::format("Diagnose {}'s perfect candidates: {}", i, joined));
        perfect_candidates.insert(perfect_candidates.end(), ids.begin(), ids.end());
    }

    for (const auto& candidate : perfect_candidates) {
        std::string scores;
        for (const auto& report : history) {
            const auto* assessment = report->device_assessment(candidate);
            scores += assessment ? std::format("{} ", assessment->score()) : std::string{"N/A "};
        }
        logger_.info(std::format("Score for {}: {}", candidate, scores));
    }
}

Result<DeviceInfo> SingleDeviceDiagnostician::convert_device_info(const QueryDeviceInfo& record) {
    auto status = parse_device_status(record.status);
    if (!status) {
        return Error{ErrorCode::ParseError,
                     "Unknown status '" + record.status + "' of device " + record.id};
    }

    DeviceInfo device;
    device.locator = DeviceLocator{record.id,
                                   LabLocator{host_dimension(record, dimension::name::kHostIp),
                                              host_dimension(record, dimension::name::kHostName)}};
    device.status = *status;
    device.owners.insert(record.owners.begin(), record.owners.end());
    device.types.insert(record.types.begin(), record.types.end());
    device.drivers.insert(record.drivers.begin(), record.drivers.end());
    device.decorators.insert(record.decorators.begin(), record.decorators.end());
    for (const auto& dimension : record.dimensions) {
        if (dimension.required) {
            device.dimensions.required.add(dimension.name, dimension.value);
        } else {
            device.dimensions.supported.add(dimension.name, dimension.value);
        }
    }
    return device;
}

}  // namespace lab_alloc
