/**
 * @file device_query.hpp
 * @brief Device inventory query records and the querier interface.
 *
 * These records mirror what the lab inventory service returns; transport and
 * serialization live outside this library.
 */

#pragma once

#include "core/result.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lab_alloc {

struct QueryDimension {
    std::string name;
    std::string value;
    bool required = false;
};

struct QueryDeviceInfo {
    std::string id;
    std::string status;
    std::vector<std::string> owners;
    std::vector<std::string> types;
    std::vector<std::string> drivers;
    std::vector<std::string> decorators;
    std::vector<QueryDimension> dimensions;
};

struct DeviceQueryResult {
    std::vector<QueryDeviceInfo> devices;
};

/**
 * @brief Regex filter on one dimension. The name "id" filters on the device id.
 */
struct DimensionFilter {
    std::string name;
    std::string value_regex;
};

/**
 * @brief Conjunction of full-match regex filters. Empty fields do not constrain.
 */
struct DeviceQueryFilter {
    std::vector<DimensionFilter> dimension_filters;
    std::vector<std::string> type_regex;
    std::vector<std::string> driver_regex;
    std::vector<std::string> decorator_regex;
    std::vector<std::string> owner_regex;
    std::string status_regex;

    /**
     * @brief Whether @p device passes every filter. Each *_regex entry must
     *        match at least one of the corresponding device values.
     */
    [[nodiscard]] bool matches(const QueryDeviceInfo& device) const;
};

/**
 * @brief Blocking device inventory lookup.
 *
 * Implementations report transport failures as ErrorCode::QueryFailed and
 * interruption as ErrorCode::Interrupted.
 */
class IDeviceQuerier {
public:
    virtual ~IDeviceQuerier() = default;
    virtual Result<DeviceQueryResult> query_device(const DeviceQueryFilter& filter) = 0;
};

/**
 * @brief Querier over a fixed inventory held in memory.
 *
 * Used by the CLI to replay scenario files and by tests. Thread-safe.
 */
class InMemoryDeviceQuerier : public IDeviceQuerier {
public:
    InMemoryDeviceQuerier() = default;
    explicit InMemoryDeviceQuerier(std::vector<QueryDeviceInfo> devices);

    Result<DeviceQueryResult> query_device(const DeviceQueryFilter& filter) override;

    void set_devices(std::vector<QueryDeviceInfo> devices);
    void upsert_device(QueryDeviceInfo device);
    bool remove_device(const std::string& id);

    /// The next query returns @p error instead of results.
    void fail_next_query(Error error);

    [[nodiscard]] size_t query_count() const;
    [[nodiscard]] std::optional<DeviceQueryFilter> last_filter() const;

private:
    mutable std::mutex mutex_;
    std::vector<QueryDeviceInfo> devices_;
    std::optional<Error> next_error_;
    std::optional<DeviceQueryFilter> last_filter_;
    size_t query_count_{0};
};

}  // namespace lab_alloc
