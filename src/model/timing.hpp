/**
 * @file timing.hpp
 * @brief Timing record, timeout settings and the derived countdown timer.
 */

#pragma once

#include "core/clock.hpp"
#include "core/types.hpp"

#include <optional>

namespace lab_alloc {

struct Timeout {
    Duration job_timeout{0};
    Duration test_timeout{0};
    Duration start_timeout{0};     ///< How long a job may wait for its first allocation

    bool operator==(const Timeout&) const = default;
};

struct Timing {
    Timestamp create_time;
    Timestamp start_time;
    std::optional<Timestamp> end_time;

    /// A new record with create and start time set to now.
    [[nodiscard]] static Timing fresh(const IClock& clock) {
        auto now = clock.now();
        return Timing{.create_time = now, .start_time = now, .end_time = std::nullopt};
    }

    bool operator==(const Timing&) const = default;
};

/**
 * @brief Read-only countdown to a fixed expiry.
 *
 * Only constructible from a timing record and a timeout, so a schedule
 * unit's timer can never disagree with its timing.
 */
class CountDownTimer {
public:
    CountDownTimer(const Timing& timing, const Timeout& timeout)
        : expire_time_(timing.start_time + timeout.job_timeout) {}

    [[nodiscard]] Timestamp expire_time() const noexcept { return expire_time_; }
    [[nodiscard]] bool is_expired(Timestamp now) const noexcept { return now >= expire_time_; }

    /// Zero once expired.
    [[nodiscard]] Duration remaining(Timestamp now) const noexcept {
        if (is_expired(now)) return Duration{0};
        return std::chrono::duration_cast<Duration>(expire_time_ - now);
    }

private:
    Timestamp expire_time_;
};

}  // namespace lab_alloc
