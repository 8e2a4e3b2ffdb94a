/**
 * @file clock.hpp
 * @brief Injectable wall clock.
 *
 * Time-windowed components (failed-device table, schedule-unit timing) read
 * the time through IClock so tests can step over 10/20-minute windows.
 */

#pragma once

#include "core/types.hpp"

#include <mutex>

namespace lab_alloc {

class IClock {
public:
    virtual ~IClock() = default;
    [[nodiscard]] virtual Timestamp now() const = 0;
};

class SystemClock : public IClock {
public:
    [[nodiscard]] Timestamp now() const override { return std::chrono::system_clock::now(); }
};

/**
 * @brief Manually driven clock for tests and replays. Thread-safe.
 */
class ManualClock : public IClock {
public:
    explicit ManualClock(Timestamp start = Timestamp{std::chrono::hours(24 * 365 * 50)})
        : now_(start) {}

    [[nodiscard]] Timestamp now() const override {
        std::lock_guard lock(mutex_);
        return now_;
    }

    void set(Timestamp t) {
        std::lock_guard lock(mutex_);
        now_ = t;
    }

    template <typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> d) {
        std::lock_guard lock(mutex_);
        now_ += std::chrono::duration_cast<Timestamp::duration>(d);
    }

private:
    mutable std::mutex mutex_;
    Timestamp now_;
};

}  // namespace lab_alloc
