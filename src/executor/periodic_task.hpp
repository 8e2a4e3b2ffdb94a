/**
 * @file periodic_task.hpp
 * @brief Fixed-delay recurring task on a dedicated std::jthread.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace lab_alloc {

/**
 * @brief Runs a callable repeatedly with a fixed delay between the end of one
 *        run and the start of the next.
 *
 * A run that throws std::exception is reported to the error handler and the
 * schedule continues. stop() (or destruction) interrupts the wait promptly.
 */
class PeriodicTask {
public:
    using Body = std::function<void()>;
    using ErrorHandler = std::function<void(const std::exception&)>;

    PeriodicTask(std::string name,
                 std::chrono::milliseconds initial_delay,
                 std::chrono::milliseconds delay,
                 Body body,
                 ErrorHandler on_error = {});
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /// Starts the worker thread. Calling start() on a running task is a no-op.
    void start();
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] uint64_t run_count() const noexcept { return run_count_.load(); }
    [[nodiscard]] uint64_t failure_count() const noexcept { return failure_count_.load(); }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    void run_loop(std::stop_token stop);
    /// Returns false if stop was requested during the wait.
    bool wait_for(std::stop_token& stop, std::chrono::milliseconds d);

    std::string name_;
    std::chrono::milliseconds initial_delay_;
    std::chrono::milliseconds delay_;
    Body body_;
    ErrorHandler on_error_;

    std::mutex wait_mutex_;
    std::condition_variable_any wait_cv_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> run_count_{0};
    std::atomic<uint64_t> failure_count_{0};
    std::jthread worker_;
};

}  // namespace lab_alloc
