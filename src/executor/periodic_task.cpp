/**
 * @file periodic_task.cpp
 * @brief PeriodicTask implementation.
 */

#include "executor/periodic_task.hpp"

namespace lab_alloc {

PeriodicTask::PeriodicTask(std::string name,
                           std::chrono::milliseconds initial_delay,
                           std::chrono::milliseconds delay,
                           Body body,
                           ErrorHandler on_error)
    : name_(std::move(name))
    , initial_delay_(initial_delay)
    , delay_(delay)
    , body_(std::move(body))
    , on_error_(std::move(on_error)) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    if (running_.exchange(true)) return;
    worker_ = std::jthread([this](std::stop_token stop) {
        run_loop(stop);
    });
}

void PeriodicTask::stop() {
    if (worker_.joinable()) {
        worker_.request_stop();
        wait_cv_.notify_all();
        worker_.join();
    }
    running_.store(false);
}

bool PeriodicTask::wait_for(std::stop_token& stop, std::chrono::milliseconds d) {
    std::unique_lock lock(wait_mutex_);
    // Only a stop request ends the wait early.
    wait_cv_.wait_for(lock, stop, d, [] { return false; });
    return !stop.stop_requested();
}

void PeriodicTask::run_loop(std::stop_token stop) {
    if (!wait_for(stop, initial_delay_)) return;

    while (!stop.stop_requested()) {
        try {
            body_();
        } catch (const std::exception& e) {
            ++failure_count_;
            if (on_error_) on_error_(e);
        }
        ++run_count_;

        if (!wait_for(stop, delay_)) return;
    }
}

}  // namespace lab_alloc
