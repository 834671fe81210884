#include "core/periodic_task.hpp"
#include <spdlog/spdlog.h>

namespace updown {

PeriodicTask::PeriodicTask(std::string name, IntervalFn interval, Body body, bool run_immediately)
    : name_(std::move(name))
    , interval_(std::move(interval))
    , body_(std::move(body))
    , run_immediately_(run_immediately)
{
}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        spdlog::warn("{} already running", name_);
        return;
    }
    stop_requested_ = false;
    running_ = true;
    thread_ = std::thread(&PeriodicTask::loop, this);
    spdlog::info("{} started", name_);
}

void PeriodicTask::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    spdlog::info("{} stopped", name_);
}

bool PeriodicTask::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

int64_t PeriodicTask::runs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runs_;
}

void PeriodicTask::run_once() {
    try {
        body_();
    } catch (const std::exception& e) {
        spdlog::error("{} run failed: {}", name_, e.what());
    }
    std::lock_guard<std::mutex> lock(mutex_);
    runs_++;
}

void PeriodicTask::loop() {
    if (run_immediately_) {
        run_once();
    }

    while (true) {
        auto interval = interval_();
        if (interval < std::chrono::milliseconds(1)) {
            interval = std::chrono::milliseconds(1);
        }
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_for(lock, interval, [this] { return stop_requested_; })) {
                return;
            }
        }
        run_once();
    }
}

} // namespace updown
