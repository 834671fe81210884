#pragma once

#include <string>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <chrono>

namespace updown {

/**
 * Runs a body on its own thread every interval until stopped. The wait is
 * interruptible, so stop() returns promptly. Exceptions from the body are
 * logged and the next run proceeds.
 */
class PeriodicTask {
public:
    using Body = std::function<void()>;
    using IntervalFn = std::function<std::chrono::milliseconds()>;

    // The interval is re-read before every wait so settings changes apply
    PeriodicTask(std::string name, IntervalFn interval, Body body, bool run_immediately = true);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    void stop();

    bool is_running() const;
    int64_t runs() const;

    const std::string& name() const { return name_; }

private:
    std::string name_;
    IntervalFn interval_;
    Body body_;
    bool run_immediately_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_{false};
    bool running_{false};
    int64_t runs_{0};
    std::thread thread_;

    void loop();
    void run_once();
};

} // namespace updown
