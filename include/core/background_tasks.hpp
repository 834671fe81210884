#pragma once

#include <string>
#include <map>
#include <vector>
#include <mutex>
#include <thread>
#include <optional>
#include <functional>
#include "common/types.hpp"

namespace updown {

enum class TaskState {
    RUNNING,
    SUCCEEDED,
    FAILED
};

inline std::string task_state_to_string(TaskState s) {
    switch (s) {
        case TaskState::RUNNING: return "running";
        case TaskState::SUCCEEDED: return "succeeded";
        case TaskState::FAILED: return "failed";
    }
    return "unknown";
}

struct TaskStatus {
    int id{0};
    std::string name;
    TaskState state{TaskState::RUNNING};
    std::string message;          // result summary or error
    int64_t started_at{0};        // epoch ms
    std::optional<int64_t> finished_at;
};

/**
 * Operator-triggered work that outlives the request that started it.
 * The body returns a summary; an exception marks the task FAILED with its
 * message. Finished threads are joined on the next spawn, the rest on
 * destruction. Only the most recent finished statuses are kept.
 */
class BackgroundTaskRunner {
public:
    using Body = std::function<std::string()>;

    static constexpr size_t MAX_FINISHED_TASKS = 64;

    BackgroundTaskRunner() = default;
    ~BackgroundTaskRunner();

    BackgroundTaskRunner(const BackgroundTaskRunner&) = delete;
    BackgroundTaskRunner& operator=(const BackgroundTaskRunner&) = delete;

    int spawn(const std::string& name, Body body);

    std::optional<TaskStatus> status(int id) const;
    std::vector<TaskStatus> all() const;

    // Blocks until every spawned task has finished
    void wait_all();

    size_t tracked_threads() const;

private:
    mutable std::mutex mutex_;
    std::map<int, TaskStatus> tasks_;
    std::map<int, std::thread> threads_;
    int next_id_{1};

    void finish(int id, TaskState state, const std::string& message);
    void reap_finished();
};

} // namespace updown
