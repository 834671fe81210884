#include "core/background_tasks.hpp"
#include <spdlog/spdlog.h>

namespace updown {

BackgroundTaskRunner::~BackgroundTaskRunner() {
    wait_all();
}

int BackgroundTaskRunner::spawn(const std::string& name, Body body) {
    reap_finished();

    std::lock_guard<std::mutex> lock(mutex_);
    int id = next_id_++;

    TaskStatus status;
    status.id = id;
    status.name = name;
    status.started_at = now_ms();
    tasks_[id] = status;

    threads_[id] = std::thread([this, id, name, body = std::move(body)]() {
        try {
            std::string result = body();
            finish(id, TaskState::SUCCEEDED, result);
            spdlog::info("Task {} ({}) finished: {}", id, name, result);
        } catch (const std::exception& e) {
            finish(id, TaskState::FAILED, e.what());
            spdlog::error("Task {} ({}) failed: {}", id, name, e.what());
        }
    });

    spdlog::info("Task {} ({}) started", id, name);
    return id;
}

void BackgroundTaskRunner::finish(int id, TaskState state, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return;
    it->second.state = state;
    it->second.message = message;
    it->second.finished_at = now_ms();
}

std::optional<TaskStatus> BackgroundTaskRunner::status(int id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return std::nullopt;
    return it->second;
}

std::vector<TaskStatus> BackgroundTaskRunner::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TaskStatus> out;
    for (const auto& [id, status] : tasks_) {
        out.push_back(status);
    }
    return out;
}

void BackgroundTaskRunner::reap_finished() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = threads_.begin(); it != threads_.end();) {
            auto task = tasks_.find(it->first);
            if (task != tasks_.end() && task->second.state != TaskState::RUNNING) {
                done.push_back(std::move(it->second));
                it = threads_.erase(it);
            } else {
                ++it;
            }
        }

        // Oldest finished statuses go first; ids increase with spawn order
        size_t finished = 0;
        for (const auto& [id, status] : tasks_) {
            if (status.state != TaskState::RUNNING) finished++;
        }
        for (auto it = tasks_.begin(); it != tasks_.end() && finished > MAX_FINISHED_TASKS;) {
            if (it->second.state != TaskState::RUNNING && threads_.count(it->first) == 0) {
                it = tasks_.erase(it);
                finished--;
            } else {
                ++it;
            }
        }
    }

    // A finished body has already released the mutex, so these joins are short
    for (auto& t : done) {
        if (t.joinable()) t.join();
    }
}

size_t BackgroundTaskRunner::tracked_threads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return threads_.size();
}

void BackgroundTaskRunner::wait_all() {
    std::map<int, std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        threads.swap(threads_);
    }
    for (auto& [id, t] : threads) {
        if (t.joinable()) t.join();
    }
}

} // namespace updown
