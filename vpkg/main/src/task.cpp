#include "task.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <chrono>
#include <vector>

const char* task_state_name(TaskState state) {
    switch (state) {
        case TaskState::Pending: return "pending";
        case TaskState::Running: return "running";
        case TaskState::Succeeded: return "succeeded";
        case TaskState::Failed: return "failed";
    }
    return "unknown";
}

TaskRunner::~TaskRunner() {
    std::vector<std::shared_future<void>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : tasks_) {
            pending.push_back(entry->done);
        }
    }
    for (auto& f : pending) {
        if (f.valid()) f.wait();
    }
}

bool TaskRunner::finished(const Entry& entry) {
    return entry.done.valid() && entry.done.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

void TaskRunner::prune_finished_locked() {
    std::size_t finished_count = 0;
    for (const auto& [id, entry] : tasks_) {
        if (finished(*entry)) ++finished_count;
    }
    // Ids grow monotonically, so the map is ordered oldest first
    for (auto it = tasks_.begin(); it != tasks_.end() && finished_count > max_finished_;) {
        if (finished(*it->second)) {
            it = tasks_.erase(it);
            --finished_count;
        } else {
            ++it;
        }
    }
}

std::uint64_t TaskRunner::start(std::string description, std::function<bool()> work) {
    std::lock_guard<std::mutex> lock(mutex_);
    prune_finished_locked();
    const std::uint64_t id = next_id_++;

    auto entry = std::make_unique<Entry>();
    entry->status.id = id;
    entry->status.description = std::move(description);
    log_info(string_format("info.task_started", id, entry->status.description));

    entry->done = std::async(std::launch::async, [this, id, work = std::move(work)]() {
        set_state(id, TaskState::Running);
        try {
            const bool ok = work();
            set_state(id, ok ? TaskState::Succeeded : TaskState::Failed);
        } catch (const std::exception& e) {
            log_error(string_format("error.task_failed", id, e.what()));
            set_state(id, TaskState::Failed, e.what());
        }
    }).share();

    tasks_.emplace(id, std::move(entry));
    return id;
}

void TaskRunner::set_state(std::uint64_t id, TaskState state, std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return;
    it->second->status.state = state;
    if (!message.empty()) it->second->status.message = std::move(message);
    if (state == TaskState::Succeeded || state == TaskState::Failed) {
        log_info(string_format("info.task_finished", id, task_state_name(state)));
    }
}

std::optional<TaskStatus> TaskRunner::status(std::uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return std::nullopt;
    return it->second->status;
}

std::optional<TaskStatus> TaskRunner::wait(std::uint64_t id) {
    std::shared_future<void> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) return std::nullopt;
        done = it->second->done;
    }
    done.wait();
    return status(id);
}

bool TaskRunner::forget(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end() || !finished(*it->second)) return false;
    tasks_.erase(it);
    return true;
}
