#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

enum class TaskState {
    Pending,
    Running,
    Succeeded,
    Failed
};

const char* task_state_name(TaskState state);

struct TaskStatus {
    std::uint64_t id = 0;
    std::string description;
    TaskState state = TaskState::Pending;
    std::string message;
};

// Runs long operations (download, install, activation) in the background and keeps
// their status pollable. Tasks cannot be cancelled once started. Only the most recent
// max_finished finished tasks are remembered; older ones are dropped when a new task starts.
class TaskRunner {
public:
    explicit TaskRunner(std::size_t max_finished = 64) : max_finished_(max_finished) {}
    // Blocks until every started task has finished.
    ~TaskRunner();

    TaskRunner(const TaskRunner&) = delete;
    TaskRunner& operator=(const TaskRunner&) = delete;

    std::uint64_t start(std::string description, std::function<bool()> work);

    std::optional<TaskStatus> status(std::uint64_t id) const;
    // Blocks until the task finishes; nullopt for an unknown id.
    std::optional<TaskStatus> wait(std::uint64_t id);
    // Drops a finished task. False if the id is unknown or the task is still running.
    bool forget(std::uint64_t id);

private:
    struct Entry {
        TaskStatus status;
        std::shared_future<void> done;
    };

    static bool finished(const Entry& entry);
    void set_state(std::uint64_t id, TaskState state, std::string message = {});
    void prune_finished_locked();

    mutable std::mutex mutex_;
    std::map<std::uint64_t, std::unique_ptr<Entry>> tasks_;
    std::uint64_t next_id_ = 1;
    std::size_t max_finished_;
};
