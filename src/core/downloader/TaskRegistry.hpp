#pragma once

/**
 * TaskRegistry.hpp
 *
 * Owns every download task and its lifecycle state.
 */

#include "Task.hpp"
#include "ProgressEvent.hpp"
#include "TransferEngine.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace downpour::core {
class EventBus;
}

namespace downpour::core::downloader {

/**
 * What happened to a progress event
 */
enum class ReconcileResult {
    Applied,
    Completed,
    DroppedUnknown,
    DroppedNotRunning,
    // Belongs to an earlier admission cycle of the task
    DroppedStale,
    DroppedInvalid
};

const char* toString(ReconcileResult result);

/**
 * Ticket for one admission cycle of a task
 */
struct Admission {
    std::string taskId;
    uint64_t cycle{0};
    std::string url;
    std::string destination;
    CancelToken cancel;
};

/**
 * TaskRegistry - single source of truth for task state
 *
 * Membership is append-only. All mutations are serialized behind one mutex
 * and each successful one is published on the event bus ("task.added",
 * "task.updated") after the lock is released.
 */
class TaskRegistry {
public:
    /**
     * Constructor
     * @param events Bus for change notifications (optional)
     */
    explicit TaskRegistry(EventBus* events = nullptr);

    TaskRegistry(const TaskRegistry&) = delete;
    TaskRegistry& operator=(const TaskRegistry&) = delete;

    /**
     * Create a task in Idle state
     * @param url Source URL
     * @param directory Directory used when no destination is given
     * @param destination Explicit output path (optional)
     * @return Snapshot of the new task
     */
    Task create(const std::string& url,
                const std::filesystem::path& directory,
                const std::string& destination = "");

    std::optional<Task> find(const std::string& id) const;

    /**
     * All tasks in insertion order
     */
    std::vector<Task> snapshot() const;

    size_t size() const;
    size_t countInState(TaskState state) const;

    /**
     * Idle/Paused -> Running, opening a new admission cycle
     * @param id Task id
     * @param expected Required current state (Idle or Paused), any
     *        admissible state if nullopt
     * @return Ticket for the cycle, or nullopt if the task is unknown or
     *         not admissible
     */
    std::optional<Admission> admit(const std::string& id,
                                   std::optional<TaskState> expected = std::nullopt);

    /**
     * Running -> Paused, raising the cancel flag of the current cycle
     * @return true if the task was running
     */
    bool pause(const std::string& id);

    /**
     * @return true if the task is Running in the given admission cycle
     */
    bool isCurrent(const std::string& id, uint64_t cycle) const;

    /**
     * Apply a progress report to a running task
     */
    ReconcileResult applyProgress(const ProgressEvent& event);

    /**
     * Apply the resolved start command of an admission cycle
     * @return true if the outcome changed the task
     */
    bool applyOutcome(const std::string& id, uint64_t cycle, const TransferOutcome& outcome);

    /**
     * The allowed edges of the task state machine
     */
    static bool isValidTransition(TaskState from, TaskState to);

    /**
     * Display name for a URL: its last path segment, or the id if empty
     */
    static std::string deriveName(const std::string& url, const std::string& id);

private:
    struct Entry {
        Task task;
        // First report of a new admission cycle may move progress backwards
        bool progressRestartable{false};
        CancelToken cancel;
    };

    Entry* findLocked(const std::string& id);
    const Entry* findLocked(const std::string& id) const;
    bool transitionLocked(Entry& entry, TaskState to);
    void publish(const char* event, const Task& task);

private:
    EventBus* m_events;

    mutable std::mutex m_mutex;
    std::vector<Entry> m_tasks;
    std::unordered_map<std::string, size_t> m_index;
    uint64_t m_nextId{0};
};

} // namespace downpour::core::downloader
