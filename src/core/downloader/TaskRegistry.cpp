/**
 * TaskRegistry.cpp
 *
 * Implementation of the task registry and its state machine.
 */

#include "TaskRegistry.hpp"
#include "../EventBus.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <cmath>

namespace downpour::core::downloader {

const char* toString(ReconcileResult result) {
    switch (result) {
        case ReconcileResult::Applied:           return "applied";
        case ReconcileResult::Completed:         return "completed";
        case ReconcileResult::DroppedUnknown:    return "dropped_unknown";
        case ReconcileResult::DroppedNotRunning: return "dropped_not_running";
        case ReconcileResult::DroppedStale:      return "dropped_stale";
        case ReconcileResult::DroppedInvalid:    return "dropped_invalid";
    }
    return "unknown";
}

TaskRegistry::TaskRegistry(EventBus* events)
    : m_events(events) {
}

Task TaskRegistry::create(const std::string& url,
                          const std::filesystem::path& directory,
                          const std::string& destination) {
    Task snapshot;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        Task task;
        task.id = "dl_" + std::to_string(++m_nextId);
        task.url = url;
        task.name = deriveName(url, task.id);
        task.destination = destination.empty()
            ? (directory / utils::StringUtils::sanitizeFileName(task.name)).string()
            : destination;

        m_index.emplace(task.id, m_tasks.size());
        m_tasks.push_back({task, false, nullptr});
        snapshot = task;
    }

    Logger::instance().debug("Task {} created: {} -> {}", snapshot.id, snapshot.url, snapshot.destination);
    publish("task.added", snapshot);
    return snapshot;
}

std::optional<Task> TaskRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const Entry* entry = findLocked(id);
    if (!entry) {
        return std::nullopt;
    }
    return entry->task;
}

std::vector<Task> TaskRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<Task> tasks;
    tasks.reserve(m_tasks.size());
    for (const auto& entry : m_tasks) {
        tasks.push_back(entry.task);
    }
    return tasks;
}

size_t TaskRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

size_t TaskRegistry::countInState(TaskState state) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<size_t>(std::count_if(m_tasks.begin(), m_tasks.end(),
        [state](const Entry& entry) { return entry.task.state == state; }));
}

std::optional<Admission> TaskRegistry::admit(const std::string& id, std::optional<TaskState> expected) {
    Admission admission;
    Task snapshot;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        Entry* entry = findLocked(id);
        if (!entry) {
            return std::nullopt;
        }

        Task& task = entry->task;
        if (task.state != TaskState::Idle && task.state != TaskState::Paused) {
            return std::nullopt;
        }
        if (expected && task.state != *expected) {
            return std::nullopt;
        }

        if (!transitionLocked(*entry, TaskState::Running)) {
            return std::nullopt;
        }

        ++task.admission;
        task.speed = 0.0;
        task.error.clear();
        entry->progressRestartable = true;
        entry->cancel = std::make_shared<std::atomic<bool>>(false);

        admission = {task.id, task.admission, task.url, task.destination, entry->cancel};
        snapshot = task;
    }

    publish("task.updated", snapshot);
    return admission;
}

bool TaskRegistry::pause(const std::string& id) {
    Task snapshot;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        Entry* entry = findLocked(id);
        if (!entry || entry->task.state != TaskState::Running) {
            return false;
        }

        if (!transitionLocked(*entry, TaskState::Paused)) {
            return false;
        }
        if (entry->cancel) {
            entry->cancel->store(true);
        }
        entry->task.speed = 0.0;
        snapshot = entry->task;
    }

    publish("task.updated", snapshot);
    return true;
}

bool TaskRegistry::isCurrent(const std::string& id, uint64_t cycle) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const Entry* entry = findLocked(id);
    return entry && entry->task.state == TaskState::Running && entry->task.admission == cycle;
}

ReconcileResult TaskRegistry::applyProgress(const ProgressEvent& event) {
    if (!std::isfinite(event.percentage)) {
        return ReconcileResult::DroppedInvalid;
    }

    ReconcileResult result = ReconcileResult::Applied;
    Task snapshot;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        Entry* entry = findLocked(event.taskId);
        if (!entry) {
            return ReconcileResult::DroppedUnknown;
        }

        Task& task = entry->task;
        if (task.state != TaskState::Running) {
            return ReconcileResult::DroppedNotRunning;
        }
        if (event.cycle != 0 && event.cycle != task.admission) {
            return ReconcileResult::DroppedStale;
        }

        const double percentage = std::clamp(event.percentage, 0.0, 100.0);
        if (entry->progressRestartable) {
            task.progress = percentage;
            entry->progressRestartable = false;
        } else {
            task.progress = std::max(task.progress, percentage);
        }
        task.speed = (std::isfinite(event.rate) && event.rate > 0.0) ? event.rate : 0.0;
        task.transferredBytes = event.transferredBytes;

        if (percentage >= 100.0) {
            if (!transitionLocked(*entry, TaskState::Done)) {
                return ReconcileResult::DroppedInvalid;
            }
            task.progress = 100.0;
            task.speed = 0.0;
            result = ReconcileResult::Completed;
        }

        snapshot = task;
    }

    publish("task.updated", snapshot);
    return result;
}

bool TaskRegistry::applyOutcome(const std::string& id, uint64_t cycle, const TransferOutcome& outcome) {
    Task snapshot;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        Entry* entry = findLocked(id);
        if (!entry) {
            return false;
        }

        Task& task = entry->task;
        if (task.state != TaskState::Running || task.admission != cycle) {
            return false;
        }

        switch (outcome.status) {
            case TransferStatus::Completed:
                if (!transitionLocked(*entry, TaskState::Done)) return false;
                task.progress = 100.0;
                break;
            case TransferStatus::Failed:
                if (!transitionLocked(*entry, TaskState::Error)) return false;
                task.error = outcome.reason;
                break;
            case TransferStatus::Cancelled:
                if (!transitionLocked(*entry, TaskState::Paused)) return false;
                break;
        }
        task.speed = 0.0;
        snapshot = task;
    }

    publish("task.updated", snapshot);
    return true;
}

bool TaskRegistry::isValidTransition(TaskState from, TaskState to) {
    switch (from) {
        case TaskState::Idle:
            return to == TaskState::Running;
        case TaskState::Running:
            return to == TaskState::Paused || to == TaskState::Done || to == TaskState::Error;
        case TaskState::Paused:
            return to == TaskState::Running;
        case TaskState::Done:
        case TaskState::Error:
            return false;
    }
    return false;
}

std::string TaskRegistry::deriveName(const std::string& url, const std::string& id) {
    std::string name = utils::StringUtils::urlFileName(utils::StringUtils::trim(url));
    return name.empty() ? id : name;
}

TaskRegistry::Entry* TaskRegistry::findLocked(const std::string& id) {
    auto it = m_index.find(id);
    return it == m_index.end() ? nullptr : &m_tasks[it->second];
}

const TaskRegistry::Entry* TaskRegistry::findLocked(const std::string& id) const {
    auto it = m_index.find(id);
    return it == m_index.end() ? nullptr : &m_tasks[it->second];
}

bool TaskRegistry::transitionLocked(Entry& entry, TaskState to) {
    if (!isValidTransition(entry.task.state, to)) {
        Logger::instance().error("Rejected transition of {}: {} -> {}",
                                 entry.task.id, toString(entry.task.state), toString(to));
        return false;
    }
    entry.task.state = to;
    return true;
}

void TaskRegistry::publish(const char* event, const Task& task) {
    if (m_events) {
        m_events->emit(event, task);
    }
}

} // namespace downpour::core::downloader
