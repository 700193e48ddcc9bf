#pragma once

/**
 * ViewProjector.hpp
 *
 * Read-only, filtered view of the task list for presentation layers.
 */

#include "Task.hpp"

#include <optional>
#include <string>
#include <vector>

namespace downpour::core::downloader {

/**
 * Selectable list filters. Idle and Paused tasks only show under All.
 */
enum class TaskFilter {
    All,
    Running,
    Done,
    Error
};

/**
 * Badge severity for a state
 */
enum class Severity {
    Info,
    Primary,
    Warning,
    Success,
    Danger
};

class ViewProjector {
public:
    /**
     * Subsequence of tasks, in their original order, whose state passes the
     * filter and whose name contains searchText (case-sensitive)
     */
    static std::vector<Task> project(const std::vector<Task>& tasks,
                                     TaskFilter filter,
                                     const std::string& searchText);

    static bool matches(const Task& task, TaskFilter filter, const std::string& searchText);

    static std::optional<TaskFilter> parseFilter(const std::string& name);
    static const char* toString(TaskFilter filter);

    // Display helpers
    static const char* stateLabel(TaskState state);
    static Severity stateSeverity(TaskState state);
    static const char* toString(Severity severity);
    static std::string formatSpeed(double bytesPerSecond);
};

} // namespace downpour::core::downloader
