/**
 * ViewProjector.cpp
 */

#include "ViewProjector.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <iterator>

namespace downpour::core::downloader {

std::vector<Task> ViewProjector::project(const std::vector<Task>& tasks,
                                         TaskFilter filter,
                                         const std::string& searchText) {
    std::vector<Task> view;
    std::copy_if(tasks.begin(), tasks.end(), std::back_inserter(view),
        [&](const Task& task) { return matches(task, filter, searchText); });
    return view;
}

bool ViewProjector::matches(const Task& task, TaskFilter filter, const std::string& searchText) {
    bool stateMatches = false;
    switch (filter) {
        case TaskFilter::All:     stateMatches = true; break;
        case TaskFilter::Running: stateMatches = task.state == TaskState::Running; break;
        case TaskFilter::Done:    stateMatches = task.state == TaskState::Done; break;
        case TaskFilter::Error:   stateMatches = task.state == TaskState::Error; break;
    }
    return stateMatches && utils::StringUtils::contains(task.name, searchText);
}

std::optional<TaskFilter> ViewProjector::parseFilter(const std::string& name) {
    if (name == "all") return TaskFilter::All;
    if (name == "running") return TaskFilter::Running;
    if (name == "done") return TaskFilter::Done;
    if (name == "error") return TaskFilter::Error;
    return std::nullopt;
}

const char* ViewProjector::toString(TaskFilter filter) {
    switch (filter) {
        case TaskFilter::All:     return "all";
        case TaskFilter::Running: return "running";
        case TaskFilter::Done:    return "done";
        case TaskFilter::Error:   return "error";
    }
    return "all";
}

const char* ViewProjector::stateLabel(TaskState state) {
    switch (state) {
        case TaskState::Idle:    return "Waiting";
        case TaskState::Running: return "Downloading";
        case TaskState::Paused:  return "Paused";
        case TaskState::Done:    return "Completed";
        case TaskState::Error:   return "Failed";
    }
    return "Unknown";
}

Severity ViewProjector::stateSeverity(TaskState state) {
    switch (state) {
        case TaskState::Idle:    return Severity::Info;
        case TaskState::Running: return Severity::Primary;
        case TaskState::Paused:  return Severity::Warning;
        case TaskState::Done:    return Severity::Success;
        case TaskState::Error:   return Severity::Danger;
    }
    return Severity::Info;
}

const char* ViewProjector::toString(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Primary: return "primary";
        case Severity::Warning: return "warning";
        case Severity::Success: return "success";
        case Severity::Danger:  return "danger";
    }
    return "info";
}

std::string ViewProjector::formatSpeed(double bytesPerSecond) {
    return utils::StringUtils::formatSpeed(bytesPerSecond);
}

} // namespace downpour::core::downloader
