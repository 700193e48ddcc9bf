#pragma once

/**
 * Task.hpp
 *
 * A single user-requested download and its lifecycle state.
 */

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace downpour::core::downloader {

using json = nlohmann::json;

/**
 * Task lifecycle state
 *
 *   Idle -> Running -> {Paused, Done, Error}
 *   Paused -> Running
 */
enum class TaskState {
    Idle,
    Running,
    Paused,
    Done,
    Error
};

NLOHMANN_JSON_SERIALIZE_ENUM(TaskState, {
    {TaskState::Idle, "idle"},
    {TaskState::Running, "running"},
    {TaskState::Paused, "paused"},
    {TaskState::Done, "done"},
    {TaskState::Error, "error"},
})

inline const char* toString(TaskState state) {
    switch (state) {
        case TaskState::Idle:    return "idle";
        case TaskState::Running: return "running";
        case TaskState::Paused:  return "paused";
        case TaskState::Done:    return "done";
        case TaskState::Error:   return "error";
    }
    return "unknown";
}

/**
 * Task - value snapshot of one download
 *
 * The registry owns the live record; everything outside it sees copies.
 */
struct Task {
    // Unique id ("dl_<n>"), never reused
    std::string id;

    // Source URL
    std::string url;

    // Display label derived from the URL at creation
    std::string name;

    // Output path handed to the transfer engine
    std::string destination;

    // Percentage in [0, 100]
    double progress{0.0};

    // Bytes per second, zero unless running
    double speed{0.0};

    // Last byte count reported by the engine
    uint64_t transferredBytes{0};

    TaskState state{TaskState::Idle};

    // Reason of the last failed admission
    std::string error;

    // Admission cycle, bumped on every start/resume
    uint64_t admission{0};

    bool isRunning() const { return state == TaskState::Running; }

    bool isFinished() const {
        return state == TaskState::Done || state == TaskState::Error;
    }
};

inline void to_json(json& j, const Task& task) {
    j = json{
        {"id", task.id},
        {"url", task.url},
        {"name", task.name},
        {"destination", task.destination},
        {"progress", task.progress},
        {"speed", task.speed},
        {"transferred", task.transferredBytes},
        {"state", task.state},
        {"error", task.error},
    };
}

} // namespace downpour::core::downloader
