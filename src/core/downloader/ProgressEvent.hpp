#pragma once

/**
 * ProgressEvent.hpp
 *
 * Progress report pushed by a transfer engine while a task downloads.
 */

#include <cstdint>
#include <functional>
#include <string>

namespace downpour::core::downloader {

struct ProgressEvent {
    std::string taskId;
    uint64_t transferredBytes{0};
    // Bytes per second
    double rate{0.0};
    // 0..100
    double percentage{0.0};
    // Admission cycle the transfer belongs to, 0 if the engine does not know
    uint64_t cycle{0};
};

using ProgressSink = std::function<void(const ProgressEvent&)>;

} // namespace downpour::core::downloader
