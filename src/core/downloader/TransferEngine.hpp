#pragma once

/**
 * TransferEngine.hpp
 *
 * Boundary to the component that actually moves bytes.
 */

#include "ProgressEvent.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace downpour::core::downloader {

/**
 * How a start command resolved
 */
enum class TransferStatus {
    Completed,
    Failed,
    // Stopped through the request's cancel flag; the task was paused, this is not a failure
    Cancelled
};

inline constexpr const char* kPausedReason = "Paused";

struct TransferOutcome {
    TransferStatus status{TransferStatus::Failed};
    std::string reason;

    static TransferOutcome completed() {
        return {TransferStatus::Completed, ""};
    }

    static TransferOutcome failed(std::string reason) {
        return {TransferStatus::Failed, std::move(reason)};
    }

    static TransferOutcome cancelled() {
        return {TransferStatus::Cancelled, kPausedReason};
    }

    bool isCancelled() const { return status == TransferStatus::Cancelled; }
};

/**
 * Cancellation flag of one admission cycle. Owned by the registry, set when
 * the task is paused or the queue shuts down; never reset.
 */
using CancelToken = std::shared_ptr<std::atomic<bool>>;

inline bool isCancelled(const CancelToken& token) {
    return token && token->load();
}

struct TransferRequest {
    std::string taskId;
    std::string url;
    std::string destination;
    // Admission cycle; engines copy it into every ProgressEvent they emit
    uint64_t cycle{0};
    CancelToken cancel;
};

/**
 * TransferEngine - start/cancel command interface plus a progress stream
 *
 * start() blocks the calling worker until the transfer resolves. The
 * request's cancel flag may already be set when start() is entered; the
 * engine must then return Cancelled without moving bytes, and otherwise
 * poll the flag often enough to stop within a fraction of a second.
 * Engines must deliver progress events for one task in order; events for
 * different tasks may interleave freely.
 */
class TransferEngine {
public:
    virtual ~TransferEngine() = default;

    virtual TransferOutcome start(const TransferRequest& request) = 0;

    // Fire-and-forget; a running start() for taskId should resolve Cancelled soon after.
    virtual void cancel(const std::string& taskId) = 0;

    virtual void setProgressSink(ProgressSink sink) = 0;
};

} // namespace downpour::core::downloader
