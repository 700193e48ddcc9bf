#pragma once

/**
 * ProgressReconciler.hpp
 *
 * Applies engine progress reports and transfer outcomes to the registry.
 */

#include "TaskRegistry.hpp"
#include "ProgressEvent.hpp"
#include "TransferEngine.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace downpour::core::downloader {

/**
 * ProgressReconciler - single consumer of the progress stream
 *
 * Engine threads post() events into a FIFO channel; one consumer thread
 * applies them in arrival order, so per-task ordering from the engine is
 * preserved. Events for unknown or non-running tasks are dropped.
 */
class ProgressReconciler {
public:
    explicit ProgressReconciler(TaskRegistry& registry);
    ~ProgressReconciler();

    ProgressReconciler(const ProgressReconciler&) = delete;
    ProgressReconciler& operator=(const ProgressReconciler&) = delete;

    /**
     * Start the consumer thread
     */
    void start();

    /**
     * Apply what is still queued, then stop the consumer thread
     */
    void stop();

    bool isRunning() const;

    /**
     * Queue an event for the consumer thread
     */
    void post(ProgressEvent event);

    /**
     * Sink to hand to a TransferEngine; forwards into post()
     */
    ProgressSink sink();

    /**
     * Apply one event immediately on the calling thread
     */
    ReconcileResult reconcile(const ProgressEvent& event);

    /**
     * Apply how a start command resolved. Only the cycle that is still
     * running is affected; Cancelled maps to Paused, Failed to Error.
     * @return true if the task changed
     */
    bool reconcileOutcome(const std::string& taskId, uint64_t cycle, const TransferOutcome& outcome);

    /**
     * Block until every posted event has been applied
     */
    void flush();

    size_t pending() const;

private:
    void consumerLoop();

private:
    TaskRegistry& m_registry;

    std::deque<ProgressEvent> m_channel;
    mutable std::mutex m_mutex;
    std::condition_variable m_available;
    std::condition_variable m_drained;
    bool m_stop{false};
    bool m_busy{false};
    std::thread m_consumer;
};

} // namespace downpour::core::downloader
