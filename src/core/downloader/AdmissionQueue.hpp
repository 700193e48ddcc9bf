#pragma once

/**
 * AdmissionQueue.hpp
 *
 * Bounded-concurrency dispatch of start commands to the transfer engine.
 */

#include "TaskRegistry.hpp"
#include "ProgressReconciler.hpp"
#include "TransferEngine.hpp"
#include "../ThreadPool.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace downpour::core::downloader {

/**
 * AdmissionQueue - FIFO scheduler with a fixed number of engine slots
 *
 * admit() flips the task to Running at once and queues its start command.
 * The command reaches the engine when one of the pool's workers is free,
 * so at most maxConcurrent start() calls are ever in flight. A job whose
 * task was paused while it waited is skipped without touching the engine.
 * At most one start() per task is in flight: a resumed cycle waits on its
 * worker until the cancelled cycle has left the engine.
 */
class AdmissionQueue {
public:
    static constexpr size_t kDefaultConcurrency = 3;

    AdmissionQueue(TaskRegistry& registry,
                   ProgressReconciler& reconciler,
                   TransferEngine& engine,
                   size_t maxConcurrent = kDefaultConcurrency);

    ~AdmissionQueue();

    AdmissionQueue(const AdmissionQueue&) = delete;
    AdmissionQueue& operator=(const AdmissionQueue&) = delete;

    /**
     * Admit an Idle or Paused task
     * @param taskId Task id
     * @param expected Only admit if the task is currently in this state
     * @return false if the task is unknown, not admissible or the queue is
     *         shut down
     */
    bool admit(const std::string& taskId, std::optional<TaskState> expected = std::nullopt);

    /**
     * Pause a Running task, raise its cancel flag and send the engine a
     * cancel command if the transfer is already inside it
     * @return false if the task was not running
     */
    bool pause(const std::string& taskId);

    /**
     * Number of start commands currently inside the engine
     */
    size_t activeCount() const { return m_active.load(); }

    /**
     * Number of admitted commands still waiting for a slot
     */
    size_t queuedCount() const { return m_pool.pendingTasks(); }

    size_t limit() const { return m_limit; }

    /**
     * Block until no command is queued or executing
     */
    void waitIdle();

    /**
     * Stop admitting, cancel active transfers and join the workers
     */
    void shutdown();

private:
    void execute(const Admission& admission);

private:
    TaskRegistry& m_registry;
    ProgressReconciler& m_reconciler;
    TransferEngine& m_engine;
    size_t m_limit;

    std::atomic<bool> m_accepting{true};
    std::atomic<size_t> m_active{0};

    mutable std::mutex m_activeMutex;
    std::condition_variable m_activeReleased;
    // Task id -> cancel flag of the cycle inside the engine
    std::unordered_map<std::string, CancelToken> m_activeTransfers;

    // Last member: its workers must be joined before the state above dies
    ThreadPool m_pool;
};

} // namespace downpour::core::downloader
