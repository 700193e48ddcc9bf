#pragma once

/**
 * DownloadManager.hpp
 *
 * Facade over the download orchestration core.
 * Presentation layers add, start, pause and resume tasks here and read a
 * filtered view of them; the transfer itself is done by a TransferEngine.
 */

#include "Task.hpp"
#include "TaskRegistry.hpp"
#include "ProgressReconciler.hpp"
#include "AdmissionQueue.hpp"
#include "ViewProjector.hpp"
#include "TransferEngine.hpp"
#include "../EventBus.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace downpour::core::downloader {

/**
 * Settings of a DownloadManager
 */
struct DownloadOptions {
    // Start commands allowed inside the engine at once
    size_t maxConcurrent{AdmissionQueue::kDefaultConcurrency};

    // Where tasks without an explicit destination are written
    std::filesystem::path directory;

    /**
     * Read "downloads.maxConcurrent" and "downloads.directory" from Config
     */
    static DownloadOptions fromConfig();
};

/**
 * DownloadManager - owns the registry, reconciler and admission queue
 *
 * Commands that do not apply to the task's current state are no-ops and
 * return false:
 * - startTask:  Idle -> Running
 * - pauseTask:  Running -> Paused (raises the transfer's cancel flag)
 * - resumeTask: Paused -> Running
 */
class DownloadManager {
public:
    /**
     * Constructor
     * @param engine Transfer engine; must outlive the manager
     * @param options Concurrency limit and download directory
     */
    explicit DownloadManager(TransferEngine& engine,
                             DownloadOptions options = DownloadOptions::fromConfig());

    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    /**
     * Wire the engine's progress stream and start the workers
     */
    void initialize();

    /**
     * Cancel active transfers and stop all workers
     */
    void shutdown();

    bool isInitialized() const { return m_initialized; }

    /**
     * Add a download task in Idle state
     * @param url Source URL
     * @param destination Output path (default: <directory>/<name>)
     * @return Task ID
     * @throws std::invalid_argument if url is blank
     */
    std::string addTask(const std::string& url, const std::string& destination = "");

    /**
     * Add several tasks
     * @return Task IDs in the order of urls
     */
    std::vector<std::string> addTasks(const std::vector<std::string>& urls);

    bool startTask(const std::string& taskId);
    bool pauseTask(const std::string& taskId);
    bool resumeTask(const std::string& taskId);

    /**
     * Start every Idle task, in insertion order
     * @return Number of tasks started
     */
    size_t startAll();

    /**
     * Pause every Running task
     * @return Number of tasks paused
     */
    size_t pauseAll();

    /**
     * Resume every Paused task
     * @return Number of tasks resumed
     */
    size_t resumeAll();

    /**
     * Filtered, searched view in insertion order
     */
    std::vector<Task> view(TaskFilter filter = TaskFilter::All,
                           const std::string& searchText = "") const;

    std::vector<Task> tasks() const;
    std::optional<Task> getTask(const std::string& taskId) const;

    /**
     * Tasks whose start command is executing inside the engine right now
     */
    size_t activeTransfers() const;

    size_t runningCount() const;

    /**
     * Apply every progress event received so far before returning
     */
    void flushProgress();

    /**
     * Block until no task is Running
     * @param timeout Maximum wait (zero waits forever)
     * @return true if settled, false on timeout
     */
    bool waitUntilSettled(std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());

    /**
     * Change notifications: "task.added" and "task.updated" carry the task
     * as JSON
     */
    EventBus& events() { return m_events; }

    const DownloadOptions& options() const { return m_options; }

private:
    DownloadOptions m_options;
    TransferEngine& m_engine;

    EventBus m_events;
    TaskRegistry m_registry;
    ProgressReconciler m_reconciler;
    std::unique_ptr<AdmissionQueue> m_queue;

    SubscriptionPtr m_settleSubscription;
    std::mutex m_settleMutex;
    std::condition_variable m_settled;

    bool m_initialized{false};
};

} // namespace downpour::core::downloader
