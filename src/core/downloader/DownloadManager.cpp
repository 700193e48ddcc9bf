/**
 * DownloadManager.cpp
 *
 * Implementation of the download orchestration facade.
 */

#include "DownloadManager.hpp"
#include "../Logger.hpp"
#include "../Config.hpp"
#include "../../utils/PathUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <stdexcept>

namespace downpour::core::downloader {

DownloadOptions DownloadOptions::fromConfig() {
    auto& config = Config::instance();

    DownloadOptions options;
    int maxConcurrent = config.get<int>("downloads.maxConcurrent",
                                        static_cast<int>(AdmissionQueue::kDefaultConcurrency));
    options.maxConcurrent = static_cast<size_t>(std::max(1, maxConcurrent));

    auto directory = config.get<std::string>("downloads.directory", "");
    options.directory = directory.empty() ? utils::PathUtils::getDownloadsPath()
                                          : std::filesystem::path(directory);
    return options;
}

DownloadManager::DownloadManager(TransferEngine& engine, DownloadOptions options)
    : m_options(std::move(options))
    , m_engine(engine)
    , m_registry(&m_events)
    , m_reconciler(m_registry) {
    if (m_options.maxConcurrent == 0) {
        m_options.maxConcurrent = 1;
    }
}

DownloadManager::~DownloadManager() {
    shutdown();
}

void DownloadManager::initialize() {
    if (m_initialized) return;

    Logger::instance().info("Initializing DownloadManager");

    m_settleSubscription = m_events.subscribe("task.updated", [this](const json&) {
        { std::lock_guard<std::mutex> lock(m_settleMutex); }
        m_settled.notify_all();
    });

    m_engine.setProgressSink(m_reconciler.sink());
    m_reconciler.start();
    m_queue = std::make_unique<AdmissionQueue>(m_registry, m_reconciler, m_engine, m_options.maxConcurrent);

    m_initialized = true;

    Logger::instance().info("DownloadManager initialized (max concurrent: {}, directory: {})",
                            m_options.maxConcurrent, m_options.directory.string());
}

void DownloadManager::shutdown() {
    if (!m_initialized) return;

    Logger::instance().info("Shutting down DownloadManager");

    m_queue->shutdown();
    m_reconciler.stop();
    m_engine.setProgressSink(nullptr);

    m_events.unsubscribe(m_settleSubscription);
    m_settleSubscription.reset();

    m_queue.reset();
    m_initialized = false;
}

std::string DownloadManager::addTask(const std::string& url, const std::string& destination) {
    std::string trimmed = utils::StringUtils::trim(url);
    if (trimmed.empty()) {
        throw std::invalid_argument("Download URL must not be empty");
    }

    Task task = m_registry.create(trimmed, m_options.directory, destination);
    Logger::instance().info("Added download task {}: {}", task.id, task.url);
    return task.id;
}

std::vector<std::string> DownloadManager::addTasks(const std::vector<std::string>& urls) {
    std::vector<std::string> taskIds;
    taskIds.reserve(urls.size());

    for (const auto& url : urls) {
        taskIds.push_back(addTask(url));
    }

    return taskIds;
}

bool DownloadManager::startTask(const std::string& taskId) {
    if (!m_queue) {
        Logger::instance().warn("startTask({}) before initialize()", taskId);
        return false;
    }
    return m_queue->admit(taskId, TaskState::Idle);
}

bool DownloadManager::pauseTask(const std::string& taskId) {
    if (!m_queue) {
        Logger::instance().warn("pauseTask({}) before initialize()", taskId);
        return false;
    }
    return m_queue->pause(taskId);
}

bool DownloadManager::resumeTask(const std::string& taskId) {
    if (!m_queue) {
        Logger::instance().warn("resumeTask({}) before initialize()", taskId);
        return false;
    }

    bool resumed = m_queue->admit(taskId, TaskState::Paused);
    if (resumed) {
        Logger::instance().info("Task {} resumed", taskId);
    }
    return resumed;
}

size_t DownloadManager::startAll() {
    size_t started = 0;
    for (const auto& task : m_registry.snapshot()) {
        if (task.state == TaskState::Idle && startTask(task.id)) {
            ++started;
        }
    }
    return started;
}

size_t DownloadManager::pauseAll() {
    size_t paused = 0;
    for (const auto& task : m_registry.snapshot()) {
        if (task.state == TaskState::Running && pauseTask(task.id)) {
            ++paused;
        }
    }
    return paused;
}

size_t DownloadManager::resumeAll() {
    size_t resumed = 0;
    for (const auto& task : m_registry.snapshot()) {
        if (task.state == TaskState::Paused && resumeTask(task.id)) {
            ++resumed;
        }
    }
    return resumed;
}

std::vector<Task> DownloadManager::view(TaskFilter filter, const std::string& searchText) const {
    return ViewProjector::project(m_registry.snapshot(), filter, searchText);
}

std::vector<Task> DownloadManager::tasks() const {
    return m_registry.snapshot();
}

std::optional<Task> DownloadManager::getTask(const std::string& taskId) const {
    return m_registry.find(taskId);
}

size_t DownloadManager::activeTransfers() const {
    return m_queue ? m_queue->activeCount() : 0;
}

size_t DownloadManager::runningCount() const {
    return m_registry.countInState(TaskState::Running);
}

void DownloadManager::flushProgress() {
    m_reconciler.flush();
}

bool DownloadManager::waitUntilSettled(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_settleMutex);
    auto settled = [this] { return m_registry.countInState(TaskState::Running) == 0; };

    if (timeout <= std::chrono::milliseconds::zero()) {
        m_settled.wait(lock, settled);
        return true;
    }
    return m_settled.wait_for(lock, timeout, settled);
}

} // namespace downpour::core::downloader
