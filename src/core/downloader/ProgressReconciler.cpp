/**
 * ProgressReconciler.cpp
 *
 * Implementation of the progress channel and its consumer.
 */

#include "ProgressReconciler.hpp"
#include "../Logger.hpp"

#include <utility>

namespace downpour::core::downloader {

ProgressReconciler::ProgressReconciler(TaskRegistry& registry)
    : m_registry(registry) {
}

ProgressReconciler::~ProgressReconciler() {
    stop();
}

void ProgressReconciler::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_consumer.joinable()) {
        return;
    }
    m_stop = false;
    m_consumer = std::thread([this] { consumerLoop(); });
}

void ProgressReconciler::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_consumer.joinable()) {
            return;
        }
        m_stop = true;
    }
    m_available.notify_all();
    m_consumer.join();
}

bool ProgressReconciler::isRunning() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_consumer.joinable() && !m_stop;
}

void ProgressReconciler::post(ProgressEvent event) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_channel.push_back(std::move(event));
    }
    m_available.notify_one();
}

ProgressSink ProgressReconciler::sink() {
    return [this](const ProgressEvent& event) { post(event); };
}

ReconcileResult ProgressReconciler::reconcile(const ProgressEvent& event) {
    ReconcileResult result = m_registry.applyProgress(event);

    switch (result) {
        case ReconcileResult::Applied:
            break;
        case ReconcileResult::Completed:
            Logger::instance().info("Task {} completed ({} bytes)", event.taskId, event.transferredBytes);
            break;
        default:
            Logger::instance().trace("Progress for {} {}: {:.1f}%", event.taskId, toString(result), event.percentage);
            break;
    }

    return result;
}

bool ProgressReconciler::reconcileOutcome(const std::string& taskId, uint64_t cycle, const TransferOutcome& outcome) {
    bool changed = m_registry.applyOutcome(taskId, cycle, outcome);

    if (!changed) {
        Logger::instance().debug("Stale outcome for {} (cycle {}) ignored", taskId, cycle);
        return false;
    }

    switch (outcome.status) {
        case TransferStatus::Completed:
            Logger::instance().info("Task {} finished", taskId);
            break;
        case TransferStatus::Failed:
            Logger::instance().error("Task {} failed: {}", taskId, outcome.reason);
            break;
        case TransferStatus::Cancelled:
            Logger::instance().info("Task {} paused by engine cancellation", taskId);
            break;
    }
    return true;
}

void ProgressReconciler::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);

    if (!m_consumer.joinable()) {
        // No consumer: drain on the caller's thread
        while (!m_channel.empty()) {
            ProgressEvent event = std::move(m_channel.front());
            m_channel.pop_front();
            lock.unlock();
            reconcile(event);
            lock.lock();
        }
        return;
    }

    m_drained.wait(lock, [this] { return m_channel.empty() && !m_busy; });
}

size_t ProgressReconciler::pending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_channel.size();
}

void ProgressReconciler::consumerLoop() {
    std::unique_lock<std::mutex> lock(m_mutex);

    while (true) {
        m_available.wait(lock, [this] { return m_stop || !m_channel.empty(); });

        if (m_channel.empty()) {
            // m_stop with nothing left
            m_drained.notify_all();
            return;
        }

        ProgressEvent event = std::move(m_channel.front());
        m_channel.pop_front();
        m_busy = true;

        lock.unlock();
        reconcile(event);
        lock.lock();

        m_busy = false;
        if (m_channel.empty()) {
            m_drained.notify_all();
        }
    }
}

} // namespace downpour::core::downloader
