/**
 * AdmissionQueue.cpp
 *
 * Implementation of the bounded start-command scheduler.
 */

#include "AdmissionQueue.hpp"
#include "../Logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace downpour::core::downloader {

AdmissionQueue::AdmissionQueue(TaskRegistry& registry,
                               ProgressReconciler& reconciler,
                               TransferEngine& engine,
                               size_t maxConcurrent)
    : m_registry(registry)
    , m_reconciler(reconciler)
    , m_engine(engine)
    , m_limit(std::max<size_t>(1, maxConcurrent))
    , m_pool(m_limit) {
    Logger::instance().debug("Admission queue ready ({} slots)", m_limit);
}

AdmissionQueue::~AdmissionQueue() {
    shutdown();
}

bool AdmissionQueue::admit(const std::string& taskId, std::optional<TaskState> expected) {
    if (!m_accepting) {
        return false;
    }

    auto admission = m_registry.admit(taskId, expected);
    if (!admission) {
        Logger::instance().debug("Admission of {} rejected", taskId);
        return false;
    }

    try {
        m_pool.submit([this, ticket = *admission]() { execute(ticket); });
    } catch (const std::runtime_error& e) {
        // Raced with shutdown; do not leave the task stuck in Running
        m_reconciler.reconcileOutcome(admission->taskId, admission->cycle,
                                      TransferOutcome::failed(e.what()));
        return false;
    }

    Logger::instance().debug("Task {} admitted (cycle {})", admission->taskId, admission->cycle);
    return true;
}

bool AdmissionQueue::pause(const std::string& taskId) {
    if (!m_registry.pause(taskId)) {
        return false;
    }

    Logger::instance().info("Task {} paused", taskId);

    // Only the paused cycle may receive the cancel; a resumed one has a fresh flag
    std::lock_guard<std::mutex> lock(m_activeMutex);
    auto it = m_activeTransfers.find(taskId);
    if (it != m_activeTransfers.end() && isCancelled(it->second)) {
        m_engine.cancel(taskId);
    }
    return true;
}

void AdmissionQueue::waitIdle() {
    m_pool.waitAll();
}

void AdmissionQueue::shutdown() {
    if (!m_accepting.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_activeMutex);
        for (const auto& [taskId, token] : m_activeTransfers) {
            Logger::instance().debug("Cancelling {} for shutdown", taskId);
            token->store(true);
            m_engine.cancel(taskId);
        }
    }

    m_pool.shutdown();
}

void AdmissionQueue::execute(const Admission& admission) {
    if (!m_registry.isCurrent(admission.taskId, admission.cycle)) {
        Logger::instance().debug("Skipping start of {} (cycle {} no longer current)",
                                 admission.taskId, admission.cycle);
        return;
    }

    {
        std::unique_lock<std::mutex> lock(m_activeMutex);
        if (m_activeTransfers.count(admission.taskId)) {
            Logger::instance().debug("Start of {} waits for its previous transfer", admission.taskId);
            m_activeReleased.wait(lock, [&] { return m_activeTransfers.count(admission.taskId) == 0; });
        }

        if (!m_accepting) {
            // Queued when shutdown began; it never reached the engine
            lock.unlock();
            m_reconciler.reconcileOutcome(admission.taskId, admission.cycle, TransferOutcome::cancelled());
            return;
        }
        m_activeTransfers.emplace(admission.taskId, admission.cancel);
    }

    auto release = [this, &admission] {
        {
            std::lock_guard<std::mutex> lock(m_activeMutex);
            m_activeTransfers.erase(admission.taskId);
        }
        m_activeReleased.notify_all();
    };

    // Paused or superseded while waiting for the previous transfer
    if (!m_registry.isCurrent(admission.taskId, admission.cycle)) {
        release();
        return;
    }

    ++m_active;
    Logger::instance().info("Starting {}", admission.url);

    TransferOutcome outcome;
    try {
        outcome = m_engine.start({admission.taskId, admission.url, admission.destination,
                                  admission.cycle, admission.cancel});
    } catch (const std::exception& e) {
        outcome = TransferOutcome::failed(e.what());
    }

    --m_active;
    release();

    m_reconciler.reconcileOutcome(admission.taskId, admission.cycle, outcome);
}

} // namespace downpour::core::downloader
