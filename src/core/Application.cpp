/**
 * Application.cpp
 *
 * Implementation of the core Application class.
 */

#include "Application.hpp"
#include "Logger.hpp"
#include "downloader/DownloadManager.hpp"
#include "downloader/HttpTransferEngine.hpp"

#include <chrono>

namespace downpour::core {

namespace {

const char* stateName(AppState state) {
    switch (state) {
        case AppState::Uninitialized: return "uninitialized";
        case AppState::Initializing:  return "initializing";
        case AppState::Ready:         return "ready";
        case AppState::ShuttingDown:  return "shutting down";
        case AppState::Error:         return "error";
    }
    return "unknown";
}

} // namespace

Application::Application() {
    Logger::instance().debug("Application instance created");
}

Application::~Application() {
    if (m_state != AppState::Uninitialized && m_state != AppState::ShuttingDown) {
        shutdown();
    }
    Logger::instance().debug("Application instance destroyed");
}

bool Application::initialize() {
    if (m_state != AppState::Uninitialized) {
        Logger::instance().warn("Application already initialized");
        return false;
    }

    setState(AppState::Initializing);
    Logger::instance().info("Initializing application...");

    auto startTime = std::chrono::steady_clock::now();

    if (!initializeDownloader()) {
        Logger::instance().error("Failed to initialize downloader");
        setState(AppState::Error);
        return false;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    Logger::instance().info("Application initialized in {}ms", duration.count());

    setState(AppState::Ready);
    return true;
}

void Application::shutdown() {
    if (m_state == AppState::ShuttingDown || m_state == AppState::Uninitialized) {
        return;
    }

    setState(AppState::ShuttingDown);
    Logger::instance().info("Shutting down application...");

    if (m_downloadManager) {
        m_downloadManager->shutdown();
    }
    m_downloadManager.reset();
    m_engine.reset();

    Logger::instance().info("Application shutdown complete");
    Logger::instance().flush();

    setState(AppState::Uninitialized);
}

void Application::setState(AppState state) {
    AppState previous = m_state.exchange(state);
    if (previous != state) {
        Logger::instance().debug("Application state {} -> {}", stateName(previous), stateName(state));
    }
}

bool Application::initializeDownloader() {
    try {
        m_engine = std::make_unique<downloader::HttpTransferEngine>();
        m_downloadManager = std::make_shared<downloader::DownloadManager>(*m_engine);
        m_downloadManager->initialize();
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("Downloader initialization error: {}", e.what());
        m_downloadManager.reset();
        m_engine.reset();
        return false;
    }
}

} // namespace downpour::core
