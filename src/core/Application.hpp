#pragma once

/**
 * Application.hpp
 *
 * Owns the transfer engine and the download manager and ties their
 * lifetimes together.
 */

#include <atomic>
#include <memory>
#include <string>

namespace downpour::core::downloader {
class DownloadManager;
class TransferEngine;
}

namespace downpour::core {

/**
 * Application state enum
 */
enum class AppState {
    Uninitialized,
    Initializing,
    Ready,
    ShuttingDown,
    Error
};

/**
 * Main application class
 *
 * Reads its settings from Config, so CLI overrides must be applied to
 * Config before initialize().
 */
class Application {
public:
    Application();
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * Create the HTTP engine and start the download manager
     * @return true if initialization successful
     */
    bool initialize();

    /**
     * Pause active transfers and stop all workers
     */
    void shutdown();

    /**
     * Get download manager instance
     * @return Shared pointer to DownloadManager (null before initialize)
     */
    std::shared_ptr<downloader::DownloadManager> getDownloadManager() const { return m_downloadManager; }

    static std::string getVersion() { return "1.0.0"; }
    static std::string getName() { return "Downpour"; }

private:
    void setState(AppState state);

    bool initializeDownloader();

private:
    std::atomic<AppState> m_state{AppState::Uninitialized};

    // Declared before the manager, which holds a reference to it
    std::unique_ptr<downloader::TransferEngine> m_engine;
    std::shared_ptr<downloader::DownloadManager> m_downloadManager;
};

} // namespace downpour::core
