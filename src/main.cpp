/**
 * Downpour - concurrent download manager
 *
 * Command line entry point. Adds every URL given on the command line,
 * downloads them with at most N transfers in flight and redraws a progress
 * panel until nothing is running any more.
 */

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/Application.hpp"
#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "core/downloader/DownloadManager.hpp"
#include "core/downloader/ViewProjector.hpp"
#include "utils/PathUtils.hpp"
#include "utils/StringUtils.hpp"

namespace fs = std::filesystem;

using downpour::core::downloader::Task;
using downpour::core::downloader::TaskFilter;
using downpour::core::downloader::TaskState;
using downpour::core::downloader::ViewProjector;

namespace {

// Set from the signal handler, consumed by the render loop
std::atomic<bool> g_interrupted{false};

struct CliOptions {
    std::vector<std::string> urls;
    std::string directory;
    std::optional<int> maxConcurrent;
    std::string configPath;
    TaskFilter filter{TaskFilter::All};
    std::string search;
    bool debug{false};
};

void signalHandler(int /*signal*/) {
    g_interrupted.store(true);
}

void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#ifdef _WIN32
    std::signal(SIGBREAK, signalHandler);
#endif
}

void printUsage(const char* program) {
    std::cout << "Downpour - concurrent download manager\n"
              << "\nUsage: " << program << " [options] <url>...\n"
              << "\nOptions:\n"
              << "  -d, --directory <dir>   Download directory\n"
              << "  -c, --concurrent <n>    Maximum simultaneous downloads (default 3)\n"
              << "      --config <path>     Configuration file\n"
              << "      --filter <f>        Final listing filter: all, running, done, error\n"
              << "      --search <text>     Final listing name search\n"
              << "      --debug             Enable debug logging\n"
              << "  -h, --help              Show this help message\n"
              << "  -v, --version           Show version information\n"
              << std::endl;
}

/**
 * Parse argv into options
 * @return Exit code to stop with, or nullopt to continue
 */
std::optional<int> parseArguments(int argc, char* argv[], CliOptions& options) {
    auto needValue = [&](int& i, const std::string& flag) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << flag << "\n";
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << downpour::core::Application::getName() << " v"
                      << downpour::core::Application::getVersion() << std::endl;
            return 0;
        } else if (arg == "--debug") {
            options.debug = true;
        } else if (arg == "-d" || arg == "--directory") {
            const char* value = needValue(i, arg);
            if (!value) return 2;
            options.directory = value;
        } else if (arg == "-c" || arg == "--concurrent") {
            const char* value = needValue(i, arg);
            if (!value) return 2;
            int n = downpour::utils::StringUtils::parseInt(value, 0);
            if (n < 1) {
                std::cerr << "Invalid concurrency: " << value << "\n";
                return 2;
            }
            options.maxConcurrent = n;
        } else if (arg == "--config") {
            const char* value = needValue(i, arg);
            if (!value) return 2;
            options.configPath = value;
        } else if (arg == "--filter") {
            const char* value = needValue(i, arg);
            if (!value) return 2;
            auto filter = ViewProjector::parseFilter(value);
            if (!filter) {
                std::cerr << "Unknown filter: " << value << "\n";
                return 2;
            }
            options.filter = *filter;
        } else if (arg == "--search") {
            const char* value = needValue(i, arg);
            if (!value) return 2;
            options.search = value;
        } else if (downpour::utils::StringUtils::startsWith(arg, "-")) {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            options.urls.push_back(arg);
        }
    }

    if (options.urls.empty()) {
        printUsage(argv[0]);
        return 2;
    }
    return std::nullopt;
}

/**
 * Load the configuration file, creating it with defaults when missing
 */
void loadConfiguration(const std::string& explicitPath) {
    auto& config = downpour::core::Config::instance();
    config.setDefaults();

    fs::path configPath = explicitPath.empty()
        ? downpour::utils::PathUtils::getConfigPath()
        : fs::path(explicitPath);

    std::error_code ec;
    if (fs::exists(configPath, ec)) {
        if (!config.load(configPath.string())) {
            std::cerr << "Using default configuration, " << configPath.string() << " could not be read\n";
        }
    } else if (explicitPath.empty()) {
        fs::create_directories(configPath.parent_path(), ec);
        if (ec || !config.save(configPath.string())) {
            std::cerr << "Cannot create " << configPath.string() << "\n";
        }
    } else {
        std::cerr << "Config file not found: " << configPath.string() << "\n";
    }
}

void applyOverrides(const CliOptions& options) {
    auto& config = downpour::core::Config::instance();
    if (!options.directory.empty()) {
        std::error_code ec;
        auto directory = fs::absolute(options.directory, ec);
        config.set("downloads.directory", ec ? options.directory : directory.string());
    }
    if (options.maxConcurrent) {
        config.set("downloads.maxConcurrent", *options.maxConcurrent);
    }
}

void initializeLogging(const CliOptions& options) {
    auto& config = downpour::core::Config::instance();

    auto level = options.debug
        ? downpour::core::LogLevel::Debug
        : downpour::core::Logger::parseLevel(config.get<std::string>("logging.level", "info"),
                                             downpour::core::LogLevel::Info);

    auto logDir = config.get<std::string>("logging.directory", "");
    if (logDir.empty()) {
        logDir = downpour::utils::PathUtils::getLogsPath().string();
    }

    downpour::core::Logger::instance().initialize(level, logDir);
}

std::string formatTaskLine(const Task& task) {
    std::string name = task.name;
    if (name.size() > 24) {
        name = name.substr(0, 21) + "...";
    }

    constexpr int barWidth = 30;
    const int filled = std::clamp(static_cast<int>(task.progress / 100.0 * barWidth), 0, barWidth);

    std::string bar;
    bar.reserve(static_cast<size_t>(barWidth) * 3);
    for (int i = 0; i < barWidth; ++i) {
        bar += (i < filled) ? u8"█" : u8"░";
    }

    std::string line = fmt::format("{:<24} [{}] {:>4} {:<11}",
                                   name,
                                   bar,
                                   downpour::utils::StringUtils::formatPercentage(task.progress),
                                   ViewProjector::stateLabel(task.state));

    if (task.state == TaskState::Running) {
        line += fmt::format(" {} {}",
                            downpour::utils::StringUtils::formatBytes(static_cast<int64_t>(task.transferredBytes)),
                            ViewProjector::formatSpeed(task.speed));
    } else if (task.state == TaskState::Error && !task.error.empty()) {
        line += fmt::format(" {}", task.error);
    }
    return line;
}

std::string buildProgressPanel(const std::vector<Task>& tasks, size_t active) {
    std::string panel;
    panel.reserve(tasks.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("Downpour ({} tasks, {} transferring)\n", tasks.size(), active);
    panel.append("--------------------------------------------------\n");

    for (const auto& task : tasks) {
        panel += formatTaskLine(task);
        panel.push_back('\n');
    }

    panel.append("==================================================\n");
    return panel;
}

void redrawPanel(const std::string& panel, size_t& previousLines) {
    const size_t currentLines = static_cast<size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previousLines > 0) {
        std::cout << "\033[" << previousLines << "F\033[J";
    }
    std::cout << panel << std::flush;
    previousLines = currentLines;
}

/**
 * Redraw the panel until no task is running
 */
void renderProgressLoop(downpour::core::downloader::DownloadManager& manager) {
    size_t previousLines = 0;
    bool pauseRequested = false;

    while (true) {
        if (g_interrupted.load() && !pauseRequested) {
            pauseRequested = true;
            size_t paused = manager.pauseAll();
            DOWNPOUR_LOG_INFO("Interrupted, paused {} running task(s)", paused);
        }

        redrawPanel(buildProgressPanel(manager.tasks(), manager.activeTransfers()), previousLines);

        if (manager.waitUntilSettled(std::chrono::milliseconds(200))) {
            break;
        }
    }

    redrawPanel(buildProgressPanel(manager.tasks(), manager.activeTransfers()), previousLines);
}

void printSummary(const std::vector<Task>& tasks, const CliOptions& options) {
    std::cout << "\nTasks (filter: " << ViewProjector::toString(options.filter);
    if (!options.search.empty()) {
        std::cout << ", search: \"" << options.search << "\"";
    }
    std::cout << ")\n";

    if (tasks.empty()) {
        std::cout << "  (none)\n";
        return;
    }

    for (const auto& task : tasks) {
        std::cout << fmt::format("  {:<8} {:<11} {:>4}  {}", task.id,
                                 ViewProjector::stateLabel(task.state),
                                 downpour::utils::StringUtils::formatPercentage(task.progress),
                                 task.destination);
        if (!task.error.empty()) {
            std::cout << "  (" << task.error << ")";
        }
        std::cout << "\n";
    }
}

} // namespace

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    CliOptions options;
    if (auto exitCode = parseArguments(argc, argv, options)) {
        return *exitCode;
    }

    loadConfiguration(options.configPath);
    applyOverrides(options);
    initializeLogging(options);

    auto& logger = downpour::core::Logger::instance();
    logger.info("{} v{} starting...", downpour::core::Application::getName(),
                downpour::core::Application::getVersion());

    setupSignalHandlers();

    try {
        downpour::core::Application app;
        if (!app.initialize()) {
            logger.critical("Failed to initialize application");
            return 1;
        }

        auto manager = app.getDownloadManager();

        for (const auto& url : options.urls) {
            try {
                manager->addTask(url);
            } catch (const std::invalid_argument& e) {
                logger.warn("Skipping argument \"{}\": {}", url, e.what());
            }
        }

        manager->startAll();
        renderProgressLoop(*manager);

        auto all = manager->tasks();
        printSummary(manager->view(options.filter, options.search), options);

        bool allDone = !all.empty() && std::all_of(all.begin(), all.end(),
            [](const Task& task) { return task.state == TaskState::Done; });

        app.shutdown();

        logger.info("Downpour finished: {}", allDone ? "all downloads completed" : "incomplete");
        return allDone ? 0 : 1;

    } catch (const std::exception& e) {
        logger.critical("Unhandled exception: {}", e.what());
        return 1;
    }
}
