/**
 * HttpTransferEngine.cpp
 *
 * HTTP transfer engine implementation using cpr (which wraps libcurl).
 */

#include "HttpTransferEngine.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"
#include "../ThreadPool.hpp"
#include "../../utils/StringUtils.hpp"

#include <cpr/cpr.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <thread>
#include <vector>

namespace downpour::core::downloader {

namespace {

// Keeps the final 100% for after the file is closed
constexpr double kInFlightCeiling = 99.9;

double percentOf(int64_t done, int64_t total) {
    if (total <= 0) {
        return 0.0;
    }
    return static_cast<double>(done) * 100.0 / static_cast<double>(total);
}

double rateSince(std::chrono::steady_clock::time_point since, int64_t bytes) {
    auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count();
    return elapsedMs > 0 ? static_cast<double>(bytes) * 1000.0 / static_cast<double>(elapsedMs) : 0.0;
}

} // namespace

HttpEngineOptions HttpEngineOptions::fromConfig() {
    auto& config = Config::instance();

    HttpEngineOptions options;
    options.progressIntervalMs = std::max(1, config.get<int>("downloads.progressIntervalMs", 50));
    options.retryCount = std::max(0, config.get<int>("downloads.retryCount", 3));
    options.retryDelayMs = std::max(0, config.get<int>("downloads.retryDelay", 1000));
    options.timeoutMs = std::max(0, config.get<int>("downloads.timeout", 0));
    options.connectTimeoutMs = std::max(0, config.get<int>("downloads.connectTimeout", 10000));
    options.segments = std::max(1, config.get<int>("downloads.segments", 8));
    options.minSegmentBytes = std::max<int64_t>(1, config.get<int64_t>("downloads.minSegmentSize", 1024 * 1024));
    options.userAgent = config.get<std::string>("downloads.userAgent", "Downpour/1.0");
    return options;
}

HttpTransferEngine::HttpTransferEngine(HttpEngineOptions options)
    : m_options(std::move(options)) {
}

HttpTransferEngine::~HttpTransferEngine() {
    std::lock_guard<std::mutex> lock(m_transferMutex);
    for (auto& [id, cancel] : m_transfers) {
        cancel->store(true);
    }
}

void HttpTransferEngine::cancel(const std::string& taskId) {
    std::lock_guard<std::mutex> lock(m_transferMutex);
    auto it = m_transfers.find(taskId);
    if (it != m_transfers.end()) {
        it->second->store(true);
        Logger::instance().debug("Cancel requested for {}", taskId);
    }
}

void HttpTransferEngine::registerTransfer(const std::string& taskId, const CancelToken& cancel) {
    std::lock_guard<std::mutex> lock(m_transferMutex);
    m_transfers[taskId] = cancel;
}

void HttpTransferEngine::releaseTransfer(const std::string& taskId, const CancelToken& cancel) {
    std::lock_guard<std::mutex> lock(m_transferMutex);
    auto it = m_transfers.find(taskId);
    if (it != m_transfers.end() && it->second == cancel) {
        m_transfers.erase(it);
    }
}

void HttpTransferEngine::setProgressSink(ProgressSink sink) {
    std::lock_guard<std::mutex> lock(m_sinkMutex);
    m_sink = std::move(sink);
}

TransferOutcome HttpTransferEngine::start(const TransferRequest& request) {
    TransferRequest active = request;
    if (!active.cancel) {
        // Caller without its own flag; cancel() is then the only way to stop
        active.cancel = std::make_shared<std::atomic<bool>>(false);
    }

    registerTransfer(active.taskId, active.cancel);

    struct TransferGuard {
        HttpTransferEngine& engine;
        const TransferRequest& request;
        ~TransferGuard() { engine.releaseTransfer(request.taskId, request.cancel); }
    } guard{*this, active};

    return run(active);
}

TransferOutcome HttpTransferEngine::run(const TransferRequest& request) {
    if (isCancelled(request.cancel)) {
        return TransferOutcome::cancelled();
    }

    std::error_code ec;
    auto parent = std::filesystem::path(request.destination).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return TransferOutcome::failed("Cannot create " + parent.string() + ": " + ec.message());
        }
    }

    std::string lastError = "Download failed";
    bool allowRanges = true;

    for (int attemptNo = 0; attemptNo <= m_options.retryCount; ++attemptNo) {
        if (attemptNo > 0) {
            Logger::instance().warn("Retry {} for {}: {}", attemptNo, request.url, lastError);
            if (!waitBeforeRetry(attemptNo, request.cancel)) {
                return TransferOutcome::cancelled();
            }
        }

        AttemptResult result = attempt(request, allowRanges);
        switch (result.status) {
            case AttemptStatus::Completed:
                return TransferOutcome::completed();
            case AttemptStatus::Cancelled:
                return TransferOutcome::cancelled();
            case AttemptStatus::Failed:
                return TransferOutcome::failed(result.message);
            case AttemptStatus::Retry:
                lastError = result.message;
                allowRanges = allowRanges && !result.discardedPartial;
                break;
        }
    }

    Logger::instance().error("Download failed after {} retries: {}", m_options.retryCount, request.url);
    return TransferOutcome::failed(lastError);
}

HttpTransferEngine::RemoteInfo HttpTransferEngine::probe(const std::string& url) const {
    RemoteInfo info;

    cpr::Response response = cpr::Head(
        cpr::Url{url},
        cpr::ConnectTimeout{m_options.connectTimeoutMs},
        cpr::UserAgent{m_options.userAgent}
    );

    if (response.error.code != cpr::ErrorCode::OK) {
        info.error = response.error.message;
        return info;
    }

    info.reachable = true;

    // Servers that refuse HEAD are still downloadable, just without ranges
    if (response.status_code < 200 || response.status_code >= 300) {
        return info;
    }

    auto length = response.header.find("Content-Length");
    if (length != response.header.end()) {
        info.contentLength = utils::StringUtils::parseLong(length->second, -1);
    }

    auto ranges = response.header.find("Accept-Ranges");
    info.acceptsRanges = ranges != response.header.end()
        && utils::StringUtils::contains(ranges->second, "bytes");

    return info;
}

bool HttpTransferEngine::useSegments(const RemoteInfo& remote) const {
    return m_options.segments > 1
        && remote.acceptsRanges
        && remote.contentLength >= static_cast<int64_t>(m_options.segments) * m_options.minSegmentBytes;
}

HttpTransferEngine::AttemptResult HttpTransferEngine::attempt(const TransferRequest& request, bool allowRanges) {
    if (isCancelled(request.cancel)) {
        return {AttemptStatus::Cancelled, kPausedReason};
    }

    RemoteInfo remote = probe(request.url);
    if (!remote.reachable) {
        return {AttemptStatus::Retry, remote.error};
    }

    if (allowRanges && useSegments(remote)) {
        std::error_code ec;
        // A partial file without a resume record came from a single stream
        const bool singleStreamPartial = std::filesystem::exists(request.destination, ec)
            && !std::filesystem::exists(SegmentPlan::statePath(request.destination), ec);
        if (!singleStreamPartial) {
            return attemptSegmented(request, remote);
        }
    }

    return attemptSingle(request, remote, allowRanges);
}

HttpTransferEngine::AttemptResult HttpTransferEngine::attemptSingle(const TransferRequest& request,
                                                                    const RemoteInfo& remote,
                                                                    bool allowRanges) {
    int64_t offset = 0;
    std::error_code ec;
    if (allowRanges && remote.acceptsRanges && remote.contentLength > 0
        && std::filesystem::exists(request.destination, ec)) {
        auto existing = std::filesystem::file_size(request.destination, ec);
        if (!ec) {
            offset = static_cast<int64_t>(existing);
        }
    }

    if (offset > 0 && offset >= remote.contentLength) {
        emit({request.taskId, static_cast<uint64_t>(offset), 0.0, 100.0, request.cycle});
        return {AttemptStatus::Completed, ""};
    }

    // A stale resume record would claim the rewritten file on the next start
    SegmentPlan::discard(request.destination);

    std::ofstream file(request.destination,
                       std::ios::binary | (offset > 0 ? std::ios::app : std::ios::trunc));
    if (!file.is_open()) {
        return {AttemptStatus::Failed, "Failed to open output file " + request.destination};
    }

    cpr::Header headers;
    if (offset > 0) {
        headers["Range"] = "bytes=" + std::to_string(offset) + "-";
        Logger::instance().info("Resuming {} at byte {}", request.url, offset);
    }

    const auto interval = std::chrono::milliseconds(m_options.progressIntervalMs);
    const auto startTime = std::chrono::steady_clock::now();
    auto lastEmit = startTime - interval;
    int64_t sessionBytes = 0;
    int64_t expectedTotal = remote.contentLength;

    cpr::Response response = cpr::Download(
        file,
        cpr::Url{request.url},
        headers,
        cpr::Timeout{m_options.timeoutMs},
        cpr::ConnectTimeout{m_options.connectTimeoutMs},
        cpr::UserAgent{m_options.userAgent},
        cpr::ProgressCallback([&](cpr::cpr_off_t downloadTotal, cpr::cpr_off_t downloadNow,
                                  cpr::cpr_off_t /*uploadTotal*/, cpr::cpr_off_t /*uploadNow*/,
                                  intptr_t /*userdata*/) -> bool {
            if (isCancelled(request.cancel)) {
                return false;
            }

            sessionBytes = static_cast<int64_t>(downloadNow);
            if (downloadTotal > 0) {
                expectedTotal = offset + static_cast<int64_t>(downloadTotal);
            }

            auto now = std::chrono::steady_clock::now();
            if (now - lastEmit < interval) {
                return true;
            }
            lastEmit = now;

            int64_t done = offset + sessionBytes;
            emit({request.taskId, static_cast<uint64_t>(done), rateSince(startTime, sessionBytes),
                  std::min(percentOf(done, expectedTotal), kInFlightCeiling), request.cycle});
            return true;
        })
    );

    file.flush();
    const bool written = file.good();
    file.close();

    if (isCancelled(request.cancel)) {
        return {AttemptStatus::Cancelled, kPausedReason};
    }

    if (response.error.code != cpr::ErrorCode::OK) {
        return {AttemptStatus::Retry, response.error.message};
    }

    if (response.status_code == 416 && offset > 0) {
        std::filesystem::remove(request.destination, ec);
        return {AttemptStatus::Retry, "HTTP 416 for range starting at " + std::to_string(offset), true};
    }

    if (offset > 0 && response.status_code == 200) {
        // Full body appended after the partial data
        std::filesystem::remove(request.destination, ec);
        return {AttemptStatus::Retry, "Range ignored by server", true};
    }

    if (response.status_code >= 500) {
        return {AttemptStatus::Retry, "HTTP " + std::to_string(response.status_code)};
    }

    if (response.status_code != 200 && response.status_code != 206) {
        return {AttemptStatus::Failed, "HTTP " + std::to_string(response.status_code)};
    }

    if (!written) {
        return {AttemptStatus::Failed, "Failed to write output file " + request.destination};
    }

    emit({request.taskId, static_cast<uint64_t>(offset + sessionBytes), rateSince(startTime, sessionBytes),
          100.0, request.cycle});

    Logger::instance().debug("Downloaded: {}", request.destination);
    return {AttemptStatus::Completed, ""};
}

HttpTransferEngine::AttemptResult HttpTransferEngine::attemptSegmented(const TransferRequest& request,
                                                                       const RemoteInfo& remote) {
    std::error_code ec;

    SegmentPlan plan;
    auto saved = SegmentPlan::load(request.destination);
    const bool resuming = saved
        && saved->url == request.url
        && saved->totalSize == remote.contentLength
        && std::filesystem::exists(request.destination, ec)
        && static_cast<int64_t>(std::filesystem::file_size(request.destination, ec)) == remote.contentLength
        && !ec;

    if (resuming) {
        plan = std::move(*saved);
        Logger::instance().info("Resuming {} in {} segments ({} of {} bytes on disk)",
                                request.url, plan.segments.size(), plan.downloaded(), plan.totalSize);
    } else {
        plan = SegmentPlan::split(request.url, remote.contentLength, m_options.segments);

        // Full-size file so every segment can write at its own offset
        {
            std::ofstream create(request.destination, std::ios::binary | std::ios::trunc);
            if (!create.is_open()) {
                return {AttemptStatus::Failed, "Failed to open output file " + request.destination};
            }
        }
        std::filesystem::resize_file(request.destination, static_cast<uintmax_t>(plan.totalSize), ec);
        if (ec) {
            return {AttemptStatus::Failed, "Cannot allocate " + request.destination + ": " + ec.message()};
        }
        if (!plan.save(request.destination)) {
            Logger::instance().warn("{} will not be resumable", request.destination);
        }
        Logger::instance().debug("Fetching {} in {} segments", request.url, plan.segments.size());
    }

    std::vector<std::atomic<int64_t>> progress(plan.segments.size());
    for (size_t i = 0; i < plan.segments.size(); ++i) {
        progress[i] = plan.segments[i].downloaded;
    }

    std::vector<std::future<SegmentResult>> results;
    {
        ThreadPool workers(plan.segments.size());
        for (size_t i = 0; i < plan.segments.size(); ++i) {
            if (plan.segments[i].finished()) {
                continue;
            }
            results.push_back(workers.submit([this, &request, &plan, &progress, i] {
                return fetchSegment(request, plan.segments[i], progress[i]);
            }));
        }

        const auto interval = std::chrono::milliseconds(m_options.progressIntervalMs);
        const auto startTime = std::chrono::steady_clock::now();
        const int64_t initialBytes = plan.downloaded();

        auto allDone = [&results] {
            return std::all_of(results.begin(), results.end(), [](const std::future<SegmentResult>& r) {
                return r.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
            });
        };

        while (!allDone()) {
            std::this_thread::sleep_for(interval);

            int64_t done = 0;
            for (const auto& counter : progress) {
                done += counter.load();
            }
            emit({request.taskId, static_cast<uint64_t>(done), rateSince(startTime, done - initialBytes),
                  std::min(percentOf(done, plan.totalSize), kInFlightCeiling), request.cycle});
        }

        workers.shutdown();
    }

    for (size_t i = 0; i < plan.segments.size(); ++i) {
        plan.segments[i].downloaded = progress[i].load();
    }

    SegmentResult worst;
    for (auto& future : results) {
        SegmentResult result = future.get();
        if (result.rangeIgnored) {
            worst = result;
            break;
        }
        if (result.status == AttemptStatus::Failed
            || (result.status == AttemptStatus::Retry && worst.status != AttemptStatus::Failed)) {
            worst = result;
        }
    }

    if (isCancelled(request.cancel)) {
        plan.save(request.destination);
        return {AttemptStatus::Cancelled, kPausedReason};
    }

    if (worst.rangeIgnored) {
        std::filesystem::remove(request.destination, ec);
        SegmentPlan::discard(request.destination);
        return {AttemptStatus::Retry, worst.message, true};
    }

    if (worst.status != AttemptStatus::Completed) {
        plan.save(request.destination);
        return {worst.status, worst.message};
    }

    if (!plan.finished()) {
        plan.save(request.destination);
        return {AttemptStatus::Retry, "Segments ended before the end of the file"};
    }

    SegmentPlan::discard(request.destination);
    emit({request.taskId, static_cast<uint64_t>(plan.totalSize), 0.0, 100.0, request.cycle});

    Logger::instance().debug("Downloaded: {} ({} segments)", request.destination, plan.segments.size());
    return {AttemptStatus::Completed, ""};
}

HttpTransferEngine::SegmentResult HttpTransferEngine::fetchSegment(const TransferRequest& request,
                                                                   const Segment& segment,
                                                                   std::atomic<int64_t>& downloaded) const {
    const int64_t from = segment.start + downloaded.load();

    std::fstream file(request.destination, std::ios::in | std::ios::out | std::ios::binary);
    if (!file.is_open()) {
        return {AttemptStatus::Failed, "Failed to open output file " + request.destination};
    }
    file.seekp(from);

    bool overflow = false;
    bool writeFailed = false;

    cpr::Response response = cpr::Get(
        cpr::Url{request.url},
        cpr::Header{{"Range", "bytes=" + std::to_string(from) + "-" + std::to_string(segment.end)}},
        cpr::Timeout{m_options.timeoutMs},
        cpr::ConnectTimeout{m_options.connectTimeoutMs},
        cpr::UserAgent{m_options.userAgent},
        cpr::WriteCallback([&](const auto& data, intptr_t /*userdata*/) -> bool {
            if (isCancelled(request.cancel)) {
                return false;
            }

            const int64_t room = segment.length() - downloaded.load();
            if (static_cast<int64_t>(data.size()) > room) {
                overflow = true;
                return false;
            }

            file.write(data.data(), static_cast<std::streamsize>(data.size()));
            if (!file) {
                writeFailed = true;
                return false;
            }
            downloaded += static_cast<int64_t>(data.size());
            return true;
        }),
        // Lets an idle connection notice the cancel flag
        cpr::ProgressCallback([&](cpr::cpr_off_t, cpr::cpr_off_t, cpr::cpr_off_t, cpr::cpr_off_t,
                                  intptr_t /*userdata*/) -> bool {
            return !isCancelled(request.cancel);
        })
    );

    file.flush();
    writeFailed = writeFailed || !file.good();
    file.close();

    if (isCancelled(request.cancel)) {
        return {AttemptStatus::Cancelled, kPausedReason};
    }

    if (overflow || response.status_code == 200) {
        return {AttemptStatus::Retry, "Range ignored by server", true};
    }

    if (writeFailed) {
        return {AttemptStatus::Failed, "Failed to write output file " + request.destination};
    }

    if (response.error.code != cpr::ErrorCode::OK) {
        return {AttemptStatus::Retry, response.error.message};
    }

    if (response.status_code >= 500) {
        return {AttemptStatus::Retry, "HTTP " + std::to_string(response.status_code)};
    }

    if (response.status_code != 206) {
        return {AttemptStatus::Failed, "HTTP " + std::to_string(response.status_code)};
    }

    if (downloaded.load() < segment.length()) {
        return {AttemptStatus::Retry, "Segment at byte " + std::to_string(segment.start) + " ended early"};
    }

    return {AttemptStatus::Completed, ""};
}

bool HttpTransferEngine::waitBeforeRetry(int attemptNo, const CancelToken& cancel) const {
    const auto deadline = std::chrono::steady_clock::now()
        + std::chrono::milliseconds(static_cast<int64_t>(m_options.retryDelayMs) * attemptNo);

    while (std::chrono::steady_clock::now() < deadline) {
        if (isCancelled(cancel)) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return !isCancelled(cancel);
}

void HttpTransferEngine::emit(const ProgressEvent& event) {
    ProgressSink sink;
    {
        std::lock_guard<std::mutex> lock(m_sinkMutex);
        sink = m_sink;
    }
    if (sink) {
        sink(event);
    }
}

} // namespace downpour::core::downloader
