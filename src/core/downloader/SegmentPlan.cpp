/**
 * SegmentPlan.cpp
 *
 * Segment splitting and the JSON resume record.
 */

#include "SegmentPlan.hpp"
#include "../Logger.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace downpour::core::downloader {

SegmentPlan SegmentPlan::split(const std::string& url, int64_t totalSize, int count) {
    SegmentPlan plan;
    plan.url = url;
    plan.totalSize = std::max<int64_t>(0, totalSize);

    if (plan.totalSize == 0) {
        return plan;
    }

    const int64_t parts = std::clamp<int64_t>(count, 1, plan.totalSize);
    const int64_t part = plan.totalSize / parts;

    plan.segments.reserve(static_cast<size_t>(parts));
    for (int64_t i = 0; i < parts; ++i) {
        Segment segment;
        segment.start = i * part;
        segment.end = (i == parts - 1) ? plan.totalSize - 1 : (i + 1) * part - 1;
        plan.segments.push_back(segment);
    }
    return plan;
}

int64_t SegmentPlan::downloaded() const {
    int64_t total = 0;
    for (const auto& segment : segments) {
        total += segment.downloaded;
    }
    return total;
}

bool SegmentPlan::finished() const {
    return !segments.empty()
        && std::all_of(segments.begin(), segments.end(), [](const Segment& s) { return s.finished(); });
}

bool SegmentPlan::isConsistent() const {
    if (totalSize <= 0 || segments.empty()) {
        return false;
    }

    int64_t expectedStart = 0;
    for (const auto& segment : segments) {
        if (segment.start != expectedStart || segment.end < segment.start) {
            return false;
        }
        if (segment.downloaded < 0 || segment.downloaded > segment.length()) {
            return false;
        }
        expectedStart = segment.end + 1;
    }
    return expectedStart == totalSize;
}

std::string SegmentPlan::statePath(const std::string& destination) {
    return destination + ".state";
}

std::optional<SegmentPlan> SegmentPlan::load(const std::string& destination) {
    const std::string path = statePath(destination);

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    try {
        SegmentPlan plan = json::parse(file).get<SegmentPlan>();
        if (!plan.isConsistent()) {
            Logger::instance().warn("Ignoring inconsistent resume record {}", path);
            return std::nullopt;
        }
        return plan;
    } catch (const json::exception& e) {
        Logger::instance().warn("Ignoring unreadable resume record {}: {}", path, e.what());
        return std::nullopt;
    }
}

bool SegmentPlan::save(const std::string& destination) const {
    const std::string path = statePath(destination);

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        Logger::instance().warn("Cannot write resume record {}", path);
        return false;
    }

    file << json(*this).dump();
    return static_cast<bool>(file);
}

void SegmentPlan::discard(const std::string& destination) {
    std::error_code ec;
    std::filesystem::remove(statePath(destination), ec);
}

void to_json(json& j, const Segment& segment) {
    j = json{
        {"start", segment.start},
        {"end", segment.end},
        {"downloaded", segment.downloaded},
    };
}

void from_json(const json& j, Segment& segment) {
    j.at("start").get_to(segment.start);
    j.at("end").get_to(segment.end);
    segment.downloaded = j.value("downloaded", int64_t{0});
}

void to_json(json& j, const SegmentPlan& plan) {
    j = json{
        {"url", plan.url},
        {"total_size", plan.totalSize},
        {"concurrency", plan.segments.size()},
        {"segments", plan.segments},
    };
}

void from_json(const json& j, SegmentPlan& plan) {
    j.at("url").get_to(plan.url);
    j.at("total_size").get_to(plan.totalSize);
    j.at("segments").get_to(plan.segments);
}

} // namespace downpour::core::downloader
