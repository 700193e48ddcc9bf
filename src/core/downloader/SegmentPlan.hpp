#pragma once

/**
 * SegmentPlan.hpp
 *
 * Byte-range split of one download and its on-disk resume record.
 */

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace downpour::core::downloader {

using json = nlohmann::json;

/**
 * Inclusive byte range [start, end] of the remote file and how much of it
 * is already written at its offset in the destination
 */
struct Segment {
    int64_t start{0};
    int64_t end{0};
    int64_t downloaded{0};

    int64_t length() const { return end - start + 1; }
    int64_t remaining() const { return length() - downloaded; }
    bool finished() const { return downloaded >= length(); }
};

/**
 * SegmentPlan - how a file is fetched as parallel Range requests
 *
 * Saved as "<destination>.state" while the download is incomplete so a
 * later start can continue every segment where it stopped.
 */
struct SegmentPlan {
    std::string url;
    int64_t totalSize{0};
    std::vector<Segment> segments;

    /**
     * Split totalSize bytes into count contiguous segments; the last one
     * takes the remainder. Never produces empty segments.
     */
    static SegmentPlan split(const std::string& url, int64_t totalSize, int count);

    int64_t downloaded() const;
    bool finished() const;

    /**
     * Segments are contiguous, cover [0, totalSize) and have sane counters
     */
    bool isConsistent() const;

    static std::string statePath(const std::string& destination);

    /**
     * Read the resume record of destination
     * @return nullopt if there is none or it cannot be used
     */
    static std::optional<SegmentPlan> load(const std::string& destination);

    bool save(const std::string& destination) const;

    static void discard(const std::string& destination);
};

void to_json(json& j, const Segment& segment);
void from_json(const json& j, Segment& segment);
void to_json(json& j, const SegmentPlan& plan);
void from_json(const json& j, SegmentPlan& plan);

} // namespace downpour::core::downloader
