#pragma once

#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "annotation/BoundingBox.hpp"

namespace matching {

// Half-open area interval [min, max).
struct AreaRange {
    double min{0.0};
    double max{std::numeric_limits<double>::infinity()};

    [[nodiscard]] bool contains(double area) const {
        return area >= min && area < max;
    }

    bool operator==(const AreaRange& other) const {
        return min == other.min && max == other.max;
    }
};

struct MatchOptions {
    double iouThreshold{0.5};
    std::optional<std::size_t> maxDetections;
    std::optional<AreaRange> areaRange;
};

// All boxes of one (image, class) pair.
struct ImageClassGroup {
    std::string imageId;
    std::string classLabel;
    std::vector<annotation::BoundingBox> groundTruths;
    std::vector<annotation::BoundingBox> detections;
    // Position of each detection in the caller's detection sequence.
    std::vector<std::size_t> inputIndices;
    // Detection indices by descending confidence, ties in input order.
    std::vector<std::size_t> order;
    // ious(r, g): IoU of detections[order[r]] against groundTruths[g].
    cv::Mat1d ious;
};

struct DetectionMatch {
    std::size_t detectionIndex{0};
    double confidence{0.0};
    bool truePositive{false};
    bool ignored{false};
    std::optional<std::size_t> groundTruthIndex;
    double iou{0.0};
};

struct GroupMatch {
    // Sorted by descending confidence, truncated to MatchOptions::maxDetections.
    std::vector<DetectionMatch> detections;
    std::vector<bool> groundTruthMatched;
    // Ground truths that are not ignored.
    std::size_t positives{0};
};

struct MatchRecord {
    std::string imageId;
    double confidence{0.0};
    bool truePositive{false};
    double iou{0.0};
    std::size_t inputIndex{0};
};

struct ClassMatches {
    std::string classLabel;
    // Non-ignored detections by descending confidence, ties in input order.
    std::vector<MatchRecord> records;
    std::size_t totalPositives{0};
};

// Throws errors::InvalidInputError when a box carries the wrong kind for its list.
std::vector<ImageClassGroup> groupByImageAndClass(
    const std::vector<annotation::BoundingBox>& groundTruths,
    const std::vector<annotation::BoundingBox>& detections);

GroupMatch matchGroup(const ImageClassGroup& group, const MatchOptions& options);

std::vector<ClassMatches> matchByClass(
    const std::vector<ImageClassGroup>& groups,
    const MatchOptions& options,
    bool parallel = false);

std::vector<ClassMatches> matchDetections(
    const std::vector<annotation::BoundingBox>& groundTruths,
    const std::vector<annotation::BoundingBox>& detections,
    double iouThreshold);

}  // namespace matching
