#include "matching/Matcher.hpp"

#include <algorithm>
#include <map>
#include <numeric>
#include <utility>

#include "config/Config.hpp"
#include "errors/InvalidInputError.hpp"
#include "geometry/Rect.hpp"

namespace matching {

namespace {

void requireKind(const annotation::BoundingBox& box, annotation::BoxKind expected, std::size_t index) {
    if (box.kind() == expected) {
        return;
    }
    throw errors::InvalidInputError(
        "Box #" + std::to_string(index) + " of image '" + box.imageId() + "' is tagged " +
        annotation::toString(box.kind()) + " but was passed as " + annotation::toString(expected));
}

void finalizeGroup(ImageClassGroup& group) {
    group.order.resize(group.detections.size());
    std::iota(group.order.begin(), group.order.end(), 0);
    std::stable_sort(group.order.begin(), group.order.end(), [&](std::size_t lhs, std::size_t rhs) {
        return group.detections[lhs].score() > group.detections[rhs].score();
    });

    const int rows = static_cast<int>(group.detections.size());
    const int cols = static_cast<int>(group.groundTruths.size());
    if (rows == 0 || cols == 0) {
        group.ious.release();
        return;
    }
    group.ious = cv::Mat1d(rows, cols, 0.0);
    for (int r = 0; r < rows; ++r) {
        const auto& det = group.detections[group.order[static_cast<std::size_t>(r)]];
        for (int g = 0; g < cols; ++g) {
            group.ious(r, g) = geometry::iou(det.rect(), group.groundTruths[static_cast<std::size_t>(g)].rect());
        }
    }
}

}  // namespace

std::vector<ImageClassGroup> groupByImageAndClass(
    const std::vector<annotation::BoundingBox>& groundTruths,
    const std::vector<annotation::BoundingBox>& detections) {
    std::map<std::pair<std::string, std::string>, ImageClassGroup> cells;

    auto cellFor = [&](const annotation::BoundingBox& box) -> ImageClassGroup& {
        auto& cell = cells[{box.classLabel(), box.imageId()}];
        if (cell.classLabel.empty() && cell.imageId.empty()) {
            cell.classLabel = box.classLabel();
            cell.imageId = box.imageId();
        }
        return cell;
    };

    for (std::size_t i = 0; i < groundTruths.size(); ++i) {
        requireKind(groundTruths[i], annotation::BoxKind::GroundTruth, i);
        cellFor(groundTruths[i]).groundTruths.push_back(groundTruths[i]);
    }
    for (std::size_t i = 0; i < detections.size(); ++i) {
        requireKind(detections[i], annotation::BoxKind::Detected, i);
        auto& cell = cellFor(detections[i]);
        cell.detections.push_back(detections[i]);
        cell.inputIndices.push_back(i);
    }

    std::vector<ImageClassGroup> groups;
    groups.reserve(cells.size());
    for (auto& entry : cells) {
        finalizeGroup(entry.second);
        groups.push_back(std::move(entry.second));
    }
    return groups;
}

GroupMatch matchGroup(const ImageClassGroup& group, const MatchOptions& options) {
    const std::size_t gtCount = group.groundTruths.size();

    std::vector<bool> gtIgnored(gtCount, false);
    if (options.areaRange) {
        for (std::size_t g = 0; g < gtCount; ++g) {
            gtIgnored[g] = !options.areaRange->contains(group.groundTruths[g].area());
        }
    }

    GroupMatch result;
    result.groundTruthMatched.assign(gtCount, false);
    result.positives = static_cast<std::size_t>(std::count(gtIgnored.begin(), gtIgnored.end(), false));

    const std::size_t limit = std::min(group.order.size(), options.maxDetections.value_or(group.order.size()));
    result.detections.reserve(limit);

    for (std::size_t r = 0; r < limit; ++r) {
        const std::size_t detIndex = group.order[r];
        const auto& det = group.detections[detIndex];

        DetectionMatch match;
        match.detectionIndex = detIndex;
        match.confidence = det.score();

        // In-range ground truths are tried first; ignored ones only absorb leftovers.
        std::optional<std::size_t> best;
        double bestIoU = 0.0;
        for (const bool ignoredPass : {false, true}) {
            best.reset();
            bestIoU = 0.0;
            for (std::size_t g = 0; g < gtCount; ++g) {
                if (result.groundTruthMatched[g] || gtIgnored[g] != ignoredPass) {
                    continue;
                }
                const double value = group.ious(static_cast<int>(r), static_cast<int>(g));
                if (!best || value > bestIoU) {
                    best = g;
                    bestIoU = value;
                }
            }
            if (best && bestIoU >= options.iouThreshold) {
                break;
            }
            best.reset();
        }

        if (best) {
            result.groundTruthMatched[*best] = true;
            match.groundTruthIndex = best;
            match.iou = bestIoU;
            match.ignored = gtIgnored[*best];
            match.truePositive = !match.ignored;
        } else {
            match.ignored = options.areaRange && !options.areaRange->contains(det.area());
        }
        result.detections.push_back(match);
    }
    return result;
}

std::vector<ClassMatches> matchByClass(
    const std::vector<ImageClassGroup>& groups,
    const MatchOptions& options,
    bool parallel) {
    std::map<std::string, std::vector<std::size_t>> members;
    for (std::size_t i = 0; i < groups.size(); ++i) {
        members[groups[i].classLabel].push_back(i);
    }

    std::vector<const std::pair<const std::string, std::vector<std::size_t>>*> classes;
    classes.reserve(members.size());
    for (const auto& entry : members) {
        classes.push_back(&entry);
    }

    std::vector<ClassMatches> results(classes.size());

    auto evaluateClass = [&](std::size_t c) {
        ClassMatches& out = results[c];
        out.classLabel = classes[c]->first;
        for (const std::size_t groupIndex : classes[c]->second) {
            const auto& group = groups[groupIndex];
            const GroupMatch groupMatch = matchGroup(group, options);
            out.totalPositives += groupMatch.positives;
            for (const auto& match : groupMatch.detections) {
                if (match.ignored) {
                    continue;
                }
                out.records.push_back(MatchRecord{
                    group.imageId,
                    match.confidence,
                    match.truePositive,
                    match.iou,
                    group.inputIndices[match.detectionIndex]});
            }
        }
        std::sort(out.records.begin(), out.records.end(), [](const MatchRecord& lhs, const MatchRecord& rhs) {
            if (lhs.confidence != rhs.confidence) {
                return lhs.confidence > rhs.confidence;
            }
            return lhs.inputIndex < rhs.inputIndex;
        });
    };

    if (parallel && classes.size() > 1) {
        cv::parallel_for_(cv::Range(0, static_cast<int>(classes.size())), [&](const cv::Range& range) {
            for (int c = range.start; c < range.end; ++c) {
                evaluateClass(static_cast<std::size_t>(c));
            }
        });
    } else {
        for (std::size_t c = 0; c < classes.size(); ++c) {
            evaluateClass(c);
        }
    }
    return results;
}

std::vector<ClassMatches> matchDetections(
    const std::vector<annotation::BoundingBox>& groundTruths,
    const std::vector<annotation::BoundingBox>& detections,
    double iouThreshold) {
    config::validateIouThreshold(iouThreshold);
    MatchOptions options;
    options.iouThreshold = iouThreshold;
    return matchByClass(groupByImageAndClass(groundTruths, detections), options);
}

}  // namespace matching
