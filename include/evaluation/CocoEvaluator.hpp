#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "annotation/BoundingBox.hpp"
#include "config/Config.hpp"
#include "matching/Matcher.hpp"

namespace evaluation {

// Requested COCO fields only; a field with no ground truth to average over is NaN.
using CocoSummary = std::map<config::Metric, double>;

enum class AreaBucket {
    All,
    Small,
    Medium,
    Large,
};

struct CocoClassMetrics {
    std::string classLabel;
    std::vector<double> precision;
    std::vector<double> recall;
    std::vector<double> interpolatedPrecision;
    std::vector<double> interpolatedRecall;
    double ap{0.0};
    std::size_t totalPositives{0};
    std::size_t tp{0};
    std::size_t fp{0};
};

// Evenly spaced recall levels 0, 1/(n-1), ..., 1.
std::vector<double> recallLevels(int samples);

// Interpolated AP of a class whose records are in ranking order. Expects totalPositives > 0.
CocoClassMetrics accumulateClass(const matching::ClassMatches& classMatches, int recallSamples);

class CocoEvaluator {
public:
    explicit CocoEvaluator(config::CocoConfig config = {});

    CocoSummary summarize(
        const std::vector<annotation::BoundingBox>& groundTruths,
        const std::vector<annotation::BoundingBox>& detections,
        const config::MetricSelection& metrics = config::MetricSelection::all()) const;

    // Per-class metrics at a single setting; classes without ground truth in range are omitted.
    std::map<std::string, CocoClassMetrics> evaluateClasses(
        const std::vector<annotation::BoundingBox>& groundTruths,
        const std::vector<annotation::BoundingBox>& detections,
        double iouThreshold,
        AreaBucket bucket = AreaBucket::All,
        std::optional<std::size_t> maxDetections = std::nullopt) const;

    std::optional<matching::AreaRange> areaRange(AreaBucket bucket) const;

    const config::CocoConfig& config() const { return config_; }

private:
    std::vector<CocoClassMetrics> evaluateSetting(
        const std::vector<matching::ImageClassGroup>& groups,
        const matching::MatchOptions& options) const;

    config::CocoConfig config_;
};

}  // namespace evaluation
