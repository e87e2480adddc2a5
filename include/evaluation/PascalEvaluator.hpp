#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "annotation/BoundingBox.hpp"
#include "config/Config.hpp"
#include "matching/Matcher.hpp"

namespace evaluation {

struct InterpolatedCurve {
    double ap{0.0};
    std::vector<double> precision;
    std::vector<double> recall;
};

// One row per detection, in ranking order.
struct PascalTableRow {
    std::string imageId;
    double confidence{0.0};
    bool truePositive{false};
    double iou{0.0};
    std::size_t accumulatedTP{0};
    std::size_t accumulatedFP{0};
    double precision{0.0};
    double recall{0.0};
};

struct PascalClassMetrics {
    std::string classLabel;
    std::vector<double> precision;
    std::vector<double> recall;
    std::vector<double> interpolatedPrecision;
    std::vector<double> interpolatedRecall;
    double ap{0.0};
    std::size_t totalPositives{0};
    std::size_t totalTP{0};
    std::size_t totalFP{0};
    double iouThreshold{0.5};
    config::Interpolation interpolation{config::Interpolation::EveryPoint};
    std::vector<PascalTableRow> table;
};

struct PascalResult {
    // NaN when no class has ground truth.
    double mAP{0.0};
    std::map<std::string, PascalClassMetrics> perClass;
};

// VOC 2012 area under the monotone precision envelope.
InterpolatedCurve everyPointAveragePrecision(const std::vector<double>& recall, const std::vector<double>& precision);

// VOC 2007 mean of the envelope sampled at recall 1.0, 0.9, ..., 0.0.
InterpolatedCurve elevenPointAveragePrecision(const std::vector<double>& recall, const std::vector<double>& precision);

class PascalEvaluator {
public:
    explicit PascalEvaluator(config::PascalConfig config = {});

    PascalResult evaluate(
        const std::vector<annotation::BoundingBox>& groundTruths,
        const std::vector<annotation::BoundingBox>& detections) const;

    // Expects classMatches.totalPositives > 0.
    PascalClassMetrics evaluateClass(const matching::ClassMatches& classMatches) const;

    const config::PascalConfig& config() const { return config_; }

private:
    config::PascalConfig config_;
};

}  // namespace evaluation
