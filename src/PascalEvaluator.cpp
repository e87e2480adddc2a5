#include "evaluation/PascalEvaluator.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace evaluation {

InterpolatedCurve everyPointAveragePrecision(const std::vector<double>& recall, const std::vector<double>& precision) {
    std::vector<double> mrec;
    std::vector<double> mpre;
    mrec.reserve(recall.size() + 2);
    mpre.reserve(precision.size() + 2);

    mrec.push_back(0.0);
    mrec.insert(mrec.end(), recall.begin(), recall.end());
    mrec.push_back(1.0);
    mpre.push_back(0.0);
    mpre.insert(mpre.end(), precision.begin(), precision.end());
    mpre.push_back(0.0);

    for (std::size_t i = mpre.size() - 1; i > 0; --i) {
        mpre[i - 1] = std::max(mpre[i - 1], mpre[i]);
    }

    InterpolatedCurve curve;
    for (std::size_t i = 1; i < mrec.size(); ++i) {
        if (mrec[i] != mrec[i - 1]) {
            curve.ap += (mrec[i] - mrec[i - 1]) * mpre[i];
        }
    }

    // The closing sentinel point is not part of the reported curve.
    curve.precision.assign(mpre.begin(), mpre.end() - 1);
    curve.recall.assign(mrec.begin(), mrec.end() - 1);
    return curve;
}

InterpolatedCurve elevenPointAveragePrecision(const std::vector<double>& recall, const std::vector<double>& precision) {
    constexpr int kLevels = 11;

    InterpolatedCurve curve;
    curve.precision.reserve(kLevels);
    curve.recall.reserve(kLevels);

    double sum = 0.0;
    for (int level = kLevels - 1; level >= 0; --level) {
        const double r = static_cast<double>(level) / static_cast<double>(kLevels - 1);
        const auto first = std::find_if(recall.begin(), recall.end(), [r](double value) { return value >= r; });
        double pmax = 0.0;
        if (first != recall.end()) {
            const auto offset = std::distance(recall.begin(), first);
            pmax = *std::max_element(precision.begin() + offset, precision.end());
        }
        curve.recall.push_back(r);
        curve.precision.push_back(pmax);
        sum += pmax;
    }
    curve.ap = sum / static_cast<double>(kLevels);
    return curve;
}

PascalEvaluator::PascalEvaluator(config::PascalConfig config)
    : config_(std::move(config)) {
    config::validate(config_);
}

PascalClassMetrics PascalEvaluator::evaluateClass(const matching::ClassMatches& classMatches) const {
    PascalClassMetrics metrics;
    metrics.classLabel = classMatches.classLabel;
    metrics.totalPositives = classMatches.totalPositives;
    metrics.iouThreshold = config_.iouThreshold;
    metrics.interpolation = config_.interpolation;

    const double npos = static_cast<double>(classMatches.totalPositives);
    metrics.precision.reserve(classMatches.records.size());
    metrics.recall.reserve(classMatches.records.size());

    for (const auto& record : classMatches.records) {
        if (record.truePositive) {
            ++metrics.totalTP;
        } else {
            ++metrics.totalFP;
        }
        const double tp = static_cast<double>(metrics.totalTP);
        const double fp = static_cast<double>(metrics.totalFP);
        const double precision = tp / (tp + fp);
        const double recall = tp / npos;
        metrics.precision.push_back(precision);
        metrics.recall.push_back(recall);

        if (config_.generateTable) {
            metrics.table.push_back(PascalTableRow{
                record.imageId,
                record.confidence,
                record.truePositive,
                record.iou,
                metrics.totalTP,
                metrics.totalFP,
                precision,
                recall});
        }
    }

    const InterpolatedCurve curve = (config_.interpolation == config::Interpolation::ElevenPoint)
        ? elevenPointAveragePrecision(metrics.recall, metrics.precision)
        : everyPointAveragePrecision(metrics.recall, metrics.precision);
    metrics.ap = curve.ap;
    metrics.interpolatedPrecision = curve.precision;
    metrics.interpolatedRecall = curve.recall;
    return metrics;
}

PascalResult PascalEvaluator::evaluate(
    const std::vector<annotation::BoundingBox>& groundTruths,
    const std::vector<annotation::BoundingBox>& detections) const {
    matching::MatchOptions options;
    options.iouThreshold = config_.iouThreshold;

    const auto groups = matching::groupByImageAndClass(groundTruths, detections);
    const auto classes = matching::matchByClass(groups, options, config_.parallel);

    PascalResult result;
    double sumAP = 0.0;
    for (const auto& classMatches : classes) {
        // Classes seen only among detections have no recall to speak of.
        if (classMatches.totalPositives == 0) {
            continue;
        }
        PascalClassMetrics metrics = evaluateClass(classMatches);
        sumAP += metrics.ap;
        result.perClass.emplace(metrics.classLabel, std::move(metrics));
    }

    result.mAP = result.perClass.empty()
        ? std::numeric_limits<double>::quiet_NaN()
        : sumAP / static_cast<double>(result.perClass.size());
    return result;
}

}  // namespace evaluation
