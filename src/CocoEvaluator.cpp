#include "evaluation/CocoEvaluator.hpp"

#include <algorithm>
#include <limits>
#include <tuple>
#include <utility>

namespace evaluation {

namespace {

using SettingKey = std::tuple<double, AreaBucket, std::size_t>;
using SettingResult = std::vector<CocoClassMetrics>;

double mean(const std::vector<double>& values) {
    if (values.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    double sum = 0.0;
    for (const double value : values) {
        sum += value;
    }
    return sum / static_cast<double>(values.size());
}

}  // namespace

std::vector<double> recallLevels(int samples) {
    std::vector<double> levels;
    if (samples < 2) {
        return levels;
    }
    const double step = 1.0 / static_cast<double>(samples - 1);
    levels.reserve(static_cast<std::size_t>(samples));
    for (int k = 0; k < samples - 1; ++k) {
        levels.push_back(step * static_cast<double>(k));
    }
    levels.push_back(1.0);
    return levels;
}

CocoClassMetrics accumulateClass(const matching::ClassMatches& classMatches, int recallSamples) {
    CocoClassMetrics metrics;
    metrics.classLabel = classMatches.classLabel;
    metrics.totalPositives = classMatches.totalPositives;

    const double npos = static_cast<double>(classMatches.totalPositives);
    for (const auto& record : classMatches.records) {
        if (record.truePositive) {
            ++metrics.tp;
        } else {
            ++metrics.fp;
        }
        const double tp = static_cast<double>(metrics.tp);
        const double fp = static_cast<double>(metrics.fp);
        metrics.recall.push_back(tp / npos);
        metrics.precision.push_back(tp / (tp + fp));
    }

    // Precision envelope, non-increasing along the ranking.
    std::vector<double> envelope = metrics.precision;
    for (std::size_t i = envelope.size(); i > 1; --i) {
        envelope[i - 2] = std::max(envelope[i - 2], envelope[i - 1]);
    }

    metrics.interpolatedRecall = recallLevels(recallSamples);
    metrics.interpolatedPrecision.reserve(metrics.interpolatedRecall.size());
    double sum = 0.0;
    for (const double level : metrics.interpolatedRecall) {
        const auto it = std::lower_bound(metrics.recall.begin(), metrics.recall.end(), level);
        const double value = (it != metrics.recall.end())
            ? envelope[static_cast<std::size_t>(std::distance(metrics.recall.begin(), it))]
            : 0.0;
        metrics.interpolatedPrecision.push_back(value);
        sum += value;
    }
    metrics.ap = metrics.interpolatedRecall.empty()
        ? 0.0
        : sum / static_cast<double>(metrics.interpolatedRecall.size());
    return metrics;
}

CocoEvaluator::CocoEvaluator(config::CocoConfig config)
    : config_(std::move(config)) {
    config::validate(config_);
}

std::optional<matching::AreaRange> CocoEvaluator::areaRange(AreaBucket bucket) const {
    switch (bucket) {
        case AreaBucket::All:
            return std::nullopt;
        case AreaBucket::Small:
            return matching::AreaRange{0.0, config_.smallAreaLimit};
        case AreaBucket::Medium:
            return matching::AreaRange{config_.smallAreaLimit, config_.largeAreaLimit};
        case AreaBucket::Large:
            return matching::AreaRange{config_.largeAreaLimit, std::numeric_limits<double>::infinity()};
    }
    return std::nullopt;
}

std::vector<CocoClassMetrics> CocoEvaluator::evaluateSetting(
    const std::vector<matching::ImageClassGroup>& groups,
    const matching::MatchOptions& options) const {
    const auto classes = matching::matchByClass(groups, options, config_.parallel);

    std::vector<CocoClassMetrics> results;
    results.reserve(classes.size());
    for (const auto& classMatches : classes) {
        if (classMatches.totalPositives == 0) {
            continue;
        }
        results.push_back(accumulateClass(classMatches, config_.recallSamples));
    }
    return results;
}

std::map<std::string, CocoClassMetrics> CocoEvaluator::evaluateClasses(
    const std::vector<annotation::BoundingBox>& groundTruths,
    const std::vector<annotation::BoundingBox>& detections,
    double iouThreshold,
    AreaBucket bucket,
    std::optional<std::size_t> maxDetections) const {
    config::validateIouThreshold(iouThreshold);
    matching::MatchOptions options;
    options.iouThreshold = iouThreshold;
    options.areaRange = areaRange(bucket);
    options.maxDetections = maxDetections;

    std::map<std::string, CocoClassMetrics> perClass;
    for (auto& metrics : evaluateSetting(matching::groupByImageAndClass(groundTruths, detections), options)) {
        std::string label = metrics.classLabel;
        perClass.emplace(std::move(label), std::move(metrics));
    }
    return perClass;
}

CocoSummary CocoEvaluator::summarize(
    const std::vector<annotation::BoundingBox>& groundTruths,
    const std::vector<annotation::BoundingBox>& detections,
    const config::MetricSelection& metrics) const {
    CocoSummary summary;
    if (!metrics.anyCoco()) {
        return summary;
    }

    const auto groups = matching::groupByImageAndClass(groundTruths, detections);
    const std::size_t maxDets = config_.maxDetections.back();

    std::map<SettingKey, SettingResult> cache;
    auto setting = [&](double threshold, AreaBucket bucket, std::size_t limit) -> const SettingResult& {
        const SettingKey key{threshold, bucket, limit};
        auto it = cache.find(key);
        if (it == cache.end()) {
            matching::MatchOptions options;
            options.iouThreshold = threshold;
            options.areaRange = areaRange(bucket);
            options.maxDetections = limit;
            it = cache.emplace(key, evaluateSetting(groups, options)).first;
        }
        return it->second;
    };

    auto averagePrecision = [&](const std::vector<double>& thresholds, AreaBucket bucket) {
        std::vector<double> values;
        for (const double threshold : thresholds) {
            for (const auto& classMetrics : setting(threshold, bucket, maxDets)) {
                values.push_back(classMetrics.ap);
            }
        }
        return mean(values);
    };

    auto averageRecall = [&](AreaBucket bucket, std::size_t limit) {
        std::vector<double> values;
        for (const double threshold : config_.iouThresholds) {
            for (const auto& classMetrics : setting(threshold, bucket, limit)) {
                values.push_back(static_cast<double>(classMetrics.tp) /
                                 static_cast<double>(classMetrics.totalPositives));
            }
        }
        return mean(values);
    };

    for (const config::Metric metric : config::cocoMetrics()) {
        if (!metrics.contains(metric)) {
            continue;
        }
        double value = std::numeric_limits<double>::quiet_NaN();
        switch (metric) {
            case config::Metric::CocoAP: value = averagePrecision(config_.iouThresholds, AreaBucket::All); break;
            case config::Metric::CocoAP50: value = averagePrecision({0.50}, AreaBucket::All); break;
            case config::Metric::CocoAP75: value = averagePrecision({0.75}, AreaBucket::All); break;
            case config::Metric::CocoAPSmall: value = averagePrecision(config_.iouThresholds, AreaBucket::Small); break;
            case config::Metric::CocoAPMedium: value = averagePrecision(config_.iouThresholds, AreaBucket::Medium); break;
            case config::Metric::CocoAPLarge: value = averagePrecision(config_.iouThresholds, AreaBucket::Large); break;
            case config::Metric::CocoAR1: value = averageRecall(AreaBucket::All, config_.maxDetections[0]); break;
            case config::Metric::CocoAR10: value = averageRecall(AreaBucket::All, config_.maxDetections[1]); break;
            case config::Metric::CocoAR100: value = averageRecall(AreaBucket::All, config_.maxDetections[2]); break;
            case config::Metric::CocoARSmall: value = averageRecall(AreaBucket::Small, maxDets); break;
            case config::Metric::CocoARMedium: value = averageRecall(AreaBucket::Medium, maxDets); break;
            case config::Metric::CocoARLarge: value = averageRecall(AreaBucket::Large, maxDets); break;
            default: break;
        }
        summary.emplace(metric, value);
    }
    return summary;
}

}  // namespace evaluation
