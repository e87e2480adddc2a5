#include "config/Config.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "errors/InvalidInputError.hpp"

namespace config {

namespace {

bool isValidIouThreshold(double threshold) {
    return std::isfinite(threshold) && threshold > 0.0 && threshold <= 1.0;
}

}  // namespace

std::string toString(Metric metric) {
    switch (metric) {
        case Metric::CocoAP: return "AP";
        case Metric::CocoAP50: return "AP50";
        case Metric::CocoAP75: return "AP75";
        case Metric::CocoAPSmall: return "APsmall";
        case Metric::CocoAPMedium: return "APmedium";
        case Metric::CocoAPLarge: return "APlarge";
        case Metric::CocoAR1: return "AR1";
        case Metric::CocoAR10: return "AR10";
        case Metric::CocoAR100: return "AR100";
        case Metric::CocoARSmall: return "ARsmall";
        case Metric::CocoARMedium: return "ARmedium";
        case Metric::CocoARLarge: return "ARlarge";
        case Metric::PascalAP: return "per_class";
        case Metric::PascalMAP: return "mAP";
    }
    return "unknown";
}

std::string toString(Interpolation interpolation) {
    switch (interpolation) {
        case Interpolation::EveryPoint: return "every_point";
        case Interpolation::ElevenPoint: return "eleven_point";
    }
    return "unknown";
}

const std::array<Metric, 12>& cocoMetrics() {
    static const std::array<Metric, 12> metrics{
        Metric::CocoAP, Metric::CocoAP50, Metric::CocoAP75,
        Metric::CocoAPSmall, Metric::CocoAPMedium, Metric::CocoAPLarge,
        Metric::CocoAR1, Metric::CocoAR10, Metric::CocoAR100,
        Metric::CocoARSmall, Metric::CocoARMedium, Metric::CocoARLarge,
    };
    return metrics;
}

bool isCocoMetric(Metric metric) {
    return metric != Metric::PascalAP && metric != Metric::PascalMAP;
}

MetricSelection::MetricSelection(std::initializer_list<Metric> metrics)
    : metrics_(metrics) {}

MetricSelection MetricSelection::all() {
    MetricSelection selection;
    for (const Metric metric : cocoMetrics()) {
        selection.add(metric);
    }
    selection.add(Metric::PascalAP);
    selection.add(Metric::PascalMAP);
    return selection;
}

MetricSelection& MetricSelection::add(Metric metric) {
    metrics_.insert(metric);
    return *this;
}

MetricSelection& MetricSelection::remove(Metric metric) {
    metrics_.erase(metric);
    return *this;
}

bool MetricSelection::anyCoco() const {
    return std::any_of(metrics_.begin(), metrics_.end(), isCocoMetric);
}

bool MetricSelection::anyPascal() const {
    return contains(Metric::PascalAP) || contains(Metric::PascalMAP);
}

std::vector<double> defaultCocoIouThresholds() {
    constexpr int kCount = 10;
    constexpr double kStart = 0.5;
    constexpr double kStop = 0.95;
    const double step = (kStop - kStart) / static_cast<double>(kCount - 1);

    std::vector<double> thresholds;
    thresholds.reserve(kCount);
    for (int i = 0; i < kCount - 1; ++i) {
        thresholds.push_back(kStart + step * static_cast<double>(i));
    }
    thresholds.push_back(kStop);
    return thresholds;
}

EvaluationConfig defaultConfig() {
    return EvaluationConfig{};
}

void validateIouThreshold(double threshold) {
    if (!isValidIouThreshold(threshold)) {
        std::ostringstream oss;
        oss << "IoU threshold must lie in (0, 1], got " << threshold;
        throw errors::InvalidInputError(oss.str());
    }
}

void validate(const PascalConfig& config) {
    validateIouThreshold(config.iouThreshold);
}

void validate(const CocoConfig& config) {
    if (config.iouThresholds.empty()) {
        throw errors::InvalidInputError("COCO evaluation needs at least one IoU threshold");
    }
    for (const double threshold : config.iouThresholds) {
        if (!isValidIouThreshold(threshold)) {
            std::ostringstream oss;
            oss << "COCO IoU threshold must lie in (0, 1], got " << threshold;
            throw errors::InvalidInputError(oss.str());
        }
    }
    for (const std::size_t limit : config.maxDetections) {
        if (limit == 0) {
            throw errors::InvalidInputError("COCO max-detections limits must be positive");
        }
    }
    if (!(config.smallAreaLimit > 0.0) || !(config.largeAreaLimit > config.smallAreaLimit)) {
        std::ostringstream oss;
        oss << "COCO area breakpoints must satisfy 0 < small < large, got "
            << config.smallAreaLimit << " and " << config.largeAreaLimit;
        throw errors::InvalidInputError(oss.str());
    }
    if (config.recallSamples < 2) {
        throw errors::InvalidInputError("COCO interpolation needs at least 2 recall samples");
    }
}

void validate(const EvaluationConfig& config) {
    validate(config.pascal);
    validate(config.coco);
}

}  // namespace config
