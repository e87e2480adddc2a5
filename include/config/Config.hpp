#pragma once

#include <array>
#include <cstddef>
#include <initializer_list>
#include <set>
#include <string>
#include <vector>

namespace config {

enum class Interpolation {
    EveryPoint,
    ElevenPoint,
};

enum class Metric {
    CocoAP,
    CocoAP50,
    CocoAP75,
    CocoAPSmall,
    CocoAPMedium,
    CocoAPLarge,
    CocoAR1,
    CocoAR10,
    CocoAR100,
    CocoARSmall,
    CocoARMedium,
    CocoARLarge,
    // Selects the per-class Pascal table, reported under "per_class".
    PascalAP,
    PascalMAP,
};

// Output key of a metric: "AP", "AP50", ..., "ARlarge", "per_class", "mAP".
std::string toString(Metric metric);

std::string toString(Interpolation interpolation);

const std::array<Metric, 12>& cocoMetrics();

bool isCocoMetric(Metric metric);

class MetricSelection {
public:
    MetricSelection() = default;
    MetricSelection(std::initializer_list<Metric> metrics);

    static MetricSelection all();

    MetricSelection& add(Metric metric);
    MetricSelection& remove(Metric metric);

    bool contains(Metric metric) const { return metrics_.count(metric) > 0; }
    bool empty() const { return metrics_.empty(); }
    bool anyCoco() const;
    bool anyPascal() const;

    const std::set<Metric>& metrics() const { return metrics_; }

private:
    std::set<Metric> metrics_;
};

// 0.50, 0.55, ..., 0.95
std::vector<double> defaultCocoIouThresholds();

struct PascalConfig {
    double iouThreshold{0.5};
    Interpolation interpolation{Interpolation::EveryPoint};
    bool generateTable{false};
    bool parallel{true};
};

struct CocoConfig {
    std::vector<double> iouThresholds{defaultCocoIouThresholds()};
    // Limits behind AR1, AR10 and AR100; the last one also bounds every AP field.
    std::array<std::size_t, 3> maxDetections{1, 10, 100};
    double smallAreaLimit{32.0 * 32.0};
    double largeAreaLimit{96.0 * 96.0};
    int recallSamples{101};
    bool parallel{true};
};

struct EvaluationConfig {
    PascalConfig pascal{};
    CocoConfig coco{};
    MetricSelection metrics{MetricSelection::all()};
    bool verbose{false};
};

EvaluationConfig defaultConfig();

// Throws errors::InvalidInputError unless threshold lies in (0, 1].
void validateIouThreshold(double threshold);

void validate(const PascalConfig& config);
void validate(const CocoConfig& config);
void validate(const EvaluationConfig& config);

}  // namespace config
