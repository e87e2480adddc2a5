#pragma once

#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "annotation/BoundingBox.hpp"
#include "config/Config.hpp"
#include "evaluation/CocoEvaluator.hpp"
#include "evaluation/PascalEvaluator.hpp"

namespace report {

// Precision-recall series of one class, ready for an external plotter.
struct CurveData {
    std::string classLabel;
    std::vector<double> precision;
    std::vector<double> recall;
    std::vector<double> interpolatedPrecision;
    std::vector<double> interpolatedRecall;
    double ap{0.0};
};

struct EvaluationReport {
    // Holds exactly the requested COCO fields; empty when none were requested.
    evaluation::CocoSummary coco;
    std::optional<double> pascalMAP;
    std::optional<std::map<std::string, evaluation::PascalClassMetrics>> pascalPerClass;
    std::vector<CurveData> curves;
    double pascalIouThreshold{0.5};
};

// Runs only what config.metrics asks for. Throws errors::InvalidInputError on
// invalid configuration or malformed input.
EvaluationReport evaluate(
    const std::vector<annotation::BoundingBox>& groundTruths,
    const std::vector<annotation::BoundingBox>& detections,
    const config::EvaluationConfig& config = config::defaultConfig());

std::vector<CurveData> extractCurves(const std::map<std::string, evaluation::PascalClassMetrics>& perClass);

void printReport(std::ostream& os, const EvaluationReport& report);

// In-memory JSON document; nothing is written to disk.
std::string toJson(const EvaluationReport& report);

}  // namespace report
