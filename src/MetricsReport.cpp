#include "report/MetricsReport.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>
#include <utility>

#include <opencv2/core/persistence.hpp>

namespace report {

namespace {

std::string formatValue(double value, int precision = 3) {
    if (std::isnan(value)) {
        return "n/a";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

void writeValue(cv::FileStorage& fs, const std::string& key, double value) {
    if (std::isnan(value)) {
        fs << key << "NaN";
    } else {
        fs << key << value;
    }
}

void warnAboutInputs(
    const std::vector<annotation::BoundingBox>& groundTruths,
    const std::vector<annotation::BoundingBox>& detections) {
    if (groundTruths.empty()) {
        std::cerr << "No ground-truth boxes supplied; averaged metrics will be reported as NaN.\n";
        return;
    }
    std::set<std::string> gtClasses;
    for (const auto& box : groundTruths) {
        gtClasses.insert(box.classLabel());
    }
    std::set<std::string> orphanClasses;
    for (const auto& box : detections) {
        if (gtClasses.count(box.classLabel()) == 0) {
            orphanClasses.insert(box.classLabel());
        }
    }
    for (const auto& label : orphanClasses) {
        std::cerr << "Detections of class '" << label << "' have no ground truth and are left out of the averages.\n";
    }
}

}  // namespace

EvaluationReport evaluate(
    const std::vector<annotation::BoundingBox>& groundTruths,
    const std::vector<annotation::BoundingBox>& detections,
    const config::EvaluationConfig& config) {
    config::validate(config);

    if (config.verbose) {
        std::cout << "Evaluating " << detections.size() << " detections against "
                  << groundTruths.size() << " ground-truth boxes ("
                  << config.metrics.metrics().size() << " metrics requested)" << std::endl;
        warnAboutInputs(groundTruths, detections);
    }

    EvaluationReport report;
    report.pascalIouThreshold = config.pascal.iouThreshold;

    if (config.metrics.anyCoco()) {
        const evaluation::CocoEvaluator coco(config.coco);
        report.coco = coco.summarize(groundTruths, detections, config.metrics);
        if (config.verbose) {
            std::cout << "COCO summary done: " << report.coco.size() << " fields" << std::endl;
        }
    }

    if (config.metrics.anyPascal()) {
        const evaluation::PascalEvaluator pascal(config.pascal);
        evaluation::PascalResult result = pascal.evaluate(groundTruths, detections);
        if (config.metrics.contains(config::Metric::PascalMAP)) {
            report.pascalMAP = result.mAP;
        }
        if (config.metrics.contains(config::Metric::PascalAP)) {
            report.curves = extractCurves(result.perClass);
            report.pascalPerClass = std::move(result.perClass);
        }
        if (config.verbose) {
            std::cout << "Pascal VOC evaluation done at IoU " << config.pascal.iouThreshold << std::endl;
        }
    }
    return report;
}

std::vector<CurveData> extractCurves(const std::map<std::string, evaluation::PascalClassMetrics>& perClass) {
    std::vector<CurveData> curves;
    curves.reserve(perClass.size());
    for (const auto& [label, metrics] : perClass) {
        curves.push_back(CurveData{
            label,
            metrics.precision,
            metrics.recall,
            metrics.interpolatedPrecision,
            metrics.interpolatedRecall,
            metrics.ap});
    }
    return curves;
}

void printReport(std::ostream& os, const EvaluationReport& report) {
    const std::string separatorLine(58, '-');

    if (!report.coco.empty()) {
        os << "COCO metrics\n" << separatorLine << "\n";
        for (const auto& [metric, value] : report.coco) {
            os << std::left << std::setw(18) << config::toString(metric)
               << std::right << std::setw(12) << formatValue(value) << "\n";
        }
    }

    if (report.pascalPerClass || report.pascalMAP) {
        if (!report.coco.empty()) {
            os << "\n";
        }
        os << "Pascal VOC metrics (IoU " << formatValue(report.pascalIouThreshold, 2) << ")\n";
        if (report.pascalPerClass) {
            os << std::left << std::setw(18) << "Class"
               << std::right << std::setw(10) << "Positives"
               << std::setw(10) << "TP"
               << std::setw(10) << "FP"
               << std::setw(10) << "AP" << "\n";
            os << separatorLine << "\n";
            for (const auto& [label, metrics] : *report.pascalPerClass) {
                os << std::left << std::setw(18) << label
                   << std::right << std::setw(10) << metrics.totalPositives
                   << std::setw(10) << metrics.totalTP
                   << std::setw(10) << metrics.totalFP
                   << std::setw(10) << formatValue(metrics.ap) << "\n";
            }
        }
        if (report.pascalMAP) {
            os << separatorLine << "\n";
            os << std::left << std::setw(18) << "mAP"
               << std::right << std::setw(40) << formatValue(*report.pascalMAP) << "\n";
        }
    }
}

std::string toJson(const EvaluationReport& report) {
    cv::FileStorage fs(".json", cv::FileStorage::WRITE | cv::FileStorage::MEMORY | cv::FileStorage::FORMAT_JSON);

    if (!report.coco.empty()) {
        fs << "coco" << "{";
        for (const auto& [metric, value] : report.coco) {
            writeValue(fs, config::toString(metric), value);
        }
        fs << "}";
    }

    if (report.pascalPerClass || report.pascalMAP) {
        fs << "pascal" << "{";
        fs << "iou_threshold" << report.pascalIouThreshold;
        if (report.pascalMAP) {
            writeValue(fs, "mAP", *report.pascalMAP);
        }
        if (report.pascalPerClass) {
            // Labels are free text, so classes go in a sequence rather than as keys.
            fs << "per_class" << "[";
            for (const auto& [label, metrics] : *report.pascalPerClass) {
                fs << "{";
                fs.write("label", label);
                fs << "AP" << metrics.ap;
                fs << "total_positives" << static_cast<int>(metrics.totalPositives);
                fs << "TP" << static_cast<int>(metrics.totalTP);
                fs << "FP" << static_cast<int>(metrics.totalFP);
                fs << "interpolation" << config::toString(metrics.interpolation);
                fs << "precision" << metrics.precision;
                fs << "recall" << metrics.recall;
                fs << "}";
            }
            fs << "]";
        }
        fs << "}";
    }

    return fs.releaseAndGetString();
}

}  // namespace report
