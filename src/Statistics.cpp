#include "report/Statistics.hpp"

#include <iomanip>
#include <set>
#include <string>

namespace report {

BoxStatistics computeStatistics(
    const std::vector<annotation::BoundingBox>& boxes,
    const config::CocoConfig& coco) {
    BoxStatistics statistics;
    std::map<std::string, std::set<std::string>> imagesPerClass;

    for (const auto& box : boxes) {
        ClassStatistics& perClass = statistics.perClass[box.classLabel()];
        ++perClass.boxes;
        imagesPerClass[box.classLabel()].insert(box.imageId());
        ++statistics.boxesPerImage[box.imageId()];

        const double area = box.area();
        if (area < coco.smallAreaLimit) {
            ++perClass.small;
        } else if (area < coco.largeAreaLimit) {
            ++perClass.medium;
        } else {
            ++perClass.large;
        }
    }

    for (auto& [label, perClass] : statistics.perClass) {
        perClass.images = imagesPerClass[label].size();
    }
    statistics.totalBoxes = boxes.size();
    statistics.totalImages = statistics.boxesPerImage.size();
    return statistics;
}

void printStatistics(std::ostream& os, const BoxStatistics& statistics) {
    os << "Boxes: " << statistics.totalBoxes << " in " << statistics.totalImages << " images\n";
    os << std::left << std::setw(18) << "Class"
       << std::right << std::setw(8) << "Boxes"
       << std::setw(8) << "Images"
       << std::setw(8) << "Small"
       << std::setw(8) << "Medium"
       << std::setw(8) << "Large" << "\n";
    os << std::string(58, '-') << "\n";
    for (const auto& [label, perClass] : statistics.perClass) {
        os << std::left << std::setw(18) << label
           << std::right << std::setw(8) << perClass.boxes
           << std::setw(8) << perClass.images
           << std::setw(8) << perClass.small
           << std::setw(8) << perClass.medium
           << std::setw(8) << perClass.large << "\n";
    }
}

}  // namespace report
