#pragma once

#include <string>

#include "annotation/BoundingBox.hpp"

namespace test_boxes {

inline annotation::BoundingBox gt(const std::string& image, const std::string& label,
                                  double x1, double y1, double x2, double y2) {
    return annotation::BoundingBox::groundTruth(image, label, {x1, y1, x2, y2});
}

inline annotation::BoundingBox det(const std::string& image, const std::string& label,
                                   double x1, double y1, double x2, double y2, double confidence) {
    return annotation::BoundingBox::detected(image, label, {x1, y1, x2, y2}, confidence);
}

}  // namespace test_boxes
