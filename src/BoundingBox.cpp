#include "annotation/BoundingBox.hpp"

#include <cmath>
#include <sstream>
#include <utility>

#include "errors/InvalidInputError.hpp"

namespace annotation {

namespace {

std::string describe(const std::string& imageId, const std::string& classLabel, const geometry::Rect& rect) {
    std::ostringstream oss;
    oss << "box '" << classLabel << "' in image '" << imageId << "' ["
        << rect.x1 << ", " << rect.y1 << ", " << rect.x2 << ", " << rect.y2 << "]";
    return oss.str();
}

}  // namespace

std::string toString(BoxKind kind) {
    switch (kind) {
        case BoxKind::GroundTruth: return "ground_truth";
        case BoxKind::Detected: return "detected";
    }
    return "unknown";
}

BoundingBox::BoundingBox(std::string imageId,
                         std::string classLabel,
                         BoxKind kind,
                         const geometry::Rect& rect,
                         std::optional<double> confidence)
    : imageId_(std::move(imageId)),
      classLabel_(std::move(classLabel)),
      kind_(kind),
      rect_(rect),
      confidence_(kind == BoxKind::Detected ? confidence : std::nullopt) {
    validate();
}

BoundingBox BoundingBox::groundTruth(std::string imageId, std::string classLabel, const geometry::Rect& rect) {
    return BoundingBox(std::move(imageId), std::move(classLabel), BoxKind::GroundTruth, rect, std::nullopt);
}

BoundingBox BoundingBox::detected(
    std::string imageId,
    std::string classLabel,
    const geometry::Rect& rect,
    double confidence) {
    return BoundingBox(std::move(imageId), std::move(classLabel), BoxKind::Detected, rect, confidence);
}

BoundingBox BoundingBox::withKind(BoxKind kind, std::optional<double> confidence) const {
    return BoundingBox(imageId_, classLabel_, kind, rect_, confidence ? confidence : confidence_);
}

void BoundingBox::validate() const {
    if (!rect_.isFinite()) {
        throw errors::InvalidInputError("Non-finite coordinates in " + describe(imageId_, classLabel_, rect_));
    }
    if (rect_.x1 - rect_.x2 > kInvertedTolerance || rect_.y1 - rect_.y2 > kInvertedTolerance) {
        throw errors::InvalidInputError("Inverted rectangle in " + describe(imageId_, classLabel_, rect_));
    }
    if (kind_ != BoxKind::Detected) {
        return;
    }
    if (!confidence_) {
        throw errors::InvalidInputError("Detected " + describe(imageId_, classLabel_, rect_) + " has no confidence");
    }
    if (!std::isfinite(*confidence_) || *confidence_ < 0.0 || *confidence_ > 1.0) {
        std::ostringstream oss;
        oss << "Confidence " << *confidence_ << " outside [0, 1] for "
            << describe(imageId_, classLabel_, rect_);
        throw errors::InvalidInputError(oss.str());
    }
}

bool BoundingBox::operator==(const BoundingBox& other) const {
    return imageId_ == other.imageId_ && classLabel_ == other.classLabel_ && kind_ == other.kind_ &&
           rect_ == other.rect_ && confidence_ == other.confidence_;
}

std::vector<BoundingBox> retag(const std::vector<BoundingBox>& boxes, BoxKind kind) {
    std::vector<BoundingBox> retagged;
    retagged.reserve(boxes.size());
    for (const auto& box : boxes) {
        retagged.push_back(box.withKind(kind));
    }
    return retagged;
}

}  // namespace annotation
