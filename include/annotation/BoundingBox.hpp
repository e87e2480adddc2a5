#pragma once

#include <optional>
#include <string>
#include <vector>

#include "geometry/Rect.hpp"

namespace annotation {

enum class BoxKind {
    GroundTruth,
    Detected,
};

// Largest inversion (x2 < x1 or y2 < y1) tolerated and clamped to zero area.
constexpr double kInvertedTolerance = 1e-6;

std::string toString(BoxKind kind);

class BoundingBox {
public:
    // Throws errors::InvalidInputError for non-finite or inverted coordinates.
    static BoundingBox groundTruth(std::string imageId, std::string classLabel, const geometry::Rect& rect);

    // Throws errors::InvalidInputError additionally when confidence is not in [0, 1].
    static BoundingBox detected(
        std::string imageId,
        std::string classLabel,
        const geometry::Rect& rect,
        double confidence);

    const std::string& imageId() const { return imageId_; }
    const std::string& classLabel() const { return classLabel_; }
    BoxKind kind() const { return kind_; }
    const geometry::Rect& rect() const { return rect_; }
    std::optional<double> confidence() const { return confidence_; }

    [[nodiscard]] double area() const { return rect_.area(); }

    // Confidence used for ranking; ground truth ranks as 0.
    [[nodiscard]] double score() const { return confidence_.value_or(0.0); }

    // Copy of this box re-tagged as `kind`. A detection keeps its confidence
    // (or takes `confidence` when given); ground truth drops it.
    [[nodiscard]] BoundingBox withKind(BoxKind kind, std::optional<double> confidence = std::nullopt) const;

    bool operator==(const BoundingBox& other) const;
    bool operator!=(const BoundingBox& other) const { return !(*this == other); }

private:
    BoundingBox(std::string imageId,
                std::string classLabel,
                BoxKind kind,
                const geometry::Rect& rect,
                std::optional<double> confidence);

    void validate() const;

    std::string imageId_;
    std::string classLabel_;
    BoxKind kind_{BoxKind::GroundTruth};
    geometry::Rect rect_{};
    std::optional<double> confidence_;
};

// New sequence with every box re-tagged; the input is left untouched.
std::vector<BoundingBox> retag(const std::vector<BoundingBox>& boxes, BoxKind kind);

}  // namespace annotation
