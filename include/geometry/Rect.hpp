#pragma once

#include <algorithm>
#include <cmath>

#include <opencv2/core.hpp>

namespace geometry {

// Axis-aligned rectangle in absolute pixel coordinates, corners (x1, y1) and (x2, y2).
struct Rect {
    double x1{0.0};
    double y1{0.0};
    double x2{0.0};
    double y2{0.0};

    constexpr Rect() = default;

    constexpr Rect(double x1_, double y1_, double x2_, double y2_)
        : x1(x1_), y1(y1_), x2(x2_), y2(y2_) {}

    [[nodiscard]] double width() const {
        return std::max(x2 - x1, 0.0);
    }

    [[nodiscard]] double height() const {
        return std::max(y2 - y1, 0.0);
    }

    [[nodiscard]] double area() const {
        return width() * height();
    }

    [[nodiscard]] bool isFinite() const {
        return std::isfinite(x1) && std::isfinite(y1) && std::isfinite(x2) && std::isfinite(y2);
    }

    // Inverted extents collapse to an empty rectangle anchored at (x1, y1).
    [[nodiscard]] cv::Rect2d toRect() const {
        return {x1, y1, width(), height()};
    }

    bool operator==(const Rect& other) const {
        return x1 == other.x1 && y1 == other.y1 && x2 == other.x2 && y2 == other.y2;
    }

    bool operator!=(const Rect& other) const {
        return !(*this == other);
    }
};

double area(const Rect& rect);

double intersectionArea(const Rect& a, const Rect& b);

double iou(const Rect& a, const Rect& b);

}  // namespace geometry
