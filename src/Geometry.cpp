#include "geometry/Rect.hpp"

namespace geometry {

double area(const Rect& rect) {
    return rect.area();
}

double intersectionArea(const Rect& a, const Rect& b) {
    const cv::Rect2d overlap = a.toRect() & b.toRect();
    if (overlap.width <= 0.0 || overlap.height <= 0.0) {
        return 0.0;
    }
    return overlap.area();
}

double iou(const Rect& a, const Rect& b) {
    const double inter = intersectionArea(a, b);
    const double uni = area(a) + area(b) - inter;
    return (uni > 0.0) ? (inter / uni) : 0.0;
}

}  // namespace geometry
