#include "graphweave/core/GeometryUtils.h"

#include <cmath>

namespace graphweave::geometry {

std::optional<Point> segmentIntersection(
    const Point& a1, const Point& a2,
    const Point& b1, const Point& b2,
    float parallelEpsilon) {

    float denom = (a1.x - a2.x) * (b1.y - b2.y) - (a1.y - a2.y) * (b1.x - b2.x);
    if (std::abs(denom) < parallelEpsilon) {
        return std::nullopt;
    }

    float t = ((a1.x - b1.x) * (b1.y - b2.y) - (a1.y - b1.y) * (b1.x - b2.x)) / denom;
    float u = -((a1.x - a2.x) * (a1.y - b1.y) - (a1.y - a2.y) * (a1.x - b1.x)) / denom;

    if (t < 0.0f || t > 1.0f || u < 0.0f || u > 1.0f) {
        return std::nullopt;
    }

    Point hit{a1.x + t * (a2.x - a1.x), a1.y + t * (a2.y - a1.y)};
    if (!hit.isFinite()) {
        return std::nullopt;
    }
    return hit;
}

std::optional<Point> centroid(const std::vector<Point>& points) {
    if (points.empty()) {
        return std::nullopt;
    }

    Point sum;
    for (const auto& p : points) {
        sum += p;
    }
    return sum / static_cast<float>(points.size());
}

}  // namespace graphweave::geometry
