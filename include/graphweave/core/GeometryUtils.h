#pragma once

#include "Types.h"

#include <optional>
#include <vector>

namespace graphweave {

/// Geometry helpers shared by the simulator and the crossing detector
namespace geometry {

/// Intersection point of two closed segments using the 2x2 determinant test
/// @param a1 Start of first segment
/// @param a2 End of first segment
/// @param b1 Start of second segment
/// @param b2 End of second segment
/// @param parallelEpsilon |determinant| below this counts as parallel or coincident
/// @return Intersection point, or std::nullopt for parallel/disjoint segments
std::optional<Point> segmentIntersection(
    const Point& a1, const Point& a2,
    const Point& b1, const Point& b2,
    float parallelEpsilon);

/// Signed distance of @p p along the unit direction @p dir measured from @p origin
inline float projectionAlong(const Point& p, const Point& origin, const Point& dir) {
    return (p - origin).dot(dir);
}

/// Arithmetic mean of the points (nullopt when empty)
std::optional<Point> centroid(const std::vector<Point>& points);

/// Unit vector at @p angle radians
inline Point unitVector(float angle) {
    return {std::cos(angle), std::sin(angle)};
}

}  // namespace geometry

namespace constants {

/// Floating-point comparison tolerance
constexpr float EPSILON = 1e-6f;

constexpr float PI = 3.14159265358979323846f;

/// Distances below this are treated as coincident points
constexpr float MIN_DISTANCE = 1e-4f;

}  // namespace constants

}  // namespace graphweave
