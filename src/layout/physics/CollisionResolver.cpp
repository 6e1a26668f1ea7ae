#include "layout/physics/CollisionResolver.h"
#include "layout/physics/ForceTerms.h"
#include "graphweave/core/GeometryUtils.h"

#include <algorithm>
#include <limits>

namespace graphweave::physics {

namespace {
    /// Extra separation so a resolved pair does not re-trigger on rounding
    constexpr float SEPARATION_MARGIN = 0.01f;
}

CollisionResolver::CollisionResolver(std::vector<NodeId> ids,
                                     std::function<float(size_t, size_t)> minDistance)
    : ids_(std::move(ids)), minDistance_(std::move(minDistance)) {}

int CollisionResolver::resolve(std::vector<Point>& points, int maxPasses, const ShareFn& share) const {
    int movedPasses = 0;
    const size_t n = points.size();

    for (int pass = 0; pass < maxPasses; ++pass) {
        bool moved = false;

        for (size_t a = 0; a < n; ++a) {
            for (size_t b = a + 1; b < n; ++b) {
                auto split = share(a, b);
                if (!split) {
                    continue;
                }

                float required = minDistance_(a, b);
                Point delta = points[a] - points[b];
                float dist = delta.length();
                if (dist >= required) {
                    continue;
                }

                Point dir = dist < constants::MIN_DISTANCE
                    ? separationDirection(ids_[a], ids_[b])
                    : delta / dist;
                float overlap = required - dist + SEPARATION_MARGIN;

                points[a] += dir * (overlap * split->first);
                points[b] -= dir * (overlap * split->second);
                moved = true;
            }
        }

        if (!moved) {
            break;
        }
        ++movedPasses;
    }

    return movedPasses;
}

float CollisionResolver::worstClearance(const std::vector<Point>& points, const ShareFn& share) const {
    float worst = std::numeric_limits<float>::max();
    for (size_t a = 0; a < points.size(); ++a) {
        for (size_t b = a + 1; b < points.size(); ++b) {
            if (!share(a, b)) {
                continue;
            }
            worst = std::min(worst, points[a].distanceTo(points[b]) - minDistance_(a, b));
        }
    }
    return worst;
}

}  // namespace graphweave::physics
