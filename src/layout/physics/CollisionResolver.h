#pragma once

#include "graphweave/core/Types.h"

#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace graphweave::physics {

/// Hard push-apart of overlapping node pairs
///
/// The caller decides per pair whether it takes part and how the overlap is
/// split: ShareFn returns {share of a, share of b} (summing to 1), or nullopt
/// to skip the pair. Passes repeat until one moves nothing or maxPasses is
/// reached.
class CollisionResolver {
public:
    using ShareFn = std::function<std::optional<std::pair<float, float>>(size_t a, size_t b)>;

    /// @param ids Node ids, parallel to the point vector passed to resolve()
    /// @param minDistance Minimum center distance for a pair of indices
    CollisionResolver(std::vector<NodeId> ids,
                      std::function<float(size_t, size_t)> minDistance);

    /// @return Number of passes that moved at least one node
    int resolve(std::vector<Point>& points, int maxPasses, const ShareFn& share) const;

    /// Smallest distance minus required distance over the pairs accepted by
    /// @p share (positive when nothing overlaps)
    float worstClearance(const std::vector<Point>& points, const ShareFn& share) const;

    /// Both move half of the overlap
    static std::optional<std::pair<float, float>> evenSplit(size_t, size_t) {
        return std::make_pair(0.5f, 0.5f);
    }

private:
    std::vector<NodeId> ids_;
    std::function<float(size_t, size_t)> minDistance_;
};

}  // namespace graphweave::physics
