#pragma once

namespace graphweave {

/// Options of the edge projection / crossing stage
struct RoutingOptions {
    float hopRadius = 8.0f;          ///< Half-width and height of a hop arc (pixels)
    float parallelEpsilon = 0.001f;  ///< |determinant| below this counts as parallel
    bool crossingsOnlyWhenSettled = true;  ///< Skip crossing detection while the layout still moves

    bool operator==(const RoutingOptions& o) const = default;
};

}  // namespace graphweave
