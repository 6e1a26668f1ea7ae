#pragma once

#include "graphweave/core/Types.h"
#include "graphweave/routing/EdgeProjector.h"
#include "graphweave/routing/RoutingOptions.h"

#include <unordered_map>
#include <vector>

namespace graphweave {

/// Small perpendicular arc drawn where an edge passes over another one
struct HopWaypoint {
    Point before;    ///< On the segment, hopRadius before the crossing
    Point peak;      ///< Crossing offset by hopRadius along the left-hand normal
    Point after;     ///< On the segment, hopRadius past the crossing
    Point crossing;
    EdgeId crossedEdgeId;
    float distanceAlong = 0.0f;  ///< Signed projection of the crossing from the edge start

    bool operator==(const HopWaypoint& o) const = default;
};

/// Intersection of two rendered edges
struct Crossing {
    EdgeId hoppingEdgeId;   ///< Lexicographically smaller id, receives the hop
    EdgeId crossedEdgeId;
    Point point;

    bool operator==(const Crossing& o) const = default;
};

using HopMap = std::unordered_map<EdgeId, std::vector<HopWaypoint>>;

/**
 * @brief Finds pairwise crossings of straight rendered edges
 *
 * Only edges with shouldRender set and a position for both render endpoints
 * take part. Pairs sharing a render endpoint meet at a node and never count
 * as a crossing; zero-length segments are ignored.
 *
 * Every crossing belongs to the edge with the smaller id, so of two crossing
 * edges exactly one receives a hop. Hops of one edge are ordered by their
 * distance from the edge start.
 */
class CrossingDetector {
public:
    explicit CrossingDetector(RoutingOptions options = RoutingOptions{});

    /// @param positions Render position per node or meta-node id
    std::vector<Crossing> detect(const std::vector<TransformedEdge>& edges,
                                 const PointMap& positions) const;

    /// Hop waypoints per edge id; edges without crossings are absent
    HopMap computeHops(const std::vector<TransformedEdge>& edges,
                       const PointMap& positions) const;

    const RoutingOptions& options() const { return options_; }

private:
    RoutingOptions options_;
};

}  // namespace graphweave
