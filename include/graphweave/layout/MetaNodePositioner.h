#pragma once

#include "graphweave/grouping/MetaNodeHierarchy.h"
#include "graphweave/layout/config/LayoutOptions.h"

#include <unordered_set>

namespace graphweave {

/**
 * @brief Moves meta-nodes toward the centroid of their member nodes
 *
 * Each tick the target of a meta-node is the centroid of its positioned
 * descendant base nodes. The meta-node follows with a damped spring and
 * snaps once closer than snapDistance. A meta-node seen for the first time
 * starts on its target.
 *
 * A meta-node the user dragged is manually positioned: it keeps its place
 * until reset() (grouping regenerated).
 */
class MetaNodePositioner {
public:
    explicit MetaNodePositioner(MetaNodeMotionOptions options = MetaNodeMotionOptions{});

    /// Advance every meta-node of @p hierarchy one step
    void update(const MetaNodeHierarchy& hierarchy, const PositionMap& nodePositions);

    /// Centroid of the positioned descendants, nullopt when none is positioned
    static std::optional<Point> targetOf(const MetaNode& meta, const PositionMap& nodePositions);

    /// Pin a meta-node to @p point and mark it manually positioned
    void place(const MetaNodeId& id, const Point& point);

    bool isManuallyPositioned(const MetaNodeId& id) const { return manual_.count(id) > 0; }

    /// Forget every position and manual flag
    void reset();

    const PositionMap& positions() const { return positions_; }
    const Position* find(const MetaNodeId& id) const;

    const MetaNodeMotionOptions& options() const { return options_; }

private:
    MetaNodeMotionOptions options_;
    PositionMap positions_;
    std::unordered_set<MetaNodeId> manual_;
};

}  // namespace graphweave
