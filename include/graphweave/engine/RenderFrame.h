#pragma once

#include "graphweave/core/Types.h"
#include "graphweave/layout/config/LayoutEnums.h"
#include "graphweave/routing/CrossingDetector.h"
#include "graphweave/routing/EdgeProjector.h"

#include <vector>

namespace graphweave {

/// Read-only snapshot handed to the renderer, rebuilt wholesale every tick
struct RenderFrame {
    PointMap nodePositions;       ///< Every simulated node, hidden ones included
    PointMap metaNodePositions;   ///< Visible, positioned meta-nodes
    std::vector<TransformedEdge> edges;
    HopMap hops;
    IdSet visibleNodeIds;
    IdSet visibleMetaNodeIds;
    int iteration = 0;
    SimulationPhase phase = SimulationPhase::Explosion;

    bool isSettled() const { return phase == SimulationPhase::Settled; }

    bool isNodeVisible(const NodeId& id) const { return visibleNodeIds.count(id) > 0; }
    bool isMetaNodeVisible(const MetaNodeId& id) const { return visibleMetaNodeIds.count(id) > 0; }

    /// Position of a render endpoint, node or meta-node
    const Point* findPosition(const std::string& id) const {
        if (auto it = nodePositions.find(id); it != nodePositions.end()) return &it->second;
        if (auto it = metaNodePositions.find(id); it != metaNodePositions.end()) return &it->second;
        return nullptr;
    }
};

}  // namespace graphweave
