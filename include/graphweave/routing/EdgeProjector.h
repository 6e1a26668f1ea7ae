#pragma once

#include "graphweave/core/GraphModel.h"
#include "graphweave/grouping/MetaNodeHierarchy.h"

#include <optional>
#include <string>
#include <vector>

namespace graphweave {

/// Edge as the renderer draws it after grouping
struct TransformedEdge {
    EdgeId edgeId;
    std::optional<std::string> label;
    NodeId originalSource;
    NodeId originalTarget;
    std::string renderSource;    ///< Node id, or meta-node id when redirected
    std::string renderTarget;
    bool sourceIsMetaNode = false;
    bool targetIsMetaNode = false;
    bool shouldRender = true;

    bool operator==(const TransformedEdge& o) const = default;
};

/**
 * @brief Rewrites edges for rendering under the current collapse state
 *
 * An endpoint inside a collapsed visible meta-node is redirected to the
 * highest-layer such meta-node. Edges whose projected endpoints coincide are
 * dropped, and of several edges projecting onto the same directed
 * (renderSource, renderTarget) pair only the first one is kept.
 *
 * With a filter, endpoints in the filter are never redirected, and an edge
 * with an original endpoint outside the filter is kept but marked
 * shouldRender = false.
 */
class EdgeProjector {
public:
    std::vector<TransformedEdge> project(const std::vector<Edge>& edges,
                                         const std::vector<const MetaNode*>& visibleMetaNodes,
                                         const IdSet* filter = nullptr) const;

    /// Projects against hierarchy.visibleMetaNodes(filter)
    std::vector<TransformedEdge> project(const std::vector<Edge>& edges,
                                         const MetaNodeHierarchy& hierarchy,
                                         const IdSet* filter = nullptr) const {
        return project(edges, hierarchy.visibleMetaNodes(filter), filter);
    }
};

}  // namespace graphweave
