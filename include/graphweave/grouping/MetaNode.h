#pragma once

#include "graphweave/core/Types.h"

#include <string>
#include <vector>

namespace graphweave {

/**
 * @brief Synthetic node standing for a group of base nodes
 *
 * childNodeIds always holds every base node below this meta-node, also for
 * nested layers where the direct children are childMetaNodeIds. Both lists
 * keep input order, which makes the first child id the representative used
 * when the next layer reads an attribute.
 */
struct MetaNode {
    MetaNodeId id;
    std::string label;
    std::string groupByAttribute;
    std::string groupValue;
    std::vector<NodeId> childNodeIds;          ///< Transitive base members, size >= 2
    std::vector<MetaNodeId> childMetaNodeIds;  ///< Direct lower-layer members (layer >= 1)
    bool collapsed = false;
    int layer = 0;

    bool containsNode(const NodeId& nodeId) const;
    bool containsMetaNode(const MetaNodeId& metaId) const;
    bool isNested() const { return !childMetaNodeIds.empty(); }

    bool operator==(const MetaNode& o) const = default;
};

}  // namespace graphweave
