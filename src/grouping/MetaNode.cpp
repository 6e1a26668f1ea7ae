#include "graphweave/grouping/MetaNode.h"

#include <algorithm>

namespace graphweave {

bool MetaNode::containsNode(const NodeId& nodeId) const {
    return std::find(childNodeIds.begin(), childNodeIds.end(), nodeId) != childNodeIds.end();
}

bool MetaNode::containsMetaNode(const MetaNodeId& metaId) const {
    return std::find(childMetaNodeIds.begin(), childMetaNodeIds.end(), metaId) != childMetaNodeIds.end();
}

}  // namespace graphweave
