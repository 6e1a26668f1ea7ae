#pragma once

#include "GroupingConfig.h"
#include "MetaNode.h"
#include "graphweave/core/GraphModel.h"

#include <optional>
#include <string>
#include <vector>

namespace graphweave {

/**
 * @brief Builds the meta-node hierarchy for a grouping configuration
 *
 * Layer 0 buckets base nodes by the single distinct non-empty value they
 * hold for the layer attribute. Nodes holding several values, or none, stay
 * ungrouped. Each further layer buckets the previous layer's meta-nodes by
 * the attribute value of their first child node. Buckets with fewer than
 * two members never produce a meta-node.
 *
 * Layers >= 1 group across the whole previous layer (global scope), not
 * within each parent of layer - 2.
 *
 * The result is sorted by layer, then by group value, so identical input
 * always produces an identical vector.
 */
class MetaNodeGrouper {
public:
    std::vector<MetaNode> generate(const std::vector<Node>& nodes,
                                   const GroupingConfig& config) const;

    std::vector<MetaNode> generate(const GraphModel& model,
                                   const GroupingConfig& config) const {
        return generate(model.nodes(), config);
    }

    /// The single distinct non-empty value of @p attribute, or nullopt when
    /// the node lacks it or holds more than one
    static std::optional<std::string> membershipValue(const Node& node,
                                                      const std::string& attribute);

    static MetaNodeId makeId(int layer, const std::string& attribute, const std::string& value);

private:
    std::vector<MetaNode> groupNodes(const std::vector<Node>& nodes,
                                     const CombinationLayer& layer) const;

    std::vector<MetaNode> groupMetaNodes(const std::vector<MetaNode>& previous,
                                         const std::unordered_map<NodeId, const Node*>& nodeLookup,
                                         const CombinationLayer& layer,
                                         int layerIndex) const;
};

}  // namespace graphweave
