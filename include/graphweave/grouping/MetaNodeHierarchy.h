#pragma once

#include "MetaNode.h"
#include "graphweave/core/GraphModel.h"

#include <optional>
#include <unordered_map>
#include <vector>

namespace graphweave {

/**
 * @brief Flat arena over one generation of meta-nodes
 *
 * Meta-nodes are stored once, in the order produced by MetaNodeGrouper, and
 * addressed by id. Parent links and per-layer membership of base nodes are
 * kept as id maps instead of nested objects, so the hierarchy can be
 * replaced wholesale without dangling references.
 *
 * The optional @p filter used by the visibility queries is the active
 * search result: when non-null, only nodes in it are visible, and those
 * stay visible even inside a collapsed group.
 */
class MetaNodeHierarchy {
public:
    MetaNodeHierarchy() = default;
    explicit MetaNodeHierarchy(std::vector<MetaNode> metaNodes);

    const std::vector<MetaNode>& metaNodes() const { return metaNodes_; }
    size_t size() const { return metaNodes_.size(); }
    bool empty() const { return metaNodes_.empty(); }

    /// Throws std::out_of_range for an unknown id
    const MetaNode& get(const MetaNodeId& id) const;
    const MetaNode* find(const MetaNodeId& id) const;
    bool contains(const MetaNodeId& id) const { return index_.count(id) > 0; }

    /// Highest layer index + 1 (0 when empty)
    int layerCount() const { return layerCount_; }
    std::vector<const MetaNode*> layer(int layerIndex) const;

    /// Meta-node one layer up that lists @p id in childMetaNodeIds
    std::optional<MetaNodeId> parentOf(const MetaNodeId& id) const;

    /// Ancestors of a meta-node, nearest first
    std::vector<MetaNodeId> ancestorsOf(const MetaNodeId& id) const;

    /// Meta-node of @p layerIndex whose members include base node @p nodeId
    std::optional<MetaNodeId> groupOf(const NodeId& nodeId, int layerIndex) const;

    // ===== Collapse state =====

    /// @return false when the id is unknown
    bool setCollapsed(const MetaNodeId& id, bool collapsed);
    bool toggleCollapsed(const MetaNodeId& id);
    void setAllCollapsed(bool collapsed);
    bool isCollapsed(const MetaNodeId& id) const;

    // ===== Visibility =====

    bool isNodeHidden(const NodeId& nodeId, const IdSet* filter = nullptr) const;
    bool isMetaNodeHidden(const MetaNodeId& id, const IdSet* filter = nullptr) const;

    std::vector<NodeId> visibleNodeIds(const GraphModel& model, const IdSet* filter = nullptr) const;
    std::vector<const MetaNode*> visibleMetaNodes(const IdSet* filter = nullptr) const;

    /// Highest-layer collapsed meta-node containing @p nodeId, or nullopt
    std::optional<MetaNodeId> outermostCollapsedGroup(const NodeId& nodeId) const;

private:
    std::vector<MetaNode> metaNodes_;
    std::unordered_map<MetaNodeId, size_t> index_;
    std::unordered_map<MetaNodeId, MetaNodeId> parent_;
    std::vector<std::unordered_map<NodeId, size_t>> membership_;  ///< per layer: node -> meta index
    int layerCount_ = 0;
};

}  // namespace graphweave
