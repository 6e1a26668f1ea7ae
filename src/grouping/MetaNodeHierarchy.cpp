#include "graphweave/grouping/MetaNodeHierarchy.h"
#include "graphweave/common/Logger.h"

#include <algorithm>
#include <stdexcept>

namespace graphweave {

MetaNodeHierarchy::MetaNodeHierarchy(std::vector<MetaNode> metaNodes)
    : metaNodes_(std::move(metaNodes)) {
    for (size_t i = 0; i < metaNodes_.size(); ++i) {
        const MetaNode& meta = metaNodes_[i];
        index_.emplace(meta.id, i);
        layerCount_ = std::max(layerCount_, meta.layer + 1);
    }

    membership_.assign(static_cast<size_t>(layerCount_), {});

    for (size_t i = 0; i < metaNodes_.size(); ++i) {
        const MetaNode& meta = metaNodes_[i];
        for (const auto& child : meta.childMetaNodeIds) {
            parent_[child] = meta.id;
        }

        auto& layerMembers = membership_[static_cast<size_t>(meta.layer)];
        for (const auto& nodeId : meta.childNodeIds) {
            auto [it, inserted] = layerMembers.emplace(nodeId, i);
            if (!inserted) {
                LOG_WARN("node '{}' listed by both '{}' and '{}' on layer {}",
                         nodeId, metaNodes_[it->second].id, meta.id, meta.layer);
            }
        }
    }
}

const MetaNode& MetaNodeHierarchy::get(const MetaNodeId& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw std::out_of_range("Unknown meta-node id: " + id);
    }
    return metaNodes_[it->second];
}

const MetaNode* MetaNodeHierarchy::find(const MetaNodeId& id) const {
    auto it = index_.find(id);
    return it != index_.end() ? &metaNodes_[it->second] : nullptr;
}

std::vector<const MetaNode*> MetaNodeHierarchy::layer(int layerIndex) const {
    std::vector<const MetaNode*> result;
    for (const auto& meta : metaNodes_) {
        if (meta.layer == layerIndex) {
            result.push_back(&meta);
        }
    }
    return result;
}

std::optional<MetaNodeId> MetaNodeHierarchy::parentOf(const MetaNodeId& id) const {
    auto it = parent_.find(id);
    if (it == parent_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<MetaNodeId> MetaNodeHierarchy::ancestorsOf(const MetaNodeId& id) const {
    std::vector<MetaNodeId> result;
    auto current = parentOf(id);
    while (current) {
        result.push_back(*current);
        current = parentOf(*current);
    }
    return result;
}

std::optional<MetaNodeId> MetaNodeHierarchy::groupOf(const NodeId& nodeId, int layerIndex) const {
    if (layerIndex < 0 || layerIndex >= layerCount_) {
        return std::nullopt;
    }
    const auto& members = membership_[static_cast<size_t>(layerIndex)];
    auto it = members.find(nodeId);
    if (it == members.end()) {
        return std::nullopt;
    }
    return metaNodes_[it->second].id;
}

bool MetaNodeHierarchy::setCollapsed(const MetaNodeId& id, bool collapsed) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return false;
    }
    metaNodes_[it->second].collapsed = collapsed;
    return true;
}

bool MetaNodeHierarchy::toggleCollapsed(const MetaNodeId& id) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return false;
    }
    auto& meta = metaNodes_[it->second];
    meta.collapsed = !meta.collapsed;
    return true;
}

void MetaNodeHierarchy::setAllCollapsed(bool collapsed) {
    for (auto& meta : metaNodes_) {
        meta.collapsed = collapsed;
    }
}

bool MetaNodeHierarchy::isCollapsed(const MetaNodeId& id) const {
    const MetaNode* meta = find(id);
    return meta && meta->collapsed;
}

bool MetaNodeHierarchy::isNodeHidden(const NodeId& nodeId, const IdSet* filter) const {
    if (filter) {
        return filter->count(nodeId) == 0;
    }
    return outermostCollapsedGroup(nodeId).has_value();
}

bool MetaNodeHierarchy::isMetaNodeHidden(const MetaNodeId& id, const IdSet* filter) const {
    const MetaNode* meta = find(id);
    if (!meta) {
        return true;
    }

    for (const auto& ancestor : ancestorsOf(id)) {
        if (isCollapsed(ancestor)) {
            return true;
        }
    }

    if (filter) {
        return std::none_of(meta->childNodeIds.begin(), meta->childNodeIds.end(),
            [filter](const NodeId& child) { return filter->count(child) > 0; });
    }
    return false;
}

std::vector<NodeId> MetaNodeHierarchy::visibleNodeIds(const GraphModel& model, const IdSet* filter) const {
    std::vector<NodeId> result;
    result.reserve(model.nodeCount());
    for (const auto& node : model.nodes()) {
        if (!isNodeHidden(node.id, filter)) {
            result.push_back(node.id);
        }
    }
    return result;
}

std::vector<const MetaNode*> MetaNodeHierarchy::visibleMetaNodes(const IdSet* filter) const {
    std::vector<const MetaNode*> result;
    for (const auto& meta : metaNodes_) {
        if (!isMetaNodeHidden(meta.id, filter)) {
            result.push_back(&meta);
        }
    }
    return result;
}

std::optional<MetaNodeId> MetaNodeHierarchy::outermostCollapsedGroup(const NodeId& nodeId) const {
    for (int layerIndex = layerCount_ - 1; layerIndex >= 0; --layerIndex) {
        const auto& members = membership_[static_cast<size_t>(layerIndex)];
        auto it = members.find(nodeId);
        if (it != members.end() && metaNodes_[it->second].collapsed) {
            return metaNodes_[it->second].id;
        }
    }
    return std::nullopt;
}

}  // namespace graphweave
