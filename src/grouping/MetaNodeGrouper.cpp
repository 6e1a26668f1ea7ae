#include "graphweave/grouping/MetaNodeGrouper.h"
#include "graphweave/common/Logger.h"

#include <algorithm>
#include <map>

namespace graphweave {

namespace {

std::string makeLabel(const std::string& value, size_t count) {
    return value + " (" + std::to_string(count) + ")";
}

}  // namespace

std::optional<std::string> MetaNodeGrouper::membershipValue(const Node& node,
                                                            const std::string& attribute) {
    std::optional<std::string> found;
    for (const auto& value : node.attributeValues(attribute)) {
        if (value.empty()) {
            continue;
        }
        if (found && *found != value) {
            return std::nullopt;  // ambiguous
        }
        found = value;
    }
    return found;
}

MetaNodeId MetaNodeGrouper::makeId(int layer, const std::string& attribute, const std::string& value) {
    if (layer == 0) {
        return "meta-" + attribute + "-" + value;
    }
    return "meta-L" + std::to_string(layer) + "-" + attribute + "-" + value;
}

std::vector<MetaNode> MetaNodeGrouper::generate(const std::vector<Node>& nodes,
                                                const GroupingConfig& config) const {
    if (!config.enabled) {
        return {};
    }

    std::vector<CombinationLayer> layers = config.effectiveLayers();
    if (layers.empty()) {
        LOG_DEBUG("grouping enabled without any attribute");
        return {};
    }

    std::unordered_map<NodeId, const Node*> lookup;
    lookup.reserve(nodes.size());
    for (const auto& node : nodes) {
        lookup.emplace(node.id, &node);
    }

    std::vector<MetaNode> result;
    std::vector<MetaNode> previous;

    for (size_t i = 0; i < layers.size(); ++i) {
        const CombinationLayer& layer = layers[i];
        int layerIndex = static_cast<int>(i);

        if (layer.attribute.empty()) {
            LOG_INFO("layer {} has no attribute; skipping it and every layer above", layerIndex);
            break;
        }

        std::vector<MetaNode> current = layerIndex == 0
            ? groupNodes(nodes, layer)
            : groupMetaNodes(previous, lookup, layer, layerIndex);

        if (current.empty()) {
            LOG_INFO("layer {} ({}) produced no groups; nested layers skipped",
                     layerIndex, layer.attribute);
            break;
        }

        LOG_DEBUG("layer {} ({}) produced {} meta-nodes", layerIndex, layer.attribute, current.size());
        result.insert(result.end(), current.begin(), current.end());
        previous = std::move(current);
    }

    return result;
}

std::vector<MetaNode> MetaNodeGrouper::groupNodes(const std::vector<Node>& nodes,
                                                  const CombinationLayer& layer) const {
    std::map<std::string, std::vector<NodeId>> buckets;
    size_t ambiguous = 0;

    for (const auto& node : nodes) {
        auto values = node.attributeValues(layer.attribute);
        if (values.empty()) {
            continue;
        }
        auto value = membershipValue(node, layer.attribute);
        if (!value) {
            // either several distinct values or only empty cells
            bool anyNonEmpty = std::any_of(values.begin(), values.end(),
                [](const std::string& v) { return !v.empty(); });
            if (anyNonEmpty) {
                ++ambiguous;
                LOG_DEBUG("node '{}' holds several '{}' values; excluded from grouping",
                          node.id, layer.attribute);
            }
            continue;
        }
        auto& bucket = buckets[*value];
        if (std::find(bucket.begin(), bucket.end(), node.id) == bucket.end()) {
            bucket.push_back(node.id);
        }
    }

    if (ambiguous > 0) {
        LOG_DEBUG("{} node(s) with ambiguous '{}' membership left ungrouped", ambiguous, layer.attribute);
    }

    std::vector<MetaNode> metaNodes;
    for (auto& [value, members] : buckets) {
        if (members.size() < 2) {
            continue;
        }
        MetaNode meta;
        meta.id = makeId(0, layer.attribute, value);
        meta.label = makeLabel(value, members.size());
        meta.groupByAttribute = layer.attribute;
        meta.groupValue = value;
        meta.childNodeIds = std::move(members);
        meta.collapsed = layer.autoCollapse;
        meta.layer = 0;
        metaNodes.push_back(std::move(meta));
    }
    return metaNodes;
}

std::vector<MetaNode> MetaNodeGrouper::groupMetaNodes(
    const std::vector<MetaNode>& previous,
    const std::unordered_map<NodeId, const Node*>& nodeLookup,
    const CombinationLayer& layer,
    int layerIndex) const {

    std::map<std::string, std::vector<const MetaNode*>> buckets;

    for (const auto& meta : previous) {
        if (meta.childNodeIds.empty()) {
            continue;
        }
        auto it = nodeLookup.find(meta.childNodeIds.front());
        if (it == nodeLookup.end()) {
            continue;
        }
        auto value = membershipValue(*it->second, layer.attribute);
        if (!value) {
            LOG_DEBUG("meta-node '{}' has no single '{}' value on its first child; left ungrouped",
                      meta.id, layer.attribute);
            continue;
        }
        buckets[*value].push_back(&meta);
    }

    std::vector<MetaNode> metaNodes;
    for (const auto& [value, members] : buckets) {
        if (members.size() < 2) {
            continue;
        }

        MetaNode meta;
        meta.id = makeId(layerIndex, layer.attribute, value);
        meta.groupByAttribute = layer.attribute;
        meta.groupValue = value;
        meta.collapsed = layer.autoCollapse;
        meta.layer = layerIndex;

        for (const MetaNode* child : members) {
            meta.childMetaNodeIds.push_back(child->id);
            for (const auto& nodeId : child->childNodeIds) {
                if (!meta.containsNode(nodeId)) {
                    meta.childNodeIds.push_back(nodeId);
                }
            }
        }
        meta.label = makeLabel(value, meta.childNodeIds.size());
        metaNodes.push_back(std::move(meta));
    }
    return metaNodes;
}

}  // namespace graphweave
