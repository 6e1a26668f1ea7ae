#include "graphweave/core/GraphModel.h"
#include "graphweave/common/Logger.h"

#include <algorithm>
#include <stdexcept>

namespace graphweave {

Node& Node::set(const std::string& name, AttributeValue value) {
    for (auto& [key, existing] : attributes) {
        if (key == name) {
            existing = std::move(value);
            return *this;
        }
    }
    attributes.emplace_back(name, std::move(value));
    return *this;
}

const AttributeValue* Node::findAttribute(const std::string& name) const {
    for (const auto& [key, value] : attributes) {
        if (key == name) {
            return &value;
        }
    }
    return nullptr;
}

std::vector<std::string> Node::attributeValues(const std::string& name) const {
    const AttributeValue* value = findAttribute(name);
    if (!value) {
        return {};
    }
    if (const auto* single = std::get_if<std::string>(value)) {
        return {*single};
    }
    return std::get<std::vector<std::string>>(*value);
}

GraphModel::GraphModel(std::vector<Node> nodes, std::vector<Edge> edges) {
    nodes_.reserve(nodes.size());
    for (auto& node : nodes) {
        if (indexById_.count(node.id)) {
            LOG_DEBUG("duplicate node id '{}' ignored", node.id);
            continue;
        }
        indexById_.emplace(node.id, nodes_.size());
        nodes_.push_back(std::move(node));
    }

    edges_.reserve(edges.size());
    std::set<EdgeId> edgeIds;
    for (auto& edge : edges) {
        if (!indexById_.count(edge.source) || !indexById_.count(edge.target)) {
            LOG_DEBUG("dropping edge '{}': unknown endpoint ({} -> {})",
                      edge.id, edge.source, edge.target);
            ++droppedEdges_;
            continue;
        }
        if (!edgeIds.insert(edge.id).second) {
            LOG_DEBUG("duplicate edge id '{}' ignored ({} -> {})", edge.id, edge.source, edge.target);
            continue;
        }
        edges_.push_back(std::move(edge));
    }

    buildIndex();
}

void GraphModel::buildIndex() {
    const size_t n = nodes_.size();
    incident_.assign(n, {});
    leafChildren_.assign(n, 0);
    hub_.assign(n, std::nullopt);

    for (const auto& edge : edges_) {
        size_t s = indexById_.at(edge.source);
        size_t t = indexById_.at(edge.target);
        if (s == t) {
            continue;
        }
        incident_[s].push_back(t);
        incident_[t].push_back(s);
    }

    for (size_t i = 0; i < n; ++i) {
        std::vector<size_t> distinct = incident_[i];
        std::sort(distinct.begin(), distinct.end());
        distinct.erase(std::unique(distinct.begin(), distinct.end()), distinct.end());

        for (size_t j : distinct) {
            if (isLeaf(j)) {
                ++leafChildren_[i];
            }

            if (!hub_[i]) {
                hub_[i] = j;
                continue;
            }
            size_t best = *hub_[i];
            if (degree(j) > degree(best) ||
                (degree(j) == degree(best) && nodes_[j].id < nodes_[best].id)) {
                hub_[i] = j;
            }
        }
    }
}

const Node& GraphModel::node(const NodeId& id) const {
    auto it = indexById_.find(id);
    if (it == indexById_.end()) {
        throw std::out_of_range("Unknown node id: " + id);
    }
    return nodes_[it->second];
}

const Node* GraphModel::findNode(const NodeId& id) const {
    auto it = indexById_.find(id);
    return it != indexById_.end() ? &nodes_[it->second] : nullptr;
}

bool GraphModel::hasNode(const NodeId& id) const {
    return indexById_.count(id) > 0;
}

std::optional<size_t> GraphModel::indexOf(const NodeId& id) const {
    auto it = indexById_.find(id);
    if (it == indexById_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<size_t> GraphModel::leafParent(size_t index) const {
    if (!isLeaf(index)) {
        return std::nullopt;
    }
    return incident_[index].front();
}

std::vector<NodeId> GraphModel::neighbors(const NodeId& id) const {
    auto index = indexOf(id);
    if (!index) {
        return {};
    }

    std::vector<NodeId> result;
    for (size_t j : incident_[*index]) {
        const NodeId& other = nodes_[j].id;
        if (std::find(result.begin(), result.end(), other) == result.end()) {
            result.push_back(other);
        }
    }
    return result;
}

size_t GraphModel::degree(const NodeId& id) const {
    auto index = indexOf(id);
    return index ? degree(*index) : 0;
}

}  // namespace graphweave
