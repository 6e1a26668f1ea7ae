#pragma once

#include "Types.h"

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace graphweave {

/// Cell value of a node attribute: a plain string or a parsed multi-value list
using AttributeValue = std::variant<std::string, std::vector<std::string>>;

/// Attributes keep the column order of the source table
using AttributeList = std::vector<std::pair<std::string, AttributeValue>>;

struct Node {
    NodeId id;
    std::string label;
    AttributeList attributes;
    std::set<std::string> tags;
    bool isStub = false;                 ///< Created upstream for an unresolved link
    std::optional<double> timestamp;

    Node() = default;
    explicit Node(NodeId nodeId) : id(std::move(nodeId)) {}
    Node(NodeId nodeId, std::string lbl) : id(std::move(nodeId)), label(std::move(lbl)) {}

    /// Builder: append or replace an attribute
    Node& set(const std::string& name, AttributeValue value);

    const AttributeValue* findAttribute(const std::string& name) const;
    bool hasAttribute(const std::string& name) const { return findAttribute(name) != nullptr; }

    /// All values stored under @p name (one for plain strings, empty when absent)
    std::vector<std::string> attributeValues(const std::string& name) const;
};

struct Edge {
    EdgeId id;
    NodeId source;
    NodeId target;
    std::optional<std::string> label;

    Edge() = default;
    Edge(EdgeId edgeId, NodeId from, NodeId to)
        : id(std::move(edgeId)), source(std::move(from)), target(std::move(to)) {}
    Edge(EdgeId edgeId, NodeId from, NodeId to, std::string lbl)
        : id(std::move(edgeId)), source(std::move(from)), target(std::move(to)), label(std::move(lbl)) {}
};

/**
 * @brief Immutable snapshot of the node/edge set plus its adjacency index
 *
 * Built once per upstream data change and never mutated afterwards, so a
 * tick can read it without copying. Edges whose endpoints are unknown are
 * dropped at construction; of two nodes sharing an id the first one wins.
 *
 * Hot loops address nodes by their index in nodes(); the id-based accessors
 * are for callers outside the simulator.
 */
class GraphModel {
public:
    GraphModel() = default;
    GraphModel(std::vector<Node> nodes, std::vector<Edge> edges);

    // Node access:
    // - node(): throws std::out_of_range for an unknown id
    // - findNode(): nullptr for an unknown id
    const Node& node(const NodeId& id) const;
    const Node* findNode(const NodeId& id) const;
    bool hasNode(const NodeId& id) const;
    std::optional<size_t> indexOf(const NodeId& id) const;

    const std::vector<Node>& nodes() const { return nodes_; }
    const std::vector<Edge>& edges() const { return edges_; }

    size_t nodeCount() const { return nodes_.size(); }
    size_t edgeCount() const { return edges_.size(); }
    bool empty() const { return nodes_.empty(); }

    /// Edges rejected because an endpoint was missing
    size_t droppedEdgeCount() const { return droppedEdges_; }

    // ===== Adjacency (index based) =====

    /// Opposite endpoint of every incident edge, self loops excluded.
    /// A neighbor appears once per parallel edge.
    const std::vector<size_t>& incidentNeighbors(size_t index) const { return incident_[index]; }

    size_t degree(size_t index) const { return incident_[index].size(); }

    /// Degree-1 node
    bool isLeaf(size_t index) const { return incident_[index].size() == 1; }

    /// Number of distinct leaf neighbors
    size_t leafChildCount(size_t index) const { return leafChildren_[index]; }

    /// Sole neighbor of a leaf
    std::optional<size_t> leafParent(size_t index) const;

    /// Highest-degree neighbor, ties broken by smaller node id
    std::optional<size_t> hubNeighbor(size_t index) const { return hub_[index]; }

    // ===== Adjacency (id based) =====

    std::vector<NodeId> neighbors(const NodeId& id) const;
    size_t degree(const NodeId& id) const;

private:
    std::vector<Node> nodes_;
    std::vector<Edge> edges_;
    std::unordered_map<NodeId, size_t> indexById_;

    std::vector<std::vector<size_t>> incident_;
    std::vector<size_t> leafChildren_;
    std::vector<std::optional<size_t>> hub_;
    size_t droppedEdges_ = 0;

    void buildIndex();
};

}  // namespace graphweave
