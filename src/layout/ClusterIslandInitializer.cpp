#include "graphweave/layout/ClusterIslandInitializer.h"
#include "graphweave/common/Logger.h"
#include "graphweave/core/GeometryUtils.h"
#include "layout/physics/ForceTerms.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

namespace graphweave {

namespace {
    /// Smallest island edge, used when the canvas is too small for the grid
    constexpr float MIN_ISLAND_EXTENT = 100.0f;

    /// Union-find with path halving and union by rank
    class DisjointSet {
    public:
        explicit DisjointSet(size_t n) : parent_(n), rank_(n, 0) {
            std::iota(parent_.begin(), parent_.end(), size_t{0});
        }

        size_t find(size_t x) {
            while (parent_[x] != x) {
                parent_[x] = parent_[parent_[x]];
                x = parent_[x];
            }
            return x;
        }

        void unite(size_t a, size_t b) {
            a = find(a);
            b = find(b);
            if (a == b) return;
            if (rank_[a] < rank_[b]) std::swap(a, b);
            parent_[b] = a;
            if (rank_[a] == rank_[b]) ++rank_[a];
        }

    private:
        std::vector<size_t> parent_;
        std::vector<int> rank_;
    };
}

ClusterIslandInitializer::ClusterIslandInitializer(IslandOptions options)
    : options_(options) {}

std::vector<std::vector<size_t>> ClusterIslandInitializer::connectedComponents(const GraphModel& model) {
    const size_t n = model.nodeCount();
    DisjointSet sets(n);
    for (size_t i = 0; i < n; ++i) {
        for (size_t nb : model.incidentNeighbors(i)) {
            sets.unite(i, nb);
        }
    }

    std::vector<std::vector<size_t>> components;
    std::unordered_map<size_t, size_t> componentOfRoot;
    for (size_t i = 0; i < n; ++i) {
        size_t root = sets.find(i);
        auto [it, inserted] = componentOfRoot.emplace(root, components.size());
        if (inserted) {
            components.emplace_back();
        }
        components[it->second].push_back(i);
    }
    return components;
}

PositionMap ClusterIslandInitializer::initialize(const std::vector<Node>& nodes,
                                                 const std::vector<Edge>& edges,
                                                 Size canvas) const {
    return initialize(GraphModel(nodes, edges), canvas);
}

PositionMap ClusterIslandInitializer::initialize(const GraphModel& model, Size canvas,
                                                 const PositionMap* previous) const {
    PositionMap result;
    if (model.empty()) {
        return result;
    }

    const auto& nodes = model.nodes();

    bool anyKnown = previous && std::any_of(nodes.begin(), nodes.end(),
        [previous](const Node& node) { return previous->count(node.id) > 0; });

    if (anyKnown) {
        std::mt19937 rng(options_.seed);
        std::uniform_real_distribution<float> jitter(-options_.centerJitter, options_.centerJitter);
        Point center = canvas.center();
        size_t fresh = 0;

        for (const auto& node : nodes) {
            auto it = previous->find(node.id);
            if (it != previous->end() && it->second.point().isFinite()) {
                Position pos = it->second;
                pos.stop();
                result.emplace(node.id, pos);
            } else {
                Point p{center.x + jitter(rng), center.y + jitter(rng)};
                result.emplace(node.id, Position(p));
                ++fresh;
            }
        }
        LOG_DEBUG("reused {} positions, placed {} new nodes near the center", nodes.size() - fresh, fresh);
        return result;
    }

    auto components = connectedComponents(model);
    std::vector<Point> points = placeIslands(model, components, canvas);
    relax(model, components, points);

    for (size_t i = 0; i < nodes.size(); ++i) {
        result.emplace(nodes[i].id, Position(points[i]));
    }

    LOG_DEBUG("placed {} nodes on {} islands", nodes.size(), components.size());
    return result;
}

std::vector<Point> ClusterIslandInitializer::placeIslands(
    const GraphModel& model,
    const std::vector<std::vector<size_t>>& components,
    Size canvas) const {

    std::vector<Point> points(model.nodeCount());
    std::mt19937 rng(options_.seed);
    std::uniform_real_distribution<float> jitter(-options_.centerJitter, options_.centerJitter);

    const size_t count = components.size();
    const size_t cols = static_cast<size_t>(std::ceil(std::sqrt(static_cast<double>(count))));
    const size_t rows = (count + cols - 1) / cols;
    const float spacing = options_.islandSpacing;

    float islandWidth = (canvas.width - static_cast<float>(cols + 1) * spacing) / static_cast<float>(cols);
    float islandHeight = (canvas.height - static_cast<float>(rows + 1) * spacing) / static_cast<float>(rows);
    islandWidth = std::max(islandWidth, MIN_ISLAND_EXTENT);
    islandHeight = std::max(islandHeight, MIN_ISLAND_EXTENT);

    for (size_t c = 0; c < count; ++c) {
        const auto& members = components[c];
        size_t row = c / cols;
        size_t col = c % cols;

        Point center{
            spacing + static_cast<float>(col) * (islandWidth + spacing) + islandWidth / 2,
            spacing + static_cast<float>(row) * (islandHeight + spacing) + islandHeight / 2};

        if (members.size() == 1) {
            points[members.front()] = center;
            continue;
        }

        float radius = std::min(islandWidth, islandHeight) / 2 * 0.8f;
        for (size_t k = 0; k < members.size(); ++k) {
            float angle = static_cast<float>(k) / static_cast<float>(members.size()) * 2.0f * constants::PI;
            Point offset{jitter(rng), jitter(rng)};
            points[members[k]] = center + geometry::unitVector(angle) * radius + offset;
        }
    }
    return points;
}

void ClusterIslandInitializer::relax(const GraphModel& model,
                                     const std::vector<std::vector<size_t>>& components,
                                     std::vector<Point>& points) const {
    const size_t n = points.size();
    const auto& nodes = model.nodes();

    std::vector<size_t> componentOf(n);
    for (size_t c = 0; c < components.size(); ++c) {
        for (size_t i : components[c]) {
            componentOf[i] = c;
        }
    }

    std::vector<Point> force(n);
    std::vector<Point> centroids(components.size());

    for (int it = 0; it < options_.iterations; ++it) {
        std::fill(force.begin(), force.end(), Point{});

        // Intra-cluster repulsion
        for (size_t i = 0; i < n; ++i) {
            for (size_t j = i + 1; j < n; ++j) {
                if (componentOf[i] != componentOf[j]) {
                    continue;
                }
                Point f = physics::repulsionForce(points[i], points[j], options_.intraClusterRepulsion);
                force[i] += f;
                force[j] -= f;
            }
        }

        // Intra-cluster attraction; leaves use the radial spring instead
        for (size_t i = 0; i < n; ++i) {
            for (size_t nb : model.incidentNeighbors(i)) {
                float strength = model.isLeaf(i) ? options_.leafRadialForce : options_.intraClusterAttraction;
                force[i] += physics::springForce(points[i], points[nb], options_.idealEdgeLength, strength);
            }
        }

        // Cluster-level repulsion
        for (size_t c = 0; c < components.size(); ++c) {
            std::vector<Point> members;
            members.reserve(components[c].size());
            for (size_t i : components[c]) members.push_back(points[i]);
            centroids[c] = geometry::centroid(members).value_or(Point{});
        }

        for (size_t a = 0; a < components.size(); ++a) {
            for (size_t b = a + 1; b < components.size(); ++b) {
                Point delta = centroids[a] - centroids[b];
                float dist = delta.length();
                Point dir = dist < constants::MIN_DISTANCE
                    ? physics::separationDirection(nodes[components[a].front()].id,
                                                   nodes[components[b].front()].id)
                    : delta / dist;

                float safeDist = std::max(dist, 1.0f);
                float magnitude = options_.interClusterRepulsion / (safeDist * safeDist);
                if (dist < options_.minClusterDistance) {
                    magnitude += (options_.minClusterDistance - dist) * 0.5f;
                }

                for (size_t i : components[a]) force[i] += dir * magnitude;
                for (size_t i : components[b]) force[i] -= dir * magnitude;
            }
        }

        float progress = static_cast<float>(it) / static_cast<float>(options_.iterations);
        float cap = options_.maxStep * (1.0f - progress) + 1.0f;
        for (size_t i = 0; i < n; ++i) {
            Point step = physics::clampLength(force[i], cap);
            if (step.isFinite()) {
                points[i] += step;
            }
        }
    }
}

}  // namespace graphweave
