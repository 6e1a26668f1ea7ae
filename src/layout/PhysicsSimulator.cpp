#include "graphweave/layout/PhysicsSimulator.h"
#include "graphweave/common/Logger.h"
#include "graphweave/core/GeometryUtils.h"
#include "layout/physics/CollisionResolver.h"
#include "layout/physics/ForceTerms.h"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace graphweave {

namespace {
    /// Radius of the disc fresh nodes are scattered in around the canvas center
    constexpr float FRESH_PLACEMENT_RADIUS = 50.0f;

    using Share = std::optional<std::pair<float, float>>;

    std::vector<NodeId> nodeIds(const GraphModel& model) {
        std::vector<NodeId> ids;
        ids.reserve(model.nodeCount());
        for (const auto& node : model.nodes()) {
            ids.push_back(node.id);
        }
        return ids;
    }
}

PhysicsSimulator::PhysicsSimulator(SimulationOptions options, Size canvas,
                                   std::shared_ptr<const ISizeProvider> sizes)
    : options_(options), canvas_(canvas) {
    setSizeProvider(std::move(sizes));
}

void PhysicsSimulator::setSizeProvider(std::shared_ptr<const ISizeProvider> sizes) {
    sizes_ = sizes ? std::move(sizes) : std::make_shared<UniformSizeProvider>();
}

float PhysicsSimulator::temperature(int iteration, size_t nodeCount) const {
    float area = std::max(canvas_.area(), 0.0f);
    float kOpt = std::sqrt(area / static_cast<float>(std::max<size_t>(nodeCount, 1)));
    float progress = std::clamp(static_cast<float>(iteration) / static_cast<float>(options_.maxIterations),
                                0.0f, 1.0f);
    float remaining = 1.0f - progress;
    return kOpt * remaining * remaining;
}

float PhysicsSimulator::collisionDistance(const NodeId& a, const NodeId& b) const {
    return options_.collisionDistance(sizes_->sizeMultiplierOf(a), sizes_->sizeMultiplierOf(b));
}

SimulationState PhysicsSimulator::tick(const SimulationState& state, const GraphModel& model) const {
    if (isSettled(state)) {
        if (!state.drag) {
            // frozen: only drop ids the model no longer has
            std::vector<Point> points = gatherPoints(state, model);
            return commit(state, model, points, points);
        }
        return dragTick(state, model);
    }
    return forceTick(state, model);
}

SimulationState PhysicsSimulator::run(SimulationState state, const GraphModel& model, int ticks) const {
    for (int i = 0; i < ticks; ++i) {
        if (isSettled(state) && !state.drag) {
            break;
        }
        state = tick(state, model);
    }
    return state;
}

SimulationState PhysicsSimulator::runToSettled(SimulationState state, const GraphModel& model) const {
    while (!isSettled(state)) {
        state = tick(state, model);
    }
    return state;
}

std::vector<Point> PhysicsSimulator::gatherPoints(const SimulationState& state, const GraphModel& model) const {
    std::vector<Point> points;
    points.reserve(model.nodeCount());
    Point center = canvas_.center();

    for (const auto& node : model.nodes()) {
        const Position* pos = state.find(node.id);
        if (pos && pos->point().isFinite()) {
            points.push_back(pos->point());
        } else {
            points.push_back(center + physics::placementJitter(node.id, options_.seed, FRESH_PLACEMENT_RADIUS));
        }
    }

    if (state.drag) {
        if (auto index = model.indexOf(state.drag->nodeId); index && state.drag->pointer.isFinite()) {
            points[*index] = state.drag->pointer;
        }
    }
    return points;
}

std::vector<float> PhysicsSimulator::gatherMultipliers(const GraphModel& model) const {
    std::vector<float> multipliers;
    multipliers.reserve(model.nodeCount());
    for (const auto& node : model.nodes()) {
        float m = sizes_->sizeMultiplierOf(node.id);
        multipliers.push_back(std::isfinite(m) && m > 0.0f ? m : 1.0f);
    }
    return multipliers;
}

SimulationState PhysicsSimulator::forceTick(const SimulationState& state, const GraphModel& model) const {
    const int t = state.iteration;
    const SimulationPhase phase = options_.phaseAt(t);
    const PhaseForces& leafForces = options_.forcesFor(phase);
    const size_t n = model.nodeCount();

    const std::vector<Point> before = gatherPoints(state, model);
    const std::vector<float> multipliers = gatherMultipliers(model);

    std::optional<size_t> dragged;
    if (state.drag) {
        dragged = model.indexOf(state.drag->nodeId);
    }

    std::vector<Point> force(n);

    // Springs along edges
    for (const auto& edge : model.edges()) {
        size_t i = *model.indexOf(edge.source);
        size_t j = *model.indexOf(edge.target);
        if (i == j) {
            continue;
        }
        bool leafEdge = model.isLeaf(i) || model.isLeaf(j);
        float ideal = leafEdge ? leafForces.leafIdealLength : options_.structuralIdealLength;
        float strength = leafEdge ? leafForces.leafSpring : options_.structuralSpring;

        Point f = physics::springForce(before[i], before[j], ideal, strength);
        force[i] += f;
        force[j] -= f;
    }

    // Direct leaf -> parent pull and hub gravity, both acting on the pulled node only
    for (size_t i = 0; i < n; ++i) {
        if (leafForces.leafParentAttraction > 0.0f && model.isLeaf(i)) {
            if (auto parent = model.leafParent(i)) {
                force[i] += physics::linearPull(before[i], before[*parent], leafForces.leafParentAttraction);
            }
        }
        if (auto hub = model.hubNeighbor(i)) {
            force[i] += physics::linearPull(before[i], before[*hub], options_.hubGravity);
        }
    }

    // Pairwise repulsion
    std::vector<uint64_t> hashes;
    hashes.reserve(n);
    for (const auto& node : model.nodes()) {
        hashes.push_back(physics::hashId(node.id));
    }

    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            float strength = options_.repulsionStrength *
                physics::pairFactor(hashes[i], hashes[j], options_.repulsionJitterMin, options_.repulsionJitterMax);

            if (model.isLeaf(i) || model.isLeaf(j)) {
                strength *= options_.leafRepulsionFactor;
            } else {
                size_t leavesI = model.leafChildCount(i);
                size_t leavesJ = model.leafChildCount(j);
                if (leavesI > 0 && leavesJ > 0) {
                    strength *= 1.0f + std::sqrt(static_cast<float>(leavesI * leavesJ));
                }
            }

            Point f = physics::repulsionForce(before[i], before[j], strength);
            force[i] += f;
            force[j] -= f;
        }
    }

    // Integration, capped by the annealing temperature
    const float temp = temperature(t, n);
    std::vector<Point> after = before;
    for (size_t i = 0; i < n; ++i) {
        if (dragged && *dragged == i) {
            continue;
        }
        Point displacement = physics::clampLength(force[i], temp) * options_.damping;
        if (displacement.isFinite()) {
            after[i] += displacement;
        }
    }

    // Collision enforcement
    physics::CollisionResolver resolver(nodeIds(model), [this, &multipliers](size_t a, size_t b) {
        return options_.collisionDistance(multipliers[a], multipliers[b]);
    });

    auto share = [&](size_t a, size_t b) -> Share {
        if (!leafForces.leafCollisions && (model.isLeaf(a) || model.isLeaf(b))) {
            return std::nullopt;
        }
        if (dragged && *dragged == a) return std::make_pair(0.0f, 1.0f);
        if (dragged && *dragged == b) return std::make_pair(1.0f, 0.0f);
        // a leaf is pushed out along its own ray, its parent stays put
        if (model.isLeaf(a) && model.leafParent(a) == b) return std::make_pair(1.0f, 0.0f);
        if (model.isLeaf(b) && model.leafParent(b) == a) return std::make_pair(0.0f, 1.0f);
        return physics::CollisionResolver::evenSplit(a, b);
    };
    resolver.resolve(after, options_.collisionPasses, share);

    SimulationState next = commit(state, model, before, after);
    next.iteration = t + 1;

    SimulationPhase nextPhase = options_.phaseAt(next.iteration);
    if (nextPhase != phase) {
        if (nextPhase == SimulationPhase::Settled) {
            LOG_INFO("layout settled after {} iterations ({} nodes, worst clearance {:.2f})",
                     next.iteration, n, n > 1 ? resolver.worstClearance(after, share) : 0.0f);
        } else {
            LOG_DEBUG("phase {} -> {} at t={}", phaseName(phase), phaseName(nextPhase), next.iteration);
        }
    }
    return next;
}

SimulationState PhysicsSimulator::dragTick(const SimulationState& state, const GraphModel& model) const {
    std::optional<size_t> dragged = model.indexOf(state.drag->nodeId);
    const std::vector<Point> before = gatherPoints(state, model);
    if (!dragged) {
        LOG_DEBUG("dragged node '{}' is not part of the graph", state.drag->nodeId);
        return commit(state, model, before, before);
    }

    const size_t d = *dragged;
    const std::vector<float> multipliers = gatherMultipliers(model);

    std::unordered_set<size_t> neighbors;
    for (size_t nb : model.incidentNeighbors(d)) {
        if (nb != d) {
            neighbors.insert(nb);
        }
    }

    // Each neighbor is pulled by a single spring toward the dragged node
    std::vector<Point> after = before;
    for (size_t nb : neighbors) {
        Point f = physics::springForce(before[nb], before[d], options_.dragIdealLength, options_.dragSpring);
        Point displacement = f * options_.dragDamping;
        if (displacement.isFinite()) {
            after[nb] += displacement;
        }
    }

    physics::CollisionResolver resolver(nodeIds(model), [this, &multipliers](size_t a, size_t b) {
        return options_.collisionDistance(multipliers[a], multipliers[b]);
    });

    auto overlapping = [&](size_t a, size_t b) {
        return after[a].distanceTo(after[b]) < options_.collisionDistance(multipliers[a], multipliers[b]);
    };

    // Nodes pushed aside during this tick; each one in turn pushes untouched nodes out of its way
    std::unordered_set<size_t> shoved;

    auto share = [&](size_t a, size_t b) -> Share {
        if (a == d || b == d) {
            size_t other = a == d ? b : a;
            if (neighbors.count(other) == 0 && overlapping(a, b)) {
                shoved.insert(other);
            }
            return a == d ? std::make_pair(0.0f, 1.0f) : std::make_pair(1.0f, 0.0f);
        }

        bool aNeighbor = neighbors.count(a) > 0;
        bool bNeighbor = neighbors.count(b) > 0;
        if (aNeighbor && bNeighbor) return physics::CollisionResolver::evenSplit(a, b);
        if (aNeighbor) return std::make_pair(1.0f, 0.0f);
        if (bNeighbor) return std::make_pair(0.0f, 1.0f);

        bool aShoved = shoved.count(a) > 0;
        bool bShoved = shoved.count(b) > 0;
        if (aShoved && bShoved) return physics::CollisionResolver::evenSplit(a, b);
        if (aShoved) {
            if (overlapping(a, b)) shoved.insert(b);
            return std::make_pair(0.0f, 1.0f);
        }
        if (bShoved) {
            if (overlapping(a, b)) shoved.insert(a);
            return std::make_pair(1.0f, 0.0f);
        }
        return std::nullopt;
    };
    resolver.resolve(after, options_.dragOverlapPasses, share);

    return commit(state, model, before, after);
}

SimulationState PhysicsSimulator::commit(const SimulationState& state, const GraphModel& model,
                                         const std::vector<Point>& before,
                                         const std::vector<Point>& after) const {
    SimulationState next;
    next.iteration = state.iteration;
    next.drag = state.drag;
    next.positions.reserve(model.nodeCount());

    const auto& nodes = model.nodes();
    for (size_t i = 0; i < nodes.size(); ++i) {
        Point p = after[i].isFinite() ? after[i] : before[i];
        Point v = p - before[i];
        next.positions.emplace(nodes[i].id, Position{p.x, p.y, v.x, v.y});
    }
    return next;
}

}  // namespace graphweave
