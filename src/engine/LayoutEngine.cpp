#include "graphweave/engine/LayoutEngine.h"
#include "graphweave/common/Logger.h"

namespace graphweave {

LayoutEngine::LayoutEngine(EngineOptions options)
    : options_(options),
      simulator_(options.simulation, options.canvas),
      islands_(options.islands),
      positioner_(options.metaNodeMotion),
      crossings_(options.routing) {
    rebuildFrame();
}

// =============================================================================
// Inputs
// =============================================================================

void LayoutEngine::setGraph(std::vector<Node> nodes, std::vector<Edge> edges) {
    PositionMap previous = std::move(state_.positions);
    state_.positions.clear();
    model_ = GraphModel(std::move(nodes), std::move(edges));

    if (model_.droppedEdgeCount() > 0) {
        LOG_DEBUG("{} edge(s) dropped for unknown endpoints", model_.droppedEdgeCount());
    }

    size_t known = 0;
    for (const auto& node : model_.nodes()) {
        if (previous.count(node.id)) {
            ++known;
        }
    }
    const size_t fresh = model_.nodeCount() - known;

    if (known == 0) {
        std::optional<DragState> drag = state_.drag;
        state_ = SimulationState{};
        state_.drag = drag;
        state_.positions = islands_.initialize(model_, options_.canvas);
        LOG_INFO("new layout for {} nodes, {} edges", model_.nodeCount(), model_.edgeCount());
    } else {
        state_.positions = islands_.initialize(model_, options_.canvas, &previous);
        int reheat = options_.simulation.reheatIteration;
        if (fresh > 0 && state_.iteration > reheat) {
            LOG_DEBUG("{} new node(s); rewinding iteration {} -> {}", fresh, state_.iteration, reheat);
            state_.iteration = reheat;
        }
    }

    if (dragId_ && !draggingMetaNode_ && !model_.hasNode(*dragId_)) {
        endDrag();
    }

    regroup(true);
    rebuildFrame();
}

void LayoutEngine::setGroupingConfig(GroupingConfig config) {
    grouping_ = std::move(config);
    regroup(false);
    rebuildFrame();
}

void LayoutEngine::setFilter(IdSet filter) {
    filter_ = std::move(filter);
    rebuildFrame();
}

void LayoutEngine::clearFilter() {
    filter_.reset();
    rebuildFrame();
}

void LayoutEngine::setSizeProvider(std::shared_ptr<const ISizeProvider> sizes) {
    simulator_.setSizeProvider(std::move(sizes));
}

void LayoutEngine::setCanvas(Size canvas) {
    options_.canvas = canvas;
    simulator_.setCanvas(canvas);
}

void LayoutEngine::regroup(bool keepCollapseState) {
    std::vector<MetaNode> metaNodes = grouper_.generate(model_, grouping_);

    if (keepCollapseState) {
        for (auto& meta : metaNodes) {
            if (const MetaNode* old = hierarchy_.find(meta.id)) {
                meta.collapsed = old->collapsed;
            }
        }
    } else {
        positioner_.reset();
    }

    hierarchy_ = MetaNodeHierarchy(std::move(metaNodes));
    positioner_.update(hierarchy_, state_.positions);

    if (dragId_ && draggingMetaNode_ && !hierarchy_.contains(*dragId_)) {
        endDrag();
    }
    LOG_DEBUG("{} meta-node(s) over {} layer(s)", hierarchy_.size(), hierarchy_.layerCount());
}

// =============================================================================
// Collapse state
// =============================================================================

bool LayoutEngine::setMetaNodeCollapsed(const MetaNodeId& id, bool collapsed) {
    if (!hierarchy_.setCollapsed(id, collapsed)) {
        return false;
    }
    rebuildFrame();
    return true;
}

bool LayoutEngine::toggleMetaNode(const MetaNodeId& id) {
    if (!hierarchy_.toggleCollapsed(id)) {
        return false;
    }
    rebuildFrame();
    return true;
}

void LayoutEngine::collapseAll() {
    hierarchy_.setAllCollapsed(true);
    rebuildFrame();
}

void LayoutEngine::expandAll() {
    hierarchy_.setAllCollapsed(false);
    rebuildFrame();
}

// =============================================================================
// Drag
// =============================================================================

bool LayoutEngine::beginDrag(const std::string& id, Point pointer) {
    if (!pointer.isFinite()) {
        return false;
    }

    if (model_.hasNode(id)) {
        dragId_ = id;
        draggingMetaNode_ = false;
        state_.drag = DragState{id, pointer};
        state_.positions[id] = Position(pointer);
    } else if (hierarchy_.contains(id)) {
        dragId_ = id;
        draggingMetaNode_ = true;
        positioner_.place(id, pointer);
    } else {
        LOG_DEBUG("cannot drag unknown id '{}'", id);
        return false;
    }

    LOG_DEBUG("drag start '{}' at ({:.1f}, {:.1f})", id, pointer.x, pointer.y);
    rebuildFrame();
    return true;
}

void LayoutEngine::dragTo(Point pointer) {
    if (!dragId_ || !pointer.isFinite()) {
        return;
    }

    if (draggingMetaNode_) {
        positioner_.place(*dragId_, pointer);
    } else {
        state_.drag->pointer = pointer;
        state_.positions[*dragId_].moveTo(pointer);
    }
    rebuildFrame();
}

void LayoutEngine::endDrag() {
    if (!dragId_) {
        return;
    }
    LOG_DEBUG("drag stop '{}'", *dragId_);
    state_.drag.reset();
    dragId_.reset();
    draggingMetaNode_ = false;
}

// =============================================================================
// Simulation
// =============================================================================

void LayoutEngine::tick() {
    if (!simulator_.isSettled(state_) || state_.drag) {
        state_ = simulator_.tick(state_, model_);
    }
    positioner_.update(hierarchy_, state_.positions);
    rebuildFrame();
}

int LayoutEngine::runUntilSettled() {
    int ticks = 0;
    while (!isSettled()) {
        tick();
        ++ticks;
    }
    return ticks;
}

void LayoutEngine::restart() {
    endDrag();
    state_ = SimulationState{};
    state_.positions = islands_.initialize(model_, options_.canvas);
    positioner_.reset();
    positioner_.update(hierarchy_, state_.positions);
    rebuildFrame();
}

// =============================================================================
// Frame
// =============================================================================

void LayoutEngine::rebuildFrame() {
    RenderFrame next;
    const IdSet* active = filter();

    next.iteration = state_.iteration;
    next.phase = simulator_.phaseOf(state_);

    next.nodePositions.reserve(state_.positions.size());
    for (const auto& [id, pos] : state_.positions) {
        next.nodePositions.emplace(id, pos.point());
    }

    for (auto& id : hierarchy_.visibleNodeIds(model_, active)) {
        next.visibleNodeIds.insert(std::move(id));
    }

    std::vector<const MetaNode*> visibleMetaNodes = hierarchy_.visibleMetaNodes(active);
    for (const MetaNode* meta : visibleMetaNodes) {
        next.visibleMetaNodeIds.insert(meta->id);
        if (const Position* pos = positioner_.find(meta->id)) {
            next.metaNodePositions.emplace(meta->id, pos->point());
        }
    }

    next.edges = projector_.project(model_.edges(), visibleMetaNodes, active);

    if (!options_.routing.crossingsOnlyWhenSettled || next.isSettled()) {
        PointMap endpoints = next.metaNodePositions;
        for (const auto& id : next.visibleNodeIds) {
            if (auto it = next.nodePositions.find(id); it != next.nodePositions.end()) {
                endpoints.emplace(id, it->second);
            }
        }
        next.hops = crossings_.computeHops(next.edges, endpoints);
    }

    frame_ = std::move(next);
}

}  // namespace graphweave
