#pragma once

#include "graphweave/core/GraphModel.h"
#include "graphweave/engine/EngineOptions.h"
#include "graphweave/engine/RenderFrame.h"
#include "graphweave/grouping/GroupingConfig.h"
#include "graphweave/grouping/MetaNodeGrouper.h"
#include "graphweave/grouping/MetaNodeHierarchy.h"
#include "graphweave/layout/ClusterIslandInitializer.h"
#include "graphweave/layout/ISizeProvider.h"
#include "graphweave/layout/MetaNodePositioner.h"
#include "graphweave/layout/PhysicsSimulator.h"
#include "graphweave/layout/SimulationState.h"
#include "graphweave/routing/CrossingDetector.h"
#include "graphweave/routing/EdgeProjector.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace graphweave {

/**
 * @brief Single entry point tying grouping, simulation and routing together
 *
 * The engine owns one GraphModel, one meta-node hierarchy, the simulation
 * state and the meta-node positions. Inputs (graph, grouping, filter,
 * collapse toggles, drag) may change between ticks; every change and every
 * tick rebuilds the RenderFrame returned by frame().
 *
 * Usage:
 * @code
 * LayoutEngine engine;
 * engine.setGraph(nodes, edges);
 * engine.setGroupingConfig(GroupingConfig::singleLayer("dept", true));
 * while (!engine.isSettled()) {
 *     engine.tick();
 *     render(engine.frame());
 * }
 * @endcode
 *
 * Not thread-safe: the host calls every method from its render thread.
 */
class LayoutEngine {
public:
    explicit LayoutEngine(EngineOptions options = EngineOptions{});

    // =========================================================================
    // Inputs
    // =========================================================================

    /// Replace the graph. Surviving ids keep their position; a settled layout
    /// is rewound to the reheat iteration when new ids appear.
    void setGraph(std::vector<Node> nodes, std::vector<Edge> edges);

    /// Regenerates the meta-node hierarchy wholesale
    void setGroupingConfig(GroupingConfig config);

    /// Search result kept visible through collapsed groups
    void setFilter(IdSet filter);
    void clearFilter();
    bool hasFilter() const { return filter_.has_value(); }

    void setSizeProvider(std::shared_ptr<const ISizeProvider> sizes);
    void setCanvas(Size canvas);

    // =========================================================================
    // Collapse state (false for an unknown meta-node id)
    // =========================================================================

    bool setMetaNodeCollapsed(const MetaNodeId& id, bool collapsed);
    bool toggleMetaNode(const MetaNodeId& id);
    void collapseAll();
    void expandAll();

    // =========================================================================
    // Drag (nodes and meta-nodes)
    // =========================================================================

    /// @return false when @p id is neither a node nor a meta-node
    bool beginDrag(const std::string& id, Point pointer);
    void dragTo(Point pointer);
    void endDrag();
    bool isDragging() const { return dragId_.has_value(); }

    // =========================================================================
    // Simulation
    // =========================================================================

    /// One simulation step followed by a frame rebuild
    void tick();

    /// Tick until settled; returns the number of ticks run
    int runUntilSettled();

    bool isSettled() const { return simulator_.isSettled(state_); }

    /// Drop every position and start again from the island initializer
    void restart();

    // =========================================================================
    // Read-only access
    // =========================================================================

    const RenderFrame& frame() const { return frame_; }
    const GraphModel& model() const { return model_; }
    const MetaNodeHierarchy& hierarchy() const { return hierarchy_; }
    const SimulationState& state() const { return state_; }
    const GroupingConfig& groupingConfig() const { return grouping_; }
    const EngineOptions& options() const { return options_; }
    const PositionMap& metaNodePositions() const { return positioner_.positions(); }

private:
    EngineOptions options_;
    GraphModel model_;
    GroupingConfig grouping_;
    MetaNodeHierarchy hierarchy_;
    std::optional<IdSet> filter_;

    PhysicsSimulator simulator_;
    ClusterIslandInitializer islands_;
    MetaNodeGrouper grouper_;
    MetaNodePositioner positioner_;
    EdgeProjector projector_;
    CrossingDetector crossings_;

    SimulationState state_;
    std::optional<std::string> dragId_;
    bool draggingMetaNode_ = false;

    RenderFrame frame_;

    void regroup(bool keepCollapseState);
    void rebuildFrame();
    const IdSet* filter() const { return filter_ ? &*filter_ : nullptr; }
};

}  // namespace graphweave
