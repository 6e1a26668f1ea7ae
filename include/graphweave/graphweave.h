#pragma once

/// @file graphweave.h
/// @brief Main header for the graphweave layout and grouping engine
///
/// graphweave lays out large attribute-rich networks with a phased force
/// simulation, folds nodes into collapsible attribute groups and projects
/// edges for rendering.
///
/// Example usage:
/// @code
/// #include <graphweave/graphweave.h>
///
/// graphweave::LayoutEngine engine;
/// engine.setGraph(nodes, edges);
/// engine.setGroupingConfig(graphweave::GroupingConfig::singleLayer("department", true));
///
/// graphweave::FrameLoop loop(engine, [](const graphweave::RenderFrame& frame) {
///     draw(frame);
/// });
/// loop.runUntilSettled(1000);
/// @endcode

// Core module - Graph data and geometry
#include "core/Types.h"
#include "core/GraphModel.h"
#include "core/GeometryUtils.h"

// Grouping module - Meta-nodes and collapse state
#include "grouping/GroupingConfig.h"
#include "grouping/MetaNode.h"
#include "grouping/MetaNodeGrouper.h"
#include "grouping/MetaNodeHierarchy.h"

// Layout module - Initial placement and force simulation
#include "layout/config/LayoutEnums.h"
#include "layout/config/LayoutOptions.h"
#include "layout/ISizeProvider.h"
#include "layout/SimulationState.h"
#include "layout/ClusterIslandInitializer.h"
#include "layout/PhysicsSimulator.h"
#include "layout/MetaNodePositioner.h"

// Routing module - Edge projection and crossing hops
#include "routing/RoutingOptions.h"
#include "routing/EdgeProjector.h"
#include "routing/CrossingDetector.h"

// Engine module - Host-facing facade
#include "engine/EngineOptions.h"
#include "engine/RenderFrame.h"
#include "engine/LayoutEngine.h"
#include "engine/FrameLoop.h"

#include "util/ConfigSerializer.h"

#include <string>

namespace graphweave {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace graphweave
