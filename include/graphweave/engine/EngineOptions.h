#pragma once

#include "graphweave/core/Types.h"
#include "graphweave/layout/config/LayoutOptions.h"
#include "graphweave/routing/RoutingOptions.h"

namespace graphweave {

/// Everything LayoutEngine can be tuned with
struct EngineOptions {
    Size canvas{1200.0f, 800.0f};
    SimulationOptions simulation;
    IslandOptions islands;
    RoutingOptions routing;
    MetaNodeMotionOptions metaNodeMotion;

    bool operator==(const EngineOptions& o) const = default;
};

}  // namespace graphweave
