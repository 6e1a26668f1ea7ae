#pragma once

#include "graphweave/core/Types.h"

#include <optional>

namespace graphweave {

/// Node currently held by the pointer
struct DragState {
    NodeId nodeId;
    Point pointer;

    bool operator==(const DragState& o) const = default;
};

/**
 * @brief Everything the simulator carries from one tick to the next
 *
 * Plain value type: PhysicsSimulator::tick() takes one and returns the next,
 * so the host can keep, copy or discard states freely.
 */
struct SimulationState {
    PositionMap positions;
    int iteration = 0;
    std::optional<DragState> drag;

    bool isDragging() const { return drag.has_value(); }
    bool isDragging(const NodeId& id) const { return drag && drag->nodeId == id; }

    const Position* find(const NodeId& id) const {
        auto it = positions.find(id);
        return it != positions.end() ? &it->second : nullptr;
    }

    bool operator==(const SimulationState& o) const = default;
};

}  // namespace graphweave
