#pragma once

#include "graphweave/core/GraphModel.h"
#include "graphweave/layout/ISizeProvider.h"
#include "graphweave/layout/SimulationState.h"
#include "graphweave/layout/config/LayoutOptions.h"

#include <memory>

namespace graphweave {

/**
 * @brief Four-phase force simulation over a GraphModel
 *
 * tick() is a pure function of the previous state and the model: forces are
 * computed from the previous positions only, then displacements are applied
 * and overlaps resolved. The host loop owns the state and decides when to
 * call tick().
 *
 * Phases by iteration t (see SimulationOptions for the constants):
 * - [0, 250) explosion: weak leaf springs, leaves ignore collisions
 * - [250, 350) leaf retraction: tighter leaf springs plus leaf -> parent pull
 * - [350, 450) non-overlap: collisions enforced for every node
 * - [450, 500) final snap: near-zero leaf rest length
 *
 * From t = 500 on the layout is frozen. A tick then only moves a dragged
 * node, its direct neighbors, and whatever they push out of the way.
 *
 * Every node of the model is simulated, hidden ones included; visibility
 * only affects rendering. Nodes missing from the state are placed at the
 * canvas center with a small deterministic offset.
 */
class PhysicsSimulator {
public:
    explicit PhysicsSimulator(SimulationOptions options = SimulationOptions{},
                              Size canvas = Size{1200.0f, 800.0f},
                              std::shared_ptr<const ISizeProvider> sizes = nullptr);

    /// Advance one iteration
    SimulationState tick(const SimulationState& state, const GraphModel& model) const;

    /// Advance @p ticks iterations (stops early once settled and not dragging)
    SimulationState run(SimulationState state, const GraphModel& model, int ticks) const;

    /// Advance until the iteration counter reaches maxIterations
    SimulationState runToSettled(SimulationState state, const GraphModel& model) const;

    SimulationPhase phaseOf(const SimulationState& state) const { return options_.phaseAt(state.iteration); }
    bool isSettled(const SimulationState& state) const { return state.iteration >= options_.maxIterations; }

    /// Annealing cap on displacement: k_opt * (1 - t / maxIterations)^2,
    /// k_opt = sqrt(canvasArea / nodeCount)
    float temperature(int iteration, size_t nodeCount) const;

    /// Minimum center distance of two nodes, scaled by their size multipliers
    float collisionDistance(const NodeId& a, const NodeId& b) const;

    const SimulationOptions& options() const { return options_; }
    Size canvas() const { return canvas_; }

    void setCanvas(Size canvas) { canvas_ = canvas; }
    void setSizeProvider(std::shared_ptr<const ISizeProvider> sizes);

private:
    SimulationOptions options_;
    Size canvas_;
    std::shared_ptr<const ISizeProvider> sizes_;

    SimulationState forceTick(const SimulationState& state, const GraphModel& model) const;
    SimulationState dragTick(const SimulationState& state, const GraphModel& model) const;

    /// Positions of every model node in model order, missing ones placed fresh
    std::vector<Point> gatherPoints(const SimulationState& state, const GraphModel& model) const;
    std::vector<float> gatherMultipliers(const GraphModel& model) const;

    SimulationState commit(const SimulationState& state, const GraphModel& model,
                           const std::vector<Point>& before,
                           const std::vector<Point>& after) const;
};

}  // namespace graphweave
