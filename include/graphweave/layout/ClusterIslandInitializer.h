#pragma once

#include "graphweave/core/GraphModel.h"
#include "graphweave/layout/config/LayoutOptions.h"

#include <vector>

namespace graphweave {

/**
 * @brief Initial placement that keeps each connected component on its own island
 *
 * Components are laid out on a grid of islands (ceil(sqrt(C)) columns), each
 * component on a circle inside its island. A short two-tier relaxation then
 * spreads nodes inside their component and keeps components apart with a
 * much stronger cluster-level repulsion and a minimum cluster distance.
 *
 * When @p previous holds a position for at least one node of the model, the
 * relaxation is skipped: known nodes keep their position and unseen ones are
 * dropped near the canvas center with a small random offset, for the main
 * simulator to absorb.
 *
 * Results are deterministic for a given seed.
 */
class ClusterIslandInitializer {
public:
    explicit ClusterIslandInitializer(IslandOptions options = IslandOptions{});

    PositionMap initialize(const GraphModel& model, Size canvas,
                           const PositionMap* previous = nullptr) const;

    PositionMap initialize(const std::vector<Node>& nodes, const std::vector<Edge>& edges,
                           Size canvas) const;

    /// Connected components as node indices, ordered by first node index
    static std::vector<std::vector<size_t>> connectedComponents(const GraphModel& model);

    const IslandOptions& options() const { return options_; }

private:
    IslandOptions options_;

    std::vector<Point> placeIslands(const GraphModel& model,
                                    const std::vector<std::vector<size_t>>& components,
                                    Size canvas) const;

    void relax(const GraphModel& model,
               const std::vector<std::vector<size_t>>& components,
               std::vector<Point>& points) const;
};

}  // namespace graphweave
