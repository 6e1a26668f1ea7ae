#pragma once

namespace graphweave {

/// Simulation phase, selected by the iteration counter
enum class SimulationPhase {
    Explosion,       ///< Weak leaf springs, leaves pass through each other
    LeafRetraction,  ///< Tighter leaf springs plus leaf -> parent pull
    NonOverlap,      ///< Collision enforcement for every node
    FinalSnap,       ///< Near-zero leaf spring length, strict collisions
    Settled          ///< Frozen; only drag input moves nodes
};

inline const char* phaseName(SimulationPhase phase) {
    switch (phase) {
        case SimulationPhase::Explosion: return "explosion";
        case SimulationPhase::LeafRetraction: return "leaf-retraction";
        case SimulationPhase::NonOverlap: return "non-overlap";
        case SimulationPhase::FinalSnap: return "final-snap";
        case SimulationPhase::Settled: return "settled";
    }
    return "unknown";
}

}  // namespace graphweave
