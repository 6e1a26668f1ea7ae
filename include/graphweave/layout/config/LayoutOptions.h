#pragma once

#include "LayoutEnums.h"

#include <cstdint>

namespace graphweave {

/// Leaf-related force parameters of one simulation phase
struct PhaseForces {
    float leafIdealLength = 60.0f;     ///< Rest length of edges touching a leaf
    float leafSpring = 0.5f;           ///< Spring constant of those edges
    float leafParentAttraction = 0.0f; ///< Direct leaf -> parent pull, scaled by distance
    bool leafCollisions = false;       ///< Leaves take part in collision enforcement

    bool operator==(const PhaseForces& o) const = default;
};

/// Constants of the four-phase force simulation
/// Lengths are in pixels, iteration bounds are half-open [start, next start)
struct SimulationOptions {
    int maxIterations = 500;
    int leafRetractionStart = 250;
    int nonOverlapStart = 350;
    int finalSnapStart = 450;

    PhaseForces explosion{60.0f, 0.5f, 0.0f, false};
    PhaseForces leafRetraction{40.0f, 2.0f, 1.5f, false};
    PhaseForces nonOverlap{20.0f, 8.0f, 5.0f, true};
    PhaseForces finalSnap{5.0f, 20.0f, 10.0f, true};

    // Edges between two non-leaf nodes
    float structuralIdealLength = 120.0f;
    float structuralSpring = 0.2f;

    // Coulomb-like repulsion, F = strength / distance
    float repulsionStrength = 8000.0f;
    float repulsionJitterMin = 0.5f;   ///< Per-pair hash factor lower bound
    float repulsionJitterMax = 1.5f;   ///< Per-pair hash factor upper bound
    float leafRepulsionFactor = 0.02f;

    float hubGravity = 0.05f;
    float damping = 0.6f;

    // Collision radius = nodeRadius * sizeMultiplier; a pair collides below
    // collisionFactor * (radiusA + radiusB) / 2
    float nodeRadius = 60.0f;
    float collisionFactor = 4.0f;
    int collisionPasses = 20;

    // Drag relaxation once settled
    float dragIdealLength = 150.0f;
    float dragSpring = 0.12f;
    float dragDamping = 0.4f;
    int dragOverlapPasses = 5;

    /// Iteration a settled layout is rewound to when new nodes arrive
    int reheatIteration = 350;

    /// Seed for jitter of nodes without a position
    uint32_t seed = 42;

    SimulationPhase phaseAt(int iteration) const {
        if (iteration >= maxIterations) return SimulationPhase::Settled;
        if (iteration >= finalSnapStart) return SimulationPhase::FinalSnap;
        if (iteration >= nonOverlapStart) return SimulationPhase::NonOverlap;
        if (iteration >= leafRetractionStart) return SimulationPhase::LeafRetraction;
        return SimulationPhase::Explosion;
    }

    /// Leaf forces of @p phase (Settled reuses the final snap values)
    const PhaseForces& forcesFor(SimulationPhase phase) const {
        switch (phase) {
            case SimulationPhase::Explosion: return explosion;
            case SimulationPhase::LeafRetraction: return leafRetraction;
            case SimulationPhase::NonOverlap: return nonOverlap;
            case SimulationPhase::FinalSnap:
            case SimulationPhase::Settled: return finalSnap;
        }
        return finalSnap;
    }

    /// Minimum center distance of two nodes with the given size multipliers
    float collisionDistance(float multiplierA, float multiplierB) const {
        return collisionFactor * nodeRadius * (multiplierA + multiplierB) * 0.5f;
    }

    bool operator==(const SimulationOptions& o) const = default;
};

/// Parameters of the connected-component island initializer
struct IslandOptions {
    int iterations = 300;
    float islandSpacing = 100.0f;
    float idealEdgeLength = 80.0f;
    float intraClusterAttraction = 0.05f;
    float intraClusterRepulsion = 2000.0f;
    float leafRadialForce = 0.3f;
    float interClusterRepulsion = 200000.0f;  ///< Between cluster centroids, F = strength / distance^2
    float minClusterDistance = 400.0f;
    float centerJitter = 20.0f;  ///< Max offset of fresh placements
    float maxStep = 30.0f;       ///< Displacement cap of the first iteration
    uint32_t seed = 42;

    bool operator==(const IslandOptions& o) const = default;
};

/// Damped spring moving meta-nodes toward the centroid of their members
struct MetaNodeMotionOptions {
    float spring = 0.15f;
    float damping = 0.7f;
    float maxVelocity = 20.0f;
    float snapDistance = 0.5f;

    bool operator==(const MetaNodeMotionOptions& o) const = default;
};

}  // namespace graphweave
