#pragma once

#include "graphweave/core/Types.h"

#include <cstdint>
#include <string_view>

namespace graphweave::physics {

/// FNV-1a over the id bytes, mixed with @p seed
uint64_t hashId(std::string_view id, uint64_t seed = 0);

/// Deterministic factor in [lo, hi] for an unordered id pair
float pairFactor(const NodeId& a, const NodeId& b, float lo, float hi);

/// Same as above from precomputed hashId() values
float pairFactor(uint64_t hashA, uint64_t hashB, float lo, float hi);

/// Deterministic unit vector for an unordered id pair, used to separate
/// coincident points; points from @p b toward @p a
Point separationDirection(const NodeId& a, const NodeId& b);

/// Deterministic offset inside a disc of @p radius
Point placementJitter(const NodeId& id, uint32_t seed, float radius);

/// Hooke spring pulling @p from toward @p to (pushing when closer than idealLength)
Point springForce(const Point& from, const Point& to, float idealLength, float strength);

/// Force proportional to distance pulling @p from toward @p to
Point linearPull(const Point& from, const Point& to, float strength);

/// Coulomb-like push of @p from away from @p other, F = strength / distance
Point repulsionForce(const Point& from, const Point& other, float strength);

/// Scale @p v down so its length does not exceed @p maxLength
Point clampLength(const Point& v, float maxLength);

}  // namespace graphweave::physics
