#include "layout/physics/ForceTerms.h"
#include "graphweave/core/GeometryUtils.h"

#include <algorithm>
#include <cmath>

namespace graphweave::physics {

namespace {
    constexpr uint64_t FNV_OFFSET = 14695981039346656037ULL;
    constexpr uint64_t FNV_PRIME = 1099511628211ULL;

    uint64_t mix(uint64_t hashA, uint64_t hashB) {
        uint64_t lo = std::min(hashA, hashB);
        uint64_t hi = std::max(hashA, hashB);
        uint64_t h = lo ^ (hi + 0x9e3779b97f4a7c15ULL + (lo << 6) + (lo >> 2));
        h ^= h >> 33;
        h *= 0xff51afd7ed558ccdULL;
        h ^= h >> 33;
        return h;
    }

    uint64_t pairHash(const NodeId& a, const NodeId& b) {
        return mix(hashId(a), hashId(b));
    }

    float unitFraction(uint64_t h) {
        return static_cast<float>(h % 10007ULL) / 10006.0f;
    }
}

uint64_t hashId(std::string_view id, uint64_t seed) {
    uint64_t h = FNV_OFFSET ^ (seed * FNV_PRIME);
    for (char c : id) {
        h ^= static_cast<unsigned char>(c);
        h *= FNV_PRIME;
    }
    return h;
}

float pairFactor(const NodeId& a, const NodeId& b, float lo, float hi) {
    return pairFactor(hashId(a), hashId(b), lo, hi);
}

float pairFactor(uint64_t hashA, uint64_t hashB, float lo, float hi) {
    return lo + (hi - lo) * unitFraction(mix(hashA, hashB));
}

Point separationDirection(const NodeId& a, const NodeId& b) {
    float angle = unitFraction(pairHash(a, b) >> 16) * 2.0f * constants::PI;
    Point dir = geometry::unitVector(angle);
    // keep the result antisymmetric in (a, b)
    return a < b ? dir : dir * -1.0f;
}

Point placementJitter(const NodeId& id, uint32_t seed, float radius) {
    uint64_t h = hashId(id, seed);
    float angle = unitFraction(h) * 2.0f * constants::PI;
    float r = radius * std::sqrt(unitFraction(h >> 20));
    return geometry::unitVector(angle) * r;
}

Point springForce(const Point& from, const Point& to, float idealLength, float strength) {
    Point delta = to - from;
    float dist = delta.length();
    if (dist < constants::MIN_DISTANCE) {
        return {};
    }
    return delta / dist * (strength * (dist - idealLength));
}

Point linearPull(const Point& from, const Point& to, float strength) {
    return (to - from) * strength;
}

Point repulsionForce(const Point& from, const Point& other, float strength) {
    Point delta = from - other;
    float dist = delta.length();
    if (dist < constants::MIN_DISTANCE) {
        return {};
    }
    // unit direction times strength / dist
    return delta * (strength / (dist * dist));
}

Point clampLength(const Point& v, float maxLength) {
    float len = v.length();
    if (len <= maxLength || len <= 0.0f) {
        return v;
    }
    return v * (maxLength / len);
}

}  // namespace graphweave::physics
