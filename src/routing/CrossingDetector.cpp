#include "graphweave/routing/CrossingDetector.h"
#include "graphweave/common/Logger.h"
#include "graphweave/core/GeometryUtils.h"

#include <algorithm>

namespace graphweave {

namespace {
    struct Segment {
        const TransformedEdge* edge;
        Point start;
        Point end;
    };

    bool sharesEndpoint(const TransformedEdge& a, const TransformedEdge& b) {
        return a.renderSource == b.renderSource || a.renderSource == b.renderTarget ||
               a.renderTarget == b.renderSource || a.renderTarget == b.renderTarget;
    }
}

CrossingDetector::CrossingDetector(RoutingOptions options)
    : options_(options) {}

std::vector<Crossing> CrossingDetector::detect(const std::vector<TransformedEdge>& edges,
                                               const PointMap& positions) const {
    std::vector<Segment> segments;
    segments.reserve(edges.size());

    for (const auto& edge : edges) {
        if (!edge.shouldRender) {
            continue;
        }
        auto source = positions.find(edge.renderSource);
        auto target = positions.find(edge.renderTarget);
        if (source == positions.end() || target == positions.end()) {
            continue;
        }
        if (source->second.distanceTo(target->second) < constants::MIN_DISTANCE) {
            continue;
        }
        segments.push_back({&edge, source->second, target->second});
    }

    std::vector<Crossing> crossings;
    for (size_t i = 0; i < segments.size(); ++i) {
        for (size_t j = i + 1; j < segments.size(); ++j) {
            const Segment& a = segments[i];
            const Segment& b = segments[j];
            if (sharesEndpoint(*a.edge, *b.edge)) {
                continue;
            }

            auto hit = geometry::segmentIntersection(a.start, a.end, b.start, b.end,
                                                     options_.parallelEpsilon);
            if (!hit) {
                continue;
            }

            bool aHops = a.edge->edgeId < b.edge->edgeId;
            crossings.push_back({aHops ? a.edge->edgeId : b.edge->edgeId,
                                 aHops ? b.edge->edgeId : a.edge->edgeId,
                                 *hit});
        }
    }
    return crossings;
}

HopMap CrossingDetector::computeHops(const std::vector<TransformedEdge>& edges,
                                     const PointMap& positions) const {
    HopMap hops;
    auto crossings = detect(edges, positions);
    if (crossings.empty()) {
        return hops;
    }

    // Only edges detect() could have drawn; a reused id must not resolve to an unplaced edge
    std::unordered_map<EdgeId, const TransformedEdge*> byId;
    for (const auto& edge : edges) {
        if (edge.shouldRender && positions.count(edge.renderSource) && positions.count(edge.renderTarget)) {
            byId.emplace(edge.edgeId, &edge);
        }
    }

    const float r = options_.hopRadius;
    for (const auto& crossing : crossings) {
        const TransformedEdge* edge = byId.at(crossing.hoppingEdgeId);
        Point start = positions.at(edge->renderSource);
        Point end = positions.at(edge->renderTarget);
        Point dir = (end - start).normalized();
        Point normal = dir.perpendicular();

        HopWaypoint hop;
        hop.crossing = crossing.point;
        hop.crossedEdgeId = crossing.crossedEdgeId;
        hop.distanceAlong = geometry::projectionAlong(crossing.point, start, dir);
        hop.before = crossing.point - dir * r;
        hop.peak = crossing.point + normal * r;
        hop.after = crossing.point + dir * r;
        hops[crossing.hoppingEdgeId].push_back(hop);
    }

    for (auto& [edgeId, list] : hops) {
        std::sort(list.begin(), list.end(), [](const HopWaypoint& a, const HopWaypoint& b) {
            return a.distanceAlong < b.distanceAlong;
        });
    }

    LOG_TRACE("{} crossing(s) over {} edge(s)", crossings.size(), hops.size());
    return hops;
}

}  // namespace graphweave
