#include "graphweave/layout/MetaNodePositioner.h"
#include "graphweave/core/GeometryUtils.h"

#include <iterator>

namespace graphweave {

MetaNodePositioner::MetaNodePositioner(MetaNodeMotionOptions options)
    : options_(options) {}

std::optional<Point> MetaNodePositioner::targetOf(const MetaNode& meta, const PositionMap& nodePositions) {
    std::vector<Point> points;
    points.reserve(meta.childNodeIds.size());
    for (const auto& child : meta.childNodeIds) {
        auto it = nodePositions.find(child);
        if (it != nodePositions.end() && it->second.point().isFinite()) {
            points.push_back(it->second.point());
        }
    }
    return geometry::centroid(points);
}

void MetaNodePositioner::update(const MetaNodeHierarchy& hierarchy, const PositionMap& nodePositions) {
    PositionMap next;
    next.reserve(hierarchy.size());

    for (const auto& meta : hierarchy.metaNodes()) {
        auto current = positions_.find(meta.id);

        if (manual_.count(meta.id) && current != positions_.end()) {
            next.emplace(meta.id, current->second);
            continue;
        }

        auto target = targetOf(meta, nodePositions);
        if (!target) {
            if (current != positions_.end()) {
                next.emplace(meta.id, current->second);
            }
            continue;
        }

        if (current == positions_.end()) {
            next.emplace(meta.id, Position(*target));
            continue;
        }

        Position pos = current->second;
        Point delta = *target - pos.point();
        if (delta.length() < options_.snapDistance) {
            next.emplace(meta.id, Position(*target));
            continue;
        }

        Point velocity = (pos.velocity() + delta * options_.spring) * options_.damping;
        float speed = velocity.length();
        if (speed > options_.maxVelocity) {
            velocity = velocity * (options_.maxVelocity / speed);
        }
        if (!velocity.isFinite()) {
            velocity = {};
        }

        pos.moveBy(velocity);
        pos.vx = velocity.x;
        pos.vy = velocity.y;
        next.emplace(meta.id, pos);
    }

    positions_ = std::move(next);

    // manual flags of meta-nodes that no longer exist are dropped
    for (auto it = manual_.begin(); it != manual_.end();) {
        it = positions_.count(*it) ? std::next(it) : manual_.erase(it);
    }
}

void MetaNodePositioner::place(const MetaNodeId& id, const Point& point) {
    if (!point.isFinite()) {
        return;
    }
    positions_[id] = Position(point);
    manual_.insert(id);
}

void MetaNodePositioner::reset() {
    positions_.clear();
    manual_.clear();
}

const Position* MetaNodePositioner::find(const MetaNodeId& id) const {
    auto it = positions_.find(id);
    return it != positions_.end() ? &it->second : nullptr;
}

}  // namespace graphweave
