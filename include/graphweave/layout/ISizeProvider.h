#pragma once

#include "graphweave/core/Types.h"

#include <unordered_map>
#include <utility>

namespace graphweave {

/// Per-node size hint supplied by the styling layer.
/// The engine only uses it to scale collision radii.
class ISizeProvider {
public:
    virtual ~ISizeProvider() = default;

    /// Relative node size, 1.0 for the default template
    virtual float sizeMultiplierOf(const NodeId& id) const = 0;
};

/// Every node has the default size
class UniformSizeProvider : public ISizeProvider {
public:
    float sizeMultiplierOf(const NodeId&) const override { return 1.0f; }
};

/// Fixed multipliers per node id; unknown ids fall back to 1.0
class MapSizeProvider : public ISizeProvider {
public:
    MapSizeProvider() = default;
    explicit MapSizeProvider(std::unordered_map<NodeId, float> multipliers)
        : multipliers_(std::move(multipliers)) {}

    void set(const NodeId& id, float multiplier) { multipliers_[id] = multiplier; }

    float sizeMultiplierOf(const NodeId& id) const override {
        auto it = multipliers_.find(id);
        if (it == multipliers_.end() || !(it->second > 0.0f)) {
            return 1.0f;
        }
        return it->second;
    }

private:
    std::unordered_map<NodeId, float> multipliers_;
};

}  // namespace graphweave
