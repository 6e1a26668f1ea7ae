#include "graphweave/grouping/GroupingConfig.h"

#include <algorithm>

namespace graphweave {

std::vector<CombinationLayer> GroupingConfig::effectiveLayers() const {
    if (layers.empty()) {
        if (groupByAttribute.empty()) {
            return {};
        }
        CombinationLayer legacy(groupByAttribute, autoCollapse, 0);
        legacy.id = "legacy";
        return {legacy};
    }

    std::vector<CombinationLayer> ordered = layers;
    std::stable_sort(ordered.begin(), ordered.end(),
        [](const CombinationLayer& a, const CombinationLayer& b) { return a.order < b.order; });
    return ordered;
}

bool GroupingConfig::operator==(const GroupingConfig& o) const {
    if (enabled != o.enabled || groupByAttribute != o.groupByAttribute ||
        autoCollapse != o.autoCollapse || layers.size() != o.layers.size()) {
        return false;
    }
    for (size_t i = 0; i < layers.size(); ++i) {
        const auto& a = layers[i];
        const auto& b = o.layers[i];
        if (a.id != b.id || a.attribute != b.attribute ||
            a.autoCollapse != b.autoCollapse || a.order != b.order) {
            return false;
        }
    }
    return true;
}

}  // namespace graphweave
