#pragma once

#include <string>
#include <vector>

namespace graphweave {

/// One grouping tier: combine by @ref attribute, optionally collapsed at creation
struct CombinationLayer {
    std::string id;
    std::string attribute;
    bool autoCollapse = false;
    int order = 0;                 ///< Layers are applied in ascending order

    CombinationLayer() = default;
    CombinationLayer(std::string attr, bool collapse, int ord)
        : id("layer-" + std::to_string(ord)), attribute(std::move(attr)),
          autoCollapse(collapse), order(ord) {}
};

/// Grouping configuration supplied by the UI
///
/// When @ref layers is empty the legacy single-layer fields
/// (@ref groupByAttribute, @ref autoCollapse) describe one layer-0 grouping.
struct GroupingConfig {
    bool enabled = false;
    std::string groupByAttribute;  ///< Legacy single-layer attribute
    bool autoCollapse = false;     ///< Legacy single-layer collapse flag
    std::vector<CombinationLayer> layers;

    /// Layers in application order; synthesizes the legacy layer when needed
    std::vector<CombinationLayer> effectiveLayers() const;

    // Builders
    GroupingConfig& enable(bool on = true) { enabled = on; return *this; }
    GroupingConfig& addLayer(const std::string& attribute, bool collapse = false) {
        layers.emplace_back(attribute, collapse, static_cast<int>(layers.size()));
        return *this;
    }

    static GroupingConfig singleLayer(const std::string& attribute, bool collapse = false) {
        GroupingConfig config;
        config.enabled = true;
        config.groupByAttribute = attribute;
        config.autoCollapse = collapse;
        return config;
    }

    bool operator==(const GroupingConfig& o) const;
};

}  // namespace graphweave
