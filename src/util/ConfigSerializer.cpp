#include "graphweave/util/ConfigSerializer.h"
#include "graphweave/common/Logger.h"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace graphweave {

using json = nlohmann::json;

namespace {
    void readFloat(const json& j, const char* key, float& out) {
        if (j.contains(key) && j[key].is_number()) {
            out = j[key].get<float>();
        }
    }

    void readInt(const json& j, const char* key, int& out) {
        if (j.contains(key) && j[key].is_number_integer()) {
            out = j[key].get<int>();
        }
    }

    void readBool(const json& j, const char* key, bool& out) {
        if (j.contains(key) && j[key].is_boolean()) {
            out = j[key].get<bool>();
        }
    }

    void readString(const json& j, const char* key, std::string& out) {
        if (j.contains(key) && j[key].is_string()) {
            out = j[key].get<std::string>();
        }
    }

    void readSeed(const json& j, const char* key, uint32_t& out) {
        if (j.contains(key) && j[key].is_number_unsigned()) {
            out = j[key].get<uint32_t>();
        }
    }

    const json* objectAt(const json& j, const char* key) {
        if (j.contains(key) && j[key].is_object()) {
            return &j[key];
        }
        return nullptr;
    }

    json phaseToJson(const PhaseForces& forces) {
        json j;
        j["leafIdealLength"] = forces.leafIdealLength;
        j["leafSpring"] = forces.leafSpring;
        j["leafParentAttraction"] = forces.leafParentAttraction;
        j["leafCollisions"] = forces.leafCollisions;
        return j;
    }

    void readPhase(const json& j, const char* key, PhaseForces& forces) {
        const json* pj = objectAt(j, key);
        if (!pj) {
            return;
        }
        readFloat(*pj, "leafIdealLength", forces.leafIdealLength);
        readFloat(*pj, "leafSpring", forces.leafSpring);
        readFloat(*pj, "leafParentAttraction", forces.leafParentAttraction);
        readBool(*pj, "leafCollisions", forces.leafCollisions);
    }

    json simulationToJson(const SimulationOptions& o) {
        json j;
        j["maxIterations"] = o.maxIterations;
        j["leafRetractionStart"] = o.leafRetractionStart;
        j["nonOverlapStart"] = o.nonOverlapStart;
        j["finalSnapStart"] = o.finalSnapStart;
        j["explosion"] = phaseToJson(o.explosion);
        j["leafRetraction"] = phaseToJson(o.leafRetraction);
        j["nonOverlap"] = phaseToJson(o.nonOverlap);
        j["finalSnap"] = phaseToJson(o.finalSnap);
        j["structuralIdealLength"] = o.structuralIdealLength;
        j["structuralSpring"] = o.structuralSpring;
        j["repulsionStrength"] = o.repulsionStrength;
        j["repulsionJitterMin"] = o.repulsionJitterMin;
        j["repulsionJitterMax"] = o.repulsionJitterMax;
        j["leafRepulsionFactor"] = o.leafRepulsionFactor;
        j["hubGravity"] = o.hubGravity;
        j["damping"] = o.damping;
        j["nodeRadius"] = o.nodeRadius;
        j["collisionFactor"] = o.collisionFactor;
        j["collisionPasses"] = o.collisionPasses;
        j["dragIdealLength"] = o.dragIdealLength;
        j["dragSpring"] = o.dragSpring;
        j["dragDamping"] = o.dragDamping;
        j["dragOverlapPasses"] = o.dragOverlapPasses;
        j["reheatIteration"] = o.reheatIteration;
        j["seed"] = o.seed;
        return j;
    }

    void readSimulation(const json& j, SimulationOptions& o) {
        readInt(j, "maxIterations", o.maxIterations);
        readInt(j, "leafRetractionStart", o.leafRetractionStart);
        readInt(j, "nonOverlapStart", o.nonOverlapStart);
        readInt(j, "finalSnapStart", o.finalSnapStart);
        readPhase(j, "explosion", o.explosion);
        readPhase(j, "leafRetraction", o.leafRetraction);
        readPhase(j, "nonOverlap", o.nonOverlap);
        readPhase(j, "finalSnap", o.finalSnap);
        readFloat(j, "structuralIdealLength", o.structuralIdealLength);
        readFloat(j, "structuralSpring", o.structuralSpring);
        readFloat(j, "repulsionStrength", o.repulsionStrength);
        readFloat(j, "repulsionJitterMin", o.repulsionJitterMin);
        readFloat(j, "repulsionJitterMax", o.repulsionJitterMax);
        readFloat(j, "leafRepulsionFactor", o.leafRepulsionFactor);
        readFloat(j, "hubGravity", o.hubGravity);
        readFloat(j, "damping", o.damping);
        readFloat(j, "nodeRadius", o.nodeRadius);
        readFloat(j, "collisionFactor", o.collisionFactor);
        readInt(j, "collisionPasses", o.collisionPasses);
        readFloat(j, "dragIdealLength", o.dragIdealLength);
        readFloat(j, "dragSpring", o.dragSpring);
        readFloat(j, "dragDamping", o.dragDamping);
        readInt(j, "dragOverlapPasses", o.dragOverlapPasses);
        readInt(j, "reheatIteration", o.reheatIteration);
        readSeed(j, "seed", o.seed);
    }

    json islandsToJson(const IslandOptions& o) {
        json j;
        j["iterations"] = o.iterations;
        j["islandSpacing"] = o.islandSpacing;
        j["idealEdgeLength"] = o.idealEdgeLength;
        j["intraClusterAttraction"] = o.intraClusterAttraction;
        j["intraClusterRepulsion"] = o.intraClusterRepulsion;
        j["leafRadialForce"] = o.leafRadialForce;
        j["interClusterRepulsion"] = o.interClusterRepulsion;
        j["minClusterDistance"] = o.minClusterDistance;
        j["centerJitter"] = o.centerJitter;
        j["maxStep"] = o.maxStep;
        j["seed"] = o.seed;
        return j;
    }

    void readIslands(const json& j, IslandOptions& o) {
        readInt(j, "iterations", o.iterations);
        readFloat(j, "islandSpacing", o.islandSpacing);
        readFloat(j, "idealEdgeLength", o.idealEdgeLength);
        readFloat(j, "intraClusterAttraction", o.intraClusterAttraction);
        readFloat(j, "intraClusterRepulsion", o.intraClusterRepulsion);
        readFloat(j, "leafRadialForce", o.leafRadialForce);
        readFloat(j, "interClusterRepulsion", o.interClusterRepulsion);
        readFloat(j, "minClusterDistance", o.minClusterDistance);
        readFloat(j, "centerJitter", o.centerJitter);
        readFloat(j, "maxStep", o.maxStep);
        readSeed(j, "seed", o.seed);
    }

    EngineOptions parseEngineOptions(const std::string& jsonStr) {
        json j = json::parse(jsonStr);
        if (!j.is_object()) {
            throw std::runtime_error("engine options: top-level value is not an object");
        }

        EngineOptions options;
        if (const json* cj = objectAt(j, "canvas")) {
            readFloat(*cj, "width", options.canvas.width);
            readFloat(*cj, "height", options.canvas.height);
        }
        if (const json* sj = objectAt(j, "simulation")) {
            readSimulation(*sj, options.simulation);
        }
        if (const json* ij = objectAt(j, "islands")) {
            readIslands(*ij, options.islands);
        }
        if (const json* rj = objectAt(j, "routing")) {
            readFloat(*rj, "hopRadius", options.routing.hopRadius);
            readFloat(*rj, "parallelEpsilon", options.routing.parallelEpsilon);
            readBool(*rj, "crossingsOnlyWhenSettled", options.routing.crossingsOnlyWhenSettled);
        }
        if (const json* mj = objectAt(j, "metaNodeMotion")) {
            readFloat(*mj, "spring", options.metaNodeMotion.spring);
            readFloat(*mj, "damping", options.metaNodeMotion.damping);
            readFloat(*mj, "maxVelocity", options.metaNodeMotion.maxVelocity);
            readFloat(*mj, "snapDistance", options.metaNodeMotion.snapDistance);
        }
        return options;
    }

    GroupingConfig parseGroupingConfig(const std::string& jsonStr) {
        json j = json::parse(jsonStr);
        if (!j.is_object()) {
            throw std::runtime_error("grouping config: top-level value is not an object");
        }

        GroupingConfig config;
        readBool(j, "enabled", config.enabled);
        readString(j, "groupByAttribute", config.groupByAttribute);
        readBool(j, "autoCollapse", config.autoCollapse);

        if (j.contains("layers") && j["layers"].is_array()) {
            for (const auto& lj : j["layers"]) {
                if (!lj.is_object()) {
                    continue;
                }
                CombinationLayer layer;
                layer.order = static_cast<int>(config.layers.size());
                readInt(lj, "order", layer.order);
                readString(lj, "attribute", layer.attribute);
                readBool(lj, "autoCollapse", layer.autoCollapse);
                layer.id = "layer-" + std::to_string(layer.order);
                readString(lj, "id", layer.id);
                config.layers.push_back(std::move(layer));
            }
        }
        return config;
    }
}

// =============================================================================
// EngineOptions
// =============================================================================

std::string ConfigSerializer::toJson(const EngineOptions& options) {
    json j;
    j["canvas"] = {{"width", options.canvas.width}, {"height", options.canvas.height}};
    j["simulation"] = simulationToJson(options.simulation);
    j["islands"] = islandsToJson(options.islands);
    j["routing"] = {
        {"hopRadius", options.routing.hopRadius},
        {"parallelEpsilon", options.routing.parallelEpsilon},
        {"crossingsOnlyWhenSettled", options.routing.crossingsOnlyWhenSettled}
    };
    j["metaNodeMotion"] = {
        {"spring", options.metaNodeMotion.spring},
        {"damping", options.metaNodeMotion.damping},
        {"maxVelocity", options.metaNodeMotion.maxVelocity},
        {"snapDistance", options.metaNodeMotion.snapDistance}
    };
    return j.dump(2);
}

EngineOptions ConfigSerializer::engineOptionsFromJson(const std::string& jsonStr) {
    try {
        return parseEngineOptions(jsonStr);
    } catch (const json::exception& e) {
        LOG_WARN("invalid engine options, using defaults: {}", e.what());
    } catch (const std::runtime_error& e) {
        LOG_WARN("invalid engine options, using defaults: {}", e.what());
    }
    return {};
}

EngineOptions ConfigSerializer::engineOptionsFromJsonStrict(const std::string& jsonStr) {
    try {
        return parseEngineOptions(jsonStr);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("engine options: ") + e.what());
    }
}

// =============================================================================
// GroupingConfig
// =============================================================================

std::string ConfigSerializer::toJson(const GroupingConfig& config) {
    json j;
    j["enabled"] = config.enabled;
    j["groupByAttribute"] = config.groupByAttribute;
    j["autoCollapse"] = config.autoCollapse;
    j["layers"] = json::array();

    for (const auto& layer : config.layers) {
        json lj;
        lj["id"] = layer.id;
        lj["attribute"] = layer.attribute;
        lj["autoCollapse"] = layer.autoCollapse;
        lj["order"] = layer.order;
        j["layers"].push_back(lj);
    }
    return j.dump(2);
}

GroupingConfig ConfigSerializer::groupingConfigFromJson(const std::string& jsonStr) {
    try {
        return parseGroupingConfig(jsonStr);
    } catch (const json::exception& e) {
        LOG_WARN("invalid grouping config, grouping disabled: {}", e.what());
    } catch (const std::runtime_error& e) {
        LOG_WARN("invalid grouping config, grouping disabled: {}", e.what());
    }
    return {};
}

GroupingConfig ConfigSerializer::groupingConfigFromJsonStrict(const std::string& jsonStr) {
    try {
        return parseGroupingConfig(jsonStr);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("grouping config: ") + e.what());
    }
}

}  // namespace graphweave
