#include "graphweave/routing/EdgeProjector.h"
#include "graphweave/common/Logger.h"

#include <set>
#include <unordered_map>

namespace graphweave {

std::vector<TransformedEdge> EdgeProjector::project(const std::vector<Edge>& edges,
                                                    const std::vector<const MetaNode*>& visibleMetaNodes,
                                                    const IdSet* filter) const {
    // base node -> highest-layer collapsed visible meta-node holding it
    std::unordered_map<NodeId, const MetaNode*> redirects;
    for (const MetaNode* meta : visibleMetaNodes) {
        if (!meta || !meta->collapsed) {
            continue;
        }
        for (const auto& nodeId : meta->childNodeIds) {
            if (filter && filter->count(nodeId)) {
                continue;
            }
            auto& slot = redirects[nodeId];
            if (!slot || meta->layer > slot->layer) {
                slot = meta;
            }
        }
    }

    auto resolve = [&redirects](const NodeId& nodeId, std::string& renderId, bool& isMeta) {
        auto it = redirects.find(nodeId);
        if (it != redirects.end()) {
            renderId = it->second->id;
            isMeta = true;
        } else {
            renderId = nodeId;
            isMeta = false;
        }
    };

    std::vector<TransformedEdge> result;
    result.reserve(edges.size());
    std::set<std::pair<std::string, std::string>> seen;
    size_t internal = 0;

    for (const auto& edge : edges) {
        TransformedEdge projected;
        projected.edgeId = edge.id;
        projected.label = edge.label;
        projected.originalSource = edge.source;
        projected.originalTarget = edge.target;
        resolve(edge.source, projected.renderSource, projected.sourceIsMetaNode);
        resolve(edge.target, projected.renderTarget, projected.targetIsMetaNode);

        if (projected.renderSource == projected.renderTarget) {
            ++internal;
            continue;
        }

        if (filter) {
            projected.shouldRender = filter->count(edge.source) > 0 && filter->count(edge.target) > 0;
        }

        if (seen.emplace(projected.renderSource, projected.renderTarget).second) {
            result.push_back(std::move(projected));
        }
    }

    if (internal > 0) {
        LOG_TRACE("{} edge(s) internal to a collapsed group dropped", internal);
    }
    return result;
}

}  // namespace graphweave
