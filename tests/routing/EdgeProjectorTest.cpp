#include <gtest/gtest.h>
#include <graphweave/grouping/MetaNodeGrouper.h>
#include <graphweave/routing/EdgeProjector.h>

using namespace graphweave;

namespace {

MetaNode makeMeta(const MetaNodeId& id, std::vector<NodeId> children, bool collapsed, int layer = 0) {
    MetaNode meta;
    meta.id = id;
    meta.childNodeIds = std::move(children);
    meta.collapsed = collapsed;
    meta.layer = layer;
    return meta;
}

const TransformedEdge* findEdge(const std::vector<TransformedEdge>& edges, const EdgeId& id) {
    for (const auto& edge : edges) {
        if (edge.edgeId == id) {
            return &edge;
        }
    }
    return nullptr;
}

}  // namespace

TEST(EdgeProjectorTest, PassesEdgesThroughWithoutGroups) {
    EdgeProjector projector;
    std::vector<Edge> edges = {{"e1", "a", "b", "knows"}, {"e2", "b", "c"}};

    auto projected = projector.project(edges, std::vector<const MetaNode*>{});

    ASSERT_EQ(projected.size(), 2u);
    EXPECT_EQ(projected[0].renderSource, "a");
    EXPECT_EQ(projected[0].renderTarget, "b");
    EXPECT_EQ(projected[0].label, std::optional<std::string>("knows"));
    EXPECT_FALSE(projected[0].sourceIsMetaNode);
    EXPECT_TRUE(projected[0].shouldRender);
    EXPECT_FALSE(projected[1].label.has_value());
}

TEST(EdgeProjectorTest, RedirectsIntoCollapsedGroup) {
    EdgeProjector projector;
    MetaNode group = makeMeta("meta-dept-x", {"a", "b"}, true);
    std::vector<Edge> edges = {{"e1", "a", "c"}, {"e2", "c", "b"}};

    auto projected = projector.project(edges, {&group});

    ASSERT_EQ(projected.size(), 2u);
    EXPECT_EQ(projected[0].renderSource, "meta-dept-x");
    EXPECT_TRUE(projected[0].sourceIsMetaNode);
    EXPECT_EQ(projected[0].originalSource, "a");
    EXPECT_EQ(projected[0].renderTarget, "c");
    EXPECT_EQ(projected[1].renderTarget, "meta-dept-x");
    EXPECT_TRUE(projected[1].targetIsMetaNode);
}

TEST(EdgeProjectorTest, ExpandedGroupDoesNotRedirect) {
    EdgeProjector projector;
    MetaNode group = makeMeta("meta-dept-x", {"a", "b"}, false);
    std::vector<Edge> edges = {{"e1", "a", "c"}};

    auto projected = projector.project(edges, {&group});

    ASSERT_EQ(projected.size(), 1u);
    EXPECT_EQ(projected[0].renderSource, "a");
}

TEST(EdgeProjectorTest, DropsEdgesInternalToCollapsedGroup) {
    EdgeProjector projector;
    MetaNode group = makeMeta("meta-dept-x", {"a", "b"}, true);
    std::vector<Edge> edges = {{"e1", "a", "b"}, {"e2", "a", "c"}};

    auto projected = projector.project(edges, {&group});

    ASSERT_EQ(projected.size(), 1u);
    EXPECT_EQ(projected[0].edgeId, "e2");
}

TEST(EdgeProjectorTest, DeduplicatesByDirectedPairFirstWins) {
    EdgeProjector projector;
    MetaNode group = makeMeta("meta-dept-x", {"a", "b"}, true);
    std::vector<Edge> edges = {
        {"e1", "a", "c"}, {"e2", "b", "c"}, {"e3", "c", "a"}
    };

    auto projected = projector.project(edges, {&group});

    ASSERT_EQ(projected.size(), 2u);
    EXPECT_EQ(projected[0].edgeId, "e1");
    // Reverse direction is a different pair
    EXPECT_EQ(projected[1].edgeId, "e3");
    EXPECT_EQ(findEdge(projected, "e2"), nullptr);
}

TEST(EdgeProjectorTest, RedirectsToHighestCollapsedLayer) {
    EdgeProjector projector;
    MetaNode inner = makeMeta("meta-dept-x", {"a", "b"}, true, 0);
    MetaNode outer = makeMeta("meta-L1-site-s", {"a", "b", "c", "d"}, true, 1);
    outer.childMetaNodeIds = {"meta-dept-x"};
    std::vector<Edge> edges = {{"e1", "a", "z"}};

    auto projected = projector.project(edges, {&inner, &outer});

    ASSERT_EQ(projected.size(), 1u);
    EXPECT_EQ(projected[0].renderSource, "meta-L1-site-s");
}

TEST(EdgeProjectorTest, FilterKeepsMatchesAsEndpoints) {
    EdgeProjector projector;
    MetaNode group = makeMeta("meta-dept-x", {"a", "b"}, true);
    std::vector<Edge> edges = {{"e1", "a", "c"}, {"e2", "b", "c"}};
    IdSet filter = {"a", "c"};

    auto projected = projector.project(edges, {&group}, &filter);

    const TransformedEdge* e1 = findEdge(projected, "e1");
    ASSERT_NE(e1, nullptr);
    EXPECT_EQ(e1->renderSource, "a");
    EXPECT_TRUE(e1->shouldRender);

    const TransformedEdge* e2 = findEdge(projected, "e2");
    ASSERT_NE(e2, nullptr);
    EXPECT_EQ(e2->renderSource, "meta-dept-x");
    EXPECT_FALSE(e2->shouldRender);
}

TEST(EdgeProjectorTest, FilterMarksEdgesLeavingTheFilter) {
    EdgeProjector projector;
    std::vector<Edge> edges = {{"e1", "a", "b"}, {"e2", "b", "c"}, {"e3", "c", "d"}};
    IdSet filter = {"a", "b"};

    auto projected = projector.project(edges, std::vector<const MetaNode*>{}, &filter);

    ASSERT_EQ(projected.size(), 3u);
    EXPECT_TRUE(projected[0].shouldRender);
    EXPECT_FALSE(projected[1].shouldRender);
    EXPECT_FALSE(projected[2].shouldRender);
}

TEST(EdgeProjectorTest, NeverProjectsOntoItself) {
    EdgeProjector projector;
    MetaNode g1 = makeMeta("meta-1", {"a", "b", "c"}, true);
    MetaNode g2 = makeMeta("meta-2", {"d", "e"}, true);
    std::vector<Edge> edges = {
        {"e1", "a", "b"}, {"e2", "b", "c"}, {"e3", "c", "d"}, {"e4", "d", "e"},
        {"e5", "e", "a"}, {"e6", "f", "f"}, {"e7", "f", "a"}
    };

    auto projected = projector.project(edges, {&g1, &g2});

    for (const auto& edge : projected) {
        EXPECT_NE(edge.renderSource, edge.renderTarget) << edge.edgeId;
    }
    EXPECT_EQ(projected.size(), 3u);  // e3, e5, e7
}

TEST(EdgeProjectorTest, HierarchyOverloadUsesVisibleMetaNodes) {
    std::vector<Node> nodes;
    for (const char* id : {"a", "b", "c"}) {
        Node node(id);
        node.set("dept", std::string(id) == "c" ? "y" : "x");
        nodes.push_back(node);
    }
    MetaNodeHierarchy hierarchy(MetaNodeGrouper().generate(nodes, GroupingConfig::singleLayer("dept", true)));
    std::vector<Edge> edges = {{"e1", "a", "c"}};

    auto projected = EdgeProjector().project(edges, hierarchy);

    ASSERT_EQ(projected.size(), 1u);
    EXPECT_EQ(projected[0].renderSource, "meta-dept-x");
    EXPECT_EQ(projected[0].renderTarget, "c");
}
