#include <gtest/gtest.h>
#include <graphweave/grouping/MetaNodeGrouper.h>
#include <graphweave/grouping/MetaNodeHierarchy.h>

#include <algorithm>
#include <stdexcept>

using namespace graphweave;

namespace {

Node member(const std::string& id, const std::string& dept, const std::string& site) {
    Node node(id);
    node.set("dept", dept).set("site", site);
    return node;
}

class MetaNodeHierarchyTest : public ::testing::Test {
protected:
    void SetUp() override {
        nodes_ = {
            member("A", "eng", "berlin"), member("B", "eng", "berlin"),
            member("C", "ops", "berlin"), member("D", "ops", "berlin"),
            member("E", "hr", "paris"), Node("F"),
        };
        model_ = GraphModel(nodes_, {});

        GroupingConfig config;
        config.enable().addLayer("dept").addLayer("site");
        hierarchy_ = MetaNodeHierarchy(MetaNodeGrouper().generate(nodes_, config));
    }

    static bool containsId(const std::vector<NodeId>& ids, const NodeId& id) {
        return std::find(ids.begin(), ids.end(), id) != ids.end();
    }

    static bool containsMeta(const std::vector<const MetaNode*>& metas, const MetaNodeId& id) {
        return std::any_of(metas.begin(), metas.end(),
                           [&id](const MetaNode* m) { return m->id == id; });
    }

    std::vector<Node> nodes_;
    GraphModel model_;
    MetaNodeHierarchy hierarchy_;
};

}  // namespace

TEST_F(MetaNodeHierarchyTest, IndexesMetaNodes) {
    EXPECT_EQ(hierarchy_.size(), 3u);
    EXPECT_EQ(hierarchy_.layerCount(), 2);
    EXPECT_EQ(hierarchy_.layer(0).size(), 2u);
    EXPECT_EQ(hierarchy_.layer(1).size(), 1u);
    EXPECT_TRUE(hierarchy_.contains("meta-dept-eng"));
    EXPECT_EQ(hierarchy_.get("meta-L1-site-berlin").layer, 1);
}

TEST_F(MetaNodeHierarchyTest, UnknownIdThrowsOnGet) {
    EXPECT_THROW(hierarchy_.get("meta-dept-nope"), std::out_of_range);
    EXPECT_EQ(hierarchy_.find("meta-dept-nope"), nullptr);
}

TEST_F(MetaNodeHierarchyTest, ParentLinks) {
    EXPECT_EQ(hierarchy_.parentOf("meta-dept-eng"), std::optional<MetaNodeId>("meta-L1-site-berlin"));
    EXPECT_FALSE(hierarchy_.parentOf("meta-L1-site-berlin").has_value());
    EXPECT_EQ(hierarchy_.ancestorsOf("meta-dept-ops"),
              std::vector<MetaNodeId>{"meta-L1-site-berlin"});
}

TEST_F(MetaNodeHierarchyTest, GroupOfPerLayer) {
    EXPECT_EQ(hierarchy_.groupOf("C", 0), std::optional<MetaNodeId>("meta-dept-ops"));
    EXPECT_EQ(hierarchy_.groupOf("C", 1), std::optional<MetaNodeId>("meta-L1-site-berlin"));
    EXPECT_FALSE(hierarchy_.groupOf("E", 0).has_value());
    EXPECT_FALSE(hierarchy_.groupOf("A", 5).has_value());
}

TEST_F(MetaNodeHierarchyTest, CollapseToggle) {
    EXPECT_FALSE(hierarchy_.isCollapsed("meta-dept-eng"));
    EXPECT_TRUE(hierarchy_.toggleCollapsed("meta-dept-eng"));
    EXPECT_TRUE(hierarchy_.isCollapsed("meta-dept-eng"));
    EXPECT_TRUE(hierarchy_.setCollapsed("meta-dept-eng", false));
    EXPECT_FALSE(hierarchy_.isCollapsed("meta-dept-eng"));

    EXPECT_FALSE(hierarchy_.setCollapsed("unknown", true));
    EXPECT_FALSE(hierarchy_.toggleCollapsed("unknown"));
}

TEST_F(MetaNodeHierarchyTest, EverythingVisibleWhenExpanded) {
    EXPECT_EQ(hierarchy_.visibleNodeIds(model_).size(), 6u);
    EXPECT_EQ(hierarchy_.visibleMetaNodes().size(), 3u);
}

TEST_F(MetaNodeHierarchyTest, CollapsedGroupHidesMembers) {
    hierarchy_.setCollapsed("meta-dept-eng", true);

    auto visible = hierarchy_.visibleNodeIds(model_);
    EXPECT_FALSE(containsId(visible, "A"));
    EXPECT_FALSE(containsId(visible, "B"));
    EXPECT_TRUE(containsId(visible, "C"));
    EXPECT_TRUE(containsId(visible, "F"));
    EXPECT_EQ(hierarchy_.outermostCollapsedGroup("A"), std::optional<MetaNodeId>("meta-dept-eng"));
}

TEST_F(MetaNodeHierarchyTest, CollapsedAncestorHidesNestedGroups) {
    hierarchy_.setCollapsed("meta-L1-site-berlin", true);

    auto metas = hierarchy_.visibleMetaNodes();
    EXPECT_TRUE(containsMeta(metas, "meta-L1-site-berlin"));
    EXPECT_FALSE(containsMeta(metas, "meta-dept-eng"));
    EXPECT_FALSE(containsMeta(metas, "meta-dept-ops"));

    auto visible = hierarchy_.visibleNodeIds(model_);
    EXPECT_EQ(visible.size(), 2u);  // E and F
}

TEST_F(MetaNodeHierarchyTest, OutermostCollapsedGroupPrefersHighestLayer) {
    hierarchy_.setAllCollapsed(true);

    EXPECT_EQ(hierarchy_.outermostCollapsedGroup("A"),
              std::optional<MetaNodeId>("meta-L1-site-berlin"));
    EXPECT_FALSE(hierarchy_.outermostCollapsedGroup("E").has_value());
}

TEST_F(MetaNodeHierarchyTest, FilterKeepsMatchesVisibleInsideCollapsedGroup) {
    hierarchy_.setAllCollapsed(true);
    IdSet filter = {"A", "F"};

    auto visible = hierarchy_.visibleNodeIds(model_, &filter);
    ASSERT_EQ(visible.size(), 2u);
    EXPECT_TRUE(containsId(visible, "A"));
    EXPECT_TRUE(containsId(visible, "F"));
    EXPECT_TRUE(hierarchy_.isNodeHidden("B", &filter));
}

TEST_F(MetaNodeHierarchyTest, FilterHidesGroupsWithoutMatches) {
    IdSet filter = {"C"};

    auto metas = hierarchy_.visibleMetaNodes(&filter);
    EXPECT_FALSE(containsMeta(metas, "meta-dept-eng"));
    EXPECT_TRUE(containsMeta(metas, "meta-dept-ops"));
    EXPECT_TRUE(containsMeta(metas, "meta-L1-site-berlin"));
}

TEST_F(MetaNodeHierarchyTest, EmptyHierarchy) {
    MetaNodeHierarchy empty;

    EXPECT_TRUE(empty.empty());
    EXPECT_EQ(empty.layerCount(), 0);
    EXPECT_FALSE(empty.outermostCollapsedGroup("A").has_value());
    EXPECT_EQ(empty.visibleNodeIds(model_).size(), 6u);
    EXPECT_TRUE(empty.isMetaNodeHidden("anything"));
}
