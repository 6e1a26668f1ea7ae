#include <gtest/gtest.h>
#include <graphweave/layout/ClusterIslandInitializer.h>

#include <algorithm>
#include <cmath>
#include <limits>

using namespace graphweave;

namespace {

const Size CANVAS{1200.0f, 800.0f};

// Triangle, three-node chain and an isolated node
GraphModel makeThreeIslands() {
    std::vector<Node> nodes = {
        Node("a"), Node("b"), Node("c"), Node("x"), Node("y"), Node("z"), Node("lone")
    };
    std::vector<Edge> edges = {
        {"e1", "a", "b"}, {"e2", "b", "c"}, {"e3", "c", "a"}, {"e4", "x", "y"}, {"e5", "y", "z"}
    };
    return GraphModel(nodes, edges);
}

Point centroidOf(const PositionMap& positions, const std::vector<NodeId>& ids) {
    Point sum;
    for (const auto& id : ids) {
        sum += positions.at(id).point();
    }
    return sum / static_cast<float>(ids.size());
}

}  // namespace

TEST(ClusterIslandInitializerTest, ConnectedComponentsInFirstAppearanceOrder) {
    GraphModel model = makeThreeIslands();

    auto components = ClusterIslandInitializer::connectedComponents(model);

    ASSERT_EQ(components.size(), 3u);
    EXPECT_EQ(components[0], (std::vector<size_t>{0, 1, 2}));
    EXPECT_EQ(components[1], (std::vector<size_t>{3, 4, 5}));
    EXPECT_EQ(components[2], (std::vector<size_t>{6}));
}

TEST(ClusterIslandInitializerTest, EmptyModel) {
    ClusterIslandInitializer initializer;
    EXPECT_TRUE(initializer.initialize(GraphModel{}, CANVAS).empty());
}

TEST(ClusterIslandInitializerTest, PlacesEveryNodeWithFinitePosition) {
    ClusterIslandInitializer initializer;
    GraphModel model = makeThreeIslands();

    PositionMap positions = initializer.initialize(model, CANVAS);

    ASSERT_EQ(positions.size(), model.nodeCount());
    for (const auto& [id, pos] : positions) {
        EXPECT_TRUE(pos.point().isFinite()) << id;
        EXPECT_EQ(pos.velocity(), Point{}) << id;
    }
}

TEST(ClusterIslandInitializerTest, IsDeterministic) {
    ClusterIslandInitializer initializer;
    GraphModel model = makeThreeIslands();

    EXPECT_EQ(initializer.initialize(model, CANVAS), initializer.initialize(model, CANVAS));
}

TEST(ClusterIslandInitializerTest, ComponentsLandOnSeparateIslands) {
    ClusterIslandInitializer initializer;
    GraphModel model = makeThreeIslands();

    PositionMap positions = initializer.initialize(model, CANVAS);

    const std::vector<std::vector<NodeId>> islands = {{"a", "b", "c"}, {"x", "y", "z"}, {"lone"}};

    float widestIsland = 0.0f;
    for (const auto& island : islands) {
        for (const auto& p : island) {
            for (const auto& q : island) {
                widestIsland = std::max(widestIsland, positions.at(p).point().distanceTo(positions.at(q).point()));
            }
        }
    }

    float closestForeign = std::numeric_limits<float>::max();
    for (size_t i = 0; i < islands.size(); ++i) {
        for (size_t j = i + 1; j < islands.size(); ++j) {
            for (const auto& p : islands[i]) {
                for (const auto& q : islands[j]) {
                    closestForeign = std::min(closestForeign,
                                              positions.at(p).point().distanceTo(positions.at(q).point()));
                }
            }

            float centroidDistance = centroidOf(positions, islands[i]).distanceTo(centroidOf(positions, islands[j]));
            EXPECT_GE(centroidDistance, initializer.options().minClusterDistance);
        }
    }

    EXPECT_GT(closestForeign, widestIsland);
}

TEST(ClusterIslandInitializerTest, ConnectedNodesStaySpread) {
    ClusterIslandInitializer initializer;
    GraphModel model = makeThreeIslands();

    PositionMap positions = initializer.initialize(model, CANVAS);

    // Intra-cluster repulsion keeps members apart, the springs keep them close
    float ab = positions.at("a").point().distanceTo(positions.at("b").point());
    EXPECT_GT(ab, 20.0f);
    EXPECT_LT(ab, 400.0f);
}

TEST(ClusterIslandInitializerTest, ReusesPreviousPositions) {
    ClusterIslandInitializer initializer;
    GraphModel model = makeThreeIslands();

    PositionMap previous;
    previous["a"] = Position(10.0f, 20.0f, 3.0f, 4.0f);
    previous["y"] = Position(-50.0f, 70.0f);
    previous["removed"] = Position(1.0f, 1.0f);

    PositionMap positions = initializer.initialize(model, CANVAS, &previous);

    ASSERT_EQ(positions.size(), model.nodeCount());
    EXPECT_EQ(positions.count("removed"), 0u);
    EXPECT_EQ(positions.at("a").point(), Point(10.0f, 20.0f));
    EXPECT_EQ(positions.at("a").velocity(), Point{});
    EXPECT_EQ(positions.at("y").point(), Point(-50.0f, 70.0f));

    // Unseen nodes wait near the canvas center
    const float jitter = initializer.options().centerJitter;
    for (const char* id : {"b", "c", "x", "z", "lone"}) {
        Point p = positions.at(id).point();
        EXPECT_LE(std::abs(p.x - CANVAS.center().x), jitter) << id;
        EXPECT_LE(std::abs(p.y - CANVAS.center().y), jitter) << id;
    }
}

TEST(ClusterIslandInitializerTest, UnrelatedPreviousMapRunsFullLayout) {
    ClusterIslandInitializer initializer;
    GraphModel model = makeThreeIslands();

    PositionMap previous;
    previous["someone-else"] = Position(0.0f, 0.0f);

    EXPECT_EQ(initializer.initialize(model, CANVAS, &previous), initializer.initialize(model, CANVAS));
}

TEST(ClusterIslandInitializerTest, NodeAndEdgeListOverload) {
    ClusterIslandInitializer initializer;
    std::vector<Node> nodes = {Node("p"), Node("q")};
    std::vector<Edge> edges = {{"e", "p", "q"}, {"dangling", "p", "ghost"}};

    PositionMap positions = initializer.initialize(nodes, edges, CANVAS);

    EXPECT_EQ(positions.size(), 2u);
    EXPECT_EQ(positions.count("ghost"), 0u);
}
