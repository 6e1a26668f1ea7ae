#include <gtest/gtest.h>
#include <graphweave/routing/CrossingDetector.h>

#include <cmath>

using namespace graphweave;

namespace {

TransformedEdge makeEdge(const EdgeId& id, const std::string& source, const std::string& target,
                         bool shouldRender = true) {
    TransformedEdge edge;
    edge.edgeId = id;
    edge.originalSource = source;
    edge.originalTarget = target;
    edge.renderSource = source;
    edge.renderTarget = target;
    edge.shouldRender = shouldRender;
    return edge;
}

// A and C on one diagonal, B and D on the other
PointMap squareCorners() {
    return {
        {"A", Point(0.0f, 0.0f)},
        {"B", Point(100.0f, 0.0f)},
        {"C", Point(100.0f, 100.0f)},
        {"D", Point(0.0f, 100.0f)},
    };
}

}  // namespace

TEST(CrossingDetectorTest, DiagonalsCrossOnce) {
    CrossingDetector detector;
    std::vector<TransformedEdge> edges = {makeEdge("e2", "B", "D"), makeEdge("e1", "A", "C")};

    auto crossings = detector.detect(edges, squareCorners());

    ASSERT_EQ(crossings.size(), 1u);
    EXPECT_EQ(crossings[0].hoppingEdgeId, "e1");
    EXPECT_EQ(crossings[0].crossedEdgeId, "e2");
    EXPECT_NEAR(crossings[0].point.x, 50.0f, 1e-3f);
    EXPECT_NEAR(crossings[0].point.y, 50.0f, 1e-3f);
}

TEST(CrossingDetectorTest, ParallelEdgesDoNotCross) {
    CrossingDetector detector;
    std::vector<TransformedEdge> edges = {makeEdge("e1", "A", "B"), makeEdge("e2", "D", "C")};

    EXPECT_TRUE(detector.detect(edges, squareCorners()).empty());
}

TEST(CrossingDetectorTest, SharedEndpointIsNotACrossing) {
    CrossingDetector detector;
    std::vector<TransformedEdge> edges = {makeEdge("e1", "A", "C"), makeEdge("e2", "C", "B")};

    EXPECT_TRUE(detector.detect(edges, squareCorners()).empty());
}

TEST(CrossingDetectorTest, HiddenEdgesAreIgnored) {
    CrossingDetector detector;
    std::vector<TransformedEdge> edges = {makeEdge("e1", "A", "C"), makeEdge("e2", "B", "D", false)};

    EXPECT_TRUE(detector.detect(edges, squareCorners()).empty());
}

TEST(CrossingDetectorTest, EdgesWithoutPositionsAreIgnored) {
    CrossingDetector detector;
    PointMap positions = squareCorners();
    positions.erase("D");
    std::vector<TransformedEdge> edges = {makeEdge("e1", "A", "C"), makeEdge("e2", "B", "D")};

    EXPECT_TRUE(detector.detect(edges, positions).empty());
}

TEST(CrossingDetectorTest, ZeroLengthEdgesAreIgnored) {
    CrossingDetector detector;
    PointMap positions = squareCorners();
    positions["E"] = Point(50.0f, 50.0f);
    positions["F"] = Point(50.0f, 50.0f);
    std::vector<TransformedEdge> edges = {makeEdge("e1", "A", "C"), makeEdge("e2", "E", "F")};

    EXPECT_TRUE(detector.detect(edges, positions).empty());
}

TEST(CrossingDetectorTest, HopGeometry) {
    CrossingDetector detector;
    std::vector<TransformedEdge> edges = {makeEdge("e1", "A", "C"), makeEdge("e2", "B", "D")};

    HopMap hops = detector.computeHops(edges, squareCorners());

    ASSERT_EQ(hops.size(), 1u);
    ASSERT_EQ(hops.count("e2"), 0u);
    ASSERT_EQ(hops.at("e1").size(), 1u);

    const HopWaypoint& hop = hops.at("e1")[0];
    const float offset = 8.0f / std::sqrt(2.0f);
    EXPECT_EQ(hop.crossedEdgeId, "e2");
    EXPECT_NEAR(hop.before.x, 50.0f - offset, 1e-3f);
    EXPECT_NEAR(hop.before.y, 50.0f - offset, 1e-3f);
    EXPECT_NEAR(hop.peak.x, 50.0f - offset, 1e-3f);
    EXPECT_NEAR(hop.peak.y, 50.0f + offset, 1e-3f);
    EXPECT_NEAR(hop.after.x, 50.0f + offset, 1e-3f);
    EXPECT_NEAR(hop.after.y, 50.0f + offset, 1e-3f);
    EXPECT_NEAR(hop.distanceAlong, 50.0f * std::sqrt(2.0f), 1e-2f);
}

TEST(CrossingDetectorTest, HopRadiusFromOptions) {
    RoutingOptions options;
    options.hopRadius = 20.0f;
    CrossingDetector detector(options);
    PointMap positions = {
        {"w", Point(0.0f, 50.0f)}, {"e", Point(300.0f, 50.0f)},
        {"n", Point(100.0f, 0.0f)}, {"s", Point(100.0f, 100.0f)},
    };
    std::vector<TransformedEdge> edges = {makeEdge("a", "w", "e"), makeEdge("b", "n", "s")};

    HopMap hops = detector.computeHops(edges, positions);

    ASSERT_EQ(hops.at("a").size(), 1u);
    const HopWaypoint& hop = hops.at("a")[0];
    EXPECT_NEAR(hop.before.x, 80.0f, 1e-3f);
    EXPECT_NEAR(hop.after.x, 120.0f, 1e-3f);
    EXPECT_NEAR(hop.peak.x, 100.0f, 1e-3f);
    EXPECT_NEAR(hop.peak.y, 70.0f, 1e-3f);
    EXPECT_NEAR(hop.before.y, 50.0f, 1e-3f);
}

TEST(CrossingDetectorTest, HopsOrderedAlongTheEdge) {
    CrossingDetector detector;
    PointMap positions = {
        {"w", Point(0.0f, 50.0f)}, {"e", Point(300.0f, 50.0f)},
        {"n1", Point(200.0f, 0.0f)}, {"s1", Point(200.0f, 100.0f)},
        {"n2", Point(100.0f, 0.0f)}, {"s2", Point(100.0f, 100.0f)},
    };
    std::vector<TransformedEdge> edges = {
        makeEdge("a", "w", "e"), makeEdge("far", "n1", "s1"), makeEdge("near", "n2", "s2")
    };

    HopMap hops = detector.computeHops(edges, positions);

    ASSERT_EQ(hops.size(), 1u);
    const auto& list = hops.at("a");
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].crossedEdgeId, "near");
    EXPECT_EQ(list[1].crossedEdgeId, "far");
    EXPECT_LT(list[0].distanceAlong, list[1].distanceAlong);
}

TEST(CrossingDetectorTest, NoCrossingsNoHops) {
    CrossingDetector detector;
    std::vector<TransformedEdge> edges = {makeEdge("e1", "A", "B")};

    EXPECT_TRUE(detector.computeHops(edges, squareCorners()).empty());
    EXPECT_TRUE(detector.computeHops({}, {}).empty());
}

TEST(CrossingDetectorTest, ReusedIdResolvesToThePlacedEdge) {
    CrossingDetector detector;
    std::vector<TransformedEdge> edges = {
        makeEdge("e1", "A", "missing"), makeEdge("e1", "A", "C"), makeEdge("e2", "B", "D")
    };

    HopMap hops;
    ASSERT_NO_THROW(hops = detector.computeHops(edges, squareCorners()));

    ASSERT_EQ(hops.count("e1"), 1u);
    ASSERT_EQ(hops.at("e1").size(), 1u);
    EXPECT_NEAR(hops.at("e1")[0].crossing.x, 50.0f, 1e-3f);
}
