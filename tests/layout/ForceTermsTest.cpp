#include <gtest/gtest.h>
#include "layout/physics/CollisionResolver.h"
#include "layout/physics/ForceTerms.h"

using namespace graphweave;
using namespace graphweave::physics;

TEST(ForceTermsTest, PairFactorIsSymmetricAndBounded) {
    for (const char* a : {"a", "node-17", "H"}) {
        for (const char* b : {"b", "node-18", "L1"}) {
            float ab = pairFactor(a, b, 0.5f, 1.5f);
            EXPECT_FLOAT_EQ(ab, pairFactor(b, a, 0.5f, 1.5f));
            EXPECT_GE(ab, 0.5f);
            EXPECT_LE(ab, 1.5f);
        }
    }
}

TEST(ForceTermsTest, SeparationDirectionIsAntisymmetricUnit) {
    Point ab = separationDirection("x", "y");
    Point ba = separationDirection("y", "x");

    EXPECT_NEAR(ab.length(), 1.0f, 1e-5f);
    EXPECT_NEAR(ab.x, -ba.x, 1e-6f);
    EXPECT_NEAR(ab.y, -ba.y, 1e-6f);
}

TEST(ForceTermsTest, PlacementJitterStaysInDisc) {
    for (const char* id : {"a", "b", "c", "long-node-identifier"}) {
        Point offset = placementJitter(id, 42, 50.0f);
        EXPECT_LE(offset.length(), 50.0f + 1e-3f) << id;
        EXPECT_EQ(offset, placementJitter(id, 42, 50.0f));
    }
    EXPECT_NE(placementJitter("a", 42, 50.0f), placementJitter("a", 7, 50.0f));
}

TEST(ForceTermsTest, SpringPullsWhenStretchedAndPushesWhenCompressed) {
    Point stretched = springForce({0, 0}, {200, 0}, 100.0f, 0.5f);
    EXPECT_FLOAT_EQ(stretched.x, 50.0f);
    EXPECT_FLOAT_EQ(stretched.y, 0.0f);

    Point compressed = springForce({0, 0}, {50, 0}, 100.0f, 0.5f);
    EXPECT_FLOAT_EQ(compressed.x, -25.0f);
}

TEST(ForceTermsTest, RepulsionFallsOffWithDistance) {
    Point near = repulsionForce({0, 0}, {10, 0}, 8000.0f);
    Point far = repulsionForce({0, 0}, {100, 0}, 8000.0f);

    EXPECT_FLOAT_EQ(near.x, -800.0f);
    EXPECT_FLOAT_EQ(far.x, -80.0f);
}

TEST(ForceTermsTest, CoincidentPointsGiveZeroForce) {
    EXPECT_EQ(springForce({5, 5}, {5, 5}, 100.0f, 1.0f), Point{});
    EXPECT_EQ(repulsionForce({5, 5}, {5, 5}, 8000.0f), Point{});
}

TEST(ForceTermsTest, ClampLength) {
    Point clamped = clampLength({30, 40}, 10.0f);
    EXPECT_NEAR(clamped.length(), 10.0f, 1e-5f);
    EXPECT_EQ(clampLength({3, 4}, 10.0f), Point(3, 4));
}

TEST(CollisionResolverTest, EvenSplitSeparatesPair) {
    CollisionResolver resolver({"a", "b"}, [](size_t, size_t) { return 100.0f; });
    std::vector<Point> points = {{0, 0}, {40, 0}};

    int passes = resolver.resolve(points, 10, CollisionResolver::evenSplit);

    EXPECT_EQ(passes, 1);
    EXPECT_GE(points[0].distanceTo(points[1]), 100.0f);
    // Both moved by half of the overlap
    EXPECT_NEAR(points[0].x, -30.0f, 0.01f);
    EXPECT_NEAR(points[1].x, 70.0f, 0.01f);
}

TEST(CollisionResolverTest, ShareControlsWhoMoves) {
    CollisionResolver resolver({"fixed", "free"}, [](size_t, size_t) { return 100.0f; });
    std::vector<Point> points = {{0, 0}, {0, 50}};

    resolver.resolve(points, 10, [](size_t, size_t) {
        return std::make_optional(std::make_pair(0.0f, 1.0f));
    });

    EXPECT_EQ(points[0], Point(0, 0));
    EXPECT_NEAR(points[1].y, 100.0f, 0.02f);
}

TEST(CollisionResolverTest, SkippedPairsAreUntouched) {
    CollisionResolver resolver({"a", "b"}, [](size_t, size_t) { return 100.0f; });
    std::vector<Point> points = {{0, 0}, {1, 0}};

    int passes = resolver.resolve(points, 10, [](size_t, size_t) {
        return std::optional<std::pair<float, float>>{};
    });

    EXPECT_EQ(passes, 0);
    EXPECT_EQ(points[1], Point(1, 0));
}

TEST(CollisionResolverTest, WorstClearance) {
    CollisionResolver resolver({"a", "b", "c"}, [](size_t, size_t) { return 100.0f; });
    std::vector<Point> points = {{0, 0}, {150, 0}, {0, 90}};

    EXPECT_NEAR(resolver.worstClearance(points, CollisionResolver::evenSplit), -10.0f, 1e-4f);
}
