#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <stdexcept>
#include <vector>

#include "quadsim/spatial/quadtree.hpp"

class QuadtreeTest : public ::testing::Test {
protected:
    Rect world{0.0, 0.0, 100.0, 100.0};

    static entt::entity id(uint32_t n) {
        return static_cast<entt::entity>(n);
    }

    static std::vector<uint32_t> sortedIds(const std::vector<Quadtree::Entry>& entries) {
        std::vector<uint32_t> ids;
        for (const auto& e : entries) {
            ids.push_back(static_cast<uint32_t>(e.id));
        }
        std::sort(ids.begin(), ids.end());
        return ids;
    }

    // Eleven points, none on the root split lines, spread over all quadrants
    static std::vector<Position> spreadPoints() {
        return {
            {10, 10}, {20, 20}, {30, 30},
            {60, 10}, {70, 20}, {80, 30},
            {10, 60}, {20, 70},
            {60, 60}, {70, 70}, {80, 80},
        };
    }
};

TEST_F(QuadtreeTest, RejectsInvalidConfig) {
    EXPECT_THROW(Quadtree(world, QuadtreeConfig{0, 10}), std::invalid_argument);
    EXPECT_THROW(Quadtree(world, QuadtreeConfig{-3, 10}), std::invalid_argument);
    EXPECT_THROW(Quadtree(world, QuadtreeConfig{4, -1}), std::invalid_argument);
    EXPECT_NO_THROW(Quadtree(world, QuadtreeConfig{1, 0}));
}

TEST_F(QuadtreeTest, StartsAsEmptyLeaf) {
    Quadtree tree(world, QuadtreeConfig{10, 8});
    EXPECT_TRUE(tree.isLeaf());
    EXPECT_TRUE(tree.empty());
    EXPECT_EQ(tree.nodeCount(), 1u);
    EXPECT_EQ(tree.region(), world);
    EXPECT_TRUE(tree.query(world).empty());
}

TEST_F(QuadtreeTest, SplitsExactlyOnceAtCapacityPlusOne) {
    Quadtree tree(world, QuadtreeConfig{10, 8});
    auto points = spreadPoints();

    for (uint32_t i = 0; i < 10; ++i) {
        ASSERT_TRUE(tree.insert(id(i), points[i]));
    }
    EXPECT_TRUE(tree.isLeaf());
    EXPECT_EQ(tree.splitCount(), 0u);

    ASSERT_TRUE(tree.insert(id(10), points[10]));
    EXPECT_FALSE(tree.isLeaf());
    EXPECT_EQ(tree.splitCount(), 1u);
    EXPECT_EQ(tree.nodeCount(), 5u);
    EXPECT_EQ(tree.leafCount(), 4u);
    EXPECT_EQ(tree.depth(), 1);

    auto ids = tree.queryIds(world);
    EXPECT_EQ(ids.size(), 11u);
    std::vector<uint32_t> expected(11);
    for (uint32_t i = 0; i < 11; ++i) expected[i] = i;
    EXPECT_EQ(sortedIds(tree.query(world)), expected);
}

TEST_F(QuadtreeTest, OutOfBoundsPointIsDropped) {
    Quadtree tree(world, QuadtreeConfig{10, 8});
    EXPECT_FALSE(tree.insert(id(99), {150.0, 150.0}));
    EXPECT_TRUE(tree.query(world).empty());
    EXPECT_TRUE(tree.query(Rect(100.0, 100.0, 100.0, 100.0)).empty());

    auto points = spreadPoints();
    for (uint32_t i = 0; i < points.size(); ++i) {
        tree.insert(id(i), points[i]);
    }
    auto before = sortedIds(tree.query(world));
    EXPECT_FALSE(tree.insert(id(100), {-0.5, 20.0}));
    EXPECT_EQ(sortedIds(tree.query(world)), before);
    EXPECT_EQ(tree.size(), points.size());
}

TEST_F(QuadtreeTest, QueryPrunesNonIntersectingQuadrants) {
    Quadtree tree(world, QuadtreeConfig{10, 8});
    auto points = spreadPoints();
    for (uint32_t i = 0; i < points.size(); ++i) {
        tree.insert(id(i), points[i]);
    }

    // A small box in the top-left quadrant only reaches the top-left leaf,
    // whose points are all reported even where they lie outside the box
    auto found = sortedIds(tree.query(Rect(1.0, 1.0, 2.0, 2.0)));
    EXPECT_EQ(found, (std::vector<uint32_t>{0, 1, 2}));

    auto bottomRight = sortedIds(tree.query(Rect(90.0, 90.0, 5.0, 5.0)));
    EXPECT_EQ(bottomRight, (std::vector<uint32_t>{8, 9, 10}));
}

TEST_F(QuadtreeTest, NoFalseNegatives) {
    std::mt19937 rng(1234);
    std::uniform_real_distribution<double> coord(0.0, 100.0);
    std::uniform_real_distribution<double> extent(0.0, 40.0);

    Quadtree tree(world, QuadtreeConfig{4, 10});
    std::vector<Position> points;
    for (uint32_t i = 0; i < 600; ++i) {
        points.emplace_back(coord(rng), coord(rng));
        tree.insert(id(i), points.back());
    }

    for (int q = 0; q < 300; ++q) {
        Rect range(coord(rng) - 20.0, coord(rng) - 20.0, extent(rng), extent(rng));
        auto found = sortedIds(tree.query(range));

        for (uint32_t i = 0; i < points.size(); ++i) {
            if (range.contains(points[i])) {
                EXPECT_TRUE(std::binary_search(found.begin(), found.end(), i))
                    << "point " << i << " missing from query " << q;
            }
        }
    }
}

TEST_F(QuadtreeTest, ConservesPointsAcrossSplits) {
    std::mt19937 rng(99);
    std::uniform_real_distribution<double> coord(0.1, 99.9);

    Quadtree tree(world, QuadtreeConfig{3, 12});
    std::vector<uint32_t> expected;
    for (uint32_t i = 0; i < 400; ++i) {
        ASSERT_TRUE(tree.insert(id(i), {coord(rng), coord(rng)}));
        expected.push_back(i);
    }

    EXPECT_EQ(tree.size(), expected.size());
    EXPECT_EQ(sortedIds(tree.query(world)), expected);
    EXPECT_GT(tree.splitCount(), 0u);
    EXPECT_EQ(tree.nodeCount(), 1 + 4 * tree.splitCount());
}

TEST_F(QuadtreeTest, BoundaryTieIsStoredInEveryTouchingChild) {
    Quadtree tree(world, QuadtreeConfig{4, 8});
    tree.insert(id(0), {10, 10});
    tree.insert(id(1), {90, 10});
    tree.insert(id(2), {10, 90});
    tree.insert(id(3), {90, 90});
    tree.insert(id(4), {20, 20});
    ASSERT_FALSE(tree.isLeaf());
    ASSERT_EQ(tree.size(), 5u);

    // The exact center touches all four quadrants
    ASSERT_TRUE(tree.insert(id(5), {50, 50}));
    EXPECT_EQ(tree.size(), 9u);

    // On the vertical split line, away from the center: two quadrants
    ASSERT_TRUE(tree.insert(id(6), {50, 20}));
    EXPECT_EQ(tree.size(), 11u);

    auto all = tree.queryIds(world);
    EXPECT_EQ(std::count(all.begin(), all.end(), id(5)), 4);
    EXPECT_EQ(std::count(all.begin(), all.end(), id(6)), 2);

    auto topLeft = tree.queryIds(Rect(0.0, 0.0, 5.0, 5.0));
    EXPECT_EQ(std::count(topLeft.begin(), topLeft.end(), id(5)), 1);
    EXPECT_EQ(std::count(topLeft.begin(), topLeft.end(), id(6)), 1);
}

TEST_F(QuadtreeTest, DepthCeilingAbsorbsCoincidentPoints) {
    Quadtree tree(world, QuadtreeConfig{2, 3});
    for (uint32_t i = 0; i < 50; ++i) {
        ASSERT_TRUE(tree.insert(id(i), {10.0, 10.0}));
    }

    EXPECT_EQ(tree.size(), 50u);
    EXPECT_EQ(tree.depth(), 3);
    EXPECT_EQ(tree.splitCount(), 3u);
    EXPECT_EQ(tree.nodeCount(), 13u);
    EXPECT_EQ(tree.query(Rect(9.0, 9.0, 2.0, 2.0)).size(), 50u);
}

TEST_F(QuadtreeTest, ZeroMaxDepthNeverSplits) {
    Quadtree tree(world, QuadtreeConfig{1, 0});
    for (uint32_t i = 0; i < 20; ++i) {
        tree.insert(id(i), {static_cast<double>(i) * 4.0 + 1.0, 33.0});
    }
    EXPECT_TRUE(tree.isLeaf());
    EXPECT_EQ(tree.size(), 20u);
    EXPECT_EQ(tree.splitCount(), 0u);
}

TEST_F(QuadtreeTest, RebuildWithSameInputsGivesSameResults) {
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> coord(0.0, 100.0);
    std::vector<Position> points;
    for (int i = 0; i < 250; ++i) {
        points.emplace_back(coord(rng), coord(rng));
    }

    Quadtree a(world, QuadtreeConfig{5, 9});
    Quadtree b(world, QuadtreeConfig{5, 9});
    for (uint32_t i = 0; i < points.size(); ++i) {
        a.insert(id(i), points[i]);
        b.insert(id(i), points[i]);
    }

    EXPECT_EQ(a.nodeCount(), b.nodeCount());
    for (int q = 0; q < 50; ++q) {
        Rect range(coord(rng), coord(rng), 15.0, 25.0);
        EXPECT_EQ(a.queryIds(range), b.queryIds(range));
    }
}

TEST_F(QuadtreeTest, TraverseIsDepthFirstPreOrder) {
    Quadtree tree(world, QuadtreeConfig{1, 8});
    tree.insert(id(0), {10, 10});
    tree.insert(id(1), {90, 90});
    tree.insert(id(2), {15, 40});  // splits the top-left quadrant again

    std::vector<Rect> regions;
    std::vector<int> depths;
    std::vector<bool> leaves;
    tree.traverse([&](const Rect& region, int depth, bool leaf) {
        regions.push_back(region);
        depths.push_back(depth);
        leaves.push_back(leaf);
    });

    ASSERT_EQ(regions.size(), tree.nodeCount());
    ASSERT_EQ(regions.size(), 9u);

    EXPECT_EQ(regions[0], world);
    EXPECT_EQ(regions[1], Rect(0, 0, 50, 50));
    EXPECT_EQ(regions[2], Rect(0, 0, 25, 25));     // top-left's children come next
    EXPECT_EQ(regions[5], Rect(25, 25, 25, 25));
    EXPECT_EQ(regions[6], Rect(50, 0, 50, 50));
    EXPECT_EQ(regions[8], Rect(50, 50, 50, 50));

    EXPECT_EQ(depths, (std::vector<int>{0, 1, 2, 2, 2, 2, 1, 1, 1}));
    EXPECT_EQ(leaves, (std::vector<bool>{false, false, true, true, true, true, true, true, true}));
}
