#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>
#include "quadsim/math/rect.hpp"

TEST(RectTest, ContainsIsClosedOnAllEdges) {
    Rect r(0.0, 0.0, 100.0, 100.0);

    EXPECT_TRUE(r.contains({0.0, 0.0}));
    EXPECT_TRUE(r.contains({50.0, 50.0}));
    EXPECT_TRUE(r.contains({100.0, 100.0}));
    EXPECT_TRUE(r.contains({100.0, 0.0}));

    EXPECT_FALSE(r.contains({-0.001, 50.0}));
    EXPECT_FALSE(r.contains({100.001, 50.0}));
    EXPECT_FALSE(r.contains({50.0, -1.0}));
    EXPECT_FALSE(r.contains({50.0, 150.0}));
}

TEST(RectTest, Intersects) {
    Rect r(0.0, 0.0, 10.0, 10.0);

    EXPECT_TRUE(r.intersects(Rect(5.0, 5.0, 10.0, 10.0)));
    EXPECT_TRUE(r.intersects(Rect(2.0, 2.0, 1.0, 1.0)));   // fully inside
    EXPECT_TRUE(r.intersects(Rect(-5.0, -5.0, 20.0, 20.0))); // fully covering
    EXPECT_TRUE(r.intersects(Rect(10.0, 0.0, 5.0, 5.0)));  // touching edge

    EXPECT_FALSE(r.intersects(Rect(10.5, 0.0, 5.0, 5.0)));
    EXPECT_FALSE(r.intersects(Rect(0.0, -6.0, 5.0, 5.0)));
}

TEST(RectTest, Quadrants) {
    Rect r(10.0, 20.0, 100.0, 60.0);

    EXPECT_EQ(r.quadrant(0), Rect(10.0, 20.0, 50.0, 30.0));
    EXPECT_EQ(r.quadrant(1), Rect(60.0, 20.0, 50.0, 30.0));
    EXPECT_EQ(r.quadrant(2), Rect(10.0, 50.0, 50.0, 30.0));
    EXPECT_EQ(r.quadrant(3), Rect(60.0, 50.0, 50.0, 30.0));
    EXPECT_THROW(r.quadrant(4), std::out_of_range);
}

TEST(RectTest, CenteredSquare) {
    Rect q = Rect::centeredSquare({50.0, 50.0}, 10.0);
    EXPECT_EQ(q, Rect(40.0, 40.0, 20.0, 20.0));
    EXPECT_EQ(q.center(), Position(50.0, 50.0));
}

TEST(RectTest, RejectsInvalidExtents) {
    EXPECT_THROW(Rect(0.0, 0.0, -1.0, 10.0), std::invalid_argument);
    EXPECT_THROW(Rect(0.0, 0.0, 10.0, -0.5), std::invalid_argument);
    EXPECT_THROW(Rect(0.0, 0.0, std::numeric_limits<double>::infinity(), 1.0), std::invalid_argument);
    EXPECT_NO_THROW(Rect(0.0, 0.0, 0.0, 0.0));
}
