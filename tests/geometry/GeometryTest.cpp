#include <winorg/geometry/Geometry.hpp>

#include <gtest/gtest.h>

using namespace worg;

TEST(Geometry, rectEdges) {
    Rect r{100, 50, 300, 200};

    EXPECT_EQ(r.left(), 100);
    EXPECT_EQ(r.top(), 50);
    EXPECT_EQ(r.right(), 400);
    EXPECT_EQ(r.bottom(), 250);
    EXPECT_EQ(r.area(), 60000);
    EXPECT_TRUE(r.contains(100, 50));
    EXPECT_FALSE(r.contains(400, 50));
    EXPECT_FALSE(Rect(0, 0, 0, 10).isValid());
}

TEST(Geometry, intersectAndOverlap) {
    Rect a{0, 0, 100, 100};
    Rect b{50, 25, 100, 100};

    auto common = intersect(a, b);
    ASSERT_TRUE(common.has_value());
    EXPECT_EQ(*common, Rect(50, 25, 50, 75));
    EXPECT_EQ(overlapArea(a, b), 50 * 75);

    // Touching edges do not overlap
    EXPECT_FALSE(intersect(a, Rect{100, 0, 10, 10}).has_value());
    EXPECT_EQ(overlapArea(a, Rect{100, 0, 10, 10}), 0);
}

TEST(Geometry, gravitySides) {
    EXPECT_TRUE(Gravity::topLeft().isTop());
    EXPECT_TRUE(Gravity::topLeft().isLeft());
    EXPECT_FALSE(Gravity::topLeft().isBottom());

    // The middle is every side at once
    Gravity middle = Gravity::center();
    EXPECT_TRUE(middle.isTop());
    EXPECT_TRUE(middle.isBottom());
    EXPECT_TRUE(middle.isLeft());
    EXPECT_TRUE(middle.isRight());

    EXPECT_EQ(Gravity::topLeft().invert(), Gravity::bottomRight());
    EXPECT_EQ(Gravity::topLeft().invert(false, true), Gravity::topRight());
    EXPECT_EQ(Gravity::topLeft().invert(true, false), Gravity::bottomLeft());
}

TEST(Geometry, gravityParse) {
    EXPECT_EQ(Gravity::parse("top-left"), Gravity::topLeft());
    EXPECT_EQ(Gravity::parse("NW"), Gravity::topLeft());
    EXPECT_EQ(Gravity::parse("bottom_right"), Gravity::bottomRight());
    EXPECT_EQ(Gravity::parse("middle"), Gravity::center());
    EXPECT_FALSE(Gravity::parse("sideways").has_value());
}

TEST(Geometry, rectAtGravity) {
    EXPECT_EQ(rectAtGravity(960, 540, 200, 100, Gravity::center()), Rect(860, 490, 200, 100));
    EXPECT_EQ(rectAtGravity(1920, 1080, 200, 100, Gravity::bottomRight()), Rect(1720, 980, 200, 100));

    int px = 0;
    int py = 0;
    gravityPoint(Rect{0, 30, 1920, 1050}, Gravity::bottom(), px, py);
    EXPECT_EQ(px, 960);
    EXPECT_EQ(py, 1080);
}
