#include "trailrun/geometry.hpp"

#include <gtest/gtest.h>

namespace {

TEST(Rect, DerivedEdges) {
    const tr::Rect r{10, 20, 30, 40};
    EXPECT_EQ(r.right(), 40);
    EXPECT_EQ(r.bottom(), 60);
    EXPECT_EQ(r.position().x, 10);
    EXPECT_EQ(r.position().y, 20);
}

TEST(Rect, OverlapOnBothAxesIntersects) {
    const tr::Rect a{0, 0, 10, 10};
    EXPECT_TRUE(a.intersects({5, 5, 10, 10}));
    EXPECT_TRUE(a.intersects({-5, -5, 10, 10}));
    EXPECT_TRUE(a.intersects({2, 2, 2, 2}));
    EXPECT_TRUE((tr::Rect{2, 2, 2, 2}).intersects(a));
}

TEST(Rect, TouchingEdgesDoNotIntersect) {
    const tr::Rect a{0, 0, 10, 10};
    EXPECT_FALSE(a.intersects({10, 0, 5, 5}));
    EXPECT_FALSE(a.intersects({-5, 0, 5, 5}));
    EXPECT_FALSE(a.intersects({0, 10, 5, 5}));
    EXPECT_FALSE(a.intersects({0, -5, 5, 5}));
}

TEST(Rect, OverlapOnOneAxisOnlyDoesNotIntersect) {
    const tr::Rect a{0, 0, 10, 10};
    EXPECT_FALSE(a.intersects({5, 20, 10, 10}));
    EXPECT_FALSE(a.intersects({20, 5, 10, 10}));
}

TEST(Rect, SetXMovesRightEdge) {
    tr::Rect r{0, 0, 10, 10};
    r.set_x(-4);
    EXPECT_EQ(r.x, -4);
    EXPECT_EQ(r.right(), 6);
}

} // namespace
