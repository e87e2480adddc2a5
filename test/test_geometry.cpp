#include <gtest/gtest.h>

#include "geometry/Rect.hpp"

using geometry::Rect;

TEST(GeometryTest, AreaOfRegularBox)
{
    EXPECT_DOUBLE_EQ(geometry::area(Rect(0, 0, 10, 20)), 200.0);
}

TEST(GeometryTest, AreaClampsInvertedExtents)
{
    EXPECT_DOUBLE_EQ(geometry::area(Rect(10, 0, 0, 10)), 0.0);
    EXPECT_DOUBLE_EQ(geometry::area(Rect(0, 10, 10, 0)), 0.0);
    EXPECT_DOUBLE_EQ(geometry::area(Rect(5, 5, 5, 5)), 0.0);
}

TEST(GeometryTest, IntersectionOfOverlappingBoxes)
{
    EXPECT_DOUBLE_EQ(geometry::intersectionArea(Rect(0, 0, 10, 10), Rect(5, 5, 15, 15)), 25.0);
    EXPECT_DOUBLE_EQ(geometry::intersectionArea(Rect(0, 0, 10, 10), Rect(2, 2, 4, 4)), 4.0);
}

TEST(GeometryTest, IntersectionIsZeroForDisjointOrTouchingBoxes)
{
    EXPECT_DOUBLE_EQ(geometry::intersectionArea(Rect(0, 0, 10, 10), Rect(20, 20, 30, 30)), 0.0);
    EXPECT_DOUBLE_EQ(geometry::intersectionArea(Rect(0, 0, 10, 10), Rect(10, 0, 20, 10)), 0.0);
}

TEST(GeometryTest, IouOfIdenticalBoxesIsOne)
{
    const Rect a(3.5, 4.25, 17.0, 40.0);
    EXPECT_DOUBLE_EQ(geometry::iou(a, a), 1.0);
}

TEST(GeometryTest, IouOfDisjointBoxesIsZero)
{
    EXPECT_DOUBLE_EQ(geometry::iou(Rect(0, 0, 10, 10), Rect(20, 20, 30, 30)), 0.0);
}

TEST(GeometryTest, IouOfPartialOverlap)
{
    // 50 shared over a union of 150.
    EXPECT_NEAR(geometry::iou(Rect(0, 0, 10, 10), Rect(5, 0, 15, 10)), 1.0 / 3.0, 1e-12);
    EXPECT_NEAR(geometry::iou(Rect(0, 0, 10, 10), Rect(2, 2, 4, 4)), 0.04, 1e-12);
}

TEST(GeometryTest, IouIsSymmetric)
{
    const Rect boxes[] = {
        Rect(0, 0, 10, 10), Rect(5, 0, 15, 10), Rect(2, 2, 4, 4),
        Rect(-3, -3, 1, 8), Rect(20, 20, 30, 30), Rect(5, 5, 5, 5),
    };
    for (const auto& a : boxes) {
        for (const auto& b : boxes) {
            EXPECT_DOUBLE_EQ(geometry::iou(a, b), geometry::iou(b, a));
        }
    }
}

TEST(GeometryTest, IouOfDegenerateBoxesIsZero)
{
    EXPECT_DOUBLE_EQ(geometry::iou(Rect(5, 5, 5, 5), Rect(5, 5, 5, 5)), 0.0);
    EXPECT_DOUBLE_EQ(geometry::iou(Rect(5, 5, 5, 5), Rect(0, 0, 10, 10)), 0.0);
}
