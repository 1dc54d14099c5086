#include <gtest/gtest.h>
#include "test_helpers.hpp"

using namespace polycurve;
using namespace polycurve::test;

using Point3 = Point3d<Unit, Global>;
using Polyline3 = Polyline3d<Unit, Global>;

// ============================================
// Polyline3d Tests
// ============================================

TEST(PolylineTest, LengthAndBoundingBox3d) {
    Polyline3 polyline({Point3(0.0, 0.0, 0.0), Point3(1.0, 0.0, 0.0),
                        Point3(1.0, 2.0, 0.0), Point3(1.0, 2.0, 3.0)});

    EXPECT_DOUBLE_EQ(polyline.length().value, 6.0);

    auto box = polyline.bounding_box();
    ASSERT_TRUE(box.has_value());
    EXPECT_EQ(*box, (BoundingBox3d<Unit, Global>{0.0, 1.0, 0.0, 2.0, 0.0, 3.0}));
}

TEST(PolylineTest, Segments3d) {
    Polyline3 polyline({Point3(0.0, 0.0, 0.0), Point3(1.0, 0.0, 0.0),
                        Point3(1.0, 2.0, 0.0), Point3(1.0, 2.0, 3.0)});

    auto segments = polyline.segments();
    ASSERT_EQ(segments.size(), 3u);
    EXPECT_DOUBLE_EQ(segments[0].length().value, 1.0);
    EXPECT_DOUBLE_EQ(segments[1].length().value, 2.0);
    EXPECT_DOUBLE_EQ(segments[2].length().value, 3.0);
    EXPECT_EQ(segments[2].midpoint(), Point3(1.0, 2.0, 1.5));
}

TEST(PolylineTest, Centroid3d) {
    Polyline3 polyline({Point3(0.0, 0.0, 0.0), Point3(1.0, 0.0, 0.0),
                        Point3(1.0, 2.0, 0.0), Point3(1.0, 2.0, 3.0)});

    // Start at the box center (0.5, 1, 1.5), then pull toward each midpoint
    Point3 estimate(0.5, 1.0, 1.5);
    estimate = estimate + (Point3(0.5, 0.0, 0.0) - estimate) * (1.0 / 6.0);
    estimate = estimate + (Point3(1.0, 1.0, 0.0) - estimate) * (2.0 / 6.0);
    estimate = estimate + (Point3(1.0, 2.0, 1.5) - estimate) * (3.0 / 6.0);

    auto centroid = polyline.centroid();
    ASSERT_TRUE(centroid.has_value());
    EXPECT_DOUBLE_EQ(centroid->x, estimate.x);
    EXPECT_DOUBLE_EQ(centroid->y, estimate.y);
    EXPECT_DOUBLE_EQ(centroid->z, estimate.z);
}

// ============================================
// Degenerate polylines
// ============================================

TEST(PolylineTest, Empty) {
    Polyline3 polyline;

    EXPECT_TRUE(polyline.empty());
    EXPECT_TRUE(polyline.segments().empty());
    EXPECT_DOUBLE_EQ(polyline.length().value, 0.0);
    EXPECT_FALSE(polyline.bounding_box().has_value());
    EXPECT_FALSE(polyline.centroid().has_value());
}

TEST(PolylineTest, SingleVertex) {
    Polyline3 polyline({Point3(1.0, 2.0, 3.0)});

    EXPECT_TRUE(polyline.segments().empty());
    EXPECT_DOUBLE_EQ(polyline.length().value, 0.0);

    auto box = polyline.bounding_box();
    ASSERT_TRUE(box.has_value());
    EXPECT_EQ(*box, (BoundingBox3d<Unit, Global>::constant(Point3(1.0, 2.0, 3.0))));

    auto centroid = polyline.centroid();
    ASSERT_TRUE(centroid.has_value());
    EXPECT_EQ(*centroid, Point3(1.0, 2.0, 3.0));
}

TEST(PolylineTest, CoincidentVerticesGiveFirstVertex) {
    Polyline2 polyline({Point(2.0, -1.0), Point(2.0, -1.0), Point(2.0, -1.0)});

    EXPECT_DOUBLE_EQ(polyline.length().value, 0.0);
    auto centroid = polyline.centroid();
    ASSERT_TRUE(centroid.has_value());
    EXPECT_EQ(*centroid, Point(2.0, -1.0));
}

// ============================================
// Polyline2d Tests
// ============================================

TEST(PolylineTest, Centroid2dFold) {
    Polyline2 polyline({Point(0.0, 0.0), Point(4.0, 0.0), Point(4.0, 2.0)});

    // Box center (2, 1); segments of length 4 and 2, total 6
    Point estimate(2.0, 1.0);
    estimate = estimate + (Point(2.0, 0.0) - estimate) * (4.0 / 6.0);
    estimate = estimate + (Point(4.0, 1.0) - estimate) * (2.0 / 6.0);

    auto centroid = polyline.centroid();
    ASSERT_TRUE(centroid.has_value());
    EXPECT_DOUBLE_EQ(centroid->x, estimate.x);
    EXPECT_DOUBLE_EQ(centroid->y, estimate.y);
}

TEST(PolylineTest, SymmetricPolylineCentroid) {
    // Collinear along x: y never leaves the axis
    Polyline2 polyline({Point(-1.0, 0.0), Point(0.0, 0.0), Point(1.0, 0.0)});

    auto centroid = polyline.centroid();
    ASSERT_TRUE(centroid.has_value());
    EXPECT_DOUBLE_EQ(centroid->y, 0.0);
    EXPECT_NEAR(centroid->x, 0.125, 1e-12);
}

TEST(PolylineTest, Reverse) {
    Polyline2 polyline({Point(0.0, 0.0), Point(1.0, 0.0), Point(1.0, 1.0)});
    Polyline2 reversed = polyline.reverse();

    EXPECT_EQ(reversed.vertices().front(), Point(1.0, 1.0));
    EXPECT_EQ(reversed.vertices().back(), Point(0.0, 0.0));
    EXPECT_DOUBLE_EQ(reversed.length().value, polyline.length().value);
    EXPECT_EQ(reversed.reverse(), polyline);
}

TEST(PolylineTest, TransformAndFrames) {
    Polyline2 polyline({Point(0.0, 0.0), Point(1.0, 0.0), Point(1.0, 1.0)});

    Polyline2 moved = transform_by(Transform::translation(Vector(1.0, 2.0)), polyline);
    EXPECT_EQ(moved.vertices()[2], Point(2.0, 3.0));

    auto frame = Frame::at_point(Point(10.0, 10.0));
    Polyline2d<Unit, Local> local = relative_to(frame, polyline);
    EXPECT_EQ(local.vertices()[1], (Point2d<Unit, Local>(-9.0, -10.0)));
    EXPECT_EQ(place_in(frame, local), polyline);
}
