#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include <cmath>
#include <numbers>

using namespace polycurve;
using namespace polycurve::test;

using EllipticalArc = EllipticalArc2d<Unit, Global>;

// ============================================
// EllipticalArc2d Tests
// ============================================

TEST(EllipticalArcTest, FromEllipse) {
    Ellipse2d<Unit, Global> ellipse{Point(1.0, 2.0), Direction2d<Global>::x_axis(), mm(3.0), mm(1.0)};
    EllipticalArc arc = EllipticalArc::from_ellipse(ellipse);

    EXPECT_EQ(arc.x_vector(), Vector(3.0, 0.0));
    EXPECT_EQ(arc.y_vector(), Vector(0.0, 1.0));
    EXPECT_DOUBLE_EQ(arc.swept_angle().radians, 2.0 * std::numbers::pi);
    EXPECT_EQ(arc.start_point(), Point(4.0, 2.0));

    Point top = arc.point_at_angle(Angle::quarter_turn());
    EXPECT_NEAR(top.x, 1.0, 1e-12);
    EXPECT_NEAR(top.y, 3.0, 1e-12);
}

TEST(EllipticalArcTest, FromArcTracesTheSamePoints) {
    Arc2d<Unit, Global> arc(Point(1.0, -1.0), mm(2.5), Angle(0.4), Angle(2.2));
    EllipticalArc elliptical = EllipticalArc::from_arc(arc);

    for (int i = 0; i <= 10; ++i) {
        double t = i / 10.0;
        EXPECT_TRUE(points_near(elliptical.point_on(t), arc.point_on(t), 1e-12));
    }
}

TEST(EllipticalArcTest, MajorRadius) {
    EllipticalArc axis_aligned(Point(0.0, 0.0), Vector(3.0, 0.0), Vector(0.0, 1.0),
                               Angle::zero(), Angle::full_turn());
    EXPECT_DOUBLE_EQ(axis_aligned.major_radius().value, 3.0);

    // Perpendicular but rotated axes
    EllipticalArc rotated(Point(0.0, 0.0), Vector(4.0, 1.0), Vector(-0.5, 2.0),
                          Angle::zero(), Angle::full_turn());
    EXPECT_NEAR(rotated.major_radius().value, std::sqrt(17.0), 1e-12);

    // Skewed axes: the major radius is the largest singular value
    EllipticalArc skewed(Point(0.0, 0.0), Vector(1.0, 0.0), Vector(1.0, 1.0),
                         Angle::zero(), Angle::full_turn());
    double expected = std::sqrt((3.0 + std::sqrt(5.0)) / 2.0);
    EXPECT_NEAR(skewed.major_radius().value, expected, 1e-12);
}

TEST(EllipticalArcTest, SegmentCount) {
    EllipticalArc arc(Point(0.0, 0.0), Vector(4.0, 1.0), Vector(-0.5, 2.0), Angle(0.2), Angle(4.0));

    auto n = arc.num_approximation_segments(mm(0.01));
    ASSERT_TRUE(n.ok());
    EXPECT_EQ(n.value(), 28);
}

TEST(EllipticalArcTest, ApproximationStaysWithinTolerance) {
    EllipticalArc arc(Point(2.0, -1.0), Vector(6.0, 0.5), Vector(1.0, 2.0), Angle(-0.5), Angle(5.0));
    Curve curve = arc;

    for (double e : {0.5, 0.05, 0.005}) {
        auto polyline = arc.approximate(mm(e));
        ASSERT_TRUE(polyline.ok());
        EXPECT_LE(max_deviation(curve, polyline.value()), e + 1e-9);
    }
}

TEST(EllipticalArcTest, InvalidTolerance) {
    EllipticalArc arc(Point(0.0, 0.0), Vector(3.0, 0.0), Vector(0.0, 1.0), Angle::zero(), Angle::half_turn());

    auto result = arc.approximate(mm(-0.1));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidTolerance);
}

// ============================================
// Bounding box
// ============================================

TEST(EllipticalArcTest, BoundingBoxFullEllipse) {
    EllipticalArc arc(Point(0.0, 0.0), Vector(3.0, 0.0), Vector(0.0, 1.0),
                      Angle::zero(), Angle::full_turn());

    auto box = arc.bounding_box();
    EXPECT_NEAR(box.min_x, -3.0, 1e-12);
    EXPECT_NEAR(box.max_x, 3.0, 1e-12);
    EXPECT_NEAR(box.min_y, -1.0, 1e-12);
    EXPECT_NEAR(box.max_y, 1.0, 1e-12);
}

TEST(EllipticalArcTest, BoundingBoxRotatedEllipseIsTight) {
    EllipticalArc arc(Point(1.0, 1.0), Vector(4.0, 1.0), Vector(-0.5, 2.0),
                      Angle::zero(), Angle::full_turn());

    double half_x = std::sqrt(16.0 + 0.25);
    double half_y = std::sqrt(1.0 + 4.0);

    auto box = arc.bounding_box();
    EXPECT_NEAR(box.min_x, 1.0 - half_x, 1e-9);
    EXPECT_NEAR(box.max_x, 1.0 + half_x, 1e-9);
    EXPECT_NEAR(box.min_y, 1.0 - half_y, 1e-9);
    EXPECT_NEAR(box.max_y, 1.0 + half_y, 1e-9);
}

TEST(EllipticalArcTest, BoundingBoxContainsSamples) {
    EllipticalArc arc(Point(2.0, -1.0), Vector(6.0, 0.5), Vector(1.0, 2.0), Angle(-0.5), Angle(2.0));

    auto box = arc.bounding_box();
    for (int i = 0; i <= 200; ++i) {
        EXPECT_TRUE(box.contains(arc.point_on(i / 200.0), 1e-12));
    }
}

// ============================================
// Transforms
// ============================================

TEST(EllipticalArcTest, ComposedTransformKeepsPointsOnCurve) {
    EllipticalArc arc(Point(1.0, 0.0), Vector(2.0, 0.0), Vector(0.0, 1.0), Angle(0.1), Angle(2.8));

    auto t = Transform::rotation_around(Point(1.0, 1.0), Angle(0.4))
                 .then(Transform::mirror_across(Axis2d<Unit, Global>::y()))
                 .then(Transform::scaling_about(Point(0.0, 0.0), 2.5))
                 .then(Transform::translation(Vector(3.0, -1.0)));
    EllipticalArc moved = arc.transform_by(t);

    for (int i = 0; i <= 10; ++i) {
        double u = i / 10.0;
        EXPECT_TRUE(points_near(moved.point_on(u), t.apply(arc.point_on(u)), 1e-12));
    }
}

TEST(EllipticalArcTest, FrameRoundTrip) {
    EllipticalArc arc(Point(1.0, 0.0), Vector(2.0, 0.0), Vector(0.0, 1.0), Angle(0.1), Angle(2.8));
    auto frame = Frame::from_x_axis(Point(5.0, -2.0), Angle(0.7));

    EllipticalArc2d<Unit, Local> local = arc.relative_to(frame);
    EllipticalArc back = local.place_in(frame);

    EXPECT_TRUE(points_near(back.center_point(), arc.center_point(), 1e-12));
    EXPECT_NEAR(back.x_vector().x, arc.x_vector().x, 1e-12);
    EXPECT_NEAR(back.y_vector().y, arc.y_vector().y, 1e-12);
    EXPECT_EQ(back.start_angle(), arc.start_angle());
}
