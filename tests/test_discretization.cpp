#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include <curve/batch.hpp>
#include <cmath>
#include <limits>
#include <numbers>

using namespace polycurve;
using namespace polycurve::test;

// ============================================
// Argument checks
// ============================================

TEST(DiscretizationTest, CheckSegmentCount) {
    EXPECT_FALSE(discretization::check_segment_count(1).has_value());
    EXPECT_FALSE(discretization::check_segment_count(1000).has_value());

    auto error = discretization::check_segment_count(0);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::InvalidSegmentCount);
    EXPECT_NE(error->message.find("0"), std::string::npos);
}

TEST(DiscretizationTest, CheckMaxError) {
    EXPECT_FALSE(discretization::check_max_error(1e-12).has_value());

    for (double e : {0.0, -1.0, std::numeric_limits<double>::infinity(), std::nan("")}) {
        auto error = discretization::check_max_error(e);
        ASSERT_TRUE(error.has_value());
        EXPECT_EQ(error->kind, ErrorKind::InvalidTolerance);
    }
}

// ============================================
// Segment count formulas
// ============================================

TEST(DiscretizationTest, ArcSegmentCount) {
    // Half circle, radius 1: chord angle 2 acos(1 - 0.1) = 0.902
    auto n = discretization::arc_segment_count(1.0, std::numbers::pi, 0.1);
    ASSERT_TRUE(n.ok());
    EXPECT_EQ(n.value(), 4);
}

TEST(DiscretizationTest, ArcSegmentCountIgnoresSweepDirection) {
    auto ccw = discretization::arc_segment_count(3.0, 2.0, 0.01);
    auto cw = discretization::arc_segment_count(3.0, -2.0, 0.01);
    ASSERT_TRUE(ccw.ok());
    ASSERT_TRUE(cw.ok());
    EXPECT_EQ(ccw.value(), cw.value());
}

TEST(DiscretizationTest, ArcSegmentCountDegenerate) {
    EXPECT_EQ(discretization::arc_segment_count(0.0, 1.0, 0.01).value(), 1);
    EXPECT_EQ(discretization::arc_segment_count(1.0, 0.0, 0.01).value(), 1);
    EXPECT_EQ(discretization::arc_segment_count(1.0, 6.0, 2.0).value(), 1);
    EXPECT_EQ(discretization::arc_segment_count(1.0, 6.0, 5.0).value(), 1);
}

TEST(DiscretizationTest, SecondDerivativeSegmentCount) {
    // 1.5 * sqrt(10 / 0.08) = 16.77
    auto n = discretization::second_derivative_segment_count(10.0, 1.5, 0.01);
    ASSERT_TRUE(n.ok());
    EXPECT_EQ(n.value(), 17);

    EXPECT_EQ(discretization::second_derivative_segment_count(0.0, 1.0, 0.01).value(), 1);
    EXPECT_EQ(discretization::second_derivative_segment_count(10.0, 0.0, 0.01).value(), 1);
}

TEST(DiscretizationTest, HugeCountIsRejected) {
    auto n = discretization::second_derivative_segment_count(1e300, 1.0, 1e-300);
    ASSERT_FALSE(n.ok());
    EXPECT_EQ(n.error().kind, ErrorKind::InvalidTolerance);
}

TEST(DiscretizationTest, SegmentCountCap) {
    // sqrt(8 / (8 e)) with e = 2^-40 is exactly 2^20
    auto at_cap = discretization::second_derivative_segment_count(8.0, 1.0, std::ldexp(1.0, -40));
    ASSERT_TRUE(at_cap.ok());
    EXPECT_EQ(at_cap.value(), discretization::MAX_SEGMENTS);

    auto above_cap = discretization::second_derivative_segment_count(8.0, 1.0, std::ldexp(1.0, -42));
    ASSERT_FALSE(above_cap.ok());
    EXPECT_EQ(above_cap.error().kind, ErrorKind::InvalidTolerance);

    auto arc = discretization::arc_segment_count(1000.0, 6.0, 1e-12);
    ASSERT_FALSE(arc.ok());
    EXPECT_EQ(arc.error().kind, ErrorKind::InvalidTolerance);
}

TEST(DiscretizationTest, TinyToleranceFailsWithoutSampling) {
    // Needs about 7e8 segments
    Curve spline = QuadraticSpline2d<Unit, Global>(Point(0.0, 0.0), Point(5.0, 10.0), Point(10.0, 0.0));

    auto n = spline.num_approximation_segments(mm(1e-17));
    ASSERT_FALSE(n.ok());
    EXPECT_EQ(n.error().kind, ErrorKind::InvalidTolerance);

    auto polyline = spline.approximate(mm(1e-17));
    ASSERT_FALSE(polyline.ok());
    EXPECT_EQ(polyline.error().kind, ErrorKind::InvalidTolerance);
}

TEST(DiscretizationTest, InvalidToleranceBeforeDegenerateShortcut) {
    auto arc = discretization::arc_segment_count(0.0, 0.0, -1.0);
    ASSERT_FALSE(arc.ok());
    EXPECT_EQ(arc.error().kind, ErrorKind::InvalidTolerance);

    auto spline = discretization::second_derivative_segment_count(0.0, 1.0, 0.0);
    ASSERT_FALSE(spline.ok());
    EXPECT_EQ(spline.error().kind, ErrorKind::InvalidTolerance);
}

// ============================================
// Result Tests
// ============================================

TEST(ResultTest, MapAndThen) {
    Result<int> three = 3;
    Result<int> failed = CurveError{ErrorKind::InvalidSegmentCount, "bad"};

    auto doubled = three.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.ok());
    EXPECT_EQ(doubled.value(), 6);

    auto chained = failed.and_then([](int v) -> Result<int> { return v + 1; });
    ASSERT_FALSE(chained.ok());
    EXPECT_EQ(chained.error().message, "bad");

    EXPECT_THROW(three.error(), std::runtime_error);
    EXPECT_STREQ(error_kind_name(ErrorKind::InvalidTolerance), "invalid_tolerance");
}

// ============================================
// Batch Tests
// ============================================

TEST(BatchTest, ApproximateAllKeepsOrder) {
    auto curves = sample_curves();
    DiscretizationConfig config;
    config.max_error = 0.05;

    auto results = approximate_all(curves, config);
    ASSERT_EQ(results.size(), curves.size());
    for (size_t i = 0; i < curves.size(); ++i) {
        ASSERT_TRUE(results[i].ok());
        EXPECT_EQ(results[i].value(), curves[i].approximate(mm(0.05)).value());
    }
}

TEST(BatchTest, FixedSegmentCount) {
    auto curves = sample_curves();
    DiscretizationConfig config;
    config.segments = 7;

    auto results = approximate_all(curves, config);
    for (const auto& result : results) {
        ASSERT_TRUE(result.ok());
        EXPECT_EQ(result.value().vertex_count(), 8u);
    }
}

TEST(BatchTest, NegativeSegmentCountFails) {
    auto curves = sample_curves();
    DiscretizationConfig config;
    config.segments = -3;

    for (const auto& result : approximate_all(curves, config)) {
        ASSERT_FALSE(result.ok());
        EXPECT_EQ(result.error().kind, ErrorKind::InvalidSegmentCount);
    }
}

TEST(BatchTest, ManyCurvesInParallel) {
    std::vector<Curve> curves;
    for (int i = 0; i < 64; ++i) {
        curves.push_back(Arc2d<Unit, Global>(Point(i, 0.0), mm(1.0 + i), Angle::zero(), Angle(0.1 * (i + 1))));
    }
    DiscretizationConfig config;
    config.max_error = 0.01;
    config.num_threads = 4;

    auto results = approximate_all(curves, config);
    ASSERT_EQ(results.size(), 64u);
    for (size_t i = 0; i < curves.size(); ++i) {
        ASSERT_TRUE(results[i].ok());
        EXPECT_EQ(results[i].value().vertices().front(), curves[i].start_point());
        EXPECT_EQ(results[i].value().vertex_count(),
                  static_cast<size_t>(curves[i].num_approximation_segments(mm(0.01)).value()) + 1);
    }
}

TEST(BatchTest, ErrorsStayInTheirSlot) {
    auto curves = sample_curves();
    DiscretizationConfig config;
    config.max_error = -1.0;

    auto results = approximate_all(curves, config);
    // The line segment ignores the tolerance
    EXPECT_TRUE(results[0].ok());
    for (size_t i = 1; i < results.size(); ++i) {
        ASSERT_FALSE(results[i].ok());
        EXPECT_EQ(results[i].error().kind, ErrorKind::InvalidTolerance);
    }
}
