#ifndef POLYCURVE_CURVE_CUBIC_SPLINE2D_HPP
#define POLYCURVE_CURVE_CUBIC_SPLINE2D_HPP

#include "discretization.hpp"
#include <math/bounding_box.hpp>
#include <math/frame2d.hpp>
#include <math/transform2d.hpp>
#include <algorithm>
#include <array>
#include <utility>

namespace polycurve {

// Cubic Bezier curve with four control points
template <typename Unit, typename Space>
class CubicSpline2d {
public:
    using Point = Point2d<Unit, Space>;
    using Vector = Vector2d<Unit, Space>;

    CubicSpline2d(const Point& p0, const Point& p1, const Point& p2, const Point& p3)
        : control_points_{p0, p1, p2, p3} {}

    // Create from Hermite data (positions and derivatives at the endpoints)
    static CubicSpline2d from_hermite(const Point& p0, const Vector& derivative0,
                                      const Point& p1, const Vector& derivative1) {
        return CubicSpline2d(p0, p0 + derivative0 / 3.0, p1 - derivative1 / 3.0, p1);
    }

    const std::array<Point, 4>& control_points() const { return control_points_; }

    const Point& start_point() const { return control_points_[0]; }
    const Point& end_point() const { return control_points_[3]; }

    Point point_on(double t) const {
        double u = 1.0 - t;
        double tt = t * t;
        double uu = u * u;
        double b0 = uu * u;
        double b1 = 3.0 * uu * t;
        double b2 = 3.0 * u * tt;
        double b3 = tt * t;
        const auto& p = control_points_;
        return {p[0].x * b0 + p[1].x * b1 + p[2].x * b2 + p[3].x * b3,
                p[0].y * b0 + p[1].y * b1 + p[2].y * b2 + p[3].y * b3};
    }

    Vector first_derivative(double t) const {
        double u = 1.0 - t;
        const auto& p = control_points_;
        Vector d0 = p[1] - p[0];
        Vector d1 = p[2] - p[1];
        Vector d2 = p[3] - p[2];
        return d0 * (3.0 * u * u) + d1 * (6.0 * u * t) + d2 * (3.0 * t * t);
    }

    Vector second_derivative(double t) const {
        auto [dd0, dd1] = second_differences();
        return dd0 * (6.0 * (1.0 - t)) + dd1 * (6.0 * t);
    }

    // Split at parameter t into two curves (de Casteljau)
    std::pair<CubicSpline2d, CubicSpline2d> split(double t) const {
        const auto& p = control_points_;
        Point p01 = lerp(p[0], p[1], t);
        Point p12 = lerp(p[1], p[2], t);
        Point p23 = lerp(p[2], p[3], t);
        Point p012 = lerp(p01, p12, t);
        Point p123 = lerp(p12, p23, t);
        Point p0123 = lerp(p012, p123, t);
        return {CubicSpline2d(p[0], p01, p012, p0123), CubicSpline2d(p0123, p123, p23, p[3])};
    }

    CubicSpline2d reverse() const {
        return CubicSpline2d(control_points_[3], control_points_[2],
                             control_points_[1], control_points_[0]);
    }

    CubicSpline2d transform_by(const Transform2d<Unit, Space>& t) const {
        return map_control_points([&t](const Point& p) { return t.apply(p); });
    }

    template <typename Global>
    CubicSpline2d<Unit, Global> place_in(const Frame2d<Unit, Global, Space>& frame) const {
        return map_control_points([&frame](const Point& p) { return frame.place_in(p); });
    }

    template <typename Local>
    CubicSpline2d<Unit, Local> relative_to(const Frame2d<Unit, Space, Local>& frame) const {
        return map_control_points([&frame](const Point& p) { return frame.relative_to(p); });
    }

    template <typename To>
    CubicSpline2d<To, Space> at(const Rate<To, Unit>& rate) const {
        return map_control_points([&rate](const Point& p) { return polycurve::at(rate, p); });
    }

    template <typename From>
    CubicSpline2d<From, Space> at_(const Rate<Unit, From>& rate) const {
        return map_control_points([&rate](const Point& p) { return polycurve::at_(rate, p); });
    }

    // Control point hull; contains the curve by the convex hull property
    BoundingBox2d<Unit, Space> bounding_box() const {
        return BoundingBox2d<Unit, Space>::constant(control_points_[0])
            .include(control_points_[1])
            .include(control_points_[2])
            .include(control_points_[3]);
    }

    // p'' is linear in t, so its largest magnitude is at t = 0 or t = 1
    Quantity<Unit> max_second_derivative() const {
        auto [dd0, dd1] = second_differences();
        return polycurve::max(dd0.length(), dd1.length()) * 6.0;
    }

    Result<Polyline2d<Unit, Space>> segments(int num_segments) const {
        return discretization::sample<Unit, Space>(*this, num_segments);
    }

    Result<int> num_approximation_segments(Quantity<Unit> max_error) const {
        return discretization::second_derivative_segment_count(
            max_second_derivative().value, 1.0, max_error.value);
    }

    Result<Polyline2d<Unit, Space>> approximate(Quantity<Unit> max_error) const {
        return num_approximation_segments(max_error).and_then(
            [this](int n) { return segments(n); });
    }

    bool operator==(const CubicSpline2d& other) const {
        return control_points_ == other.control_points_;
    }

private:
    // p0 - 2 p1 + p2 and p1 - 2 p2 + p3
    std::pair<Vector, Vector> second_differences() const {
        const auto& p = control_points_;
        return {(p[2] - p[1]) - (p[1] - p[0]), (p[3] - p[2]) - (p[2] - p[1])};
    }

    template <typename F>
    auto map_control_points(F&& f) const {
        return make_spline(f(control_points_[0]), f(control_points_[1]),
                           f(control_points_[2]), f(control_points_[3]));
    }

    template <typename U, typename S>
    static CubicSpline2d<U, S> make_spline(const Point2d<U, S>& p0, const Point2d<U, S>& p1,
                                           const Point2d<U, S>& p2, const Point2d<U, S>& p3) {
        return CubicSpline2d<U, S>(p0, p1, p2, p3);
    }

    std::array<Point, 4> control_points_;
};

}  // namespace polycurve

#endif // POLYCURVE_CURVE_CUBIC_SPLINE2D_HPP
