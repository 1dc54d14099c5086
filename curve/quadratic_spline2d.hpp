#ifndef POLYCURVE_CURVE_QUADRATIC_SPLINE2D_HPP
#define POLYCURVE_CURVE_QUADRATIC_SPLINE2D_HPP

#include "discretization.hpp"
#include <math/bounding_box.hpp>
#include <math/frame2d.hpp>
#include <math/transform2d.hpp>
#include <array>

namespace polycurve {

// Quadratic Bezier curve with three control points
template <typename Unit, typename Space>
class QuadraticSpline2d {
public:
    using Point = Point2d<Unit, Space>;
    using Vector = Vector2d<Unit, Space>;

    QuadraticSpline2d(const Point& p0, const Point& p1, const Point& p2)
        : control_points_{p0, p1, p2} {}

    const std::array<Point, 3>& control_points() const { return control_points_; }

    const Point& start_point() const { return control_points_[0]; }
    const Point& end_point() const { return control_points_[2]; }

    Point point_on(double t) const {
        double u = 1.0 - t;
        double b0 = u * u;
        double b1 = 2.0 * u * t;
        double b2 = t * t;
        const auto& p = control_points_;
        return {p[0].x * b0 + p[1].x * b1 + p[2].x * b2,
                p[0].y * b0 + p[1].y * b1 + p[2].y * b2};
    }

    Vector first_derivative(double t) const {
        const auto& p = control_points_;
        return (p[1] - p[0]) * (2.0 * (1.0 - t)) + (p[2] - p[1]) * (2.0 * t);
    }

    // Constant over the whole curve
    Vector second_derivative() const {
        const auto& p = control_points_;
        return ((p[2] - p[1]) - (p[1] - p[0])) * 2.0;
    }

    QuadraticSpline2d reverse() const {
        return QuadraticSpline2d(control_points_[2], control_points_[1], control_points_[0]);
    }

    QuadraticSpline2d transform_by(const Transform2d<Unit, Space>& t) const {
        return map_control_points([&t](const Point& p) { return t.apply(p); });
    }

    template <typename Global>
    QuadraticSpline2d<Unit, Global> place_in(const Frame2d<Unit, Global, Space>& frame) const {
        return map_control_points([&frame](const Point& p) { return frame.place_in(p); });
    }

    template <typename Local>
    QuadraticSpline2d<Unit, Local> relative_to(const Frame2d<Unit, Space, Local>& frame) const {
        return map_control_points([&frame](const Point& p) { return frame.relative_to(p); });
    }

    template <typename To>
    QuadraticSpline2d<To, Space> at(const Rate<To, Unit>& rate) const {
        return map_control_points([&rate](const Point& p) { return polycurve::at(rate, p); });
    }

    template <typename From>
    QuadraticSpline2d<From, Space> at_(const Rate<Unit, From>& rate) const {
        return map_control_points([&rate](const Point& p) { return polycurve::at_(rate, p); });
    }

    // Control point hull; contains the curve by the convex hull property
    BoundingBox2d<Unit, Space> bounding_box() const {
        return BoundingBox2d<Unit, Space>::constant(control_points_[0])
            .include(control_points_[1])
            .include(control_points_[2]);
    }

    Result<Polyline2d<Unit, Space>> segments(int num_segments) const {
        return discretization::sample<Unit, Space>(*this, num_segments);
    }

    Result<int> num_approximation_segments(Quantity<Unit> max_error) const {
        return discretization::second_derivative_segment_count(
            second_derivative().length().value, 1.0, max_error.value);
    }

    Result<Polyline2d<Unit, Space>> approximate(Quantity<Unit> max_error) const {
        return num_approximation_segments(max_error).and_then(
            [this](int n) { return segments(n); });
    }

    bool operator==(const QuadraticSpline2d& other) const {
        return control_points_ == other.control_points_;
    }

private:
    template <typename F>
    auto map_control_points(F&& f) const {
        return make_spline(f(control_points_[0]), f(control_points_[1]), f(control_points_[2]));
    }

    template <typename U, typename S>
    static QuadraticSpline2d<U, S> make_spline(const Point2d<U, S>& p0, const Point2d<U, S>& p1,
                                               const Point2d<U, S>& p2) {
        return QuadraticSpline2d<U, S>(p0, p1, p2);
    }

    std::array<Point, 3> control_points_;
};

}  // namespace polycurve

#endif // POLYCURVE_CURVE_QUADRATIC_SPLINE2D_HPP
