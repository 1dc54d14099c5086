#ifndef POLYCURVE_CURVE_ELLIPTICAL_ARC2D_HPP
#define POLYCURVE_CURVE_ELLIPTICAL_ARC2D_HPP

#include "arc2d.hpp"
#include "circle2d.hpp"
#include "discretization.hpp"
#include <math/bounding_box.hpp>
#include <math/frame2d.hpp>
#include <math/transform2d.hpp>
#include <cmath>
#include <numbers>

namespace polycurve {

// center + x_vector * cos(a) + y_vector * sin(a) for a from start_angle to
// end_angle. The two vectors need not be perpendicular, so any affine
// transform keeps an elliptical arc elliptical.
template <typename Unit, typename Space>
class EllipticalArc2d {
public:
    using Point = Point2d<Unit, Space>;
    using Vector = Vector2d<Unit, Space>;

    EllipticalArc2d(const Point& center, const Vector& x_vector, const Vector& y_vector,
                    Angle start_angle, Angle end_angle)
        : center_(center), x_vector_(x_vector), y_vector_(y_vector),
          start_angle_(start_angle), end_angle_(end_angle) {}

    static EllipticalArc2d from_ellipse(const Ellipse2d<Unit, Space>& ellipse) {
        return EllipticalArc2d(ellipse.center,
                               ellipse.x_direction * ellipse.x_radius,
                               ellipse.x_direction.rotate_left() * ellipse.y_radius,
                               Angle::zero(), Angle::full_turn());
    }

    static EllipticalArc2d from_arc(const Arc2d<Unit, Space>& arc) {
        double r = arc.radius().value;
        return EllipticalArc2d(arc.center_point(), Vector(r, 0.0), Vector(0.0, r),
                               arc.start_angle(), arc.end_angle());
    }

    const Point& center_point() const { return center_; }
    const Vector& x_vector() const { return x_vector_; }
    const Vector& y_vector() const { return y_vector_; }
    Angle start_angle() const { return start_angle_; }
    Angle end_angle() const { return end_angle_; }
    Angle swept_angle() const { return end_angle_ - start_angle_; }

    Point point_at_angle(Angle a) const {
        double c = a.cos();
        double s = a.sin();
        return {center_.x + x_vector_.x * c + y_vector_.x * s,
                center_.y + x_vector_.y * c + y_vector_.y * s};
    }

    Point start_point() const { return point_at_angle(start_angle_); }
    Point end_point() const { return point_at_angle(end_angle_); }

    // Uniform in the ellipse parameter angle
    Point point_on(double t) const {
        return point_at_angle(interpolate(start_angle_, end_angle_, t));
    }

    EllipticalArc2d reverse() const {
        return EllipticalArc2d(center_, x_vector_, y_vector_, end_angle_, start_angle_);
    }

    EllipticalArc2d transform_by(const Transform2d<Unit, Space>& t) const {
        return EllipticalArc2d(t.apply(center_), t.apply(x_vector_), t.apply(y_vector_),
                               start_angle_, end_angle_);
    }

    template <typename Global>
    EllipticalArc2d<Unit, Global> place_in(const Frame2d<Unit, Global, Space>& frame) const {
        return {frame.place_in(center_), frame.place_in(x_vector_), frame.place_in(y_vector_),
                start_angle_, end_angle_};
    }

    template <typename Local>
    EllipticalArc2d<Unit, Local> relative_to(const Frame2d<Unit, Space, Local>& frame) const {
        return {frame.relative_to(center_), frame.relative_to(x_vector_), frame.relative_to(y_vector_),
                start_angle_, end_angle_};
    }

    template <typename To>
    EllipticalArc2d<To, Space> at(const Rate<To, Unit>& rate) const {
        return {polycurve::at(rate, center_), polycurve::at(rate, x_vector_), polycurve::at(rate, y_vector_),
                start_angle_, end_angle_};
    }

    template <typename From>
    EllipticalArc2d<From, Space> at_(const Rate<Unit, From>& rate) const {
        return {polycurve::at_(rate, center_), polycurve::at_(rate, x_vector_), polycurve::at_(rate, y_vector_),
                start_angle_, end_angle_};
    }

    // Largest singular value of [x_vector y_vector]: the major semi-axis
    // length, and the maximum of |p''(a)| over all a
    Quantity<Unit> major_radius() const {
        double a2 = x_vector_.length_squared();
        double b2 = y_vector_.length_squared();
        double ab = x_vector_.dot(y_vector_);
        double d = std::sqrt((a2 - b2) * (a2 - b2) + 4.0 * ab * ab);
        return Quantity<Unit>(std::sqrt((a2 + b2 + d) * 0.5));
    }

    // Endpoints plus the per-axis extremes inside the angle range. Along x,
    // x_vector.x cos(a) + y_vector.x sin(a) peaks at atan2(y_vector.x, x_vector.x) + k pi.
    BoundingBox2d<Unit, Space> bounding_box() const {
        auto box = BoundingBox2d<Unit, Space>::hull(start_point(), end_point());
        Angle lo(std::min(start_angle_.radians, end_angle_.radians));
        Angle hi(std::max(start_angle_.radians, end_angle_.radians));
        for (Angle base : {atan2(y_vector_.x, x_vector_.x), atan2(y_vector_.y, x_vector_.y)}) {
            for (Angle a : periodic_angles_between(base, std::numbers::pi, lo, hi)) {
                box = box.include(point_at_angle(a));
            }
        }
        return box;
    }

    Result<Polyline2d<Unit, Space>> segments(int num_segments) const {
        return discretization::sample<Unit, Space>(*this, num_segments);
    }

    Result<int> num_approximation_segments(Quantity<Unit> max_error) const {
        return discretization::second_derivative_segment_count(
            major_radius().value, swept_angle().radians, max_error.value);
    }

    Result<Polyline2d<Unit, Space>> approximate(Quantity<Unit> max_error) const {
        return num_approximation_segments(max_error).and_then(
            [this](int n) { return segments(n); });
    }

    bool operator==(const EllipticalArc2d& other) const {
        return center_ == other.center_ && x_vector_ == other.x_vector_ &&
               y_vector_ == other.y_vector_ && start_angle_ == other.start_angle_ &&
               end_angle_ == other.end_angle_;
    }

private:
    Point center_;
    Vector x_vector_;
    Vector y_vector_;
    Angle start_angle_;
    Angle end_angle_;
};

}  // namespace polycurve

#endif // POLYCURVE_CURVE_ELLIPTICAL_ARC2D_HPP
