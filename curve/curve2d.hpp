#ifndef POLYCURVE_CURVE_CURVE2D_HPP
#define POLYCURVE_CURVE_CURVE2D_HPP

#include "arc2d.hpp"
#include "circle2d.hpp"
#include "cubic_spline2d.hpp"
#include "elliptical_arc2d.hpp"
#include "line_segment2d.hpp"
#include "quadratic_spline2d.hpp"
#include <cstdint>
#include <type_traits>
#include <variant>

namespace polycurve {

// Order matches the alternatives of Curve2d::Variant
enum class CurveKind : uint8_t {
    LineSegment,
    Arc,
    EllipticalArc,
    QuadraticSpline,
    CubicSpline
};

inline const char* curve_kind_name(CurveKind kind) {
    switch (kind) {
        case CurveKind::LineSegment: return "line_segment";
        case CurveKind::Arc: return "arc";
        case CurveKind::EllipticalArc: return "elliptical_arc";
        case CurveKind::QuadraticSpline: return "quadratic_spline";
        case CurveKind::CubicSpline: return "cubic_spline";
    }
    return "unknown";
}

// One of the five curve kinds, held by value. Every operation visits the
// active kind and wraps the result back into the same kind; a kind missing
// any operation fails to compile here.
template <typename Unit, typename Space>
class Curve2d {
public:
    using Point = Point2d<Unit, Space>;
    using Variant = std::variant<
        LineSegment2d<Unit, Space>,
        Arc2d<Unit, Space>,
        EllipticalArc2d<Unit, Space>,
        QuadraticSpline2d<Unit, Space>,
        CubicSpline2d<Unit, Space>
    >;

    Curve2d(const LineSegment2d<Unit, Space>& line) : curve_(line) {}
    Curve2d(const Arc2d<Unit, Space>& arc) : curve_(arc) {}
    Curve2d(const EllipticalArc2d<Unit, Space>& arc) : curve_(arc) {}
    Curve2d(const QuadraticSpline2d<Unit, Space>& spline) : curve_(spline) {}
    Curve2d(const CubicSpline2d<Unit, Space>& spline) : curve_(spline) {}

    // Degree conversions; there is no way back
    static Curve2d from_circle(const Circle2d<Unit, Space>& circle) {
        return Arc2d<Unit, Space>::from_circle(circle);
    }

    static Curve2d from_ellipse(const Ellipse2d<Unit, Space>& ellipse) {
        return EllipticalArc2d<Unit, Space>::from_ellipse(ellipse);
    }

    const Variant& variant() const { return curve_; }

    CurveKind kind() const { return static_cast<CurveKind>(curve_.index()); }

    template <typename Kind>
    const Kind* as() const { return std::get_if<Kind>(&curve_); }

    Point start_point() const {
        return std::visit([](const auto& c) -> Point { return c.start_point(); }, curve_);
    }

    Point end_point() const {
        return std::visit([](const auto& c) -> Point { return c.end_point(); }, curve_);
    }

    Point point_on(double t) const {
        return std::visit([t](const auto& c) -> Point { return c.point_on(t); }, curve_);
    }

    BoundingBox2d<Unit, Space> bounding_box() const {
        return std::visit([](const auto& c) { return c.bounding_box(); }, curve_);
    }

    Curve2d reverse() const {
        return std::visit([](const auto& c) { return Curve2d(c.reverse()); }, curve_);
    }

    Curve2d transform_by(const Transform2d<Unit, Space>& t) const {
        return std::visit([&t](const auto& c) { return Curve2d(c.transform_by(t)); }, curve_);
    }

    Curve2d translate_by(const Vector2d<Unit, Space>& displacement) const {
        return transform_by(Transform2d<Unit, Space>::translation(displacement));
    }

    Curve2d rotate_around(const Point& center, Angle angle) const {
        return transform_by(Transform2d<Unit, Space>::rotation_around(center, angle));
    }

    Curve2d mirror_across(const Axis2d<Unit, Space>& axis) const {
        return transform_by(Transform2d<Unit, Space>::mirror_across(axis));
    }

    Curve2d scale_about(const Point& center, double scale) const {
        return transform_by(Transform2d<Unit, Space>::scaling_about(center, scale));
    }

    template <typename Global>
    Curve2d<Unit, Global> place_in(const Frame2d<Unit, Global, Space>& frame) const {
        return std::visit([&frame](const auto& c) { return Curve2d<Unit, Global>(c.place_in(frame)); }, curve_);
    }

    template <typename Local>
    Curve2d<Unit, Local> relative_to(const Frame2d<Unit, Space, Local>& frame) const {
        return std::visit([&frame](const auto& c) { return Curve2d<Unit, Local>(c.relative_to(frame)); }, curve_);
    }

    template <typename To>
    Curve2d<To, Space> at(const Rate<To, Unit>& rate) const {
        return std::visit([&rate](const auto& c) { return Curve2d<To, Space>(c.at(rate)); }, curve_);
    }

    template <typename From>
    Curve2d<From, Space> at_(const Rate<Unit, From>& rate) const {
        return std::visit([&rate](const auto& c) { return Curve2d<From, Space>(c.at_(rate)); }, curve_);
    }

    Result<Polyline2d<Unit, Space>> segments(int num_segments) const {
        return std::visit([num_segments](const auto& c) { return c.segments(num_segments); }, curve_);
    }

    Result<int> num_approximation_segments(Quantity<Unit> max_error) const {
        return std::visit([max_error](const auto& c) { return c.num_approximation_segments(max_error); }, curve_);
    }

    Result<Polyline2d<Unit, Space>> approximate(Quantity<Unit> max_error) const {
        return std::visit([max_error](const auto& c) { return c.approximate(max_error); }, curve_);
    }

    bool operator==(const Curve2d& other) const { return curve_ == other.curve_; }
    bool operator!=(const Curve2d& other) const { return !(*this == other); }

private:
    Variant curve_;
};

}  // namespace polycurve

#endif // POLYCURVE_CURVE_CURVE2D_HPP
