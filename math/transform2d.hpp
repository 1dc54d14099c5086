#ifndef POLYCURVE_MATH_TRANSFORM2D_HPP
#define POLYCURVE_MATH_TRANSFORM2D_HPP

#include "vec2.hpp"
#include <cmath>

namespace polycurve {

// Oriented line: origin point plus direction
template <typename Unit, typename Space>
struct Axis2d {
    Point2d<Unit, Space> origin;
    Direction2d<Space> direction;

    static constexpr Axis2d x() { return {Point2d<Unit, Space>::origin(), Direction2d<Space>::x_axis()}; }
    static constexpr Axis2d y() { return {Point2d<Unit, Space>::origin(), Direction2d<Space>::y_axis()}; }
};

// Similarity map of a space onto itself: p' = L p + t, where L is a uniform
// scale times a rotation or a reflection. Only the named constructors and
// `then` build one, so circular arcs stay circular under every transform.
template <typename Unit, typename Space>
class Transform2d {
public:
    using Point = Point2d<Unit, Space>;
    using Vector = Vector2d<Unit, Space>;

    constexpr Transform2d() = default;

    static constexpr Transform2d identity() { return Transform2d(); }

    static constexpr Transform2d translation(const Vector& v) {
        return Transform2d(1.0, 0.0, 0.0, 1.0, v.x, v.y);
    }

    static Transform2d rotation_around(const Point& center, Angle angle) {
        double c = angle.cos();
        double s = angle.sin();
        return fixing_point(center, c, -s, s, c);
    }

    static Transform2d mirror_across(const Axis2d<Unit, Space>& axis) {
        double dx = axis.direction.x;
        double dy = axis.direction.y;
        return fixing_point(axis.origin,
                            dx * dx - dy * dy, 2.0 * dx * dy,
                            2.0 * dx * dy, dy * dy - dx * dx);
    }

    static constexpr Transform2d scaling_about(const Point& center, double scale) {
        return fixing_point(center, scale, 0.0, 0.0, scale);
    }

    constexpr Point apply(const Point& p) const {
        return {m00_ * p.x + m01_ * p.y + tx_, m10_ * p.x + m11_ * p.y + ty_};
    }

    constexpr Vector apply(const Vector& v) const {
        return {m00_ * v.x + m01_ * v.y, m10_ * v.x + m11_ * v.y};
    }

    constexpr double determinant() const {
        return m00_ * m11_ - m01_ * m10_;
    }

    double scale_factor() const {
        return std::sqrt(std::abs(determinant()));
    }

    constexpr bool preserves_orientation() const {
        return determinant() >= 0.0;
    }

    // Angle of the image of the x axis
    Angle rotation() const {
        return atan2(m10_, m00_);
    }

    // Apply `this` first, then `next`
    constexpr Transform2d then(const Transform2d& next) const {
        return Transform2d(next.m00_ * m00_ + next.m01_ * m10_, next.m00_ * m01_ + next.m01_ * m11_,
                           next.m10_ * m00_ + next.m11_ * m10_, next.m10_ * m01_ + next.m11_ * m11_,
                           next.m00_ * tx_ + next.m01_ * ty_ + next.tx_,
                           next.m10_ * tx_ + next.m11_ * ty_ + next.ty_);
    }

private:
    double m00_ = 1.0;
    double m01_ = 0.0;
    double m10_ = 0.0;
    double m11_ = 1.0;
    double tx_ = 0.0;
    double ty_ = 0.0;

    constexpr Transform2d(double m00, double m01, double m10, double m11, double tx, double ty)
        : m00_(m00), m01_(m01), m10_(m10), m11_(m11), tx_(tx), ty_(ty) {}

    // Linear map L with `center` as its fixed point
    static constexpr Transform2d fixing_point(const Point& center, double a, double b, double c, double d) {
        return Transform2d(a, b, c, d,
                           center.x - (a * center.x + b * center.y),
                           center.y - (c * center.x + d * center.y));
    }
};

}  // namespace polycurve

#endif // POLYCURVE_MATH_TRANSFORM2D_HPP
