#ifndef POLYCURVE_MATH_FRAME2D_HPP
#define POLYCURVE_MATH_FRAME2D_HPP

#include "vec2.hpp"

namespace polycurve {

// Right-handed local coordinate system (Local) defined inside Global.
// place_in() maps Local coordinates to Global ones, relative_to() is its inverse.
template <typename Unit, typename Global, typename Local>
struct Frame2d {
    Point2d<Unit, Global> origin;
    Direction2d<Global> x_direction = Direction2d<Global>::x_axis();

    static constexpr Frame2d at_origin() {
        return {Point2d<Unit, Global>::origin(), Direction2d<Global>::x_axis()};
    }

    static constexpr Frame2d at_point(const Point2d<Unit, Global>& p) {
        return {p, Direction2d<Global>::x_axis()};
    }

    static Frame2d from_x_axis(const Point2d<Unit, Global>& p, Angle rotation) {
        return {p, Direction2d<Global>::from_angle(rotation)};
    }

    constexpr Direction2d<Global> y_direction() const {
        return x_direction.rotate_left();
    }

    // Rotation of the frame's x axis relative to Global's
    Angle rotation() const {
        return x_direction.angle();
    }

    constexpr Vector2d<Unit, Global> place_in(const Vector2d<Unit, Local>& v) const {
        Direction2d<Global> yd = y_direction();
        return {v.x * x_direction.x + v.y * yd.x, v.x * x_direction.y + v.y * yd.y};
    }

    constexpr Point2d<Unit, Global> place_in(const Point2d<Unit, Local>& p) const {
        return origin + place_in(Vector2d<Unit, Local>(p.x, p.y));
    }

    constexpr Vector2d<Unit, Local> relative_to(const Vector2d<Unit, Global>& v) const {
        Direction2d<Global> yd = y_direction();
        return {v.x * x_direction.x + v.y * x_direction.y, v.x * yd.x + v.y * yd.y};
    }

    constexpr Point2d<Unit, Local> relative_to(const Point2d<Unit, Global>& p) const {
        Vector2d<Unit, Local> v = relative_to(p - origin);
        return {v.x, v.y};
    }
};

}  // namespace polycurve

#endif // POLYCURVE_MATH_FRAME2D_HPP
