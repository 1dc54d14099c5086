#ifndef POLYCURVE_CURVE_CIRCLE2D_HPP
#define POLYCURVE_CURVE_CIRCLE2D_HPP

#include <math/vec2.hpp>

namespace polycurve {

// Full circle. Only used as input to the circle -> arc conversion.
template <typename Unit, typename Space>
struct Circle2d {
    Point2d<Unit, Space> center;
    Quantity<Unit> radius;
};

// Full ellipse with semi-axes along x_direction and its left perpendicular.
// Only used as input to the ellipse -> elliptical arc conversion.
template <typename Unit, typename Space>
struct Ellipse2d {
    Point2d<Unit, Space> center;
    Direction2d<Space> x_direction;
    Quantity<Unit> x_radius;
    Quantity<Unit> y_radius;
};

}  // namespace polycurve

#endif // POLYCURVE_CURVE_CIRCLE2D_HPP
