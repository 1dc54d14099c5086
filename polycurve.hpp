#ifndef POLYCURVE_HPP
#define POLYCURVE_HPP

// Curve algebra public API
// Five curve kinds behind Curve2d, discretized into polylines with a bounded
// deviation, plus polyline measurements

#include <math/quantity.hpp>
#include <math/angle.hpp>
#include <math/vec2.hpp>
#include <math/vec3.hpp>
#include <math/bounding_box.hpp>
#include <math/transform2d.hpp>
#include <math/frame2d.hpp>
#include <curve/curve2d.hpp>
#include <curve/batch.hpp>
#include <polyline/polyline.hpp>

namespace polycurve {

// Usage:
//   using Point = Point2d<units::Millimeters, spaces::Global>;
//   Curve2d<units::Millimeters, spaces::Global> curve =
//       Arc2d<units::Millimeters, spaces::Global>::swept(
//           Point(0.0, 0.0), Point(10.0, 0.0), Angle::quarter_turn());
//
//   auto polyline = curve.approximate(Quantity<units::Millimeters>(0.01));
//   if (polyline.ok()) {
//       auto length = polyline.value().length();
//       auto centroid = polyline.value().centroid();
//   }

} // namespace polycurve

#endif // POLYCURVE_HPP
