#ifndef POLYCURVE_CURVE_DISCRETIZATION_HPP
#define POLYCURVE_CURVE_DISCRETIZATION_HPP

#include <common/result.hpp>
#include <math/vec2.hpp>
#include <polyline/polyline.hpp>
#include <optional>
#include <vector>

namespace polycurve {
namespace discretization {

// Largest count the tolerance formulas may return. A tolerance that needs
// more is reported as InvalidTolerance.
constexpr int MAX_SEGMENTS = 1 << 20;

// Argument checks shared by every curve kind
std::optional<CurveError> check_segment_count(int num_segments);
std::optional<CurveError> check_max_error(double max_error);

// Smallest n such that n chords of a circular arc with the given radius and
// swept angle (radians) each have sagitta r (1 - cos(phi / 2)) <= max_error.
Result<int> arc_segment_count(double radius, double swept_angle, double max_error);

// Smallest n such that chords over n uniform steps of a parameter domain of
// width `domain_width` deviate by at most max_error, given |p''| <= bound:
// a step h deviates by at most bound * h^2 / 8.
Result<int> second_derivative_segment_count(double second_derivative_bound,
                                            double domain_width,
                                            double max_error);

// Sample curve.point_on(i / n) for i = 0..n. The curve type must provide
// point_on(double) returning Point2d<Unit, Space>.
template <typename Unit, typename Space, typename Curve>
Result<Polyline2d<Unit, Space>> sample(const Curve& curve, int num_segments) {
    if (auto error = check_segment_count(num_segments)) {
        return *error;
    }
    std::vector<Point2d<Unit, Space>> points;
    points.reserve(static_cast<size_t>(num_segments) + 1);
    for (int i = 0; i <= num_segments; ++i) {
        double t = static_cast<double>(i) / static_cast<double>(num_segments);
        points.push_back(curve.point_on(t));
    }
    return Polyline2d<Unit, Space>(std::move(points));
}

}  // namespace discretization
}  // namespace polycurve

#endif // POLYCURVE_CURVE_DISCRETIZATION_HPP
