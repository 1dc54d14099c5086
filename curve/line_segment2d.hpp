#ifndef POLYCURVE_CURVE_LINE_SEGMENT2D_HPP
#define POLYCURVE_CURVE_LINE_SEGMENT2D_HPP

#include "discretization.hpp"
#include <math/bounding_box.hpp>
#include <math/frame2d.hpp>
#include <math/transform2d.hpp>

namespace polycurve {

template <typename Unit, typename Space>
class LineSegment2d {
public:
    using Point = Point2d<Unit, Space>;

    LineSegment2d(const Point& start, const Point& end) : start_(start), end_(end) {}

    const Point& start_point() const { return start_; }
    const Point& end_point() const { return end_; }

    Point point_on(double t) const { return lerp(start_, end_, t); }

    Quantity<Unit> length() const { return start_.distance_to(end_); }

    LineSegment2d reverse() const { return LineSegment2d(end_, start_); }

    LineSegment2d transform_by(const Transform2d<Unit, Space>& t) const {
        return LineSegment2d(t.apply(start_), t.apply(end_));
    }

    template <typename Global>
    LineSegment2d<Unit, Global> place_in(const Frame2d<Unit, Global, Space>& frame) const {
        return {frame.place_in(start_), frame.place_in(end_)};
    }

    template <typename Local>
    LineSegment2d<Unit, Local> relative_to(const Frame2d<Unit, Space, Local>& frame) const {
        return {frame.relative_to(start_), frame.relative_to(end_)};
    }

    template <typename To>
    LineSegment2d<To, Space> at(const Rate<To, Unit>& rate) const {
        return {polycurve::at(rate, start_), polycurve::at(rate, end_)};
    }

    template <typename From>
    LineSegment2d<From, Space> at_(const Rate<Unit, From>& rate) const {
        return {polycurve::at_(rate, start_), polycurve::at_(rate, end_)};
    }

    BoundingBox2d<Unit, Space> bounding_box() const {
        return BoundingBox2d<Unit, Space>::hull(start_, end_);
    }

    Result<Polyline2d<Unit, Space>> segments(int num_segments) const {
        return discretization::sample<Unit, Space>(*this, num_segments);
    }

    // A straight segment never deviates from its own chord
    Result<int> num_approximation_segments(Quantity<Unit>) const {
        return 1;
    }

    Result<Polyline2d<Unit, Space>> approximate(Quantity<Unit>) const {
        return Polyline2d<Unit, Space>(std::vector<Point>{start_, end_});
    }

    bool operator==(const LineSegment2d& other) const {
        return start_ == other.start_ && end_ == other.end_;
    }

private:
    Point start_;
    Point end_;
};

}  // namespace polycurve

#endif // POLYCURVE_CURVE_LINE_SEGMENT2D_HPP
