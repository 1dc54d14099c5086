#ifndef POLYCURVE_CURVE_ARC2D_HPP
#define POLYCURVE_CURVE_ARC2D_HPP

#include "circle2d.hpp"
#include "discretization.hpp"
#include <math/bounding_box.hpp>
#include <math/frame2d.hpp>
#include <math/transform2d.hpp>
#include <cmath>
#include <numbers>

namespace polycurve {

// Circular arc: center + radius * (cos a, sin a) for a running from
// start_angle to end_angle. A negative sweep runs clockwise.
template <typename Unit, typename Space>
class Arc2d {
public:
    using Point = Point2d<Unit, Space>;

    Arc2d(const Point& center, Quantity<Unit> radius, Angle start_angle, Angle end_angle)
        : center_(center), radius_(radius), start_angle_(start_angle), end_angle_(end_angle) {}

    // Arc starting at `start` and sweeping `swept_angle` around `center`
    static Arc2d swept(const Point& center, const Point& start, Angle swept_angle) {
        auto offset = start - center;
        Angle start_angle = atan2(offset.y, offset.x);
        return Arc2d(center, offset.length(), start_angle, start_angle + swept_angle);
    }

    // Full counterclockwise turn starting on the positive x axis
    static Arc2d from_circle(const Circle2d<Unit, Space>& circle) {
        return Arc2d(circle.center, circle.radius, Angle::zero(), Angle::full_turn());
    }

    const Point& center_point() const { return center_; }
    Quantity<Unit> radius() const { return radius_; }
    Angle start_angle() const { return start_angle_; }
    Angle end_angle() const { return end_angle_; }
    Angle swept_angle() const { return end_angle_ - start_angle_; }

    Point point_at_angle(Angle a) const {
        return {center_.x + radius_.value * a.cos(), center_.y + radius_.value * a.sin()};
    }

    Point start_point() const { return point_at_angle(start_angle_); }
    Point end_point() const { return point_at_angle(end_angle_); }

    // Uniform in angle
    Point point_on(double t) const {
        return point_at_angle(interpolate(start_angle_, end_angle_, t));
    }

    Arc2d reverse() const {
        return Arc2d(center_, radius_, end_angle_, start_angle_);
    }

    // The linear part is k * rotation(rot) or k * reflection across angle rot / 2
    Arc2d transform_by(const Transform2d<Unit, Space>& t) const {
        Angle rot = t.rotation();
        Quantity<Unit> radius = radius_ * t.scale_factor();
        if (t.preserves_orientation()) {
            return Arc2d(t.apply(center_), radius, start_angle_ + rot, end_angle_ + rot);
        }
        return Arc2d(t.apply(center_), radius, rot - start_angle_, rot - end_angle_);
    }

    template <typename Global>
    Arc2d<Unit, Global> place_in(const Frame2d<Unit, Global, Space>& frame) const {
        Angle rot = frame.rotation();
        return {frame.place_in(center_), radius_, start_angle_ + rot, end_angle_ + rot};
    }

    template <typename Local>
    Arc2d<Unit, Local> relative_to(const Frame2d<Unit, Space, Local>& frame) const {
        Angle rot = frame.rotation();
        return {frame.relative_to(center_), radius_, start_angle_ - rot, end_angle_ - rot};
    }

    template <typename To>
    Arc2d<To, Space> at(const Rate<To, Unit>& rate) const {
        return {polycurve::at(rate, center_), polycurve::at(rate, radius_), start_angle_, end_angle_};
    }

    template <typename From>
    Arc2d<From, Space> at_(const Rate<Unit, From>& rate) const {
        return {polycurve::at_(rate, center_), polycurve::at_(rate, radius_), start_angle_, end_angle_};
    }

    // Tight: endpoints plus every axis extreme (multiples of a quarter turn)
    // the arc passes through
    BoundingBox2d<Unit, Space> bounding_box() const {
        auto box = BoundingBox2d<Unit, Space>::hull(start_point(), end_point());
        double r = radius_.value;
        double lo = std::min(start_angle_.radians, end_angle_.radians);
        double hi = std::max(start_angle_.radians, end_angle_.radians);
        double quarter = std::numbers::pi / 2.0;
        double k_min = std::ceil(lo / quarter);
        double k_max = std::min(std::floor(hi / quarter), k_min + 3.0);
        for (double k = k_min; k <= k_max; k += 1.0) {
            int quadrant = static_cast<int>(std::fmod(std::fmod(k, 4.0) + 4.0, 4.0));
            switch (quadrant) {
                case 0: box = box.include({center_.x + r, center_.y}); break;
                case 1: box = box.include({center_.x, center_.y + r}); break;
                case 2: box = box.include({center_.x - r, center_.y}); break;
                default: box = box.include({center_.x, center_.y - r}); break;
            }
        }
        return box;
    }

    Result<Polyline2d<Unit, Space>> segments(int num_segments) const {
        return discretization::sample<Unit, Space>(*this, num_segments);
    }

    Result<int> num_approximation_segments(Quantity<Unit> max_error) const {
        return discretization::arc_segment_count(
            radius_.value, swept_angle().radians, max_error.value);
    }

    Result<Polyline2d<Unit, Space>> approximate(Quantity<Unit> max_error) const {
        return num_approximation_segments(max_error).and_then(
            [this](int n) { return segments(n); });
    }

    bool operator==(const Arc2d& other) const {
        return center_ == other.center_ && radius_ == other.radius_ &&
               start_angle_ == other.start_angle_ && end_angle_ == other.end_angle_;
    }

private:
    Point center_;
    Quantity<Unit> radius_;
    Angle start_angle_;
    Angle end_angle_;
};

}  // namespace polycurve

#endif // POLYCURVE_CURVE_ARC2D_HPP
