#ifndef POLYCURVE_POLYLINE_POLYLINE_HPP
#define POLYCURVE_POLYLINE_POLYLINE_HPP

#include <math/bounding_box.hpp>
#include <math/frame2d.hpp>
#include <math/transform2d.hpp>
#include <optional>
#include <utility>
#include <vector>

namespace polycurve {

// One straight piece of a polyline
template <typename P>
struct PolylineSegment {
    P start;
    P end;

    auto length() const { return start.distance_to(end); }
    P midpoint() const { return polycurve::midpoint(start, end); }
};

// Ordered vertex sequence; consecutive vertices form the segments.
// Works for any point type providing distance_to(), midpoint(), point - point,
// point + vector and a Bounds alias with hull_of() and center_point().
template <typename P>
class Polyline {
public:
    using Point = P;
    using Bounds = typename P::Bounds;
    using Length = decltype(std::declval<const P&>().distance_to(std::declval<const P&>()));

    Polyline() = default;
    explicit Polyline(std::vector<P> vertices) : vertices_(std::move(vertices)) {}

    const std::vector<P>& vertices() const { return vertices_; }
    size_t vertex_count() const { return vertices_.size(); }
    bool empty() const { return vertices_.empty(); }

    // Zero or one vertex gives no segments
    std::vector<PolylineSegment<P>> segments() const {
        std::vector<PolylineSegment<P>> result;
        for (size_t i = 1; i < vertices_.size(); ++i) {
            result.push_back({vertices_[i - 1], vertices_[i]});
        }
        return result;
    }

    Length length() const {
        Length total{};
        for (size_t i = 1; i < vertices_.size(); ++i) {
            total += vertices_[i - 1].distance_to(vertices_[i]);
        }
        return total;
    }

    std::optional<Bounds> bounding_box() const {
        return Bounds::hull_of(vertices_);
    }

    // Length-weighted center estimate. Starts at the bounding box center and
    // pulls the estimate toward each segment midpoint, in vertex order, by
    // segment_length / total_length. All-coincident vertices give the first one.
    std::optional<P> centroid() const {
        if (vertices_.empty()) {
            return std::nullopt;
        }
        Length total = length();
        if (total.value == 0.0) {
            return vertices_.front();
        }
        P estimate = bounding_box()->center_point();
        for (size_t i = 1; i < vertices_.size(); ++i) {
            const P& a = vertices_[i - 1];
            const P& b = vertices_[i];
            double weight = a.distance_to(b) / total;
            estimate = estimate + (polycurve::midpoint(a, b) - estimate) * weight;
        }
        return estimate;
    }

    Polyline reverse() const {
        return Polyline(std::vector<P>(vertices_.rbegin(), vertices_.rend()));
    }

    // Apply f to every vertex
    template <typename F>
    auto map(F&& f) const -> Polyline<decltype(f(std::declval<const P&>()))> {
        using Q = decltype(f(std::declval<const P&>()));
        std::vector<Q> mapped;
        mapped.reserve(vertices_.size());
        for (const auto& v : vertices_) {
            mapped.push_back(f(v));
        }
        return Polyline<Q>(std::move(mapped));
    }

    bool operator==(const Polyline& other) const { return vertices_ == other.vertices_; }
    bool operator!=(const Polyline& other) const { return !(*this == other); }

private:
    std::vector<P> vertices_;
};

template <typename Unit, typename Space>
using Polyline2d = Polyline<Point2d<Unit, Space>>;

template <typename Unit, typename Space>
using Polyline3d = Polyline<Point3d<Unit, Space>>;

// 2D transforms act vertex by vertex

template <typename Unit, typename Space>
Polyline2d<Unit, Space> transform_by(const Transform2d<Unit, Space>& t, const Polyline2d<Unit, Space>& polyline) {
    return polyline.map([&t](const Point2d<Unit, Space>& p) { return t.apply(p); });
}

template <typename Unit, typename Global, typename Local>
Polyline2d<Unit, Global> place_in(const Frame2d<Unit, Global, Local>& frame, const Polyline2d<Unit, Local>& polyline) {
    return polyline.map([&frame](const Point2d<Unit, Local>& p) { return frame.place_in(p); });
}

template <typename Unit, typename Global, typename Local>
Polyline2d<Unit, Local> relative_to(const Frame2d<Unit, Global, Local>& frame, const Polyline2d<Unit, Global>& polyline) {
    return polyline.map([&frame](const Point2d<Unit, Global>& p) { return frame.relative_to(p); });
}

}  // namespace polycurve

#endif // POLYCURVE_POLYLINE_POLYLINE_HPP
