#ifndef POLYCURVE_MATH_BOUNDING_BOX_HPP
#define POLYCURVE_MATH_BOUNDING_BOX_HPP

#include "vec2.hpp"
#include "vec3.hpp"
#include <algorithm>
#include <optional>
#include <vector>

namespace polycurve {

// Axis-aligned bounding box in one coordinate space. Empty point sets have
// no box; hull_of() returns std::nullopt for them.
template <typename Unit, typename Space>
struct BoundingBox2d {
    using Point = Point2d<Unit, Space>;

    double min_x = 0.0;
    double max_x = 0.0;
    double min_y = 0.0;
    double max_y = 0.0;

    static constexpr BoundingBox2d constant(const Point& p) {
        return {p.x, p.x, p.y, p.y};
    }

    static constexpr BoundingBox2d hull(const Point& a, const Point& b) {
        return {std::min(a.x, b.x), std::max(a.x, b.x),
                std::min(a.y, b.y), std::max(a.y, b.y)};
    }

    static std::optional<BoundingBox2d> hull_of(const std::vector<Point>& points) {
        if (points.empty()) {
            return std::nullopt;
        }
        BoundingBox2d box = constant(points[0]);
        for (const auto& p : points) {
            box = box.include(p);
        }
        return box;
    }

    constexpr BoundingBox2d include(const Point& p) const {
        return {std::min(min_x, p.x), std::max(max_x, p.x),
                std::min(min_y, p.y), std::max(max_y, p.y)};
    }

    constexpr BoundingBox2d aggregate(const BoundingBox2d& other) const {
        return {std::min(min_x, other.min_x), std::max(max_x, other.max_x),
                std::min(min_y, other.min_y), std::max(max_y, other.max_y)};
    }

    constexpr Point center_point() const {
        return {(min_x + max_x) * 0.5, (min_y + max_y) * 0.5};
    }

    Quantity<Unit> x_width() const { return Quantity<Unit>(max_x - min_x); }
    Quantity<Unit> y_width() const { return Quantity<Unit>(max_y - min_y); }

    constexpr bool contains(const Point& p, double tolerance = 0.0) const {
        return p.x >= min_x - tolerance && p.x <= max_x + tolerance &&
               p.y >= min_y - tolerance && p.y <= max_y + tolerance;
    }

    constexpr bool operator==(const BoundingBox2d& other) const {
        return min_x == other.min_x && max_x == other.max_x &&
               min_y == other.min_y && max_y == other.max_y;
    }
};

template <typename Unit, typename Space>
struct BoundingBox3d {
    using Point = Point3d<Unit, Space>;

    double min_x = 0.0;
    double max_x = 0.0;
    double min_y = 0.0;
    double max_y = 0.0;
    double min_z = 0.0;
    double max_z = 0.0;

    static constexpr BoundingBox3d constant(const Point& p) {
        return {p.x, p.x, p.y, p.y, p.z, p.z};
    }

    static std::optional<BoundingBox3d> hull_of(const std::vector<Point>& points) {
        if (points.empty()) {
            return std::nullopt;
        }
        BoundingBox3d box = constant(points[0]);
        for (const auto& p : points) {
            box = box.include(p);
        }
        return box;
    }

    constexpr BoundingBox3d include(const Point& p) const {
        return {std::min(min_x, p.x), std::max(max_x, p.x),
                std::min(min_y, p.y), std::max(max_y, p.y),
                std::min(min_z, p.z), std::max(max_z, p.z)};
    }

    constexpr BoundingBox3d aggregate(const BoundingBox3d& other) const {
        return {std::min(min_x, other.min_x), std::max(max_x, other.max_x),
                std::min(min_y, other.min_y), std::max(max_y, other.max_y),
                std::min(min_z, other.min_z), std::max(max_z, other.max_z)};
    }

    constexpr Point center_point() const {
        return {(min_x + max_x) * 0.5, (min_y + max_y) * 0.5, (min_z + max_z) * 0.5};
    }

    constexpr bool contains(const Point& p, double tolerance = 0.0) const {
        return p.x >= min_x - tolerance && p.x <= max_x + tolerance &&
               p.y >= min_y - tolerance && p.y <= max_y + tolerance &&
               p.z >= min_z - tolerance && p.z <= max_z + tolerance;
    }

    constexpr bool operator==(const BoundingBox3d& other) const {
        return min_x == other.min_x && max_x == other.max_x &&
               min_y == other.min_y && max_y == other.max_y &&
               min_z == other.min_z && max_z == other.max_z;
    }
};

}  // namespace polycurve

#endif // POLYCURVE_MATH_BOUNDING_BOX_HPP
