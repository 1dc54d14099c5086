#ifndef POLYCURVE_MATH_VEC3_HPP
#define POLYCURVE_MATH_VEC3_HPP

#include "quantity.hpp"
#include <cmath>

namespace polycurve {

template <typename Unit, typename Space>
struct BoundingBox3d;

template <typename Unit, typename Space>
struct Vector3d {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    constexpr Vector3d() = default;
    constexpr Vector3d(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    static constexpr Vector3d zero() { return {0.0, 0.0, 0.0}; }

    // Arithmetic operators
    constexpr Vector3d operator+(const Vector3d& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    constexpr Vector3d operator-(const Vector3d& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    constexpr Vector3d operator*(double scalar) const {
        return {x * scalar, y * scalar, z * scalar};
    }

    constexpr Vector3d operator/(double scalar) const {
        return {x / scalar, y / scalar, z / scalar};
    }

    constexpr Vector3d operator-() const {
        return {-x, -y, -z};
    }

    constexpr double dot(const Vector3d& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    constexpr Vector3d cross(const Vector3d& other) const {
        return {
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x
        };
    }

    // Magnitude squared (no sqrt)
    constexpr double length_squared() const {
        return x * x + y * y + z * z;
    }

    Quantity<Unit> length() const {
        return Quantity<Unit>(std::sqrt(length_squared()));
    }

    // Comparison (exact)
    constexpr bool operator==(const Vector3d& other) const {
        return x == other.x && y == other.y && z == other.z;
    }

    constexpr bool operator!=(const Vector3d& other) const {
        return !(*this == other);
    }
};

template <typename Unit, typename Space>
constexpr Vector3d<Unit, Space> operator*(double scalar, const Vector3d<Unit, Space>& v) {
    return v * scalar;
}

template <typename Unit, typename Space>
struct Point3d {
    using Vector = Vector3d<Unit, Space>;
    using Bounds = BoundingBox3d<Unit, Space>;

    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    constexpr Point3d() = default;
    constexpr Point3d(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    static constexpr Point3d origin() { return {0.0, 0.0, 0.0}; }

    constexpr Point3d operator+(const Vector& v) const {
        return {x + v.x, y + v.y, z + v.z};
    }

    constexpr Point3d operator-(const Vector& v) const {
        return {x - v.x, y - v.y, z - v.z};
    }

    constexpr Vector operator-(const Point3d& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    // Distance to another point
    Quantity<Unit> distance_to(const Point3d& other) const {
        return (*this - other).length();
    }

    constexpr bool operator==(const Point3d& other) const {
        return x == other.x && y == other.y && z == other.z;
    }

    constexpr bool operator!=(const Point3d& other) const {
        return !(*this == other);
    }
};

// Linear interpolation
template <typename Unit, typename Space>
constexpr Point3d<Unit, Space> lerp(const Point3d<Unit, Space>& a, const Point3d<Unit, Space>& b, double t) {
    return {a.x * (1.0 - t) + b.x * t,
            a.y * (1.0 - t) + b.y * t,
            a.z * (1.0 - t) + b.z * t};
}

template <typename Unit, typename Space>
constexpr Point3d<Unit, Space> midpoint(const Point3d<Unit, Space>& a, const Point3d<Unit, Space>& b) {
    return {(a.x + b.x) * 0.5, (a.y + b.y) * 0.5, (a.z + b.z) * 0.5};
}

template <typename To, typename From, typename Space>
constexpr Point3d<To, Space> at(const Rate<To, From>& rate, const Point3d<From, Space>& p) {
    return {rate.apply(p.x), rate.apply(p.y), rate.apply(p.z)};
}

template <typename To, typename From, typename Space>
constexpr Point3d<From, Space> at_(const Rate<To, From>& rate, const Point3d<To, Space>& p) {
    return {rate.unapply(p.x), rate.unapply(p.y), rate.unapply(p.z)};
}

}  // namespace polycurve

#endif // POLYCURVE_MATH_VEC3_HPP
