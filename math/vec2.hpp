#ifndef POLYCURVE_MATH_VEC2_HPP
#define POLYCURVE_MATH_VEC2_HPP

#include "quantity.hpp"
#include "angle.hpp"
#include <cmath>

namespace polycurve {

template <typename Unit, typename Space>
struct BoundingBox2d;

// Unit-length direction in a coordinate space
template <typename Space>
struct Direction2d {
    double x = 1.0;
    double y = 0.0;

    static constexpr Direction2d x_axis() { return {1.0, 0.0}; }
    static constexpr Direction2d y_axis() { return {0.0, 1.0}; }

    static Direction2d from_angle(Angle a) {
        return {a.cos(), a.sin()};
    }

    // Normalizes (x, y); a zero vector gives the x axis
    static Direction2d from_components(double x_, double y_) {
        double len = std::hypot(x_, y_);
        if (len > 0.0) {
            return {x_ / len, y_ / len};
        }
        return x_axis();
    }

    // Rotated counterclockwise by a quarter turn
    constexpr Direction2d rotate_left() const { return {-y, x}; }

    Angle angle() const { return atan2(y, x); }

    constexpr Direction2d operator-() const { return {-x, -y}; }

    constexpr bool operator==(const Direction2d& other) const {
        return x == other.x && y == other.y;
    }
};

template <typename Unit, typename Space>
struct Vector2d {
    double x = 0.0;
    double y = 0.0;

    constexpr Vector2d() = default;
    constexpr Vector2d(double x_, double y_) : x(x_), y(y_) {}

    static constexpr Vector2d zero() { return {0.0, 0.0}; }

    constexpr Vector2d operator+(const Vector2d& other) const {
        return {x + other.x, y + other.y};
    }

    constexpr Vector2d operator-(const Vector2d& other) const {
        return {x - other.x, y - other.y};
    }

    constexpr Vector2d operator*(double scalar) const {
        return {x * scalar, y * scalar};
    }

    constexpr Vector2d operator/(double scalar) const {
        return {x / scalar, y / scalar};
    }

    constexpr Vector2d operator-() const {
        return {-x, -y};
    }

    // Dot and cross products are returned in squared units as raw values
    constexpr double dot(const Vector2d& other) const {
        return x * other.x + y * other.y;
    }

    constexpr double cross(const Vector2d& other) const {
        return x * other.y - y * other.x;
    }

    constexpr double length_squared() const {
        return x * x + y * y;
    }

    Quantity<Unit> length() const {
        return Quantity<Unit>(std::hypot(x, y));
    }

    Direction2d<Space> direction() const {
        return Direction2d<Space>::from_components(x, y);
    }

    constexpr bool operator==(const Vector2d& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Vector2d& other) const {
        return !(*this == other);
    }
};

template <typename Unit, typename Space>
constexpr Vector2d<Unit, Space> operator*(double scalar, const Vector2d<Unit, Space>& v) {
    return v * scalar;
}

template <typename Unit, typename Space>
constexpr Vector2d<Unit, Space> operator*(const Direction2d<Space>& d, const Quantity<Unit>& magnitude) {
    return {d.x * magnitude.value, d.y * magnitude.value};
}

template <typename Unit, typename Space>
struct Point2d {
    using Vector = Vector2d<Unit, Space>;
    using Bounds = BoundingBox2d<Unit, Space>;

    double x = 0.0;
    double y = 0.0;

    constexpr Point2d() = default;
    constexpr Point2d(double x_, double y_) : x(x_), y(y_) {}

    static constexpr Point2d origin() { return {0.0, 0.0}; }

    constexpr Point2d operator+(const Vector& v) const {
        return {x + v.x, y + v.y};
    }

    constexpr Point2d operator-(const Vector& v) const {
        return {x - v.x, y - v.y};
    }

    constexpr Vector operator-(const Point2d& other) const {
        return {x - other.x, y - other.y};
    }

    Quantity<Unit> distance_to(const Point2d& other) const {
        return (*this - other).length();
    }

    constexpr bool operator==(const Point2d& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Point2d& other) const {
        return !(*this == other);
    }
};

// Linear interpolation; exact at t = 0 and t = 1
template <typename Unit, typename Space>
constexpr Point2d<Unit, Space> lerp(const Point2d<Unit, Space>& a, const Point2d<Unit, Space>& b, double t) {
    return {a.x * (1.0 - t) + b.x * t, a.y * (1.0 - t) + b.y * t};
}

template <typename Unit, typename Space>
constexpr Point2d<Unit, Space> midpoint(const Point2d<Unit, Space>& a, const Point2d<Unit, Space>& b) {
    return {(a.x + b.x) * 0.5, (a.y + b.y) * 0.5};
}

// Unit conversion of coordinates
template <typename To, typename From, typename Space>
constexpr Point2d<To, Space> at(const Rate<To, From>& rate, const Point2d<From, Space>& p) {
    return {rate.apply(p.x), rate.apply(p.y)};
}

template <typename To, typename From, typename Space>
constexpr Point2d<From, Space> at_(const Rate<To, From>& rate, const Point2d<To, Space>& p) {
    return {rate.unapply(p.x), rate.unapply(p.y)};
}

template <typename To, typename From, typename Space>
constexpr Vector2d<To, Space> at(const Rate<To, From>& rate, const Vector2d<From, Space>& v) {
    return {rate.apply(v.x), rate.apply(v.y)};
}

template <typename To, typename From, typename Space>
constexpr Vector2d<From, Space> at_(const Rate<To, From>& rate, const Vector2d<To, Space>& v) {
    return {rate.unapply(v.x), rate.unapply(v.y)};
}

}  // namespace polycurve

#endif // POLYCURVE_MATH_VEC2_HPP
