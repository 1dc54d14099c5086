#ifndef POLYCURVE_MATH_QUANTITY_HPP
#define POLYCURVE_MATH_QUANTITY_HPP

#include <cmath>

namespace polycurve {

// Unit tags. They carry no data; a Quantity<Unit> only combines with
// quantities of the same unit.
namespace units {
    struct Meters {};
    struct Millimeters {};
    struct Inches {};
}

// Coordinate space tags for points, vectors and frames
namespace spaces {
    struct Global {};
    struct Local {};
}

template <typename Unit>
struct Quantity {
    double value = 0.0;

    constexpr Quantity() = default;
    constexpr explicit Quantity(double v) : value(v) {}

    constexpr Quantity operator+(const Quantity& other) const {
        return Quantity(value + other.value);
    }

    constexpr Quantity operator-(const Quantity& other) const {
        return Quantity(value - other.value);
    }

    constexpr Quantity operator*(double scalar) const {
        return Quantity(value * scalar);
    }

    constexpr Quantity operator/(double scalar) const {
        return Quantity(value / scalar);
    }

    // Ratio of two quantities in the same unit
    constexpr double operator/(const Quantity& other) const {
        return value / other.value;
    }

    constexpr Quantity operator-() const {
        return Quantity(-value);
    }

    constexpr Quantity& operator+=(const Quantity& other) {
        value += other.value;
        return *this;
    }

    constexpr Quantity& operator-=(const Quantity& other) {
        value -= other.value;
        return *this;
    }

    constexpr bool operator==(const Quantity& other) const { return value == other.value; }
    constexpr bool operator!=(const Quantity& other) const { return value != other.value; }
    constexpr bool operator<(const Quantity& other) const { return value < other.value; }
    constexpr bool operator<=(const Quantity& other) const { return value <= other.value; }
    constexpr bool operator>(const Quantity& other) const { return value > other.value; }
    constexpr bool operator>=(const Quantity& other) const { return value >= other.value; }
};

template <typename Unit>
constexpr Quantity<Unit> operator*(double scalar, const Quantity<Unit>& q) {
    return q * scalar;
}

template <typename Unit>
Quantity<Unit> abs(const Quantity<Unit>& q) {
    return Quantity<Unit>(std::abs(q.value));
}

template <typename Unit>
constexpr Quantity<Unit> min(const Quantity<Unit>& a, const Quantity<Unit>& b) {
    return (b < a) ? b : a;
}

template <typename Unit>
constexpr Quantity<Unit> max(const Quantity<Unit>& a, const Quantity<Unit>& b) {
    return (a < b) ? b : a;
}

// Conversion rate between two units: `factor` units of To per unit of From.
// at() applies it, at_() applies the inverse.
template <typename To, typename From>
struct Rate {
    double factor = 1.0;

    constexpr Rate() = default;
    constexpr explicit Rate(double f) : factor(f) {}

    constexpr double apply(double v) const { return v * factor; }
    constexpr double unapply(double v) const { return v / factor; }

    constexpr Rate<From, To> inverse() const { return Rate<From, To>(1.0 / factor); }
};

template <typename To, typename From>
constexpr Quantity<To> at(const Rate<To, From>& rate, const Quantity<From>& q) {
    return Quantity<To>(rate.apply(q.value));
}

template <typename To, typename From>
constexpr Quantity<From> at_(const Rate<To, From>& rate, const Quantity<To>& q) {
    return Quantity<From>(rate.unapply(q.value));
}

namespace rates {
    constexpr Rate<units::Millimeters, units::Meters> millimeters_per_meter() { return Rate<units::Millimeters, units::Meters>(1000.0); }
    constexpr Rate<units::Millimeters, units::Inches> millimeters_per_inch() { return Rate<units::Millimeters, units::Inches>(25.4); }
}

}  // namespace polycurve

#endif // POLYCURVE_MATH_QUANTITY_HPP
