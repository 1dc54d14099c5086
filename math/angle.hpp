#ifndef POLYCURVE_MATH_ANGLE_HPP
#define POLYCURVE_MATH_ANGLE_HPP

#include <cmath>
#include <numbers>
#include <vector>

namespace polycurve {

struct Angle {
    double radians = 0.0;

    constexpr Angle() = default;
    constexpr explicit Angle(double r) : radians(r) {}

    static constexpr Angle from_degrees(double d) { return Angle(d * std::numbers::pi / 180.0); }

    static constexpr Angle zero() { return Angle(0.0); }
    static constexpr Angle quarter_turn() { return Angle(std::numbers::pi / 2.0); }
    static constexpr Angle half_turn() { return Angle(std::numbers::pi); }
    static constexpr Angle full_turn() { return Angle(2.0 * std::numbers::pi); }

    constexpr double degrees() const { return radians * 180.0 / std::numbers::pi; }

    double cos() const { return std::cos(radians); }
    double sin() const { return std::sin(radians); }

    constexpr Angle operator+(const Angle& other) const { return Angle(radians + other.radians); }
    constexpr Angle operator-(const Angle& other) const { return Angle(radians - other.radians); }
    constexpr Angle operator*(double scalar) const { return Angle(radians * scalar); }
    constexpr Angle operator/(double scalar) const { return Angle(radians / scalar); }
    constexpr Angle operator-() const { return Angle(-radians); }

    constexpr bool operator==(const Angle& other) const { return radians == other.radians; }
    constexpr bool operator!=(const Angle& other) const { return radians != other.radians; }
    constexpr bool operator<(const Angle& other) const { return radians < other.radians; }
};

constexpr Angle operator*(double scalar, const Angle& a) {
    return a * scalar;
}

// Interpolate between two angles; exact at t = 0 and t = 1
constexpr Angle interpolate(const Angle& a, const Angle& b, double t) {
    return Angle(a.radians * (1.0 - t) + b.radians * t);
}

inline Angle atan2(double y, double x) {
    return Angle(std::atan2(y, x));
}

// All angles base + k * period lying in the closed interval [lo, hi]
inline std::vector<Angle> periodic_angles_between(Angle base, double period, Angle lo, Angle hi) {
    std::vector<Angle> result;
    double k_min = std::ceil((lo.radians - base.radians) / period);
    double k_max = std::floor((hi.radians - base.radians) / period);
    for (double k = k_min; k <= k_max; k += 1.0) {
        result.push_back(Angle(base.radians + k * period));
    }
    return result;
}

}  // namespace polycurve

#endif // POLYCURVE_MATH_ANGLE_HPP
