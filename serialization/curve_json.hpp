#ifndef POLYCURVE_SERIALIZATION_CURVE_JSON_HPP
#define POLYCURVE_SERIALIZATION_CURVE_JSON_HPP

#include <nlohmann/json.hpp>
#include <curve/curve2d.hpp>
#include <polyline/polyline.hpp>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace polycurve {

// Point and vector serialization: [x, y] / [x, y, z]
template <typename Unit, typename Space>
void to_json(nlohmann::json& j, const Point2d<Unit, Space>& p) {
    j = nlohmann::json::array({p.x, p.y});
}

template <typename Unit, typename Space>
void from_json(const nlohmann::json& j, Point2d<Unit, Space>& p) {
    if (!j.is_array() || j.size() != 2) {
        throw std::runtime_error("2D point must be an array of 2 numbers");
    }
    p.x = j[0].get<double>();
    p.y = j[1].get<double>();
}

template <typename Unit, typename Space>
void to_json(nlohmann::json& j, const Vector2d<Unit, Space>& v) {
    j = nlohmann::json::array({v.x, v.y});
}

template <typename Unit, typename Space>
void from_json(const nlohmann::json& j, Vector2d<Unit, Space>& v) {
    if (!j.is_array() || j.size() != 2) {
        throw std::runtime_error("2D vector must be an array of 2 numbers");
    }
    v.x = j[0].get<double>();
    v.y = j[1].get<double>();
}

template <typename Unit, typename Space>
void to_json(nlohmann::json& j, const Point3d<Unit, Space>& p) {
    j = nlohmann::json::array({p.x, p.y, p.z});
}

template <typename Unit, typename Space>
void from_json(const nlohmann::json& j, Point3d<Unit, Space>& p) {
    if (!j.is_array() || j.size() != 3) {
        throw std::runtime_error("3D point must be an array of 3 numbers");
    }
    p.x = j[0].get<double>();
    p.y = j[1].get<double>();
    p.z = j[2].get<double>();
}

template <typename Unit, typename Space>
void to_json(nlohmann::json& j, const BoundingBox2d<Unit, Space>& box) {
    j = {
        {"min_x", box.min_x}, {"max_x", box.max_x},
        {"min_y", box.min_y}, {"max_y", box.max_y}
    };
}

template <typename Unit, typename Space>
void to_json(nlohmann::json& j, const BoundingBox3d<Unit, Space>& box) {
    j = {
        {"min_x", box.min_x}, {"max_x", box.max_x},
        {"min_y", box.min_y}, {"max_y", box.max_y},
        {"min_z", box.min_z}, {"max_z", box.max_z}
    };
}

// Polyline serialization
template <typename P>
void to_json(nlohmann::json& j, const Polyline<P>& polyline) {
    j["vertices"] = polyline.vertices();
}

template <typename P>
void from_json(const nlohmann::json& j, Polyline<P>& polyline) {
    polyline = Polyline<P>(j.at("vertices").get<std::vector<P>>());
}

// Length, bounding box and centroid of a polyline; absent values are null
template <typename P>
nlohmann::json polyline_measurements_to_json(const Polyline<P>& polyline) {
    nlohmann::json j;
    j["vertex_count"] = polyline.vertex_count();
    j["length"] = polyline.length().value;
    if (auto box = polyline.bounding_box()) {
        j["bounding_box"] = *box;
    } else {
        j["bounding_box"] = nullptr;
    }
    if (auto centroid = polyline.centroid()) {
        j["centroid"] = *centroid;
    } else {
        j["centroid"] = nullptr;
    }
    return j;
}

// Curve2d serialization, tagged by "type"
template <typename Unit, typename Space>
nlohmann::json curve_to_json(const Curve2d<Unit, Space>& curve) {
    return std::visit([](const auto& c) -> nlohmann::json {
        using T = std::decay_t<decltype(c)>;

        nlohmann::json j;

        if constexpr (std::is_same_v<T, LineSegment2d<Unit, Space>>) {
            j["type"] = "line_segment";
            j["start"] = c.start_point();
            j["end"] = c.end_point();
        } else if constexpr (std::is_same_v<T, Arc2d<Unit, Space>>) {
            j["type"] = "arc";
            j["center"] = c.center_point();
            j["radius"] = c.radius().value;
            j["start_angle"] = c.start_angle().radians;
            j["end_angle"] = c.end_angle().radians;
        } else if constexpr (std::is_same_v<T, EllipticalArc2d<Unit, Space>>) {
            j["type"] = "elliptical_arc";
            j["center"] = c.center_point();
            j["x_vector"] = c.x_vector();
            j["y_vector"] = c.y_vector();
            j["start_angle"] = c.start_angle().radians;
            j["end_angle"] = c.end_angle().radians;
        } else if constexpr (std::is_same_v<T, QuadraticSpline2d<Unit, Space>>) {
            j["type"] = "quadratic_spline";
            j["control_points"] = c.control_points();
        } else if constexpr (std::is_same_v<T, CubicSpline2d<Unit, Space>>) {
            j["type"] = "cubic_spline";
            j["control_points"] = c.control_points();
        }

        return j;
    }, curve.variant());
}

// Accepts the five curve kinds plus "circle" and "ellipse", which are
// converted to a full arc / elliptical arc
template <typename Unit, typename Space>
Curve2d<Unit, Space> curve_from_json(const nlohmann::json& j) {
    using Point = Point2d<Unit, Space>;
    using Vector = Vector2d<Unit, Space>;

    std::string type = j.at("type").get<std::string>();

    auto control_points = [&j](size_t expected) {
        auto points = j.at("control_points").get<std::vector<Point>>();
        if (points.size() != expected) {
            throw std::runtime_error("Spline needs exactly " + std::to_string(expected) +
                                     " control points, got " + std::to_string(points.size()));
        }
        return points;
    };

    if (type == "line_segment") {
        return LineSegment2d<Unit, Space>(j.at("start").get<Point>(), j.at("end").get<Point>());
    } else if (type == "arc") {
        return Arc2d<Unit, Space>(j.at("center").get<Point>(),
                                  Quantity<Unit>(j.at("radius").get<double>()),
                                  Angle(j.at("start_angle").get<double>()),
                                  Angle(j.at("end_angle").get<double>()));
    } else if (type == "elliptical_arc") {
        return EllipticalArc2d<Unit, Space>(j.at("center").get<Point>(),
                                            j.at("x_vector").get<Vector>(),
                                            j.at("y_vector").get<Vector>(),
                                            Angle(j.at("start_angle").get<double>()),
                                            Angle(j.at("end_angle").get<double>()));
    } else if (type == "quadratic_spline") {
        auto p = control_points(3);
        return QuadraticSpline2d<Unit, Space>(p[0], p[1], p[2]);
    } else if (type == "cubic_spline") {
        auto p = control_points(4);
        return CubicSpline2d<Unit, Space>(p[0], p[1], p[2], p[3]);
    } else if (type == "circle") {
        return Curve2d<Unit, Space>::from_circle(
            {j.at("center").get<Point>(), Quantity<Unit>(j.at("radius").get<double>())});
    } else if (type == "ellipse") {
        return Curve2d<Unit, Space>::from_ellipse(
            {j.at("center").get<Point>(),
             Direction2d<Space>::from_angle(Angle(j.value("rotation", 0.0))),
             Quantity<Unit>(j.at("x_radius").get<double>()),
             Quantity<Unit>(j.at("y_radius").get<double>())});
    } else {
        throw std::runtime_error("Unknown curve type: " + type);
    }
}

template <typename Unit, typename Space>
nlohmann::json curves_to_json(const std::vector<Curve2d<Unit, Space>>& curves) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& curve : curves) {
        j.push_back(curve_to_json(curve));
    }
    return j;
}

template <typename Unit, typename Space>
std::vector<Curve2d<Unit, Space>> curves_from_json(const nlohmann::json& j) {
    if (!j.is_array()) {
        throw std::runtime_error("Curve list must be a JSON array");
    }
    std::vector<Curve2d<Unit, Space>> curves;
    for (const auto& curve_j : j) {
        curves.push_back(curve_from_json<Unit, Space>(curve_j));
    }
    return curves;
}

}  // namespace polycurve

#endif // POLYCURVE_SERIALIZATION_CURVE_JSON_HPP
