#ifndef POLYCURVE_SERIALIZATION_CONFIG_JSON_HPP
#define POLYCURVE_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <curve/batch.hpp>
#include <stdexcept>
#include <string>

namespace polycurve {

// DiscretizationConfig serialization
inline void to_json(nlohmann::json& j, const DiscretizationConfig& config) {
    j = {
        {"max_error", config.max_error},
        {"segments", config.segments},
        {"num_threads", config.num_threads}
    };
}

// Throws std::runtime_error on a negative segment or thread count
inline void from_json(const nlohmann::json& j, DiscretizationConfig& config) {
    config.max_error = j.value("max_error", 0.01);
    config.segments = j.value("segments", 0);
    config.num_threads = j.value("num_threads", 0);
    if (config.segments < 0) {
        throw std::runtime_error("Config \"segments\" must be 0 (auto) or positive, got " +
                                 std::to_string(config.segments));
    }
    if (config.num_threads < 0) {
        throw std::runtime_error("Config \"num_threads\" must be 0 (auto) or positive, got " +
                                 std::to_string(config.num_threads));
    }
}

}  // namespace polycurve

#endif // POLYCURVE_SERIALIZATION_CONFIG_JSON_HPP
