#ifndef POLYCURVE_SERIALIZATION_JSON_SERIALIZATION_HPP
#define POLYCURVE_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace polycurve::json {

// Files written by one major version are readable by the same major version
constexpr const char* SERIALIZATION_VERSION = "1.0.0";

// Names of the pipeline stages stored in the "step" field
namespace steps {
    constexpr const char* CURVES = "curves";
    constexpr const char* POLYLINES = "polylines";
    constexpr const char* MEASUREMENTS = "measurements";
}

inline std::string major_version(const std::string& version) {
    return version.substr(0, version.find('.'));
}

// Versioned envelope around one stage's payload
struct SerializedData {
    std::string version = SERIALIZATION_VERSION;
    std::string step;
    std::string timestamp;
    std::string source_file;
    nlohmann::json config;
    nlohmann::json stats;
    nlohmann::json data;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["version"] = version;
        j["step"] = step;
        if (!timestamp.empty()) j["timestamp"] = timestamp;
        if (!source_file.empty()) j["source_file"] = source_file;
        if (!config.is_null()) j["config"] = config;
        if (!stats.is_null()) j["stats"] = stats;
        j["data"] = data;
        return j;
    }

    // Throws if "data" is missing or the major version differs
    static SerializedData from_json(const nlohmann::json& j) {
        if (!j.is_object() || !j.contains("data")) {
            throw std::runtime_error("Serialized file has no \"data\" section");
        }
        SerializedData result;
        result.version = j.value("version", SERIALIZATION_VERSION);
        if (major_version(result.version) != major_version(SERIALIZATION_VERSION)) {
            throw std::runtime_error("Unsupported serialization version " + result.version +
                                     " (expected " + SERIALIZATION_VERSION + ")");
        }
        result.step = j.value("step", "");
        result.timestamp = j.value("timestamp", "");
        result.source_file = j.value("source_file", "");
        if (j.contains("config")) result.config = j["config"];
        if (j.contains("stats")) result.stats = j["stats"];
        result.data = j["data"];
        return result;
    }
};

// ISO 8601, UTC
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << j.dump(2);
}

inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }
}

// Accept either an envelope or a bare payload. A bare payload is wrapped
// with `source_file` set to `path` and an empty step.
inline SerializedData payload_from_json(const nlohmann::json& j, const std::string& path) {
    if (j.is_object() && j.contains("data")) {
        SerializedData envelope = SerializedData::from_json(j);
        if (envelope.source_file.empty()) {
            envelope.source_file = path;
        }
        return envelope;
    }
    SerializedData bare;
    bare.source_file = path;
    bare.data = j;
    return bare;
}

inline SerializedData read_payload(const std::string& path) {
    return payload_from_json(read_json_file(path), path);
}

inline void write_serialized(const std::string& path, const SerializedData& data) {
    write_json_file(path, data.to_json());
}

}  // namespace polycurve::json

#endif // POLYCURVE_SERIALIZATION_JSON_SERIALIZATION_HPP
