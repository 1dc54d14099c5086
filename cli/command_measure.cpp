#include "cli_common.hpp"
#include <polyline/polyline.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/curve_json.hpp>
#include <common/logging.hpp>

namespace polycurve::cli {

namespace {

// Measure one {"vertices": [...]} object, 2D or 3D by vertex size
nlohmann::json measure_polyline(const nlohmann::json& j) {
    const auto& vertices = j.at("vertices");
    bool is_3d = !vertices.empty() && vertices[0].is_array() && vertices[0].size() == 3;
    if (is_3d) {
        return polyline_measurements_to_json(j.get<Polyline3d<FileUnit, FileSpace>>());
    }
    return polyline_measurements_to_json(j.get<Polyline2d<FileUnit, FileSpace>>());
}

}  // namespace

int command_measure(int argc, char** argv) {
    auto log = polycurve::logging::get_logger();

    try {
        CommandContext ctx = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: polycurve measure <polylines.json> [-o <measurements.json>]\n";
            return ctx.help ? 0 : 1;
        }

        if (ctx.verbose) {
            logging::enable_verbose();
        }

        log->info("Measuring polylines from: {}", ctx.input_path);

        // Accept the output of `approximate`, a bare array of polylines, or one polyline
        json::SerializedData payload = json::read_payload(ctx.input_path);
        nlohmann::json input = payload.data;
        if (!input.is_array()) {
            input = nlohmann::json::array({input});
        }

        nlohmann::json measurements = nlohmann::json::array();
        for (const auto& entry : input) {
            const nlohmann::json& polyline_j = entry.contains("polyline") ? entry["polyline"] : entry;
            measurements.push_back(measure_polyline(polyline_j));
        }
        log->debug("Measured {} polylines", measurements.size());

        if (ctx.output_path.empty()) {
            std::cout << measurements.dump(2) << "\n";
        } else {
            json::SerializedData data;
            data.step = json::steps::MEASUREMENTS;
            data.timestamp = json::get_timestamp();
            data.source_file = ctx.input_path;
            data.data = measurements;
            data.stats = {{"polyline_count", measurements.size()}};
            json::write_serialized(ctx.output_path, data);
            log->info("Wrote measurements to {}", ctx.output_path);
        }

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace polycurve::cli
