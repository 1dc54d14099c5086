#include "cli_common.hpp"
#include <curve/batch.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <serialization/curve_json.hpp>
#include <common/logging.hpp>

namespace polycurve::cli {

int command_approximate(int argc, char** argv) {
    auto log = polycurve::logging::get_logger();

    try {
        CommandContext ctx = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: polycurve approximate <curves.json> [-o <polylines.json>] [options]\n";
            std::cerr << "Options:\n";
            std::cerr << "  -c, --config FILE    Discretization config (max_error, segments, num_threads)\n";
            std::cerr << "  -e, --max-error E    Maximum deviation from each curve (default: 0.01)\n";
            std::cerr << "  -n, --segments N     Fixed segment count per curve instead of max error\n";
            std::cerr << "  -j, --threads N      Worker threads (default: all)\n";
            return ctx.help ? 0 : 1;
        }

        if (ctx.verbose) {
            logging::enable_verbose();
        }

        // Configuration: file first, command line overrides
        DiscretizationConfig config;
        if (ctx.config_path.has_value()) {
            config = json::read_json_file(ctx.config_path.value()).get<DiscretizationConfig>();
            log->info("Using discretization config from {}", ctx.config_path.value());
        }
        if (ctx.max_error.has_value()) {
            config.max_error = ctx.max_error.value();
        }
        if (ctx.segments.has_value()) {
            config.segments = ctx.segments.value();
        }
        if (ctx.num_threads.has_value()) {
            config.num_threads = ctx.num_threads.value();
        }

        log->info("Approximating curves from: {}", ctx.input_path);

        // A bare curve array or an envelope around one
        json::SerializedData input = json::read_payload(ctx.input_path);
        if (!input.step.empty() && input.step != json::steps::CURVES) {
            log->warn("Input step is '{}', expected '{}'", input.step, json::steps::CURVES);
        }
        auto curves = curves_from_json<FileUnit, FileSpace>(input.data);
        log->debug("Loaded {} curves", curves.size());

        auto results = approximate_all(curves, config);

        nlohmann::json polylines = nlohmann::json::array();
        size_t failures = 0;
        size_t total_vertices = 0;
        double total_length = 0.0;

        for (size_t i = 0; i < results.size(); ++i) {
            const char* kind = curve_kind_name(curves[i].kind());
            if (!results[i].ok()) {
                const CurveError& error = results[i].error();
                log->error("Curve {} ({}): {} [{}]", i, kind, error.message, error_kind_name(error.kind));
                ++failures;
                continue;
            }

            const auto& polyline = results[i].value();
            log->debug("Curve {} ({}): {} segments", i, kind, polyline.vertex_count() - 1);
            total_vertices += polyline.vertex_count();
            total_length += polyline.length().value;

            nlohmann::json entry = {
                {"curve_index", i},
                {"kind", kind},
                {"polyline", polyline},
                {"measurements", polyline_measurements_to_json(polyline)}
            };
            polylines.push_back(entry);
        }

        if (failures > 0) {
            std::cerr << "Error: " << failures << " of " << curves.size()
                      << " curves could not be approximated\n";
            return 1;
        }

        json::SerializedData data;
        data.step = json::steps::POLYLINES;
        data.timestamp = json::get_timestamp();
        data.source_file = input.source_file;
        data.config = config;
        data.data = polylines;
        data.stats = {
            {"curve_count", curves.size()},
            {"vertex_count", total_vertices},
            {"total_length", total_length}
        };

        std::string output_path = resolve_output_path(ctx.input_path, ".polylines.json", ctx.output_path);
        json::write_serialized(output_path, data);

        log->info("Wrote polylines to {}", output_path);
        std::cerr << "Wrote " << output_path << " ("
                  << curves.size() << " curves, "
                  << total_vertices << " vertices, "
                  << "length: " << total_length << ")\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace polycurve::cli
