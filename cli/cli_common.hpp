#ifndef POLYCURVE_CLI_COMMON_HPP
#define POLYCURVE_CLI_COMMON_HPP

#include <math/quantity.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace polycurve::cli {

// Coordinates read from and written to files are millimeters in one global space
using FileUnit = units::Millimeters;
using FileSpace = spaces::Global;

// Options shared by every command; unset optionals fall back to the config file
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    std::optional<double> max_error;
    std::optional<int> segments;
    std::optional<int> num_threads;
    bool verbose = false;
    bool help = false;
};

// Flag taking one value, e.g. "-e 0.01"
struct ValueOption {
    const char* short_name;
    const char* long_name;
    std::function<void(CommandContext&, const std::string&)> apply;
};

// Counts where 0 means auto; negative values are rejected
inline int parse_count(const std::string& value) {
    int count = std::stoi(value);
    if (count < 0) {
        throw std::out_of_range("negative count");
    }
    return count;
}

inline const std::vector<ValueOption>& value_options() {
    static const std::vector<ValueOption> options = {
        {"-o", "--output", [](CommandContext& c, const std::string& v) { c.output_path = v; }},
        {"-c", "--config", [](CommandContext& c, const std::string& v) { c.config_path = v; }},
        {"-e", "--max-error", [](CommandContext& c, const std::string& v) { c.max_error = std::stod(v); }},
        {"-n", "--segments", [](CommandContext& c, const std::string& v) { c.segments = parse_count(v); }},
        {"-j", "--threads", [](CommandContext& c, const std::string& v) { c.num_threads = parse_count(v); }}
    };
    return options;
}

// Parse the arguments after the command name (argv[start_idx] onwards).
// Throws std::runtime_error on unknown options, missing or malformed values
// and a second positional argument.
inline CommandContext parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;

    for (int i = start_idx; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            continue;
        }
        if (arg == "-h" || arg == "--help") {
            ctx.help = true;
            continue;
        }
        if (arg.empty() || arg[0] != '-') {
            if (!ctx.input_path.empty()) {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
            ctx.input_path = arg;
            continue;
        }

        bool matched = false;
        for (const auto& option : value_options()) {
            if (arg != option.short_name && arg != option.long_name) {
                continue;
            }
            if (i + 1 >= argc) {
                throw std::runtime_error(arg + " requires an argument");
            }
            std::string value = argv[++i];
            try {
                option.apply(ctx, value);
            } catch (const std::logic_error&) {
                // Parsers report bad input as invalid_argument or out_of_range
                throw std::runtime_error("Invalid value for " + arg + ": " + value);
            }
            matched = true;
            break;
        }
        if (!matched) {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    return ctx;
}

// `provided_output` if set, otherwise the input path with its extension
// replaced by `suffix`
inline std::string resolve_output_path(const std::string& input,
                                       const std::string& suffix,
                                       const std::string& provided_output) {
    if (!provided_output.empty()) {
        return provided_output;
    }
    std::filesystem::path path(input);
    path.replace_extension();
    return path.string() + suffix;
}

int command_approximate(int argc, char** argv);
int command_measure(int argc, char** argv);

}  // namespace polycurve::cli

#endif // POLYCURVE_CLI_COMMON_HPP
