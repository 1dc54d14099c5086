#include "discretization.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace polycurve {
namespace discretization {

namespace {

// Round a real segment count up, rejecting counts above MAX_SEGMENTS
Result<int> to_segment_count(double n, double max_error) {
    if (!std::isfinite(n) || n > static_cast<double>(MAX_SEGMENTS)) {
        auto log = polycurve::logging::get_logger();
        log->debug("Segment count {} exceeds {} for max_error={}", n, MAX_SEGMENTS, max_error);
        return CurveError{ErrorKind::InvalidTolerance,
                          "max_error " + std::to_string(max_error) +
                          " needs more than " + std::to_string(MAX_SEGMENTS) + " segments"};
    }
    return std::max(1, static_cast<int>(std::ceil(n)));
}

}  // namespace

std::optional<CurveError> check_segment_count(int num_segments) {
    if (num_segments <= 0) {
        auto log = polycurve::logging::get_logger();
        log->debug("Rejected segment count {}", num_segments);
        return CurveError{ErrorKind::InvalidSegmentCount,
                          "segment count must be positive, got " + std::to_string(num_segments)};
    }
    return std::nullopt;
}

std::optional<CurveError> check_max_error(double max_error) {
    if (!(max_error > 0.0) || !std::isfinite(max_error)) {
        auto log = polycurve::logging::get_logger();
        log->debug("Rejected max_error {}", max_error);
        return CurveError{ErrorKind::InvalidTolerance,
                          "max_error must be positive and finite, got " + std::to_string(max_error)};
    }
    return std::nullopt;
}

Result<int> arc_segment_count(double radius, double swept_angle, double max_error) {
    if (auto error = check_max_error(max_error)) {
        return *error;
    }

    double r = std::abs(radius);
    double sweep = std::abs(swept_angle);

    // Degenerate arc, or a tolerance larger than any deviation the arc can have
    if (r == 0.0 || sweep == 0.0 || max_error >= 2.0 * r) {
        return 1;
    }

    double max_segment_angle = 2.0 * std::acos(1.0 - max_error / r);
    auto log = polycurve::logging::get_logger();
    log->trace("Arc r={} sweep={} max_error={}: max segment angle {}",
               r, sweep, max_error, max_segment_angle);
    return to_segment_count(sweep / max_segment_angle, max_error);
}

Result<int> second_derivative_segment_count(double second_derivative_bound,
                                            double domain_width,
                                            double max_error) {
    if (auto error = check_max_error(max_error)) {
        return *error;
    }

    double bound = std::abs(second_derivative_bound);
    double width = std::abs(domain_width);
    if (bound == 0.0 || width == 0.0) {
        return 1;
    }

    // bound * (width / n)^2 / 8 <= max_error
    double n = width * std::sqrt(bound / (8.0 * max_error));
    auto log = polycurve::logging::get_logger();
    log->trace("Second derivative bound {} over width {} max_error={}: {} segments",
               bound, width, max_error, n);
    return to_segment_count(n, max_error);
}

}  // namespace discretization
}  // namespace polycurve
