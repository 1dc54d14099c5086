#ifndef POLYCURVE_CURVE_BATCH_HPP
#define POLYCURVE_CURVE_BATCH_HPP

#include "curve2d.hpp"
#include <common/logging.hpp>
#include <vector>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace polycurve {

// Settings for discretizing a set of curves
struct DiscretizationConfig {
    // Maximum deviation between each curve and its polyline
    double max_error = 0.01;

    // Fixed segment count per curve; 0 = derive from max_error.
    // A negative count fails every curve with InvalidSegmentCount.
    int segments = 0;

    // Parallelization settings
    int num_threads = 0;  // 0 = auto-detect, > 0 = use specific count
};

// Discretize every curve independently. Results keep the input order.
template <typename Unit, typename Space>
std::vector<Result<Polyline2d<Unit, Space>>> approximate_all(
    const std::vector<Curve2d<Unit, Space>>& curves,
    const DiscretizationConfig& config) {

    auto log = polycurve::logging::get_logger();

    std::vector<Result<Polyline2d<Unit, Space>>> results(
        curves.size(), Result<Polyline2d<Unit, Space>>(Polyline2d<Unit, Space>()));

    #ifdef _OPENMP
    int use_threads = (config.num_threads > 0) ? config.num_threads : omp_get_max_threads();
    log->debug("Discretizing {} curves on {} OpenMP threads", curves.size(), use_threads);
    #else
    log->debug("Discretizing {} curves single-threaded (OpenMP not available)", curves.size());
    #endif

    const Quantity<Unit> max_error(config.max_error);
    const long count = static_cast<long>(curves.size());

    // Each iteration writes only its own slot
    #pragma omp parallel for schedule(dynamic) num_threads(use_threads) if(count > 16)
    for (long i = 0; i < count; ++i) {
        const auto& curve = curves[static_cast<size_t>(i)];
        results[static_cast<size_t>(i)] = (config.segments != 0)
            ? curve.segments(config.segments)
            : curve.approximate(max_error);
    }

    return results;
}

}  // namespace polycurve

#endif // POLYCURVE_CURVE_BATCH_HPP
