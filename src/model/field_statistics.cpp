/**
 * @file field_statistics.cpp
 * @brief Parallel reduction of field value statistics.
 */

#include "field_statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace terra {

FieldStatistics compute_buffer_statistics(const ValueType* values, std::size_t count) {
    FieldStatistics stats;
    stats.total_count = count;

    std::size_t finite_count = 0;
    std::size_t nan_count = 0;
    std::size_t inf_count = 0;
    double finite_sum = 0.0;
    double finite_min = std::numeric_limits<double>::infinity();
    double finite_max = -std::numeric_limits<double>::infinity();

    #pragma omp parallel for reduction(+:finite_count,nan_count,inf_count,finite_sum) reduction(min:finite_min) reduction(max:finite_max)
    for (long long i = 0; i < static_cast<long long>(count); ++i) {
        const double value = static_cast<double>(values[static_cast<std::size_t>(i)]);

        if (!std::isfinite(value)) {
            if (std::isnan(value)) {
                ++nan_count;
            } else {
                ++inf_count;
            }
            continue;
        }

        ++finite_count;
        finite_sum += value;
        finite_min = std::min(finite_min, value);
        finite_max = std::max(finite_max, value);
    }

    stats.finite_count = finite_count;
    stats.nan_count = nan_count;
    stats.inf_count = inf_count;

    stats.has_finite = stats.finite_count > 0;
    if (stats.has_finite) {
        stats.min_value = finite_min;
        stats.max_value = finite_max;
        stats.mean_value = finite_sum / static_cast<double>(stats.finite_count);
    }
    return stats;
}

FieldStatistics compute_field_statistics(const FieldArray& field) {
    return compute_buffer_statistics(field.data(), field.size());
}

}
