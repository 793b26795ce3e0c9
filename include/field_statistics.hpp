#pragma once

#include <cstddef>

#include "field_array.hpp"

/**
 * @file field_statistics.hpp
 * @brief Summary statistics over the values of a field array.
 *
 * Non-finite samples are counted separately and excluded from the
 * min/max/mean, which are only meaningful when `has_finite` is set.
 */

namespace terra
{

struct FieldStatistics
{
    std::size_t total_count = 0;
    std::size_t finite_count = 0;
    std::size_t nan_count = 0;
    std::size_t inf_count = 0;
    double min_value = 0.0;
    double max_value = 0.0;
    double mean_value = 0.0;
    bool has_finite = false;
};

/**
 * @brief Computes statistics over a contiguous value buffer.
 */
FieldStatistics compute_buffer_statistics(const ValueType* values, std::size_t count);

/**
 * @brief Computes statistics over every element of a field array.
 */
FieldStatistics compute_field_statistics(const FieldArray& field);

} // namespace terra
