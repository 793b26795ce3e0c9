#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "field_array.hpp"
#include "field_taxonomy.hpp"
#include "lateral_index.hpp"

/**
 * @file evaluation.hpp
 * @brief Point evaluation of model fields.
 *
 * A query is answered in two independent steps: lateral weights from
 * the nearest grid point(s), and a radial bracket between two adjacent
 * layers. Field components are interpolated independently with the
 * same weights.
 */

namespace terra
{

enum class LateralMethod
{
    Nearest,
    Triangle,
};

enum class RadialBoundary
{
    Clamp,
    Extrapolate,
};

struct EvaluationOptions
{
    LateralMethod lateral = LateralMethod::Nearest;
    RadialBoundary radial_boundary = RadialBoundary::Clamp;
    // Radial argument is a depth below the outermost layer.
    bool depth = false;
};

/**
 * @brief Field value at one location.
 *
 * Scalar fields carry one value; vector and composition fields carry one
 * value per component.
 */
struct FieldSample
{
    FieldKind kind = FieldKind::Scalar;
    std::vector<double> values;

    /**
     * @brief Returns the value of a scalar sample.
     * @throws std::logic_error if the sample is not scalar.
     */
    double scalar() const;

    std::size_t size() const { return values.size(); }
    double operator[](std::size_t comp) const { return values[comp]; }
};

/**
 * @brief Two layers enclosing a radius and the weight of the upper one.
 *
 * Interpolated value is `(1 - weight) * v[lower] + weight * v[upper]`.
 */
struct RadiusBracket
{
    std::size_t lower = 0;
    std::size_t upper = 0;
    double weight = 0.0;
};

struct LateralWeight
{
    std::size_t index = 0;
    double weight = 1.0;
};

/**
 * @brief Locates the layers enclosing a radius.
 * @param radii Strictly increasing layer radii.
 * @param radius Query radius.
 * @param boundary Clamp to the boundary layer or extrapolate outside the stored range.
 */
RadiusBracket radius_bracket(const std::vector<double>& radii, double radius, RadialBoundary boundary);

/**
 * @brief Computes lateral interpolation weights at (lon, lat).
 *
 * Triangle weights are spherical barycentric coordinates over the three
 * nearest points. When the query falls outside that triangle, or the
 * triangle is degenerate, the nearest point gets the full weight.
 */
std::vector<LateralWeight> lateral_weights(const LateralIndex& index, double lon, double lat, LateralMethod method);

/**
 * @brief Interpolates a field with precomputed radial and lateral weights.
 */
FieldSample interpolate_field(const FieldArray& field,
                              FieldKind kind,
                              const RadiusBracket& bracket,
                              const std::vector<LateralWeight>& lateral);

/**
 * @brief Reads the raw value at one layer and lateral point.
 */
FieldSample sample_at(const FieldArray& field, FieldKind kind, int layer, int point);

bool parse_lateral_method(const std::string& value, LateralMethod& out_method);
bool parse_radial_boundary(const std::string& value, RadialBoundary& out_boundary);
const char* to_string(LateralMethod method);
const char* to_string(RadialBoundary boundary);

} // namespace terra
