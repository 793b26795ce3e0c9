#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "evaluation.hpp"
#include "field_array.hpp"
#include "field_statistics.hpp"
#include "field_taxonomy.hpp"
#include "lateral_index.hpp"
#include "terra_errors.hpp"

/**
 * @file terra_model.hpp
 * @brief Three-dimensional model on an irregular lateral grid.
 *
 * A model is a set of lateral points (longitude, latitude) shared by every
 * layer, a strictly increasing list of layer radii, and named fields
 * sampled at every (layer, point). Field shapes are checked against the
 * grid when fields are supplied or created. The lateral search index is
 * built on the first spatial query and reused afterwards.
 *
 * Coordinate arrays and field arrays are held through shared handles:
 * getters return the handles given to the constructor, and `get_field`
 * returns the live array, so writes through it are seen by later reads.
 */

namespace terra
{

using CoordinateType = double;
using CoordinateArray = std::shared_ptr<const std::vector<CoordinateType>>;
using FieldHandle = std::shared_ptr<FieldArray>;
using FieldList = std::vector<std::pair<std::string, FieldHandle>>;
using CompositionNames = std::optional<std::vector<std::string>>;

class TerraModel
{
public:
    /**
     * @brief Constructs and validates a model.
     * @param longitude Lateral point longitudes in degrees.
     * @param latitude Lateral point latitudes in degrees, same length as longitude.
     * @param radius Layer radii, strictly increasing.
     * @param fields Initial fields in insertion order.
     * @param composition_names Labels of the composition-histogram components.
     * @throws std::invalid_argument for malformed coordinates or duplicate fields.
     * @throws FieldNameError for a field name outside the taxonomy.
     * @throws FieldDimensionError for a field shape inconsistent with the grid.
     */
    TerraModel(CoordinateArray longitude,
               CoordinateArray latitude,
               CoordinateArray radius,
               FieldList fields = {},
               CompositionNames composition_names = std::nullopt);

    /**
     * @brief Convenience overload taking ownership of plain coordinate vectors.
     */
    TerraModel(std::vector<CoordinateType> longitude,
               std::vector<CoordinateType> latitude,
               std::vector<CoordinateType> radius,
               FieldList fields = {},
               CompositionNames composition_names = std::nullopt);

    TerraModel(const TerraModel&) = delete;
    TerraModel& operator=(const TerraModel&) = delete;

    /**
     * @brief Returns the longitude and latitude handles given at construction.
     */
    std::pair<CoordinateArray, CoordinateArray> get_lateral_points() const { return {longitude_, latitude_}; }

    /**
     * @brief Returns the radius handle given at construction.
     */
    const CoordinateArray& get_radii() const { return radius_; }

    int nlayers() const { return static_cast<int>(radius_->size()); }
    int npts() const { return static_cast<int>(longitude_->size()); }

    /**
     * @brief Returns the live array of a field.
     * @throws FieldNameError if the name is not in the taxonomy.
     * @throws NoFieldError if the model has no such field.
     */
    FieldArray& get_field(const std::string& name);
    const FieldArray& get_field(const std::string& name) const;

    /**
     * @brief Returns the stored handle of a field, with the same errors as get_field.
     */
    FieldHandle get_field_handle(const std::string& name) const;

    bool has_field(const std::string& name) const;

    /**
     * @brief Names of the fields present, in insertion order.
     */
    std::vector<std::string> field_names() const { return field_order_; }

    /**
     * @brief Adds a zero-filled field shaped by the taxonomy and the grid.
     * @param name Field name.
     * @param ncomp Component count: must be absent for scalar fields, 3 if
     *        given for vector fields, and is required for composition fields.
     * @return The live array. An existing field of the same name is zeroed
     *         in place, so earlier references to it stay valid.
     */
    FieldArray& new_field(const std::string& name, std::optional<int> ncomp = std::nullopt);

    /**
     * @brief Component count of the composition histogram, if present.
     */
    std::optional<int> number_of_compositions() const;

    const CompositionNames& get_composition_names() const { return composition_names_; }

    std::size_t nearest_index(double lon, double lat) const;
    std::vector<std::size_t> nearest_indices(double lon, double lat, std::size_t n) const;
    std::vector<Neighbour> nearest_neighbours(double lon, double lat, std::size_t n) const;

    /**
     * @brief Returns the lateral search index, building it on first use.
     */
    const LateralIndex& lateral_index() const;

    /**
     * @brief Evaluates a field at an arbitrary location.
     * @param lon Longitude in degrees.
     * @param lat Latitude in degrees.
     * @param radius Radius, or depth below the outermost layer when `options.depth` is set.
     * @param field_name Field to evaluate.
     * @param options Lateral method, radial boundary policy and depth flag.
     */
    FieldSample evaluate(double lon,
                         double lat,
                         double radius,
                         const std::string& field_name,
                         const EvaluationOptions& options = {}) const;

    /**
     * @brief Field values at every layer of the lateral point nearest (lon, lat).
     */
    std::vector<FieldSample> get_1d_profile(double lon, double lat, const std::string& field_name) const;

    /**
     * @brief Lateral mean of a field at every layer.
     */
    std::vector<FieldSample> mean_1d_profile(const std::string& field_name) const;

    FieldStatistics field_statistics(const std::string& field_name) const;

    /**
     * @brief Fixed-format multi-line description of the model.
     */
    std::string summary() const;

private:
    void validate_grid() const;
    void check_field_shape(const std::string& name, const FieldArray& field) const;
    FieldArray& store_field(const std::string& name, FieldHandle field);
    const FieldHandle& find_field(const std::string& name) const;

    CoordinateArray longitude_;
    CoordinateArray latitude_;
    CoordinateArray radius_;
    std::unordered_map<std::string, FieldHandle> fields_;
    std::vector<std::string> field_order_;
    CompositionNames composition_names_;

    mutable std::once_flag index_once_;
    mutable std::unique_ptr<LateralIndex> index_;
};

std::ostream& operator<<(std::ostream& os, const TerraModel& model);

} // namespace terra
