/**
 * @file terra_model.cpp
 * @brief Grid validation, field registry, and queries of TerraModel.
 */

#include "terra_model.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace terra
{
namespace
{

const char* const kCompositionField = "c_hist";

std::string shape_to_string(const std::vector<int>& shape)
{
    std::ostringstream oss;
    oss << "(";
    for (std::size_t i = 0; i < shape.size(); ++i)
    {
        if (i > 0)
        {
            oss << ", ";
        }
        oss << shape[i];
    }
    oss << ")";
    return oss.str();
}

bool all_finite(const std::vector<CoordinateType>& values)
{
    for (const CoordinateType v : values)
    {
        if (!std::isfinite(v))
        {
            return false;
        }
    }
    return true;
}

const FieldTaxonomyEntry& entry_for(const std::string& name)
{
    const FieldTaxonomyEntry* entry = find_field_entry(name);
    if (entry == nullptr)
    {
        throw FieldNameError(name);
    }
    return *entry;
}

} // namespace

TerraModel::TerraModel(CoordinateArray longitude,
                       CoordinateArray latitude,
                       CoordinateArray radius,
                       FieldList fields,
                       CompositionNames composition_names)
    : longitude_(std::move(longitude)),
      latitude_(std::move(latitude)),
      radius_(std::move(radius)),
      composition_names_(std::move(composition_names))
{
    validate_grid();

    for (auto& item : fields)
    {
        const std::string& name = item.first;
        check_field_name(name);
        if (fields_.count(name) != 0)
        {
            throw std::invalid_argument("Field '" + name + "' supplied more than once");
        }
        if (!item.second)
        {
            throw std::invalid_argument("Field '" + name + "' has no array");
        }
        check_field_shape(name, *item.second);
        fields_.emplace(name, std::move(item.second));
        field_order_.push_back(name);
    }

    if (log_debug_enabled())
    {
        std::cout << "[terra-model] constructed model\n" << summary() << std::endl;
        for (const auto& name : field_order_)
        {
            const FieldStatistics stats = compute_field_statistics(*fields_.at(name));
            std::cout << "[terra-model] field '" << name << "' shape "
                      << shape_to_string(fields_.at(name)->shape())
                      << " min=" << stats.min_value << " max=" << stats.max_value
                      << " mean=" << stats.mean_value
                      << " nonfinite=" << (stats.nan_count + stats.inf_count) << std::endl;
        }
    }
}

TerraModel::TerraModel(std::vector<CoordinateType> longitude,
                       std::vector<CoordinateType> latitude,
                       std::vector<CoordinateType> radius,
                       FieldList fields,
                       CompositionNames composition_names)
    : TerraModel(std::make_shared<const std::vector<CoordinateType>>(std::move(longitude)),
                 std::make_shared<const std::vector<CoordinateType>>(std::move(latitude)),
                 std::make_shared<const std::vector<CoordinateType>>(std::move(radius)),
                 std::move(fields),
                 std::move(composition_names))
{
}

/**
 * @brief Checks coordinate arrays; length mismatch is reported before radius order.
 */
void TerraModel::validate_grid() const
{
    if (!longitude_ || !latitude_ || !radius_)
    {
        throw std::invalid_argument("Coordinate arrays must not be null");
    }

    if (longitude_->size() != latitude_->size())
    {
        throw std::invalid_argument("Longitude and latitude arrays must have the same length (got " +
                                    std::to_string(longitude_->size()) + " and " +
                                    std::to_string(latitude_->size()) + ")");
    }

    const std::vector<CoordinateType>& r = *radius_;
    for (std::size_t i = 1; i < r.size(); ++i)
    {
        if (!(r[i] > r[i - 1]))
        {
            throw std::invalid_argument("Radii must be strictly increasing (radius[" + std::to_string(i) +
                                        "] = " + strutil::format_float(r[i]) + " follows " +
                                        strutil::format_float(r[i - 1]) + ")");
        }
    }

    if (longitude_->empty())
    {
        throw std::invalid_argument("Model requires at least one lateral point");
    }
    if (r.empty())
    {
        throw std::invalid_argument("Model requires at least one radius");
    }
    if (!all_finite(*longitude_) || !all_finite(*latitude_) || !all_finite(r))
    {
        throw std::invalid_argument("Coordinates must be finite");
    }
}

void TerraModel::check_field_shape(const std::string& name, const FieldArray& field) const
{
    const FieldTaxonomyEntry& entry = entry_for(name);

    if (field.nlayers() != nlayers() || field.npts() != npts())
    {
        throw FieldDimensionError("Field '" + name + "' has shape " + shape_to_string(field.shape()) +
                                  " but the grid has " + std::to_string(nlayers()) + " layers and " +
                                  std::to_string(npts()) + " lateral points");
    }

    switch (entry.kind)
    {
        case FieldKind::Scalar:
            if (field.rank() != 2)
            {
                throw FieldDimensionError("Scalar field '" + name + "' must have shape " +
                                          shape_to_string({nlayers(), npts()}) + ", got " +
                                          shape_to_string(field.shape()));
            }
            break;
        case FieldKind::Vector:
        {
            const int expected = entry.expected_ncomp.value_or(3);
            if (field.rank() != 3 || field.ncomp() != expected)
            {
                throw FieldDimensionError("Vector field '" + name + "' must have shape " +
                                          shape_to_string({nlayers(), npts(), expected}) + ", got " +
                                          shape_to_string(field.shape()));
            }
            break;
        }
        case FieldKind::Composition:
            if (field.rank() != 3 || field.ncomp() < 1)
            {
                throw FieldDimensionError("Composition field '" + name +
                                          "' must have at least one component, got shape " +
                                          shape_to_string(field.shape()));
            }
            if (composition_names_ && field.ncomp() != static_cast<int>(composition_names_->size()))
            {
                throw FieldDimensionError("Composition field '" + name + "' has " +
                                          std::to_string(field.ncomp()) + " components but " +
                                          std::to_string(composition_names_->size()) +
                                          " composition names were given");
            }
            break;
    }
}

const FieldHandle& TerraModel::find_field(const std::string& name) const
{
    check_field_name(name);
    const auto it = fields_.find(name);
    if (it == fields_.end())
    {
        throw NoFieldError(name);
    }
    return it->second;
}

FieldArray& TerraModel::get_field(const std::string& name)
{
    return *find_field(name);
}

const FieldArray& TerraModel::get_field(const std::string& name) const
{
    return *find_field(name);
}

FieldHandle TerraModel::get_field_handle(const std::string& name) const
{
    return find_field(name);
}

bool TerraModel::has_field(const std::string& name) const
{
    return fields_.count(name) != 0;
}

/**
 * @brief Stores a new field, or zeroes the existing array of the same shape in place.
 *
 * References returned earlier by get_field or new_field stay valid.
 */
FieldArray& TerraModel::store_field(const std::string& name, FieldHandle field)
{
    const auto it = fields_.find(name);
    if (it != fields_.end())
    {
        FieldArray& existing = *it->second;
        if (existing.shape() != field->shape())
        {
            throw std::invalid_argument("Field '" + name + "' already exists with shape " +
                                        shape_to_string(existing.shape()) + ", cannot recreate it with shape " +
                                        shape_to_string(field->shape()));
        }
        existing.fill(0.0f);
        if (log_debug_enabled())
        {
            std::cout << "[terra-model] reset field '" << name << "' to zeros" << std::endl;
        }
        return existing;
    }

    fields_.emplace(name, field);
    field_order_.push_back(name);
    if (log_debug_enabled())
    {
        std::cout << "[terra-model] created field '" << name << "' with shape "
                  << shape_to_string(field->shape()) << std::endl;
    }
    return *field;
}

FieldArray& TerraModel::new_field(const std::string& name, std::optional<int> ncomp)
{
    const FieldTaxonomyEntry& entry = entry_for(name);

    FieldHandle field;
    switch (entry.kind)
    {
        case FieldKind::Scalar:
            if (ncomp)
            {
                throw std::invalid_argument("Scalar field '" + name + "' takes no component count (got " +
                                            std::to_string(*ncomp) + ")");
            }
            field = std::make_shared<FieldArray>(nlayers(), npts());
            break;
        case FieldKind::Vector:
        {
            const int expected = entry.expected_ncomp.value_or(3);
            if (ncomp && *ncomp != expected)
            {
                throw std::invalid_argument("Vector field '" + name + "' has " + std::to_string(expected) +
                                            " components (got " + std::to_string(*ncomp) + ")");
            }
            field = std::make_shared<FieldArray>(nlayers(), npts(), expected);
            break;
        }
        case FieldKind::Composition:
        {
            if (!ncomp)
            {
                throw std::invalid_argument("Composition field '" + name + "' requires a component count");
            }
            if (*ncomp < 1)
            {
                throw std::invalid_argument("Composition field '" + name +
                                            "' requires at least one component (got " +
                                            std::to_string(*ncomp) + ")");
            }
            if (composition_names_ && *ncomp != static_cast<int>(composition_names_->size()))
            {
                throw std::invalid_argument("Composition field '" + name + "' with " + std::to_string(*ncomp) +
                                            " components conflicts with " +
                                            std::to_string(composition_names_->size()) + " composition names");
            }
            const std::optional<int> existing = number_of_compositions();
            if (existing && *existing != *ncomp)
            {
                throw std::invalid_argument("Composition field '" + name + "' already has " +
                                            std::to_string(*existing) + " components (got " +
                                            std::to_string(*ncomp) + ")");
            }
            field = std::make_shared<FieldArray>(nlayers(), npts(), *ncomp);
            break;
        }
    }

    return store_field(name, std::move(field));
}

std::optional<int> TerraModel::number_of_compositions() const
{
    const auto it = fields_.find(kCompositionField);
    if (it == fields_.end())
    {
        return std::nullopt;
    }
    return it->second->ncomp();
}

const LateralIndex& TerraModel::lateral_index() const
{
    std::call_once(index_once_, [this]()
    {
        index_ = std::make_unique<LateralIndex>(*longitude_, *latitude_);
    });
    return *index_;
}

std::size_t TerraModel::nearest_index(double lon, double lat) const
{
    return lateral_index().nearest_index(lon, lat);
}

std::vector<std::size_t> TerraModel::nearest_indices(double lon, double lat, std::size_t n) const
{
    return lateral_index().nearest_indices(lon, lat, n);
}

std::vector<Neighbour> TerraModel::nearest_neighbours(double lon, double lat, std::size_t n) const
{
    return lateral_index().nearest_neighbours(lon, lat, n);
}

FieldSample TerraModel::evaluate(double lon,
                                 double lat,
                                 double radius,
                                 const std::string& field_name,
                                 const EvaluationOptions& options) const
{
    const FieldArray& field = *find_field(field_name);
    const FieldKind kind = entry_for(field_name).kind;

    const std::vector<LateralWeight> lateral = lateral_weights(lateral_index(), lon, lat, options.lateral);

    const double query_radius = options.depth ? radius_->back() - radius : radius;
    const RadiusBracket bracket = radius_bracket(*radius_, query_radius, options.radial_boundary);

    return interpolate_field(field, kind, bracket, lateral);
}

std::vector<FieldSample> TerraModel::get_1d_profile(double lon, double lat, const std::string& field_name) const
{
    const FieldArray& field = *find_field(field_name);
    const FieldKind kind = entry_for(field_name).kind;
    const int point = static_cast<int>(nearest_index(lon, lat));

    std::vector<FieldSample> profile;
    profile.reserve(radius_->size());
    for (int layer = 0; layer < nlayers(); ++layer)
    {
        profile.push_back(sample_at(field, kind, layer, point));
    }
    return profile;
}

std::vector<FieldSample> TerraModel::mean_1d_profile(const std::string& field_name) const
{
    const FieldArray& field = *find_field(field_name);
    const FieldKind kind = entry_for(field_name).kind;
    const int ncomp = field.ncomp();
    const int nlayer = nlayers();
    const int npoint = npts();

    std::vector<FieldSample> profile(static_cast<std::size_t>(nlayer));

    #pragma omp parallel for
    for (int layer = 0; layer < nlayer; ++layer)
    {
        FieldSample& sample = profile[static_cast<std::size_t>(layer)];
        sample.kind = kind;
        sample.values.assign(static_cast<std::size_t>(ncomp), 0.0);
        for (int point = 0; point < npoint; ++point)
        {
            const ValueType* values = field.values_at(layer, point);
            for (int comp = 0; comp < ncomp; ++comp)
            {
                sample.values[comp] += static_cast<double>(values[comp]);
            }
        }
        for (double& v : sample.values)
        {
            v /= static_cast<double>(npoint);
        }
    }
    return profile;
}

FieldStatistics TerraModel::field_statistics(const std::string& field_name) const
{
    return compute_field_statistics(*find_field(field_name));
}

std::string TerraModel::summary() const
{
    std::ostringstream oss;
    oss << "TerraModel:\n"
        << "           number of radii: " << nlayers() << "\n"
        << "             radius limits: (" << strutil::format_float(radius_->front()) << ", "
        << strutil::format_float(radius_->back()) << ")\n"
        << "  number of lateral points: " << npts() << "\n"
        << "                    fields: " << strutil::format_name_list(field_order_) << "\n"
        << "         composition names: "
        << (composition_names_ ? strutil::format_name_list(*composition_names_) : std::string("None"));
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const TerraModel& model)
{
    return os << model.summary();
}

} // namespace terra
