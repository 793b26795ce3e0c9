#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file field_taxonomy.hpp
 * @brief Static catalogue of the field names a model may carry.
 *
 * Each entry records the semantic kind of a field, its fixed component
 * count where one exists, and the external (NetCDF) variable names the
 * field is persisted under. The table is built once and never mutated;
 * every query is a probe into it.
 */

namespace terra
{

enum class FieldKind
{
    Scalar,
    Vector,
    Composition,
};

struct FieldTaxonomyEntry
{
    std::string name;
    FieldKind kind = FieldKind::Scalar;
    std::optional<int> expected_ncomp;
    std::vector<std::string> variable_names;
    std::string description;
};

/**
 * @brief Returns the complete field taxonomy.
 * @return Immutable list of entries in catalogue order.
 */
const std::vector<FieldTaxonomyEntry>& field_taxonomy();

/**
 * @brief Finds a taxonomy entry by field name.
 * @param name Field name.
 * @return Pointer to matched entry, or null if not found.
 */
const FieldTaxonomyEntry* find_field_entry(std::string_view name);

/**
 * @brief Reports whether a name is a recognised field name.
 */
bool is_valid_field_name(std::string_view name);

/**
 * @brief Throws FieldNameError when the name is not in the taxonomy.
 * @param name Field name to check.
 */
void check_field_name(std::string_view name);

/**
 * @brief Returns the external variable names for a field.
 * @param name Field name.
 * @return Ordered variable names (one per component for multi-component fields).
 * @throws UnknownFieldError if the name is not in the taxonomy.
 */
const std::vector<std::string>& variable_names_for(std::string_view name);

/**
 * @brief Inverse of variable_names_for.
 * @param variable_name External variable name.
 * @return Field name the variable belongs to.
 * @throws UnknownFieldError if no field uses the variable name.
 */
const std::string& field_name_for(std::string_view variable_name);

bool is_scalar_field(std::string_view name);
bool is_vector_field(std::string_view name);
bool is_composition_field(std::string_view name);

/**
 * @brief Returns the fixed component count of a vector field.
 * @param name Field name.
 * @return Component count, or nullopt for scalar and composition fields.
 * @throws UnknownFieldError if the name is not in the taxonomy.
 */
std::optional<int> expected_vector_ncomp(std::string_view name);

/**
 * @brief Converts field kind to text.
 */
const char* to_string(FieldKind kind);

} // namespace terra
