/**
 * @file field_taxonomy.cpp
 * @brief Field name catalogue and name translation tables.
 *
 * Holds the process-wide field taxonomy and the reverse index from
 * external variable names back to field names. Both tables are built
 * on first use and are read-only afterwards.
 */

#include "field_taxonomy.hpp"
#include "terra_errors.hpp"

#include <unordered_map>

namespace terra {
namespace {

/**
 * @brief Builds a single-variable scalar entry.
 */
FieldTaxonomyEntry scalar(const char* name, const char* variable, const char* description) {
    return {name, FieldKind::Scalar, std::nullopt, {variable}, description};
}

const std::vector<FieldTaxonomyEntry> kTaxonomy = {
    scalar("t", "Temperature", "Temperature"),
    scalar("c", "Composition", "Composition"),
    {"u_xyz", FieldKind::Vector, 3, {"Velocity_x", "Velocity_y", "Velocity_z"},
     "Cartesian velocity"},
    {"u_geog", FieldKind::Vector, 3, {"Velocity_E", "Velocity_N", "Velocity_Z"},
     "Geographic velocity (east, north, radial)"},
    {"c_hist", FieldKind::Composition, std::nullopt, {"BasaltFrac", "LherzFrac"},
     "Composition histogram"},
    scalar("vp", "Velocity_P", "P-wave velocity"),
    scalar("vs", "Velocity_S", "S-wave velocity"),
    scalar("vphi", "Velocity_Phi", "Bulk sound velocity"),
    scalar("density", "Density", "Density"),
    scalar("qp", "QualityFactor_P", "P-wave quality factor"),
    scalar("qs", "QualityFactor_S", "S-wave quality factor"),
    scalar("vp_an", "Velocity_P_Anelastic", "Anelastic P-wave velocity"),
    scalar("vs_an", "Velocity_S_Anelastic", "Anelastic S-wave velocity"),
    scalar("p", "Pressure", "Pressure"),
    scalar("visc", "Viscosity", "Viscosity"),
};

/**
 * @brief Reverse index from variable name to owning entry.
 */
const std::unordered_map<std::string, const FieldTaxonomyEntry*>& variable_index() {
    static const std::unordered_map<std::string, const FieldTaxonomyEntry*> index = [] {
        std::unordered_map<std::string, const FieldTaxonomyEntry*> out;
        for (const auto& entry : kTaxonomy) {
            for (const auto& variable : entry.variable_names) {
                out.emplace(variable, &entry);
            }
        }
        return out;
    }();
    return index;
}

const FieldTaxonomyEntry& require_entry(std::string_view name) {
    const FieldTaxonomyEntry* entry = find_field_entry(name);
    if (entry == nullptr) {
        throw UnknownFieldError("Unknown field name '" + std::string(name) + "'");
    }
    return *entry;
}

}

const std::vector<FieldTaxonomyEntry>& field_taxonomy() {
    return kTaxonomy;
}

/**
 * @brief Looks up an entry by exact field name.
 */
const FieldTaxonomyEntry* find_field_entry(std::string_view name) {
    for (const auto& entry : kTaxonomy) {
        if (entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

bool is_valid_field_name(std::string_view name) {
    return find_field_entry(name) != nullptr;
}

void check_field_name(std::string_view name) {
    if (!is_valid_field_name(name)) {
        throw FieldNameError(std::string(name));
    }
}

const std::vector<std::string>& variable_names_for(std::string_view name) {
    return require_entry(name).variable_names;
}

const std::string& field_name_for(std::string_view variable_name) {
    const auto& index = variable_index();
    const auto it = index.find(std::string(variable_name));
    if (it == index.end()) {
        throw UnknownFieldError("Unknown variable name '" + std::string(variable_name) + "'");
    }
    return it->second->name;
}

bool is_scalar_field(std::string_view name) {
    const FieldTaxonomyEntry* entry = find_field_entry(name);
    return entry != nullptr && entry->kind == FieldKind::Scalar;
}

bool is_vector_field(std::string_view name) {
    const FieldTaxonomyEntry* entry = find_field_entry(name);
    return entry != nullptr && entry->kind == FieldKind::Vector;
}

bool is_composition_field(std::string_view name) {
    const FieldTaxonomyEntry* entry = find_field_entry(name);
    return entry != nullptr && entry->kind == FieldKind::Composition;
}

std::optional<int> expected_vector_ncomp(std::string_view name) {
    const FieldTaxonomyEntry& entry = require_entry(name);
    if (entry.kind != FieldKind::Vector) {
        return std::nullopt;
    }
    return entry.expected_ncomp;
}

/**
 * @brief Converts field kind enum to stable string id.
 */
const char* to_string(FieldKind kind) {
    switch (kind) {
        case FieldKind::Scalar:
            return "scalar";
        case FieldKind::Vector:
            return "vector";
        case FieldKind::Composition:
            return "composition";
        default:
            return "unknown";
    }
}

}
