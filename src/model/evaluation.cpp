/**
 * @file evaluation.cpp
 * @brief Radial bracketing and lateral weighting for point evaluation.
 */

#include "evaluation.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace terra {
namespace {

// Barycentric weights below this are outside the triangle.
constexpr double kInsideTolerance = 1.0e-9;
constexpr double kDegenerateDeterminant = 1.0e-14;

/**
 * @brief Linear weight of x between x1 and x2.
 */
double fraction(double x1, double x2, double x) {
    if (x1 == x2) return 0.0;
    return (x - x1) / (x2 - x1);
}

}

double FieldSample::scalar() const {
    if (kind != FieldKind::Scalar || values.size() != 1) {
        throw std::logic_error(std::string("FieldSample::scalar called on a ") + to_string(kind) + " sample");
    }
    return values.front();
}

RadiusBracket radius_bracket(const std::vector<double>& radii, double radius, RadialBoundary boundary) {
    if (radii.empty()) {
        throw std::invalid_argument("radius_bracket requires at least one layer");
    }
    if (!std::isfinite(radius)) {
        throw std::invalid_argument("Query radius must be finite");
    }

    const std::size_t nlayers = radii.size();
    if (nlayers == 1) {
        return {0, 0, 0.0};
    }

    const bool extrapolate = boundary == RadialBoundary::Extrapolate;

    if (radius <= radii.front()) {
        if (extrapolate) {
            return {0, 1, fraction(radii[0], radii[1], radius)};
        }
        return {0, 0, 0.0};
    }

    if (radius >= radii.back()) {
        if (extrapolate) {
            return {nlayers - 2, nlayers - 1, fraction(radii[nlayers - 2], radii[nlayers - 1], radius)};
        }
        return {nlayers - 1, nlayers - 1, 0.0};
    }

    const auto it = std::upper_bound(radii.begin(), radii.end(), radius);
    const std::size_t upper = static_cast<std::size_t>(it - radii.begin());
    const std::size_t lower = upper - 1;
    return {lower, upper, fraction(radii[lower], radii[upper], radius)};
}

std::vector<LateralWeight> lateral_weights(const LateralIndex& index, double lon, double lat, LateralMethod method) {
    if (method == LateralMethod::Nearest || index.size() < 3) {
        return {{index.nearest_index(lon, lat), 1.0}};
    }

    const std::vector<std::size_t> nearest = index.nearest_indices(lon, lat, 3);
    const geometry::UnitVector p = geometry::geog_to_unit(lon, lat);
    const geometry::UnitVector& a = index.unit_vector(nearest[0]);
    const geometry::UnitVector& b = index.unit_vector(nearest[1]);
    const geometry::UnitVector& c = index.unit_vector(nearest[2]);

    // Solve p = wa*a + wb*b + wc*c by Cramer's rule.
    const double det = geometry::dot(a, geometry::cross(b, c));
    if (std::abs(det) < kDegenerateDeterminant) {
        return {{nearest[0], 1.0}};
    }

    double wa = geometry::dot(p, geometry::cross(b, c)) / det;
    double wb = geometry::dot(a, geometry::cross(p, c)) / det;
    double wc = geometry::dot(a, geometry::cross(b, p)) / det;
    if (wa < -kInsideTolerance || wb < -kInsideTolerance || wc < -kInsideTolerance) {
        return {{nearest[0], 1.0}};
    }

    wa = std::max(wa, 0.0);
    wb = std::max(wb, 0.0);
    wc = std::max(wc, 0.0);
    const double total = wa + wb + wc;
    return {{nearest[0], wa / total}, {nearest[1], wb / total}, {nearest[2], wc / total}};
}

FieldSample interpolate_field(const FieldArray& field,
                              FieldKind kind,
                              const RadiusBracket& bracket,
                              const std::vector<LateralWeight>& lateral) {
    const int ncomp = field.ncomp();
    const int lower = static_cast<int>(bracket.lower);
    const int upper = static_cast<int>(bracket.upper);

    FieldSample out;
    out.kind = kind;
    out.values.assign(static_cast<std::size_t>(ncomp), 0.0);

    for (const auto& lw : lateral) {
        const int point = static_cast<int>(lw.index);
        const ValueType* v_lower = field.values_at(lower, point);
        const ValueType* v_upper = field.values_at(upper, point);
        for (int comp = 0; comp < ncomp; ++comp) {
            const double radial = (1.0 - bracket.weight) * static_cast<double>(v_lower[comp]) +
                                  bracket.weight * static_cast<double>(v_upper[comp]);
            out.values[comp] += lw.weight * radial;
        }
    }
    return out;
}

FieldSample sample_at(const FieldArray& field, FieldKind kind, int layer, int point) {
    const ValueType* values = field.values_at(layer, point);
    FieldSample out;
    out.kind = kind;
    out.values.assign(values, values + field.ncomp());
    return out;
}

/**
 * @brief Parses lateral method text into enum representation.
 */
bool parse_lateral_method(const std::string& value, LateralMethod& out_method) {
    const std::string v = strutil::lower_copy(strutil::trim_copy(value));
    if (v == "nearest") {
        out_method = LateralMethod::Nearest;
        return true;
    }
    if (v == "triangle") {
        out_method = LateralMethod::Triangle;
        return true;
    }
    return false;
}

/**
 * @brief Parses radial boundary policy text into enum representation.
 */
bool parse_radial_boundary(const std::string& value, RadialBoundary& out_boundary) {
    const std::string v = strutil::lower_copy(strutil::trim_copy(value));
    if (v == "clamp") {
        out_boundary = RadialBoundary::Clamp;
        return true;
    }
    if (v == "extrapolate") {
        out_boundary = RadialBoundary::Extrapolate;
        return true;
    }
    return false;
}

const char* to_string(LateralMethod method) {
    switch (method) {
        case LateralMethod::Nearest:
            return "nearest";
        case LateralMethod::Triangle:
            return "triangle";
        default:
            return "nearest";
    }
}

const char* to_string(RadialBoundary boundary) {
    switch (boundary) {
        case RadialBoundary::Clamp:
            return "clamp";
        case RadialBoundary::Extrapolate:
            return "extrapolate";
        default:
            return "clamp";
    }
}

}
