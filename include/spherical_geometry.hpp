#pragma once

#include <algorithm>
#include <array>
#include <cmath>

#include "physical_constants.hpp"

/**
 * @file spherical_geometry.hpp
 * @brief Geographic to Cartesian conversion and distances on the unit sphere.
 *
 * Lateral searches work on unit vectors so that longitude wraparound and
 * the poles need no special handling. Chord length between unit vectors
 * is monotonic in great-circle distance, so nearest-by-chord is nearest
 * on the sphere.
 */

namespace terra
{
namespace geometry
{

using UnitVector = std::array<double, 3>;

/**
 * @brief Converts longitude/latitude in degrees to a unit vector.
 */
inline UnitVector geog_to_unit(double lon_deg, double lat_deg)
{
    const double lon = lon_deg * physical_constants::deg_to_rad;
    const double lat = lat_deg * physical_constants::deg_to_rad;
    const double cos_lat = std::cos(lat);
    return {cos_lat * std::cos(lon), cos_lat * std::sin(lon), std::sin(lat)};
}

inline double dot(const UnitVector& a, const UnitVector& b)
{
    return a[0] * b[0] + a[1] * b[1] + a[2] * b[2];
}

inline UnitVector cross(const UnitVector& a, const UnitVector& b)
{
    return {a[1] * b[2] - a[2] * b[1], a[2] * b[0] - a[0] * b[2], a[0] * b[1] - a[1] * b[0]};
}

/**
 * @brief Converts a squared chord length to the subtended angle in degrees.
 */
inline double chord_squared_to_degrees(double chord_sq)
{
    const double half_chord = 0.5 * std::sqrt(std::max(0.0, chord_sq));
    return 2.0 * std::asin(std::min(1.0, half_chord)) * physical_constants::rad_to_deg;
}

/**
 * @brief Great-circle distance in degrees between two geographic points.
 *
 * Uses the Vincenty form, which stays accurate for both small and
 * antipodal separations.
 */
inline double great_circle_degrees(double lon1_deg, double lat1_deg, double lon2_deg, double lat2_deg)
{
    const double lat1 = lat1_deg * physical_constants::deg_to_rad;
    const double lat2 = lat2_deg * physical_constants::deg_to_rad;
    const double dlon = (lon2_deg - lon1_deg) * physical_constants::deg_to_rad;

    const double a = std::cos(lat2) * std::sin(dlon);
    const double b = std::cos(lat1) * std::sin(lat2) - std::sin(lat1) * std::cos(lat2) * std::cos(dlon);
    const double c = std::sin(lat1) * std::sin(lat2) + std::cos(lat1) * std::cos(lat2) * std::cos(dlon);
    return std::atan2(std::hypot(a, b), c) * physical_constants::rad_to_deg;
}

} // namespace geometry
} // namespace terra
