#pragma once

/**
 * @file physical_constants.hpp
 * @brief Shared geometric constants used across model components.
 *
 * Angle conversion factors shared by the geometry helpers and the
 * lateral index.
 */

namespace physical_constants
{
inline constexpr double pi = 3.14159265358979323846;
inline constexpr double deg_to_rad = pi / 180.0;
inline constexpr double rad_to_deg = 180.0 / pi;
} // namespace physical_constants
