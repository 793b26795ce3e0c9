#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include <nanoflann.hpp>

#include "spherical_geometry.hpp"

/**
 * @file lateral_index.hpp
 * @brief Nearest-neighbour search over the lateral points of a model.
 *
 * Points are stored as unit vectors and searched with a 3-D k-d tree
 * using squared chord length, which orders points exactly as
 * great-circle distance does. Equidistant candidates resolve to the
 * lower point index. The index is immutable once built and safe for
 * concurrent queries.
 */

namespace terra
{

struct Neighbour
{
    std::size_t index = 0;
    double distance_deg = 0.0;
};

class LateralIndex
{
public:
    /**
     * @brief Builds the index from lateral coordinates in degrees.
     * @param longitude Point longitudes.
     * @param latitude Point latitudes, same length as longitude.
     */
    LateralIndex(const std::vector<double>& longitude, const std::vector<double>& latitude);

    LateralIndex(const LateralIndex&) = delete;
    LateralIndex& operator=(const LateralIndex&) = delete;

    /**
     * @brief Returns the index of the point closest to (lon, lat).
     */
    std::size_t nearest_index(double lon, double lat) const;

    /**
     * @brief Returns up to n point indices ordered by increasing distance.
     * @param n Number of neighbours; clamped to the point count, must be positive.
     */
    std::vector<std::size_t> nearest_indices(double lon, double lat, std::size_t n) const;

    /**
     * @brief Returns up to n neighbours with great-circle distances in degrees.
     */
    std::vector<Neighbour> nearest_neighbours(double lon, double lat, std::size_t n) const;

    std::size_t size() const { return cloud_.points.size(); }

    const geometry::UnitVector& unit_vector(std::size_t index) const { return cloud_.points[index]; }

private:
    struct PointCloud
    {
        std::vector<geometry::UnitVector> points;

        std::size_t kdtree_get_point_count() const { return points.size(); }

        double kdtree_get_pt(std::size_t idx, std::size_t dim) const { return points[idx][dim]; }

        template <class BBOX>
        bool kdtree_get_bbox(BBOX&) const
        {
            return false;
        }
    };

    using KDTree = nanoflann::KDTreeSingleIndexAdaptor<
        nanoflann::L2_Simple_Adaptor<double, PointCloud, double, std::size_t>, PointCloud, 3, std::size_t>;

    struct Candidate
    {
        std::size_t index;
        double chord_sq;
    };

    std::vector<Candidate> ranked_candidates(double lon, double lat, std::size_t n) const;

    PointCloud cloud_;
    std::unique_ptr<KDTree> tree_;
};

} // namespace terra
