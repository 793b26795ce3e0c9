/**
 * @file lateral_index.cpp
 * @brief k-d tree nearest-neighbour search on the unit sphere.
 *
 * Queries take the k nearest points from the tree, then widen to every
 * point within the k-th distance so that ties straddling the cut are
 * ranked by index rather than by tree traversal order.
 */

#include "lateral_index.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

namespace terra
{
namespace
{
// Relative squared-chord difference below which points are equidistant.
constexpr double kTieRelative = 1.0e-12;
constexpr double kTieAbsolute = 1.0e-30;
constexpr std::size_t kLeafMaxSize = 10;

double tie_tolerance(double chord_sq)
{
    return kTieRelative * chord_sq + kTieAbsolute;
}

void check_query(double lon, double lat)
{
    if (!std::isfinite(lon) || !std::isfinite(lat))
    {
        throw std::invalid_argument("Lateral query coordinates must be finite");
    }
}
} // namespace

LateralIndex::LateralIndex(const std::vector<double>& longitude, const std::vector<double>& latitude)
{
    if (longitude.size() != latitude.size())
    {
        throw std::invalid_argument("LateralIndex longitude and latitude must have the same length");
    }
    if (longitude.empty())
    {
        throw std::invalid_argument("LateralIndex requires at least one lateral point");
    }

    const int npts = static_cast<int>(longitude.size());
    cloud_.points.resize(longitude.size());

    #pragma omp parallel for
    for (int i = 0; i < npts; ++i)
    {
        cloud_.points[i] = geometry::geog_to_unit(longitude[i], latitude[i]);
    }

    tree_ = std::make_unique<KDTree>(3, cloud_, nanoflann::KDTreeSingleIndexAdaptorParams(kLeafMaxSize));

    if (log_debug_enabled())
    {
        std::cout << "[lateral-index] built k-d tree over " << npts << " lateral points" << std::endl;
    }
}

/**
 * @brief Collects the n closest points, ranked by distance then index.
 */
std::vector<LateralIndex::Candidate> LateralIndex::ranked_candidates(double lon, double lat, std::size_t n) const
{
    check_query(lon, lat);
    if (n == 0)
    {
        throw std::invalid_argument("Number of neighbours must be positive");
    }

    const geometry::UnitVector query = geometry::geog_to_unit(lon, lat);
    const std::size_t k = std::min(n, size());

    std::vector<std::size_t> knn_indices(k);
    std::vector<double> knn_dist_sq(k);
    const std::size_t found = tree_->knnSearch(query.data(), k, knn_indices.data(), knn_dist_sq.data());
    if (found == 0)
    {
        throw std::runtime_error("LateralIndex search returned no points");
    }

    const double kth = knn_dist_sq[found - 1];
    const double cutoff = kth + 2.0 * tie_tolerance(kth);
    std::vector<nanoflann::ResultItem<std::size_t, double>> matches;
    tree_->radiusSearch(query.data(), cutoff, matches);

    std::vector<Candidate> ranked;
    ranked.reserve(matches.size());
    for (const auto& match : matches)
    {
        ranked.push_back({match.first, match.second});
    }

    std::sort(ranked.begin(), ranked.end(), [](const Candidate& a, const Candidate& b)
    {
        if (a.chord_sq != b.chord_sq)
        {
            return a.chord_sq < b.chord_sq;
        }
        return a.index < b.index;
    });

    // Reorder runs of equidistant points by index.
    std::size_t run_start = 0;
    while (run_start < ranked.size())
    {
        std::size_t run_end = run_start + 1;
        const double run_limit = ranked[run_start].chord_sq + tie_tolerance(ranked[run_start].chord_sq);
        while (run_end < ranked.size() && ranked[run_end].chord_sq <= run_limit)
        {
            ++run_end;
        }
        std::sort(ranked.begin() + run_start, ranked.begin() + run_end,
                  [](const Candidate& a, const Candidate& b) { return a.index < b.index; });
        run_start = run_end;
    }

    if (ranked.size() > k)
    {
        ranked.resize(k);
    }
    return ranked;
}

std::size_t LateralIndex::nearest_index(double lon, double lat) const
{
    return ranked_candidates(lon, lat, 1).front().index;
}

std::vector<std::size_t> LateralIndex::nearest_indices(double lon, double lat, std::size_t n) const
{
    const std::vector<Candidate> ranked = ranked_candidates(lon, lat, n);
    std::vector<std::size_t> out;
    out.reserve(ranked.size());
    for (const auto& candidate : ranked)
    {
        out.push_back(candidate.index);
    }
    return out;
}

std::vector<Neighbour> LateralIndex::nearest_neighbours(double lon, double lat, std::size_t n) const
{
    const std::vector<Candidate> ranked = ranked_candidates(lon, lat, n);
    std::vector<Neighbour> out;
    out.reserve(ranked.size());
    for (const auto& candidate : ranked)
    {
        out.push_back({candidate.index, geometry::chord_squared_to_degrees(candidate.chord_sq)});
    }
    return out;
}

} // namespace terra
