#include "lateral_index.hpp"
#include "terra_model.hpp"
#include "test_support.hpp"

#include <limits>
#include <random>
#include <string>
#include <vector>

using namespace terra;
using test_support::nearly_equal;
using test_support::throws;

namespace
{
const char* const kTag = "lateral-index";

int expect_true(bool cond, const std::string& message)
{
    return test_support::expect_true(kTag, cond, message);
}

int test_nearest_index()
{
    TerraModel model(std::vector<double>{20.0, 22.0, 0.1, 25.0}, std::vector<double>{20.0, 22.0, 0.1, 24.0},
                     std::vector<double>{10.0, 20.0});
    return expect_true(model.nearest_index(0.0, 0.0) == 2, "nearest point to the origin is index 2");
}

int test_nearest_across_antimeridian()
{
    LateralIndex index({179.5, -170.0}, {0.0, 0.0});
    return expect_true(index.nearest_index(-179.9, 0.0) == 0,
                       "distance wraps across the antimeridian");
}

int test_nearest_across_pole()
{
    int failures = 0;
    LateralIndex index({0.0, 180.0}, {89.9, 89.0});
    failures += expect_true(index.nearest_index(180.0, 89.95) == 0, "distance passes over the pole");

    const std::vector<Neighbour> neighbours = index.nearest_neighbours(180.0, 89.95, 2);
    failures += expect_true(neighbours.size() == 2, "two neighbours returned");
    failures += expect_true(nearly_equal(neighbours[0].distance_deg, 0.15, 1.0e-9),
                            "great-circle distance over the pole is 0.15 degrees");
    failures += expect_true(nearly_equal(neighbours[1].distance_deg, 0.95, 1.0e-9),
                            "great-circle distance along the meridian is 0.95 degrees");
    return failures;
}

int test_ties_resolve_to_lower_index()
{
    int failures = 0;
    {
        LateralIndex index({-10.0, 10.0}, {0.0, 0.0});
        failures += expect_true(index.nearest_index(0.0, 0.0) == 0, "equidistant points pick index 0");
    }
    {
        LateralIndex index({10.0, -10.0}, {0.0, 0.0});
        failures += expect_true(index.nearest_index(0.0, 0.0) == 0, "tie-break does not depend on position");
    }
    {
        LateralIndex index({50.0, 10.0, 10.0}, {0.0, 0.0, 0.0});
        failures += expect_true(index.nearest_index(10.0, 0.0) == 1, "duplicate points pick the lower index");
        const std::vector<std::size_t> ranked = index.nearest_indices(10.0, 0.0, 3);
        failures += expect_true(ranked == std::vector<std::size_t>{1, 2, 0}, "ranking keeps duplicates in index order");
    }
    return failures;
}

int test_close_points_are_not_tied()
{
    int failures = 0;
    // Both points lie within a few metres of the query; index 1 is strictly closer.
    LateralIndex index({0.0, 0.0}, {2.0e-5, 1.0e-5});
    failures += expect_true(index.nearest_index(0.0, 0.0) == 1, "strictly closer point wins over a lower index");
    failures += expect_true(index.nearest_indices(0.0, 0.0, 2) == std::vector<std::size_t>{1, 0},
                            "nearby points are ranked by distance");
    return failures;
}

int test_nearest_indices_order()
{
    int failures = 0;
    LateralIndex index({0.0, 0.0, 0.0, 0.0}, {30.0, 0.0, 10.0, -50.0});
    failures += expect_true(index.size() == 4, "index holds every point");

    failures += expect_true(index.nearest_indices(0.0, 0.0, 3) == std::vector<std::size_t>{1, 2, 0},
                            "indices are ordered by distance");
    failures += expect_true(index.nearest_indices(0.0, 0.0, 10).size() == 4, "count is clamped to the point count");

    const std::vector<Neighbour> neighbours = index.nearest_neighbours(0.0, 0.0, 4);
    failures += expect_true(nearly_equal(neighbours[0].distance_deg, 0.0, 1.0e-9), "coincident point at 0 degrees");
    failures += expect_true(nearly_equal(neighbours[1].distance_deg, 10.0, 1.0e-9), "second point at 10 degrees");
    failures += expect_true(nearly_equal(neighbours[3].distance_deg, 50.0, 1.0e-9), "farthest point at 50 degrees");
    return failures;
}

int test_matches_brute_force()
{
    int failures = 0;
    std::mt19937 rng(31);
    const auto coords = test_support::random_coordinates(1, 500, rng);
    LateralIndex index(*coords.lon, *coords.lat);

    std::uniform_real_distribution<double> lon_dist(-180.0, 180.0);
    std::uniform_real_distribution<double> lat_dist(-90.0, 90.0);
    for (int q = 0; q < 50; ++q)
    {
        const double lon = lon_dist(rng);
        const double lat = lat_dist(rng);
        double best = std::numeric_limits<double>::infinity();
        std::size_t best_index = 0;
        for (std::size_t i = 0; i < coords.lon->size(); ++i)
        {
            const double d = geometry::great_circle_degrees(lon, lat, (*coords.lon)[i], (*coords.lat)[i]);
            if (d < best)
            {
                best = d;
                best_index = i;
            }
        }
        failures += expect_true(index.nearest_index(lon, lat) == best_index,
                                "k-d tree result must match brute force for query " + std::to_string(q));
    }
    return failures;
}

int test_invalid_queries()
{
    int failures = 0;
    LateralIndex index({0.0, 1.0}, {0.0, 1.0});
    failures += expect_true(throws<std::invalid_argument>([&] { index.nearest_indices(0.0, 0.0, 0); }),
                            "zero neighbours must be rejected");
    failures += expect_true(throws<std::invalid_argument>([&] {
                                index.nearest_index(std::numeric_limits<double>::quiet_NaN(), 0.0);
                            }),
                            "non-finite query must be rejected");
    failures += expect_true(throws<std::invalid_argument>([] { LateralIndex bad({0.0}, {0.0, 1.0}); }),
                            "mismatched coordinates must be rejected");
    failures += expect_true(throws<std::invalid_argument>([] {
                                LateralIndex empty(std::vector<double>{}, std::vector<double>{});
                            }),
                            "empty coordinates must be rejected");
    return failures;
}

int test_model_index_is_reused()
{
    int failures = 0;
    TerraModel model(std::vector<double>{0.0, 45.0, 90.0}, std::vector<double>{0.0, 0.0, 0.0},
                     std::vector<double>{1.0});
    const LateralIndex* first = &model.lateral_index();
    failures += expect_true(model.nearest_index(44.0, 1.0) == 1, "model forwards nearest_index");
    failures += expect_true(&model.lateral_index() == first, "index is built once and reused");
    failures += expect_true(model.nearest_indices(80.0, 0.0, 2) == std::vector<std::size_t>{2, 1},
                            "model forwards nearest_indices");
    return failures;
}
} // namespace

int main()
{
    int failures = 0;
    failures += test_nearest_index();
    failures += test_nearest_across_antimeridian();
    failures += test_nearest_across_pole();
    failures += test_ties_resolve_to_lower_index();
    failures += test_close_points_are_not_tied();
    failures += test_nearest_indices_order();
    failures += test_matches_brute_force();
    failures += test_invalid_queries();
    failures += test_model_index_is_reused();
    return test_support::finish(kTag, failures);
}
