#include "logging.hpp"
#include "terra_model.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <limits>
#include <random>
#include <set>
#include <string>
#include <vector>

using namespace terra;
using test_support::throws;
using test_support::throws_value_error;

namespace
{
const char* const kTag = "model-construction";

int expect_true(bool cond, const std::string& message)
{
    return test_support::expect_true(kTag, cond, message);
}

int test_invalid_field_dimensions()
{
    int failures = 0;
    std::mt19937 rng(11);
    const int nlayers = 3;
    const int npts = 10;
    const auto coords = test_support::random_coordinates(nlayers, npts, rng);

    const std::vector<std::pair<int, int>> bad_shapes = {
        {nlayers, npts - 1}, {nlayers, npts + 1}, {nlayers - 1, npts}, {nlayers + 1, npts}};
    for (const auto& shape : bad_shapes)
    {
        const FieldHandle field = test_support::random_field(shape.first, shape.second, rng);
        failures += expect_true(throws<FieldDimensionError>([&] {
                                    TerraModel model(coords.lon, coords.lat, coords.radius, {{"t", field}});
                                }),
                                "scalar field of shape (" + std::to_string(shape.first) + ", " +
                                    std::to_string(shape.second) + ") must be rejected");
    }

    const FieldHandle bad_vector = test_support::random_field(nlayers, npts + 1, 3, rng);
    failures += expect_true(throws<FieldDimensionError>([&] {
                                TerraModel model(coords.lon, coords.lat, coords.radius, {{"u_geog", bad_vector}});
                            }),
                            "vector field with the wrong point count must be rejected");

    const FieldHandle rank3_scalar = test_support::random_field(nlayers, npts, 1, rng);
    failures += expect_true(throws<FieldDimensionError>([&] {
                                TerraModel model(coords.lon, coords.lat, coords.radius, {{"vp", rank3_scalar}});
                            }),
                            "scalar field with a component axis must be rejected");
    return failures;
}

int test_invalid_field_name()
{
    std::mt19937 rng(12);
    const auto coords = test_support::random_coordinates(3, 10, rng);
    const FieldHandle field = test_support::random_field(3, 10, rng);
    return expect_true(throws<FieldNameError>([&] {
                           TerraModel model(coords.lon, coords.lat, coords.radius, {{"incorrect field name", field}});
                       }),
                       "unknown field name must raise FieldNameError");
}

int test_invalid_vector_components()
{
    int failures = 0;
    std::mt19937 rng(13);
    const auto coords = test_support::random_coordinates(3, 10, rng);

    for (int ncomp : {2, 4})
    {
        const FieldHandle field = test_support::random_field(3, 10, ncomp, rng);
        failures += expect_true(throws<FieldDimensionError>([&] {
                                    TerraModel model(coords.lon, coords.lat, coords.radius, {{"u_xyz", field}});
                                }),
                                "u_xyz with " + std::to_string(ncomp) + " components must be rejected");
    }

    const FieldHandle flat = test_support::random_field(3, 10, rng);
    failures += expect_true(throws<FieldDimensionError>([&] {
                                TerraModel model(coords.lon, coords.lat, coords.radius, {{"u_xyz", flat}});
                            }),
                            "vector field without a component axis must be rejected");
    return failures;
}

int test_composition_name_mismatch()
{
    int failures = 0;
    std::mt19937 rng(14);
    const auto coords = test_support::random_coordinates(3, 10, rng);
    const FieldHandle hist = test_support::random_field(3, 10, 2, rng);

    failures += expect_true(throws<FieldDimensionError>([&] {
                                TerraModel model(coords.lon, coords.lat, coords.radius, {{"c_hist", hist}},
                                           std::vector<std::string>{"A", "B", "C"});
                            }),
                            "composition names must match the histogram component count");
    failures += expect_true(test_support::does_not_throw([&] {
                                TerraModel model(coords.lon, coords.lat, coords.radius, {{"c_hist", hist}});
                            }),
                            "composition histogram without names is accepted");
    return failures;
}

int test_radii_must_increase()
{
    int failures = 0;
    const std::vector<double> lon = {1.0, 2.0, 3.0};
    const std::vector<double> lat = {10.0, 20.0, 30.0};

    const std::vector<std::vector<double>> bad_radii = {{1.0, 3.0, 2.0}, {3.0, 2.0, 1.0}, {1.0, 1.0, 2.0}};
    for (const auto& radii : bad_radii)
    {
        failures += expect_true(throws_value_error([&] { TerraModel model(lon, lat, radii); }),
                                "non-increasing radii must be rejected");
    }
    failures += expect_true(test_support::does_not_throw([&] { TerraModel model(lon, lat, std::vector<double>{5.0}); }),
                            "a single layer is a valid grid");
    return failures;
}

int test_coordinate_length_mismatch()
{
    int failures = 0;
    failures += expect_true(throws_value_error([] {
                                TerraModel model(std::vector<double>{1.0}, std::vector<double>{2.0, 3.0},
                                           std::vector<double>{1.0, 2.0});
                            }),
                            "longitude and latitude of different lengths must be rejected");
    failures += expect_true(throws_value_error([] {
                                TerraModel model(std::vector<double>{}, std::vector<double>{},
                                           std::vector<double>{1.0, 2.0});
                            }),
                            "a grid without lateral points must be rejected");
    failures += expect_true(throws_value_error([] {
                                TerraModel model(std::vector<double>{1.0}, std::vector<double>{2.0},
                                           std::vector<double>{});
                            }),
                            "a grid without radii must be rejected");
    failures += expect_true(throws_value_error([] {
                                TerraModel model(std::vector<double>{std::numeric_limits<double>::quiet_NaN()},
                                           std::vector<double>{2.0}, std::vector<double>{1.0});
                            }),
                            "non-finite coordinates must be rejected");
    failures += expect_true(throws_value_error([] {
                                TerraModel model(CoordinateArray(), std::make_shared<const std::vector<double>>(1, 2.0),
                                           std::make_shared<const std::vector<double>>(1, 3.0));
                            }),
                            "missing coordinate arrays must be rejected");
    return failures;
}

int test_duplicate_field()
{
    std::mt19937 rng(15);
    const auto coords = test_support::random_coordinates(2, 4, rng);
    const FieldHandle a = test_support::random_field(2, 4, rng);
    const FieldHandle b = test_support::random_field(2, 4, rng);
    return expect_true(throws_value_error([&] {
                           TerraModel model(coords.lon, coords.lat, coords.radius, {{"t", a}, {"t", b}});
                       }),
                       "a field supplied twice must be rejected");
}

int test_construction_keeps_inputs()
{
    int failures = 0;
    std::mt19937 rng(16);
    const int nlayers = 3;
    const int npts = 10;
    const auto coords = test_support::random_coordinates(nlayers, npts, rng);

    FieldList fields;
    std::set<std::string> expected_names;
    for (const auto& entry : field_taxonomy())
    {
        if (entry.kind != FieldKind::Scalar || entry.name == "vs_an")
        {
            continue;
        }
        fields.emplace_back(entry.name, test_support::random_field(nlayers, npts, rng));
        expected_names.insert(entry.name);
    }
    fields.emplace_back("u_xyz", test_support::random_field(nlayers, npts, 3, rng));
    fields.emplace_back("u_geog", test_support::random_field(nlayers, npts, 3, rng));
    fields.emplace_back("c_hist", test_support::random_field(nlayers, npts, 2, rng));
    expected_names.insert({"u_xyz", "u_geog", "c_hist"});

    const FieldList inputs = fields;
    const std::vector<std::string> composition_names = {"A", "B"};
    TerraModel model(coords.lon, coords.lat, coords.radius, fields, composition_names);

    const auto lateral = model.get_lateral_points();
    failures += expect_true(lateral.first == coords.lon && lateral.second == coords.lat,
                            "lateral point handles must be the ones given");
    failures += expect_true(model.get_radii() == coords.radius, "radius handle must be the one given");

    for (const auto& item : inputs)
    {
        failures += expect_true(model.get_field_handle(item.first) == item.second,
                                "field '" + item.first + "' must be held without copying");
        failures += expect_true(&model.get_field(item.first) == item.second.get(),
                                "get_field('" + item.first + "') must return the stored array");
    }

    failures += expect_true(model.number_of_compositions() == 2, "two composition components");
    failures += expect_true(model.get_composition_names() == CompositionNames(composition_names),
                            "composition names are stored");

    const std::vector<std::string> names = model.field_names();
    failures += expect_true(std::set<std::string>(names.begin(), names.end()) == expected_names,
                            "field_names must list exactly the supplied fields");
    failures += expect_true(names.front() == inputs.front().first && names.back() == "c_hist",
                            "field_names must keep insertion order");
    failures += expect_true(!model.has_field("vs_an"), "absent field must not be reported");
    failures += expect_true(model.has_field("c_hist"), "present field must be reported");
    failures += expect_true(!model.has_field("not a field"), "has_field is false for unknown names");
    failures += expect_true(model.nlayers() == nlayers && model.npts() == npts, "grid dimensions");
    return failures;
}

int test_debug_logging_construction()
{
    // Exercises the debug-level construction report.
    const LogProfile saved = global_log_profile;
    global_log_profile = LogProfile::debug;
    std::mt19937 rng(17);
    const auto coords = test_support::random_coordinates(2, 5, rng);
    const bool ok = test_support::does_not_throw([&] {
        TerraModel model(coords.lon, coords.lat, coords.radius, {{"t", test_support::random_field(2, 5, rng)}});
        model.new_field("vs");
        model.nearest_index(0.0, 0.0);
    });
    global_log_profile = saved;
    return expect_true(ok, "construction with debug logging must succeed");
}
} // namespace

int main()
{
    int failures = 0;
    failures += test_invalid_field_dimensions();
    failures += test_invalid_field_name();
    failures += test_invalid_vector_components();
    failures += test_composition_name_mismatch();
    failures += test_radii_must_increase();
    failures += test_coordinate_length_mismatch();
    failures += test_duplicate_field();
    failures += test_construction_keeps_inputs();
    failures += test_debug_logging_construction();
    return test_support::finish(kTag, failures);
}
