#include "doctest/doctest.h"
#include "siteplan/plan.hpp"
#include "siteplan/utils/utils.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

std::vector<double> square_vertices(double size, bool closed = true) {
    std::vector<double> v = {0, 0, 0, size, 0, 0, size, size, 0, 0, size, 0};
    if (closed) {
        v.insert(v.end(), {0, 0, 0});
    }
    return v;
}

// Trapezoid whose first (and longest) edge points along the given heading
std::vector<double> rotated_trapezoid(double degrees) {
    const double corners[4][2] = {{0, 0}, {200, 0}, {150, 80}, {50, 80}};
    double a = siteplan::utils::deg_to_rad(degrees);
    std::vector<double> v;
    for (const auto &c : corners) {
        v.insert(v.end(), {c[0] * std::cos(a) - c[1] * std::sin(a), c[0] * std::sin(a) + c[1] * std::cos(a), 0.0});
    }
    v.insert(v.end(), {0, 0, 0});
    return v;
}

bool contains(const std::vector<std::string> &messages, const std::string &msg) {
    return std::find(messages.begin(), messages.end(), msg) != messages.end();
}

TEST_CASE("Generate a plan with default parameters") {
    auto report = siteplan::generate_plan(square_vertices(100.0));
    REQUIRE(report.ok());
    CHECK(report.message.empty());

    const auto &layout = report.layout;
    CHECK(layout.building_layers_vertices.size() == 7);
    CHECK(layout.building_layers_heights.size() == layout.building_layers_vertices.size());

    for (std::size_t b = 0; b < layout.building_layers_vertices.size(); ++b) {
        const auto &floors = layout.building_layers_vertices[b];
        REQUIRE(floors.size() == 4);
        CHECK(layout.building_layers_heights[b].size() == floors.size());
        for (std::size_t f = 0; f < floors.size(); ++f) {
            CHECK(floors[f].size() == 12);
            CHECK(floors[f][2] == doctest::Approx(3.0 * static_cast<double>(f)));
            CHECK(layout.building_layers_heights[b][f] == doctest::Approx(3.0));
        }
    }

    REQUIRE(layout.sub_site_vertices.size() == 1);
    CHECK(layout.sub_site_vertices[0] == square_vertices(100.0));

    // Setback 3 + 2 * 0.5 = 4, lifted 0.2 above the site
    REQUIRE(layout.sub_site_setback_vertices.size() == 1);
    const auto &setback = layout.sub_site_setback_vertices[0];
    CHECK(setback.size() == 15);
    for (std::size_t k = 2; k < setback.size(); k += 3) {
        CHECK(setback[k] == doctest::Approx(0.2));
    }
    CHECK(report.setback.method == siteplan::OffsetMethod::CentroidOffset);
    CHECK(report.setback.polygon.get_area() < report.site.area);

    CHECK(report.design.requested_buildings == 7);
    CHECK(report.site.area == doctest::Approx(10000.0));
    CHECK_FALSE(report.site.reclosed);
}

TEST_CASE("Open site boundary is re-closed") {
    auto report = siteplan::generate_plan(square_vertices(100.0, false));
    REQUIRE(report.ok());
    CHECK(report.site.reclosed);
    REQUIRE(report.layout.sub_site_vertices.size() == 1);
    CHECK(report.layout.sub_site_vertices[0].size() == 15);
    CHECK(report.site.area == doctest::Approx(10000.0));
}

TEST_CASE("Site record from flat vertices") {
    SUBCASE("Rectangle") {
        auto site = siteplan::make_site({0, 0, 0, 200, 0, 0, 200, 50, 0, 0, 50, 0});
        CHECK(site.reclosed);
        CHECK(site.boundary.is_closed());
        CHECK(site.boundary.size() == 5);
        CHECK(site.area == doctest::Approx(10000.0));
        CHECK(site.main_orientation == doctest::Approx(0.0));
        CHECK(site.bounds.min_point.x == doctest::Approx(0.0));
        CHECK(site.bounds.max_point.x == doctest::Approx(200.0));
        CHECK(site.bounds.max_point.y == doctest::Approx(50.0));
    }

    SUBCASE("Too few vertices") {
        CHECK_THROWS_AS(siteplan::make_site({0, 0, 0, 1, 0, 0}), std::invalid_argument);
    }

    SUBCASE("Misaligned array") {
        CHECK_THROWS_AS(siteplan::make_site({0, 0, 0, 1, 0, 0, 1, 1}), std::invalid_argument);
    }
}

TEST_CASE("Layout follows the site heading without an orientation override") {
    auto site = rotated_trapezoid(30.0);
    auto report = siteplan::generate_plan(site);
    REQUIRE(report.ok());
    CHECK(report.site.main_orientation == doctest::Approx(siteplan::utils::deg_to_rad(30.0)));
    REQUIRE(report.parameters.orientation.has_value());
    CHECK(*report.parameters.orientation == doctest::Approx(report.site.main_orientation));

    siteplan::PlanOverrides heading;
    heading.orientation = 30.0;
    auto turned = siteplan::generate_plan(site, heading);

    siteplan::PlanOverrides unrotated;
    unrotated.orientation = 0.0;
    auto straight = siteplan::generate_plan(site, unrotated);

    REQUIRE(turned.ok());
    REQUIRE(straight.ok());
    REQUIRE(report.design.num_buildings() > 0);
    REQUIRE(turned.design.num_buildings() == report.design.num_buildings());
    REQUIRE(straight.design.num_buildings() == report.design.num_buildings());

    // Same seed, same lattice: the default plan is the unrotated one turned 30 degrees
    auto pivot = report.site.boundary.get_centroid();
    double max_shift = 0.0;
    for (std::size_t i = 0; i < report.design.num_buildings(); ++i) {
        const auto &p = report.design.building_positions[i];
        CHECK(p.x == doctest::Approx(turned.design.building_positions[i].x));
        CHECK(p.y == doctest::Approx(turned.design.building_positions[i].y));

        auto expected = siteplan::utils::rotate_about(straight.design.building_positions[i], pivot,
                                                      siteplan::utils::deg_to_rad(30.0));
        CHECK(p.x == doctest::Approx(expected.x));
        CHECK(p.y == doctest::Approx(expected.y));
        max_shift = std::max(max_shift, p.distance_to(straight.design.building_positions[i]));
    }
    CHECK(max_shift > 1.0);
}

TEST_CASE("Plans are reproducible for a seed") {
    siteplan::PlanOverrides overrides;
    overrides.density = 0.2;
    siteplan::PlanConfig config;
    config.seed = 1234u;

    auto a = siteplan::generate_plan(square_vertices(120.0), overrides, config);
    auto b = siteplan::generate_plan(square_vertices(120.0), overrides, config);
    REQUIRE(a.ok());
    REQUIRE(b.ok());
    CHECK(a.layout.building_layers_vertices == b.layout.building_layers_vertices);
}

TEST_CASE("Overrides flow into the layout") {
    siteplan::PlanOverrides overrides;
    overrides.density = 0.9;
    overrides.building_style = 2;
    overrides.far = 4.0;
    overrides.site_type = 3;
    overrides.mix_ratio = 7.0; // out of range, ignored

    auto report = siteplan::generate_plan(square_vertices(100.0), overrides);
    REQUIRE(report.ok());
    CHECK(report.parameters.site_type == 3);
    CHECK(report.parameters.mix_ratio == doctest::Approx(0.0));
    REQUIRE(report.parameters.ignored.size() == 1);
    CHECK(report.parameters.ignored[0] == "mix_ratio");

    REQUIRE_FALSE(report.layout.building_layers_heights.empty());
    CHECK(report.layout.building_layers_heights[0][0] == doctest::Approx(4.0));
    CHECK(report.design.strategy == siteplan::PlacementStrategy::TightGrid);
}

TEST_CASE("Plans on an elevated site") {
    std::vector<double> v = {0, 0, 10, 100, 0, 10, 100, 100, 10, 0, 100, 10, 0, 0, 10};
    auto report = siteplan::generate_plan(v);
    REQUIRE(report.ok());
    REQUIRE_FALSE(report.layout.building_layers_vertices.empty());
    CHECK(report.layout.building_layers_vertices[0][0][2] == doctest::Approx(10.0));
    CHECK(report.layout.building_layers_vertices[0][1][2] == doctest::Approx(13.0));
    REQUIRE(report.layout.sub_site_setback_vertices.size() == 1);
    CHECK(report.layout.sub_site_setback_vertices[0][2] == doctest::Approx(10.2));
}

TEST_CASE("Input shape errors are classified") {
    SUBCASE("Too few vertices") {
        auto report = siteplan::generate_plan({0, 0, 0, 1, 0, 0});
        CHECK(report.status == siteplan::Status::InvalidInput);
        CHECK_FALSE(report.message.empty());
        CHECK(report.layout.building_layers_vertices.empty());
        CHECK(report.layout.sub_site_vertices.empty());
    }

    SUBCASE("Not triple aligned") {
        auto report = siteplan::generate_plan({0, 0, 0, 1, 0, 0, 1, 1, 0, 5});
        CHECK(report.status == siteplan::Status::InvalidInput);
    }

    CHECK(std::string(siteplan::to_string(siteplan::Status::InvalidInput)) == "invalid_input");
}

TEST_CASE("Setback failure is surfaced, not hidden") {
    // Corners of a 4 x 4 site lie closer than 4 units to its centroid
    auto report = siteplan::generate_plan(square_vertices(4.0));
    REQUIRE(report.ok());
    CHECK_FALSE(report.setback.ok());
    CHECK(report.layout.sub_site_setback_vertices.empty());
    CHECK(report.layout.sub_site_vertices.size() == 1);
}

TEST_CASE("Analyze geometry") {
    auto report = siteplan::analyze_geometry({0, 0, 0, 1, 0, 0, 1, 1, 0, 0, 1, 0, 0, 0, 0});
    REQUIRE(report.status == siteplan::Status::Ok);
    CHECK(report.area == doctest::Approx(1.0));
    CHECK(report.perimeter == doctest::Approx(4.0));
    CHECK(report.is_closed);
    CHECK(report.is_valid);
    CHECK(report.centroid.x == doctest::Approx(0.5));
    CHECK(report.centroid.y == doctest::Approx(0.5));
    CHECK(report.main_orientation == doctest::Approx(0.0));

    CHECK(siteplan::analyze_geometry({0, 0, 0}).status == siteplan::Status::InvalidInput);
}

TEST_CASE("Validate geometry") {
    SUBCASE("Valid square") {
        auto report = siteplan::validate_geometry({0, 0, 0, 1, 0, 0, 1, 1, 0, 0, 1, 0, 0, 0, 0});
        CHECK(report.is_valid);
        CHECK(report.errors.empty());
        CHECK(report.warnings.empty());
        CHECK(report.is_closed);
        CHECK(report.is_planar);
        CHECK_FALSE(report.self_intersects);
        CHECK(report.polygon_area == doctest::Approx(1.0));
        CHECK(report.polygon_perimeter == doctest::Approx(4.0));
    }

    SUBCASE("Bowtie") {
        auto report = siteplan::validate_geometry({0, 0, 0, 1, 1, 0, 1, 0, 0, 0, 1, 0, 0, 0, 0});
        CHECK_FALSE(report.is_valid);
        CHECK(report.self_intersects);
        CHECK(contains(report.errors, "Polygon self-intersects"));
    }

    SUBCASE("Open polygon") {
        auto report = siteplan::validate_geometry({0, 0, 0, 1, 0, 0, 1, 1, 0, 0, 1, 0});
        CHECK(report.is_valid);
        CHECK_FALSE(report.is_closed);
        CHECK(contains(report.warnings, "Polygon is not closed"));
        CHECK(report.polygon_area == doctest::Approx(0.0));
        CHECK(report.polygon_perimeter == doctest::Approx(3.0));
    }

    SUBCASE("Collinear polygon") {
        auto report = siteplan::validate_geometry({0, 0, 0, 1, 0, 0, 2, 0, 0, 0, 0, 0});
        CHECK_FALSE(report.is_planar);
        CHECK(contains(report.warnings, "Polygon is not planar"));
    }

    SUBCASE("Checks can be disabled") {
        siteplan::ValidationOptions options;
        options.check_closure = false;
        options.check_self_intersection = false;
        options.check_planarity = false;
        auto report = siteplan::validate_geometry({0, 0, 0, 1, 1, 0, 1, 0, 0, 0, 1, 0}, options);
        CHECK(report.is_valid);
        CHECK(report.warnings.empty());
        CHECK_FALSE(report.self_intersects);
    }

    SUBCASE("Insufficient vertices") {
        auto report = siteplan::validate_geometry({0, 0, 0, 1, 0, 0});
        CHECK(report.status == siteplan::Status::Ok);
        CHECK_FALSE(report.is_valid);
        CHECK(contains(report.errors, "Insufficient vertices for polygon (minimum 3 required)"));
    }
}

TEST_CASE("Offset geometry") {
    SUBCASE("Inward") {
        auto report = siteplan::offset_geometry(square_vertices(1.0), 0.1);
        REQUIRE(report.success);
        CHECK(report.method == siteplan::OffsetMethod::CentroidOffset);
        CHECK(report.offset_vertices.size() == 15);
        auto area = siteplan::Polyline::from_flat(report.offset_vertices).get_area();
        CHECK(area > 0.0);
        CHECK(area < 1.0);
    }

    SUBCASE("Outward") {
        auto report = siteplan::offset_geometry(square_vertices(1.0), 0.1, siteplan::OffsetDirection::Outward);
        REQUIRE(report.success);
        CHECK(siteplan::Polyline::from_flat(report.offset_vertices).get_area() > 1.0);
    }

    SUBCASE("Open polygon") {
        auto report = siteplan::offset_geometry(square_vertices(1.0, false), 0.1);
        CHECK_FALSE(report.success);
        CHECK(report.error_message == "Cannot close polygon within tolerance");
    }

    SUBCASE("Offset too large") {
        auto report = siteplan::offset_geometry(square_vertices(1.0), 10.0);
        CHECK_FALSE(report.success);
        CHECK(report.error_message == "Unable to create valid offset polygon");
        CHECK(report.offset_vertices.empty());
    }

    SUBCASE("Not triple aligned") {
        auto report = siteplan::offset_geometry({0, 0, 0, 1}, 0.1);
        CHECK(report.status == siteplan::Status::InvalidInput);
        CHECK_FALSE(report.success);
    }
}

TEST_CASE("Intersection test") {
    std::vector<double> horizontal = {0, 4, 0, 10, 4, 0, 10, 6, 0, 0, 6, 0, 0, 4, 0};
    std::vector<double> vertical = {4, 0, 0, 6, 0, 0, 6, 10, 0, 4, 10, 0, 4, 0, 0};

    auto crossing = siteplan::test_intersection(horizontal, vertical);
    CHECK(crossing.intersects);
    CHECK(crossing.relation == siteplan::PolygonRelation::EdgeIntersection);
    REQUIRE(crossing.intersection_points.size() == 4);
    CHECK(crossing.intersection_points[0].size() == 3);

    auto inside = siteplan::test_intersection(square_vertices(10.0), {2, 2, 0, 4, 2, 0, 4, 4, 0, 2, 4, 0});
    CHECK(inside.intersects);
    CHECK(inside.relation == siteplan::PolygonRelation::BInsideA);
    CHECK(inside.intersection_points.empty());

    auto invalid = siteplan::test_intersection(square_vertices(10.0), {0, 0, 0, 1, 1, 0});
    CHECK(invalid.status == siteplan::Status::Ok);
    CHECK_FALSE(invalid.intersects);
    CHECK(invalid.relation == siteplan::PolygonRelation::Invalid);

    auto malformed = siteplan::test_intersection(square_vertices(10.0), {0, 0});
    CHECK(malformed.status == siteplan::Status::InvalidInput);
}
