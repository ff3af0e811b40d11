#include "doctest/doctest.h"
#include "siteplan/boolean.hpp"

#include <string>

std::vector<siteplan::Point> rect(double x0, double y0, double x1, double y1, bool closed = true) {
    std::vector<siteplan::Point> ring = {{x0, y0, 0}, {x1, y0, 0}, {x1, y1, 0}, {x0, y1, 0}};
    if (closed) {
        ring.push_back(ring.front());
    }
    return ring;
}

TEST_CASE("Approximate difference") {
    auto outer = rect(0, 0, 10, 10);

    SUBCASE("Contained subtrahend removes everything") {
        auto result = siteplan::polygon_difference(outer, rect(2, 2, 4, 4));
        CHECK(result.empty());
    }

    SUBCASE("Partially overlapping subtrahend leaves the first polygon unchanged") {
        auto result = siteplan::polygon_difference(outer, rect(5, 5, 15, 15));
        REQUIRE(result.size() == 1);
        CHECK(result[0].size() == outer.size());
        CHECK(result[0][1].x == doctest::Approx(10.0));
    }

    SUBCASE("Disjoint subtrahend") {
        auto result = siteplan::polygon_difference(outer, rect(20, 20, 30, 30));
        REQUIRE(result.size() == 1);
    }
}

TEST_CASE("Approximate intersection") {
    auto outer = rect(0, 0, 10, 10, false);

    SUBCASE("Contained polygon yields its own vertices") {
        auto result = siteplan::polygon_intersection(outer, rect(2, 2, 4, 4, false));
        REQUIRE(result.size() == 1);
        CHECK(result[0].size() == 4);
    }

    SUBCASE("Fewer than three shared vertices") {
        // One vertex of each lies inside the other
        auto result = siteplan::polygon_intersection(outer, rect(5, 5, 15, 15, false));
        CHECK(result.empty());
    }

    SUBCASE("Disjoint polygons") {
        CHECK(siteplan::polygon_intersection(outer, rect(20, 20, 30, 30, false)).empty());
    }
}

TEST_CASE("Polygon relation") {
    auto a = rect(0, 0, 10, 10);

    CHECK(siteplan::polygon_relation(a, rect(20, 0, 30, 10)).relation == siteplan::PolygonRelation::Separate);
    CHECK(siteplan::polygon_relation(rect(2, 2, 4, 4), a).relation == siteplan::PolygonRelation::AInsideB);
    CHECK(siteplan::polygon_relation(a, rect(2, 2, 4, 4)).relation == siteplan::PolygonRelation::BInsideA);
    CHECK(siteplan::polygon_relation(a, rect(5, 5, 15, 15)).relation == siteplan::PolygonRelation::Overlap);

    SUBCASE("Crossing rectangles without vertex containment") {
        auto horizontal = rect(0, 4, 10, 6);
        auto vertical = rect(4, 0, 6, 10);

        auto report = siteplan::polygon_relation(horizontal, vertical);
        CHECK(report.relation == siteplan::PolygonRelation::EdgeIntersection);
        CHECK(report.intersects());
        REQUIRE(report.crossing_points.size() == 4);
        for (const auto &p : report.crossing_points) {
            CHECK((p.x == doctest::Approx(4.0) || p.x == doctest::Approx(6.0)));
            CHECK((p.y == doctest::Approx(4.0) || p.y == doctest::Approx(6.0)));
        }
    }

    SUBCASE("Too few vertices") {
        std::vector<siteplan::Point> segment = {{0, 0, 0}, {1, 1, 0}};
        auto report = siteplan::polygon_relation(a, segment);
        CHECK(report.relation == siteplan::PolygonRelation::Invalid);
        CHECK_FALSE(report.intersects());
    }

    CHECK(std::string(siteplan::to_string(siteplan::PolygonRelation::EdgeIntersection)) == "edge_intersection");
}
