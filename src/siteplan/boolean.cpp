#include "siteplan/boolean.hpp"

#include <algorithm>

#include "siteplan/intersect.hpp"

namespace siteplan {

    std::vector<std::vector<Point>> polygon_difference(const std::vector<Point> &a, const std::vector<Point> &b) {
        bool b_inside_a =
            std::all_of(b.begin(), b.end(), [&](const Point &p) { return point_in_polygon_2d(p, a); });
        if (!b_inside_a) {
            return {a};
        }
        return {};
    }

    std::vector<std::vector<Point>> polygon_intersection(const std::vector<Point> &a, const std::vector<Point> &b) {
        std::vector<Point> shared;
        for (const auto &p : a) {
            if (point_in_polygon_2d(p, b)) {
                shared.push_back(p);
            }
        }
        for (const auto &p : b) {
            if (point_in_polygon_2d(p, a)) {
                shared.push_back(p);
            }
        }
        if (shared.size() >= 3) {
            return {shared};
        }
        return {};
    }

    RelationReport polygon_relation(const std::vector<Point> &a, const std::vector<Point> &b, double tolerance) {
        RelationReport report;
        if (a.size() < 3 || b.size() < 3) {
            report.relation = PolygonRelation::Invalid;
            return report;
        }

        auto a_in_b = static_cast<std::size_t>(
            std::count_if(a.begin(), a.end(), [&](const Point &p) { return point_in_polygon_2d(p, b); }));
        auto b_in_a = static_cast<std::size_t>(
            std::count_if(b.begin(), b.end(), [&](const Point &p) { return point_in_polygon_2d(p, a); }));

        if (a_in_b > 0 || b_in_a > 0) {
            if (a_in_b == a.size()) {
                report.relation = PolygonRelation::AInsideB;
            } else if (b_in_a == b.size()) {
                report.relation = PolygonRelation::BInsideA;
            } else {
                report.relation = PolygonRelation::Overlap;
            }
            return report;
        }

        Polyline outline_b(b);
        for (std::size_t i = 0; i + 1 < a.size(); ++i) {
            Line edge{a[i], a[i + 1]};
            for (const auto &hit : line_polyline_intersections(edge, outline_b, tolerance)) {
                report.crossing_points.push_back(hit.point);
            }
        }
        if (!report.crossing_points.empty()) {
            report.relation = PolygonRelation::EdgeIntersection;
        }
        return report;
    }

    const char *to_string(PolygonRelation relation) {
        switch (relation) {
        case PolygonRelation::Invalid:
            return "invalid";
        case PolygonRelation::Separate:
            return "separate";
        case PolygonRelation::AInsideB:
            return "a_inside_b";
        case PolygonRelation::BInsideA:
            return "b_inside_a";
        case PolygonRelation::Overlap:
            return "overlap";
        case PolygonRelation::EdgeIntersection:
            return "edge_intersection";
        }
        return "unknown";
    }

} // namespace siteplan
