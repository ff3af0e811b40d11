#pragma once

#include <vector>

#include "siteplan/polyline.hpp"

namespace siteplan {

    /*
     * Degraded boolean operations.
     *
     * These are vertex-containment approximations without any edge clipping.
     * They are not suitable for rigorous boolean composition.
     */

    /**
     * @brief Approximate a minus b
     *
     * @return {a} unchanged unless every vertex of b lies inside a, in which case
     *         the result is empty
     */
    std::vector<std::vector<Point>> polygon_difference(const std::vector<Point> &a, const std::vector<Point> &b);

    /**
     * @brief Approximate a intersect b
     *
     * @return One point set holding the vertices of each polygon that lie inside
     *         the other (not a proper boundary), or nothing when fewer than 3
     */
    std::vector<std::vector<Point>> polygon_intersection(const std::vector<Point> &a, const std::vector<Point> &b);

    enum class PolygonRelation {
        Invalid,          ///< One of the inputs has fewer than 3 vertices
        Separate,
        AInsideB,
        BInsideA,
        Overlap,          ///< Some, not all, vertices of one lie inside the other
        EdgeIntersection, ///< No vertex containment but edges cross
    };

    struct RelationReport {
        PolygonRelation relation = PolygonRelation::Separate;
        std::vector<Point> crossing_points; ///< Only filled for EdgeIntersection

        bool intersects() const {
            return relation != PolygonRelation::Separate && relation != PolygonRelation::Invalid;
        }
    };

    /**
     * @brief Classify how two polygons relate, by vertex containment first and edge crossings second
     */
    RelationReport polygon_relation(const std::vector<Point> &a, const std::vector<Point> &b,
                                    double tolerance = DEFAULT_TOLERANCE);

    const char *to_string(PolygonRelation relation);

} // namespace siteplan
