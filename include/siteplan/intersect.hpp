#pragma once

#include <optional>
#include <vector>

#include "siteplan/polyline.hpp"
#include "siteplan/primitives.hpp"

namespace siteplan {

    /**
     * @brief Crossing of two lines with the parameter along each
     */
    struct LineHit {
        Point point;
        double t = 0.0; ///< Parameter along the first line
        double u = 0.0; ///< Parameter along the second line
    };

    /**
     * @brief Three-valued point containment
     */
    enum class Containment {
        Inside,
        Outside,
        Coincident, ///< Within tolerance of the boundary
    };

    /**
     * @brief Intersect the infinite carriers of two lines in the XY projection
     *
     * Solves start1 + t * d1 = start2 + u * d2.
     *
     * @return std::nullopt when the lines are parallel or collinear (determinant
     *         within tolerance of zero) or when either line is degenerate
     */
    std::optional<LineHit> line_line_intersection(const Line &a, const Line &b,
                                                  double tolerance = DEFAULT_TOLERANCE);

    /**
     * @brief True segment/segment crossing test (t and u in [0, 1])
     */
    bool segments_intersect(const Line &a, const Line &b, double tolerance = DEFAULT_TOLERANCE);

    /**
     * @brief All crossings between a segment and the consecutive edges of a polyline
     *
     * Only hits with both parameters inside the closed unit interval are kept.
     */
    std::vector<LineHit> line_polyline_intersections(const Line &line, const Polyline &polyline,
                                                     double tolerance = DEFAULT_TOLERANCE);

    /**
     * @brief Detect whether a polyline crosses itself
     *
     * Adjacent edges are never compared, and for a closed polyline the first
     * and last edges (which share the closing vertex) are not compared either.
     * Stops at the first crossing.
     */
    bool polyline_self_intersection_check(const Polyline &polyline, double tolerance = DEFAULT_TOLERANCE);

    /**
     * @brief Ray casting parity test in XY
     *
     * The ring is implicitly closed. Points on the boundary get an arbitrary
     * answer; use point_containment when that matters.
     */
    bool point_in_polygon_2d(const Point &point, const std::vector<Point> &ring);

    /**
     * @brief Classify a point against a closed polyline
     *
     * An open polyline contains nothing and reports Outside.
     */
    Containment point_containment(const Polyline &polyline, const Point &point,
                                  double tolerance = DEFAULT_TOLERANCE);

} // namespace siteplan
