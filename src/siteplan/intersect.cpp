#include "siteplan/intersect.hpp"

#include <cmath>

namespace siteplan {

    std::optional<LineHit> line_line_intersection(const Line &a, const Line &b, double tolerance) {
        double d1x = a.end.x - a.start.x;
        double d1y = a.end.y - a.start.y;
        double d2x = b.end.x - b.start.x;
        double d2y = b.end.y - b.start.y;

        // Degenerate carriers have no direction
        if (std::hypot(d1x, d1y) <= tolerance || std::hypot(d2x, d2y) <= tolerance) {
            return std::nullopt;
        }

        double det = d1x * d2y - d1y * d2x;
        if (std::abs(det) <= tolerance) {
            return std::nullopt;
        }

        double wx = b.start.x - a.start.x;
        double wy = b.start.y - a.start.y;

        LineHit hit;
        hit.t = (wx * d2y - wy * d2x) / det;
        hit.u = (wx * d1y - wy * d1x) / det;
        hit.point = a.point_at(hit.t);
        return hit;
    }

    bool segments_intersect(const Line &a, const Line &b, double tolerance) {
        auto hit = line_line_intersection(a, b, tolerance);
        if (!hit) {
            return false;
        }
        return hit->t >= 0.0 && hit->t <= 1.0 && hit->u >= 0.0 && hit->u <= 1.0;
    }

    std::vector<LineHit> line_polyline_intersections(const Line &line, const Polyline &polyline, double tolerance) {
        std::vector<LineHit> hits;
        for (const auto &edge : polyline.segments()) {
            auto hit = line_line_intersection(line, edge, tolerance);
            if (!hit) {
                continue;
            }
            if (hit->t >= 0.0 && hit->t <= 1.0 && hit->u >= 0.0 && hit->u <= 1.0) {
                hits.push_back(*hit);
            }
        }
        return hits;
    }

    bool polyline_self_intersection_check(const Polyline &polyline, double tolerance) {
        auto edges = polyline.segments();
        std::size_t m = edges.size();
        if (m < 3) {
            return false;
        }
        bool closed = polyline.is_closed(tolerance);

        for (std::size_t i = 0; i < m; ++i) {
            for (std::size_t j = i + 2; j < m; ++j) {
                // First and last edges meet at the closing vertex
                if (closed && i == 0 && j == m - 1) {
                    continue;
                }
                if (segments_intersect(edges[i], edges[j], tolerance)) {
                    return true;
                }
            }
        }
        return false;
    }

    bool point_in_polygon_2d(const Point &point, const std::vector<Point> &ring) {
        std::size_t n = ring.size();
        if (n < 3) {
            return false;
        }
        bool inside = false;
        for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
            const auto &pi = ring[i];
            const auto &pj = ring[j];
            if ((pi.y > point.y) != (pj.y > point.y)) {
                double x_cross = (pj.x - pi.x) * (point.y - pi.y) / (pj.y - pi.y) + pi.x;
                if (point.x < x_cross) {
                    inside = !inside;
                }
            }
        }
        return inside;
    }

    Containment point_containment(const Polyline &polyline, const Point &point, double tolerance) {
        if (!polyline.is_closed(tolerance)) {
            return Containment::Outside;
        }

        // Boundary test in XY, elevation is ignored like the parity test below
        Point flat{point.x, point.y, 0.0};
        for (const auto &edge : polyline.segments()) {
            Line flat_edge{Point{edge.start.x, edge.start.y, 0.0}, Point{edge.end.x, edge.end.y, 0.0}};
            if (flat_edge.distance_to(flat, true) <= tolerance) {
                return Containment::Coincident;
            }
        }

        return point_in_polygon_2d(point, polyline.points()) ? Containment::Inside : Containment::Outside;
    }

} // namespace siteplan
