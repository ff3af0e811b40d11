#include "siteplan/triangulate.hpp"

#include <cmath>

#include "siteplan/intersect.hpp"
#include "siteplan/utils/utils.hpp"

namespace siteplan {

    TriangulationResult triangulate(const std::vector<Point> &polygon, double tolerance) {
        TriangulationResult result;
        if (polygon.size() < 3) {
            return result;
        }

        std::vector<Point> remaining = polygon;
        if (remaining.size() > 3 && points_coincide(remaining.front(), remaining.back(), tolerance)) {
            remaining.pop_back();
        }
        if (remaining.size() < 3) {
            return result;
        }

        double winding = utils::signed_area_2d(remaining) >= 0.0 ? 1.0 : -1.0;
        result.triangles.reserve(remaining.size() - 2);

        while (remaining.size() > 3) {
            std::size_t n = remaining.size();
            bool ear_found = false;

            for (std::size_t i = 0; i < n; ++i) {
                std::size_t prev_i = (i + n - 1) % n;
                std::size_t next_i = (i + 1) % n;

                const Point &a = remaining[prev_i];
                const Point &b = remaining[i];
                const Point &c = remaining[next_i];

                // Reflex or collinear corners are never ears
                if (utils::cross_2d(a, b, c) * winding <= 0.0) {
                    continue;
                }

                std::vector<Point> tri = {a, b, c};
                bool is_ear = true;
                for (std::size_t j = 0; j < n; ++j) {
                    if (j == prev_i || j == i || j == next_i) {
                        continue;
                    }
                    if (point_in_polygon_2d(remaining[j], tri)) {
                        is_ear = false;
                        break;
                    }
                }

                if (is_ear) {
                    result.triangles.push_back(Triangle{a, b, c});
                    remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(i));
                    ear_found = true;
                    break;
                }
            }

            if (!ear_found) {
                result.triangles.push_back(Triangle{remaining[0], remaining[1], remaining[2]});
                remaining.erase(remaining.begin() + 1);
                result.forced_clips += 1;
            }
        }

        result.triangles.push_back(Triangle{remaining[0], remaining[1], remaining[2]});
        return result;
    }

    TriangulationResult triangulate(const Polyline &polyline, double tolerance) {
        return triangulate(polyline.points(), tolerance);
    }

    double triangle_area(const Triangle &tri) { return std::abs(utils::cross_2d(tri[0], tri[1], tri[2])) * 0.5; }

} // namespace siteplan
