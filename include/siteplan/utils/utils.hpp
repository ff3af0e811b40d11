#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

#include <datapod/datapod.hpp>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace siteplan {

    namespace utils {

        /**
         * @brief 2D cross product of (b - a) and (c - a) in the XY plane
         *
         * Positive when a, b, c turn counter-clockwise.
         */
        inline double cross_2d(const datapod::Point &a, const datapod::Point &b, const datapod::Point &c) {
            return (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
        }

        /**
         * @brief Signed shoelace area of a vertex ring in the XY plane
         *
         * The ring is treated as implicitly closed; an explicit closing duplicate
         * contributes a zero term. Positive = CCW, negative = CW.
         */
        inline double signed_area_2d(const std::vector<datapod::Point> &ring) {
            if (ring.size() < 3) {
                return 0.0;
            }
            double area = 0.0;
            std::size_t n = ring.size();
            for (std::size_t i = 0; i < n; ++i) {
                std::size_t j = (i + 1) % n;
                area += ring[i].x * ring[j].y;
                area -= ring[j].x * ring[i].y;
            }
            return area * 0.5;
        }

        /**
         * @brief Axis-aligned bounds of a point set (all three axes)
         *
         * An empty input yields a zero box.
         */
        inline datapod::AABB bounds_of(const std::vector<datapod::Point> &pts) {
            if (pts.empty()) {
                return datapod::AABB{datapod::Point{0.0, 0.0, 0.0}, datapod::Point{0.0, 0.0, 0.0}};
            }
            datapod::Point lo = pts.front();
            datapod::Point hi = pts.front();
            for (const auto &p : pts) {
                lo.x = std::min(lo.x, p.x);
                lo.y = std::min(lo.y, p.y);
                lo.z = std::min(lo.z, p.z);
                hi.x = std::max(hi.x, p.x);
                hi.y = std::max(hi.y, p.y);
                hi.z = std::max(hi.z, p.z);
            }
            return datapod::AABB{lo, hi};
        }

        /**
         * @brief Rotate a point about a pivot in the XY plane, z is kept
         */
        inline datapod::Point rotate_about(const datapod::Point &p, const datapod::Point &pivot, double angle) {
            double c = std::cos(angle);
            double s = std::sin(angle);
            double x = p.x - pivot.x;
            double y = p.y - pivot.y;
            return datapod::Point{x * c - y * s + pivot.x, x * s + y * c + pivot.y, p.z};
        }

        /**
         * @brief Calculate the heading angle from one point to another
         *
         * @param from Start point
         * @param to End point
         * @return Heading angle in radians (0 = +x, pi/2 = +y)
         */
        inline double heading_between(const datapod::Point &from, const datapod::Point &to) {
            return std::atan2(to.y - from.y, to.x - from.x);
        }

        inline double deg_to_rad(double degrees) { return degrees * M_PI / 180.0; }

        /**
         * @brief Flatten points into consecutive (x, y, z) triples
         *
         * @param pts Points to flatten
         * @param z_offset Added to every z value
         */
        inline std::vector<double> flatten(const std::vector<datapod::Point> &pts, double z_offset = 0.0) {
            std::vector<double> out;
            out.reserve(pts.size() * 3);
            for (const auto &p : pts) {
                out.push_back(p.x);
                out.push_back(p.y);
                out.push_back(p.z + z_offset);
            }
            return out;
        }

    } // namespace utils

} // namespace siteplan
