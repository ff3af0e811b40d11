#pragma once

#include <algorithm>
#include <cmath>
#include <optional>

#include <datapod/datapod.hpp>

namespace siteplan {

    /// Tolerance used by every geometric comparison unless the caller overrides it
    inline constexpr double DEFAULT_TOLERANCE = 1e-6;

    /// Accepted tolerance window
    inline constexpr double MIN_TOLERANCE = 1e-10;
    inline constexpr double MAX_TOLERANCE = 1e-3;

    /// Locations are datapod points; equality is always tolerance based (see points_coincide)
    using Point = datapod::Point;

    /**
     * @brief Displacement in 3D space
     */
    struct Vector {
        double x = 0.0;
        double y = 0.0;
        double z = 0.0;

        Vector() = default;
        Vector(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

        /**
         * @brief Vector from one point to another (to - from)
         */
        static Vector between(const Point &from, const Point &to) {
            return Vector{to.x - from.x, to.y - from.y, to.z - from.z};
        }

        Vector operator+(const Vector &o) const { return {x + o.x, y + o.y, z + o.z}; }
        Vector operator-(const Vector &o) const { return {x - o.x, y - o.y, z - o.z}; }
        Vector operator*(double s) const { return {x * s, y * s, z * s}; }
        Vector operator-() const { return {-x, -y, -z}; }

        double dot(const Vector &o) const { return x * o.x + y * o.y + z * o.z; }

        Vector cross(const Vector &o) const { return {y * o.z - z * o.y, z * o.x - x * o.z, x * o.y - y * o.x}; }

        double length() const { return std::sqrt(x * x + y * y + z * z); }

        bool is_zero(double epsilon = 1e-12) const { return length() <= epsilon; }

        /**
         * @brief Unit vector in the same direction
         *
         * A vector shorter than epsilon has no defined direction and yields the
         * zero vector; callers must check is_zero() on the result.
         */
        Vector normalize(double epsilon = 1e-12) const {
            double len = length();
            if (len <= epsilon) {
                return Vector{};
            }
            return Vector{x / len, y / len, z / len};
        }
    };

    inline Vector operator*(double s, const Vector &v) { return v * s; }

    /**
     * @brief Point displaced by a vector
     */
    inline Point translate(const Point &p, const Vector &v) { return Point{p.x + v.x, p.y + v.y, p.z + v.z}; }

    /**
     * @brief Tolerance based point equality
     */
    inline bool points_coincide(const Point &a, const Point &b, double tolerance = DEFAULT_TOLERANCE) {
        return Vector::between(a, b).length() <= tolerance;
    }

    /**
     * @brief Finite directed segment, parametrised as start + t * (end - start)
     */
    struct Line {
        Point start;
        Point end;

        Line() = default;
        Line(const Point &s, const Point &e) : start(s), end(e) {}
        explicit Line(const datapod::Segment &seg) : start(seg.start), end(seg.end) {}

        Vector direction() const { return Vector::between(start, end); }

        double length() const { return direction().length(); }

        Point point_at(double t) const { return translate(start, direction() * t); }

        /**
         * @brief Parameter of the foot of the perpendicular from a query point
         *
         * @param query The query point
         * @param limit_to_segment Clamp the parameter to [0, 1]
         * @return Parameter t; 0 for a zero-length line
         */
        double closest_parameter(const Point &query, bool limit_to_segment = false) const {
            Vector d = direction();
            double len2 = d.dot(d);
            if (len2 <= 0.0) {
                return 0.0;
            }
            double t = Vector::between(start, query).dot(d) / len2;
            if (limit_to_segment) {
                t = std::clamp(t, 0.0, 1.0);
            }
            return t;
        }

        Point closest_point(const Point &query, bool limit_to_segment = false) const {
            return point_at(closest_parameter(query, limit_to_segment));
        }

        double distance_to(const Point &query, bool limit_to_segment = true) const {
            return Vector::between(query, closest_point(query, limit_to_segment)).length();
        }

        datapod::Segment to_segment() const { return datapod::Segment{start, end}; }
    };

    /**
     * @brief Plane through an origin with a unit normal
     */
    struct Plane {
        Point origin;
        Vector normal{0.0, 0.0, 1.0};

        /**
         * @brief Build a plane, normalising the given normal
         *
         * @return std::nullopt when the normal has no defined direction
         */
        static std::optional<Plane> from_normal(const Point &origin, const Vector &normal) {
            Vector unit = normal.normalize();
            if (unit.is_zero()) {
                return std::nullopt;
            }
            Plane plane;
            plane.origin = origin;
            plane.normal = unit;
            return plane;
        }

        static Plane world_xy() { return Plane{Point{0.0, 0.0, 0.0}, Vector{0.0, 0.0, 1.0}}; }

        double signed_distance(const Point &p) const { return Vector::between(origin, p).dot(normal); }

        Point project(const Point &p) const { return translate(p, normal * -signed_distance(p)); }
    };

} // namespace siteplan
