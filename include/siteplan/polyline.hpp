#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include <datapod/datapod.hpp>

#include "siteplan/primitives.hpp"

namespace siteplan {

    /**
     * @brief Ordered vertex sequence, the central aggregate of the kernel
     *
     * A polyline is closed when its first and last points coincide within a
     * tolerance; the closing duplicate is stored explicitly. Area and centroid
     * are only computed for closed polylines and report zero otherwise.
     */
    class Polyline {
      public:
        Polyline() = default;
        explicit Polyline(std::vector<Point> points);

        /**
         * @brief Build a polyline from consecutive (x, y, z) triples
         *
         * @throws std::invalid_argument if the value count is not a multiple of 3
         */
        static Polyline from_flat(const std::vector<double> &values);

        /**
         * @brief Flatten back to (x, y, z) triples
         *
         * @param z_offset Added to every z value
         */
        std::vector<double> to_flat(double z_offset = 0.0) const;

        const std::vector<Point> &points() const { return points_; }
        std::size_t size() const { return points_.size(); }
        bool empty() const { return points_.empty(); }
        const Point &operator[](std::size_t i) const { return points_[i]; }
        const Point &at(std::size_t i) const { return points_.at(i); }

        void add_point(const Point &p) { points_.push_back(p); }

        bool is_closed(double tolerance = DEFAULT_TOLERANCE) const;

        /**
         * @brief Closure gate for every area and centroid computation
         *
         * @param tolerance Maximum first/last gap accepted as closed
         * @return true if first and last points coincide within tolerance;
         *         false (polyline unchanged) when the gap is larger
         */
        bool make_closed(double tolerance = DEFAULT_TOLERANCE);

        /**
         * @brief Explicitly append the first point unless already closed
         *
         * @throws std::invalid_argument for fewer than 3 points
         */
        void close(double tolerance = DEFAULT_TOLERANCE);

        /// Vertices without the closing duplicate
        std::vector<Point> unique_points(double tolerance = DEFAULT_TOLERANCE) const;

        std::vector<Line> segments() const;

        /// Sum of consecutive segment lengths (the closing segment is explicit when closed)
        double length() const;

        /**
         * @brief Unsigned shoelace area on the dominant 2D projection
         *
         * @return 0 when the polyline is not closed
         */
        double get_area(double tolerance = DEFAULT_TOLERANCE) const;

        /**
         * @brief Vertex-average of the deduplicated boundary
         *
         * This is not the area-weighted centroid. Returns the origin when the
         * polyline is not closed.
         */
        Point get_centroid(double tolerance = DEFAULT_TOLERANCE) const;

        datapod::AABB get_bounding_box() const;

        /// At least 3 distinct points and no zero-length consecutive segment
        bool is_valid(double tolerance = DEFAULT_TOLERANCE) const;

        /**
         * @brief Plane through the first two points and the first non-collinear third point
         *
         * @return std::nullopt when all points are collinear (not planar, not an error)
         */
        std::optional<Plane> get_plane() const;

        /// atan2 heading of the longest edge in XY; ties keep the first occurrence
        double get_main_orientation() const;

        datapod::Polygon to_polygon() const;

      private:
        std::vector<Point> points_;
    };

} // namespace siteplan
