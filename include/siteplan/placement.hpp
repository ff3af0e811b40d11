#pragma once

#include <array>
#include <cstddef>
#include <random>
#include <vector>

#include <datapod/datapod.hpp>

#include "siteplan/polyline.hpp"

namespace siteplan {

    /**
     * @brief Corners of an axis-aligned footprint (bottom-left, bottom-right, top-right, top-left)
     */
    std::array<Point, 4> footprint_corners(const Point &center, double width, double depth);

    /// Mean z of the boundary vertices (closing duplicate excluded), the level buildings stand on
    double mean_elevation(const Polyline &site);

    /**
     * @brief Places building footprint centres inside a site boundary
     *
     * Every accepted footprint has all four corners inside the boundary. The
     * random source is borrowed from the caller so that placement is
     * reproducible and nothing is shared between requests.
     */
    class BuildingPlacer {
      public:
        /**
         * @param site Site boundary (closing duplicate optional)
         * @param rng Random source used by scatter placement
         */
        BuildingPlacer(const Polyline &site, std::mt19937 &rng);

        /**
         * @brief Rejection-sampled scatter placement
         *
         * Candidates are drawn uniformly inside the bounding box inset by half the
         * footprint. A candidate is accepted when its footprint is contained and
         * it is at least max(width, depth) + min_spacing away from every accepted
         * centre. Sampling stops after count * attempts_per_building draws, so a
         * site that cannot fit the request yields fewer positions.
         *
         * @throws std::invalid_argument on non-positive footprint or negative spacing
         */
        std::vector<Point> scatter(std::size_t count, double width, double depth, double min_spacing = 5.0);

        /**
         * @brief Deterministic lattice sweep with step (width + spacing, depth + spacing)
         *
         * @throws std::invalid_argument on non-positive footprint or negative spacing
         */
        std::vector<Point> grid(double width, double depth, double spacing = 10.0) const;

        /// Centre and all four corners inside the boundary
        bool footprint_fits(const Point &center, double width, double depth) const;

        bool contains(const Point &p) const;

        void set_attempts_per_building(std::size_t attempts);
        std::size_t attempts_per_building() const { return attempts_per_building_; }

        /// Number of candidates drawn by the last scatter call
        std::size_t last_attempts() const { return last_attempts_; }

        double elevation() const { return elevation_; }
        const datapod::AABB &bounds() const { return bounds_; }

      private:
        std::vector<Point> ring_;
        datapod::AABB bounds_;
        double elevation_ = 0.0;
        std::mt19937 &rng_;
        std::size_t attempts_per_building_ = 200;
        std::size_t last_attempts_ = 0;
    };

} // namespace siteplan
