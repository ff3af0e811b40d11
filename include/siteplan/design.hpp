#pragma once

#include <cstddef>
#include <random>
#include <vector>

#include "siteplan/config.hpp"
#include "siteplan/polyline.hpp"

namespace siteplan {

    enum class PlacementStrategy {
        Scatter,      ///< density < low threshold, rejection sampling with wide spacing
        JitteredGrid, ///< density < high threshold, grid positions with bounded random jitter
        TightGrid,    ///< otherwise, tight grid truncated to the building count
    };

    /**
     * @brief Building layout produced by the parametric rule engine
     *
     * Footprint size, floor count and floor height are shared by every building.
     */
    struct DesignResult {
        std::vector<Point> building_positions;
        double building_width = 0.0;
        double building_depth = 0.0;
        int floors_per_building = 0;
        double floor_height = 0.0;
        std::size_t requested_buildings = 0; ///< Count asked of the placement strategy
        PlacementStrategy strategy = PlacementStrategy::Scatter;
        double total_floor_area = 0.0; ///< positions * floors * footprint area

        std::size_t num_buildings() const { return building_positions.size(); }
        double footprint_area() const { return building_width * building_depth; }
    };

    PlacementStrategy select_strategy(double density, const DesignRules &rules = DesignRules{});

    /**
     * @brief Map site parameters to building positions and massing
     *
     * 1. Footprint width/depth scale linearly with density.
     * 2. Building count = floor(area / (footprint * spacing factor)) scaled by
     *    density again, at least 1 and at most rules.max_buildings.
     * 3. Floors = (area * FAR / footprint) / count, clamped to the floor range.
     * 4. Floor height comes from the building style.
     * 5. Positions come from the strategy picked by density.
     * 6. A non-zero orientation rotates every position rigidly about the site
     *    centroid; footprints themselves stay axis aligned. An unset
     *    orientation means no rotation.
     *
     * Only the positions depend on the random source.
     *
     * @param site Closed site boundary
     * @param site_area Site area
     * @param params Resolved request parameters
     * @param rng Random source for scatter and jitter
     * @param rules Empirical constants
     * @throws std::invalid_argument if the site is not closed
     */
    DesignResult apply_site_parameters(const Polyline &site, double site_area, const PlanParameters &params,
                                       std::mt19937 &rng, const DesignRules &rules = DesignRules{},
                                       double tolerance = DEFAULT_TOLERANCE);

    const char *to_string(PlacementStrategy strategy);

} // namespace siteplan
