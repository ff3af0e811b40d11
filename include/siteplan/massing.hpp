#pragma once

#include <vector>

#include "siteplan/primitives.hpp"

namespace siteplan {

    /**
     * @brief One flattened 4-corner ring per floor of a rectangular building
     *
     * Corners run bottom-left, bottom-right, top-right, top-left; floor i sits at
     * base_z + i * floor_height. Each ring holds 12 values.
     */
    std::vector<std::vector<double>> building_floor_rings(const Point &center, double width, double depth,
                                                          int floors, double floor_height, double base_z = 0.0);

    struct FloorSlab {
        std::vector<Point> outline;
        double height = 0.0;
        double z_level = 0.0;
    };

    struct Extrusion {
        std::vector<FloorSlab> floors;
        double total_height = 0.0;
    };

    /**
     * @brief Stack a footprint once per floor height
     */
    Extrusion extrude_footprint(const std::vector<Point> &footprint, const std::vector<double> &floor_heights,
                                double base_z = 0.0);

} // namespace siteplan
