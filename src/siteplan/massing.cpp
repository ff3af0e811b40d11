#include "siteplan/massing.hpp"

#include <utility>

#include "siteplan/placement.hpp"

namespace siteplan {

    std::vector<std::vector<double>> building_floor_rings(const Point &center, double width, double depth,
                                                          int floors, double floor_height, double base_z) {
        std::vector<std::vector<double>> rings;
        if (floors <= 0) {
            return rings;
        }
        rings.reserve(static_cast<std::size_t>(floors));

        for (int floor = 0; floor < floors; ++floor) {
            double z = base_z + floor * floor_height;
            std::vector<double> ring;
            ring.reserve(12);
            for (const auto &corner : footprint_corners(Point{center.x, center.y, z}, width, depth)) {
                ring.push_back(corner.x);
                ring.push_back(corner.y);
                ring.push_back(corner.z);
            }
            rings.push_back(std::move(ring));
        }
        return rings;
    }

    Extrusion extrude_footprint(const std::vector<Point> &footprint, const std::vector<double> &floor_heights,
                                double base_z) {
        Extrusion extrusion;
        double z = base_z;
        for (double h : floor_heights) {
            FloorSlab slab;
            slab.outline.reserve(footprint.size());
            for (const auto &p : footprint) {
                slab.outline.push_back(Point{p.x, p.y, z});
            }
            slab.height = h;
            slab.z_level = z;
            extrusion.floors.push_back(std::move(slab));
            z += h;
        }
        extrusion.total_height = z - base_z;
        return extrusion;
    }

} // namespace siteplan
