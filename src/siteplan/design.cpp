#include "siteplan/design.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <utility>

#include "siteplan/placement.hpp"
#include "siteplan/utils/utils.hpp"

namespace siteplan {

    PlacementStrategy select_strategy(double density, const DesignRules &rules) {
        if (density < rules.low_density_threshold) {
            return PlacementStrategy::Scatter;
        }
        if (density < rules.high_density_threshold) {
            return PlacementStrategy::JitteredGrid;
        }
        return PlacementStrategy::TightGrid;
    }

    DesignResult apply_site_parameters(const Polyline &site, double site_area, const PlanParameters &params,
                                       std::mt19937 &rng, const DesignRules &rules, double tolerance) {
        if (!site.is_closed(tolerance)) {
            throw std::invalid_argument("parametric design needs a closed site boundary");
        }

        DesignResult result;
        double density = params.density;

        result.building_width = rules.base_building_size * (rules.width_base + density * rules.width_per_density);
        result.building_depth = rules.base_building_size * (rules.depth_base + density * rules.depth_per_density);
        double footprint = result.footprint_area();

        // Density applies twice: once in the footprint size, once in the count
        double max_by_area = std::floor(site_area / (footprint * rules.spacing_factor));
        double scaled_count = std::floor(max_by_area * density);
        int num_buildings =
            static_cast<int>(std::clamp(scaled_count, 1.0, static_cast<double>(std::max(1, rules.max_buildings))));

        double total_floors_needed = site_area * params.far / footprint;
        double floors = std::floor(total_floors_needed / num_buildings);
        floors = std::max(floors, static_cast<double>(rules.min_floors));
        result.floors_per_building = static_cast<int>(std::min(floors, static_cast<double>(rules.max_floors)));

        result.floor_height = rules.floor_height(params.building_style);
        result.requested_buildings = static_cast<std::size_t>(num_buildings);
        result.strategy = select_strategy(density, rules);

        BuildingPlacer placer(site, rng);
        double w = result.building_width;
        double d = result.building_depth;

        switch (result.strategy) {
        case PlacementStrategy::Scatter:
            result.building_positions = placer.scatter(result.requested_buildings, w, d, rules.scatter_spacing);
            break;
        case PlacementStrategy::JitteredGrid: {
            auto grid = placer.grid(w, d, rules.medium_grid_spacing);
            if (grid.size() > result.requested_buildings) {
                grid.erase(grid.begin() + static_cast<std::ptrdiff_t>(result.requested_buildings), grid.end());
            }
            std::uniform_real_distribution<double> jitter(-rules.jitter, rules.jitter);
            for (const auto &pos : grid) {
                double dx = jitter(rng);
                double dy = jitter(rng);
                Point moved{pos.x + dx, pos.y + dy, pos.z};
                result.building_positions.push_back(placer.footprint_fits(moved, w, d) ? moved : pos);
            }
            break;
        }
        case PlacementStrategy::TightGrid: {
            auto grid = placer.grid(w, d, rules.tight_grid_spacing);
            if (grid.size() > result.requested_buildings) {
                grid.erase(grid.begin() + static_cast<std::ptrdiff_t>(result.requested_buildings), grid.end());
            }
            result.building_positions = std::move(grid);
            break;
        }
        }

        double angle = params.orientation.value_or(0.0);
        if (std::abs(angle) > rules.min_rotation) {
            Point pivot = site.get_centroid(tolerance);
            for (auto &pos : result.building_positions) {
                pos = utils::rotate_about(pos, pivot, angle);
            }
        }

        result.total_floor_area =
            static_cast<double>(result.building_positions.size()) * result.floors_per_building * footprint;
        return result;
    }

    const char *to_string(PlacementStrategy strategy) {
        switch (strategy) {
        case PlacementStrategy::Scatter:
            return "scatter";
        case PlacementStrategy::JitteredGrid:
            return "jittered_grid";
        case PlacementStrategy::TightGrid:
            return "tight_grid";
        }
        return "unknown";
    }

} // namespace siteplan
