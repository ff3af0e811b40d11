#include <iomanip>
#include <iostream>
#include <vector>

#include "siteplan/plan.hpp"

int main() {
    // Irregular site boundary, flat (x, y, z) triples, closing vertex omitted
    std::vector<double> site = {
        0.0,   0.0,  0.0, //
        140.0, 10.0, 0.0, //
        150.0, 90.0, 0.0, //
        70.0,  130.0, 0.0, //
        -10.0, 80.0, 0.0, //
    };

    siteplan::PlanOverrides overrides;
    overrides.density = 0.6;
    overrides.far = 2.0;
    overrides.building_style = static_cast<int>(siteplan::BuildingStyle::Office);
    overrides.orientation = 15.0;

    siteplan::PlanConfig config;
    config.seed = 2024u;
    config.verbose = true;

    auto analysis = siteplan::analyze_geometry(site, config);
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Site area: " << analysis.area << " (closed: " << std::boolalpha << analysis.is_closed << ")\n";
    std::cout << "Perimeter: " << analysis.perimeter << "\n";

    auto validation = siteplan::validate_geometry(site, siteplan::ValidationOptions{}, config);
    for (const auto &w : validation.warnings) {
        std::cout << "Validation warning: " << w << "\n";
    }

    auto report = siteplan::generate_plan(site, overrides, config);
    if (!report.ok()) {
        std::cerr << "Plan failed (" << siteplan::to_string(report.status) << "): " << report.message << "\n";
        return 1;
    }

    std::cout << "Strategy: " << siteplan::to_string(report.design.strategy) << "\n";
    std::cout << "Buildings: " << report.design.num_buildings() << " of " << report.design.requested_buildings
              << " requested\n";
    std::cout << "Footprint: " << report.design.building_width << " x " << report.design.building_depth << "\n";
    std::cout << "Floors: " << report.design.floors_per_building << " at " << report.design.floor_height << " m\n";
    std::cout << "Total floor area: " << report.design.total_floor_area << "\n";
    std::cout << "Setback: " << siteplan::to_string(report.setback.status) << " via "
              << siteplan::to_string(report.setback.method) << "\n";

    for (std::size_t i = 0; i < report.design.building_positions.size(); ++i) {
        const auto &p = report.design.building_positions[i];
        std::cout << "  building " << i << " at (" << p.x << ", " << p.y << ")\n";
    }

    auto inset = siteplan::offset_geometry(report.layout.sub_site_vertices.front(), 10.0,
                                           siteplan::OffsetDirection::Inward, config);
    if (inset.success) {
        std::cout << "10 m inset has " << inset.offset_vertices.size() / 3 << " vertices\n";
    } else {
        std::cout << "10 m inset failed: " << inset.error_message << "\n";
    }

    return 0;
}
